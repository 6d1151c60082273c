/**
 * @file proto_codec.cpp
 * @brief Protobuf codec implementation.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/proto_codec.hpp"
#include "idforge/core/parse.hpp"
#include "idforge/utils/logger.hpp"

#include <stdexcept>

namespace idforge {
namespace core {

namespace {

constexpr const char* MSG_MALFORMED = "malformed protobuf message";

// Wire data is binary; errors describe it by size instead of echoing it.
std::string describe(const std::string& data) {
    return "<" + std::to_string(data.size()) + " bytes>";
}

std::string encode(const google::protobuf::MessageLite& message) {
    std::string data;
    if (!message.SerializeToString(&data)) {
        // Only fails for messages over 2 GiB
        LOG_DEBUG("ProtoCodec", "Failed to serialize {}", message.GetTypeName());
        throw std::length_error("protobuf message too large to serialize");
    }
    return data;
}

}  // namespace

proto::Uuid toProto(const Uuid& id) {
    proto::Uuid message;
    message.set_value(reinterpret_cast<const char*>(id.data()), Uuid::SIZE);
    return message;
}

Uuid fromProto(const proto::Uuid& message) {
    const std::string& value = message.value();
    return fromBytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

proto::UuidList toProto(const std::vector<Uuid>& ids) {
    proto::UuidList message;
    message.mutable_ids()->Reserve(static_cast<int>(ids.size()));
    for (const auto& id : ids) {
        *message.add_ids() = toProto(id);
    }
    return message;
}

std::vector<Uuid> fromProto(const proto::UuidList& message) {
    std::vector<Uuid> ids;
    ids.reserve(static_cast<size_t>(message.ids_size()));
    for (const auto& entry : message.ids()) {
        ids.push_back(fromProto(entry));
    }
    return ids;
}

std::string serializeToString(const Uuid& id) {
    return encode(toProto(id));
}

Uuid parseFromString(const std::string& data) {
    proto::Uuid message;
    if (!message.ParseFromString(data)) {
        LOG_DEBUG("ProtoCodec", "Failed to parse Uuid message ({} bytes)", data.size());
        throw ParseError(describe(data), MSG_MALFORMED);
    }
    return fromProto(message);
}

std::string serializeListToString(const std::vector<Uuid>& ids) {
    return encode(toProto(ids));
}

std::vector<Uuid> parseListFromString(const std::string& data) {
    proto::UuidList message;
    if (!message.ParseFromString(data)) {
        LOG_DEBUG("ProtoCodec", "Failed to parse UuidList message ({} bytes)", data.size());
        throw ParseError(describe(data), MSG_MALFORMED);
    }
    return fromProto(message);
}

}  // namespace core
}  // namespace idforge
