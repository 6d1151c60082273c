/**
 * @file proto_codec.hpp
 * @brief Conversion between Uuid and the idforge.proto wire messages.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/errors.hpp"
#include "idforge/core/export.hpp"
#include "idforge/core/uuid.hpp"

#include "idforge/proto/uuid.pb.h"

#include <string>
#include <vector>

namespace idforge {
namespace core {

IDFORGE_CORE_API proto::Uuid toProto(const Uuid& id);

/**
 * @throws LengthError if the message value is not 16 bytes.
 */
IDFORGE_CORE_API Uuid fromProto(const proto::Uuid& message);

IDFORGE_CORE_API proto::UuidList toProto(const std::vector<Uuid>& ids);

/**
 * @throws LengthError if any entry is not 16 bytes.
 */
IDFORGE_CORE_API std::vector<Uuid> fromProto(const proto::UuidList& message);

/**
 * @brief Encoded idforge.proto.Uuid message.
 */
IDFORGE_CORE_API std::string serializeToString(const Uuid& id);

/**
 * @brief Decode an idforge.proto.Uuid message.
 * @throws ParseError on malformed wire data.
 * @throws LengthError if the decoded value is not 16 bytes.
 */
IDFORGE_CORE_API Uuid parseFromString(const std::string& data);

IDFORGE_CORE_API std::string serializeListToString(const std::vector<Uuid>& ids);

IDFORGE_CORE_API std::vector<Uuid> parseListFromString(const std::string& data);

}  // namespace core
}  // namespace idforge
