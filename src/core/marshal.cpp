/**
 * @file marshal.cpp
 * @brief Marshalling implementation.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/marshal.hpp"
#include "idforge/core/hex.hpp"
#include "idforge/core/parse.hpp"

namespace idforge {
namespace core {

namespace {

template<typename Buffer>
void ensureSpare(Buffer& out, size_t needed) {
    if (out.capacity() - out.size() < needed) {
        out.reserve((out.size() + needed) * 2);
    }
}

template<typename Buffer>
void appendEncoded(const Uuid& id, Buffer& out) {
    ensureSpare(out, hex::ENCODED_SIZE);
    const size_t offset = out.size();
    out.resize(offset + hex::ENCODED_SIZE);
    hex::encode(id.bytes(), reinterpret_cast<char*>(&out[offset]));
}

}  // namespace

std::string marshalText(const Uuid& id) {
    return id.toString();
}

Uuid unmarshalText(std::string_view text) {
    return parse(text);
}

std::vector<uint8_t> marshalBinary(const Uuid& id) {
    return std::vector<uint8_t>(id.data(), id.data() + Uuid::SIZE);
}

Uuid unmarshalBinary(const std::vector<uint8_t>& data) {
    return fromBytes(data);
}

void appendText(const Uuid& id, std::string& out) {
    appendEncoded(id, out);
}

void appendText(const Uuid& id, std::vector<uint8_t>& out) {
    appendEncoded(id, out);
}

void appendBinary(const Uuid& id, std::vector<uint8_t>& out) {
    ensureSpare(out, Uuid::SIZE);
    out.insert(out.end(), id.data(), id.data() + Uuid::SIZE);
}

}  // namespace core
}  // namespace idforge
