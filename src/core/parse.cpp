/**
 * @file parse.cpp
 * @brief Strict and lenient parsers.
 *
 * Both parsers share one non-throwing core that reports the failure
 * reason, so the optional-returning and throwing entry points agree.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/parse.hpp"
#include "idforge/core/hex.hpp"
#include "idforge/utils/logger.hpp"

#include <cstring>
#include <string>

namespace idforge {
namespace core {

namespace {

constexpr std::string_view URN_PREFIX = "urn:uuid:";

constexpr size_t URN_SIZE = URN_PREFIX.size() + hex::ENCODED_SIZE;   // 45
constexpr size_t BRACED_SIZE = hex::ENCODED_SIZE + 2;                // 38

constexpr const char* MSG_STANDARD_LENGTH = "expected 36-character hyphenated format";
constexpr const char* MSG_HYPHENS = "expected hyphens at positions 8, 13, 18, 23";
constexpr const char* MSG_BODY_HYPHENS = "expected hyphens in UUID portion";
constexpr const char* MSG_URN_PREFIX = "expected urn:uuid: prefix";
constexpr const char* MSG_BRACES = "expected braces";
constexpr const char* MSG_INVALID_HEX = "invalid hex character";
constexpr const char* MSG_UNRECOGNIZED = "unrecognized UUID format";

// Returns nullptr on success, otherwise the failure reason.
const char* parseHyphenated(std::string_view text, size_t offset,
                            const char* hyphenMessage, Uuid::Bytes& out) noexcept {
    if (!hex::hasHyphens(text, offset)) {
        return hyphenMessage;
    }
    if (!hex::decode(text, offset, out)) {
        return MSG_INVALID_HEX;
    }
    return nullptr;
}

const char* parseStrict(std::string_view text, Uuid::Bytes& out) noexcept {
    if (text.size() != hex::ENCODED_SIZE) {
        return MSG_STANDARD_LENGTH;
    }
    return parseHyphenated(text, 0, MSG_HYPHENS, out);
}

const char* parseAnyForm(std::string_view text, Uuid::Bytes& out) noexcept {
    switch (text.size()) {
        case hex::ENCODED_SIZE:
            return parseHyphenated(text, 0, MSG_HYPHENS, out);

        case URN_SIZE:
            if (text.substr(0, URN_PREFIX.size()) != URN_PREFIX) {
                return MSG_URN_PREFIX;
            }
            return parseHyphenated(text, URN_PREFIX.size(), MSG_BODY_HYPHENS, out);

        case BRACED_SIZE:
            if (text.front() != '{' || text.back() != '}') {
                return MSG_BRACES;
            }
            return parseHyphenated(text, 1, MSG_BODY_HYPHENS, out);

        case hex::COMPACT_SIZE:
            if (!hex::decodeCompact(text, out)) {
                return MSG_INVALID_HEX;
            }
            return nullptr;

        default:
            return MSG_UNRECOGNIZED;
    }
}

}  // namespace

Uuid parse(std::string_view text) {
    Uuid::Bytes bytes;
    if (const char* reason = parseStrict(text, bytes)) {
        throw ParseError(std::string(text), reason);
    }
    return Uuid(bytes);
}

Uuid parseLenient(std::string_view text) {
    Uuid::Bytes bytes;
    if (const char* reason = parseAnyForm(text, bytes)) {
        throw ParseError(std::string(text), reason);
    }
    return Uuid(bytes);
}

std::optional<Uuid> tryParse(std::string_view text) noexcept {
    Uuid::Bytes bytes;
    if (parseStrict(text, bytes) != nullptr) {
        return std::nullopt;
    }
    return Uuid(bytes);
}

std::optional<Uuid> tryParseLenient(std::string_view text) noexcept {
    Uuid::Bytes bytes;
    if (parseAnyForm(text, bytes) != nullptr) {
        return std::nullopt;
    }
    return Uuid(bytes);
}

Uuid mustParse(std::string_view text) noexcept {
    Uuid::Bytes bytes;
    if (const char* reason = parseStrict(text, bytes)) {
        LOG_FATAL("Parse", "mustParse(\"{}\"): {}", text, reason);
    }
    return Uuid(bytes);
}

Uuid fromBytes(const uint8_t* data, size_t length) {
    if (length != Uuid::SIZE) {
        throw LengthError(length, Uuid::SIZE);
    }
    Uuid::Bytes bytes;
    std::memcpy(bytes.data(), data, Uuid::SIZE);
    return Uuid(bytes);
}

Uuid fromBytes(const std::vector<uint8_t>& data) {
    return fromBytes(data.data(), data.size());
}

}  // namespace core
}  // namespace idforge
