/**
 * @file hex.cpp
 * @brief Lookup-table hex encode/decode.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/hex.hpp"

#include <array>
#include <cstdint>

namespace idforge {
namespace core {
namespace hex {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

// Values >= 0x10 mark a non-hex character.
constexpr uint8_t INVALID = 0xFF;

constexpr std::array<uint8_t, 256> makeDecodeTable() {
    std::array<uint8_t, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = INVALID;
    }
    for (uint8_t c = '0'; c <= '9'; ++c) {
        table[c] = static_cast<uint8_t>(c - '0');
    }
    for (uint8_t c = 'a'; c <= 'f'; ++c) {
        table[c] = static_cast<uint8_t>(c - 'a' + 10);
    }
    for (uint8_t c = 'A'; c <= 'F'; ++c) {
        table[c] = static_cast<uint8_t>(c - 'A' + 10);
    }
    return table;
}

constexpr std::array<uint8_t, 256> DECODE = makeDecodeTable();

// Offset of each byte's high digit within the hyphenated body.
constexpr std::array<uint8_t, 16> HYPHENATED_OFFSETS = {
    0, 2, 4, 6,
    9, 11,
    14, 16,
    19, 21,
    24, 26, 28, 30, 32, 34
};

inline uint8_t lookup(char c) noexcept {
    return DECODE[static_cast<unsigned char>(c)];
}

}  // namespace

void encode(const Uuid::Bytes& bytes, char* out) noexcept {
    size_t pos = 0;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out[pos++] = '-';
        }
        out[pos++] = DIGITS[bytes[i] >> 4];
        out[pos++] = DIGITS[bytes[i] & 0x0F];
    }
}

bool hasHyphens(std::string_view text, size_t offset) noexcept {
    return text[offset + 8] == '-' && text[offset + 13] == '-' &&
           text[offset + 18] == '-' && text[offset + 23] == '-';
}

bool decode(std::string_view text, size_t offset, Uuid::Bytes& out) noexcept {
    Uuid::Bytes result;
    uint8_t bad = 0;
    const char* src = text.data() + offset;

    for (size_t i = 0; i < result.size(); ++i) {
        const uint8_t hi = lookup(src[HYPHENATED_OFFSETS[i]]);
        const uint8_t lo = lookup(src[HYPHENATED_OFFSETS[i] + 1]);
        bad |= static_cast<uint8_t>(hi | lo);
        result[i] = static_cast<uint8_t>((hi << 4) | (lo & 0x0F));
    }

    if (bad & 0xF0) {
        return false;
    }
    out = result;
    return true;
}

bool decodeCompact(std::string_view text, Uuid::Bytes& out) noexcept {
    Uuid::Bytes result;
    uint8_t bad = 0;

    for (size_t i = 0; i < result.size(); ++i) {
        const uint8_t hi = lookup(text[i * 2]);
        const uint8_t lo = lookup(text[i * 2 + 1]);
        bad |= static_cast<uint8_t>(hi | lo);
        result[i] = static_cast<uint8_t>((hi << 4) | (lo & 0x0F));
    }

    if (bad & 0xF0) {
        return false;
    }
    out = result;
    return true;
}

}  // namespace hex
}  // namespace core
}  // namespace idforge
