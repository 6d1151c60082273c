/**
 * @file layout.hpp
 * @brief Bit-level stamping shared by the generators (private header).
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace idforge {
namespace core {
namespace layout {

constexpr int64_t NANOS_PER_MILLI = 1000000;

/// Low bits of a v7 sequence reserved for the sub-millisecond counter.
constexpr unsigned SEQUENCE_BITS = 12;
constexpr uint64_t SEQUENCE_MASK = (1u << SEQUENCE_BITS) - 1;   // 0xFFF

inline void setVersion(uint8_t* bytes, uint8_t version) noexcept {
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | (version << 4));
}

/// Top two bits of byte 8 become 10 (RFC 9562 variant).
inline void setRfcVariant(uint8_t* bytes) noexcept {
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
}

/**
 * @brief (ms << 12) | frac for a wall-clock reading.
 *
 * frac scales the nanoseconds within the millisecond to 12 bits
 * (RFC 9562 section 6.2, method 3).
 */
inline uint64_t sequenceFor(std::chrono::system_clock::time_point now) noexcept {
    const int64_t nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()).count();
    const int64_t ms = nanos / NANOS_PER_MILLI;
    const int64_t frac = (nanos % NANOS_PER_MILLI) * 4096 / NANOS_PER_MILLI;
    return (static_cast<uint64_t>(ms) << SEQUENCE_BITS) | static_cast<uint64_t>(frac);
}

/// First sequence to hand out: @p candidate, or last + 1 when the clock
/// has not moved past @p last.
inline uint64_t nextSequence(uint64_t candidate, uint64_t last) noexcept {
    return candidate > last ? candidate : last + 1;
}

/**
 * @brief Write timestamp, version 7 and counter for @p sequence into
 * bytes 0-7 and set the variant on byte 8. Bytes 8-15 must already hold
 * the random tail.
 */
inline void stampV7(uint8_t* bytes, uint64_t sequence) noexcept {
    const uint64_t ms = sequence >> SEQUENCE_BITS;
    const uint64_t seq12 = sequence & SEQUENCE_MASK;

    bytes[0] = static_cast<uint8_t>(ms >> 40);
    bytes[1] = static_cast<uint8_t>(ms >> 32);
    bytes[2] = static_cast<uint8_t>(ms >> 24);
    bytes[3] = static_cast<uint8_t>(ms >> 16);
    bytes[4] = static_cast<uint8_t>(ms >> 8);
    bytes[5] = static_cast<uint8_t>(ms);
    bytes[6] = static_cast<uint8_t>(0x70 | ((seq12 >> 8) & 0x0F));
    bytes[7] = static_cast<uint8_t>(seq12);
    setRfcVariant(bytes);
}

}  // namespace layout
}  // namespace core
}  // namespace idforge
