/**
 * @file uuid.cpp
 * @brief Uuid accessors, formatting and comparison.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/uuid.hpp"
#include "idforge/core/hex.hpp"

#include <cstring>
#include <ostream>

namespace idforge {
namespace core {

const char* versionToString(Version version) {
    switch (version) {
        case Version::NIL: return "NIL";
        case Version::V3:  return "V3";
        case Version::V4:  return "V4";
        case Version::V5:  return "V5";
        case Version::V7:  return "V7";
        case Version::V8:  return "V8";
        case Version::MAX: return "MAX";
        default:           return "unknown";
    }
}

const char* variantToString(Variant variant) {
    switch (variant) {
        case Variant::NCS:       return "NCS";
        case Variant::RFC9562:   return "RFC9562";
        case Variant::MICROSOFT: return "Microsoft";
        case Variant::FUTURE:    return "Future";
        default:                 return "unknown";
    }
}

bool isKnownVersion(Version version) {
    switch (version) {
        case Version::NIL:
        case Version::V3:
        case Version::V4:
        case Version::V5:
        case Version::V7:
        case Version::V8:
        case Version::MAX:
            return true;
        default:
            return false;
    }
}

Variant Uuid::variant() const noexcept {
    const uint8_t b = bytes_[8];
    if ((b & 0x80) == 0x00) {
        return Variant::NCS;
    }
    if ((b & 0xC0) == 0x80) {
        return Variant::RFC9562;
    }
    if ((b & 0xE0) == 0xC0) {
        return Variant::MICROSOFT;
    }
    return Variant::FUTURE;
}

bool Uuid::isNil() const noexcept {
    return *this == NIL_UUID;
}

Uuid::TimePoint Uuid::timestamp() const noexcept {
    int64_t ms = 0;
    for (size_t i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes_[i];
    }
    return TimePoint(std::chrono::milliseconds(ms));
}

std::string Uuid::toString() const {
    std::string out(hex::ENCODED_SIZE, '\0');
    hex::encode(bytes_, &out[0]);
    return out;
}

std::string Uuid::toUrn() const {
    static constexpr char PREFIX[] = "urn:uuid:";
    constexpr size_t prefixLength = sizeof(PREFIX) - 1;

    std::string out(prefixLength + hex::ENCODED_SIZE, '\0');
    std::memcpy(&out[0], PREFIX, prefixLength);
    hex::encode(bytes_, &out[prefixLength]);
    return out;
}

int Uuid::compare(const Uuid& a, const Uuid& b) noexcept {
    const int c = std::memcmp(a.bytes_.data(), b.bytes_.data(), SIZE);
    return (c > 0) - (c < 0);
}

std::ostream& operator<<(std::ostream& os, const Uuid& id) {
    char buf[hex::ENCODED_SIZE];
    hex::encode(id.bytes(), buf);
    return os.write(buf, sizeof(buf));
}

}  // namespace core
}  // namespace idforge
