/**
 * @file uuid.hpp
 * @brief The 128-bit identifier value type (RFC 9562).
 *
 * A Uuid is exactly 16 bytes, copied by value, immutable once built and
 * totally ordered by byte-lexicographic comparison. Because version 7
 * identifiers carry their timestamp in the leading bytes, that order is
 * also their chronological order.
 *
 * Binary layout (bit 0 = most significant bit of byte 0):
 * - bytes 0-5   48-bit big-endian Unix milliseconds (v7 only)
 * - byte  6     version (high nibble) + data
 * - byte  7     data
 * - byte  8     variant (top 2-3 bits) + data
 * - bytes 9-15  data
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/export.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iosfwd>
#include <string>

namespace idforge {
namespace core {

/**
 * @enum Version
 * @brief 4-bit version tag stored in the high nibble of byte 6.
 *
 * The underlying type is fixed, so tags without a named enumerator
 * (1, 2, 6, 9-14, seen in parsed external input) are carried verbatim.
 */
enum class Version : uint8_t {
    NIL = 0,   ///< Nil identifier
    V3 = 3,    ///< Name-based, MD5
    V4 = 4,    ///< Random
    V5 = 5,    ///< Name-based, SHA-1
    V7 = 7,    ///< Unix time-ordered
    V8 = 8,    ///< Custom / experimental
    MAX = 15   ///< Max identifier
};

/**
 * @enum Variant
 * @brief Layout family encoded in the top bits of byte 8.
 */
enum class Variant : uint8_t {
    NCS = 0,        ///< 0xxx - NCS backward compatibility
    RFC9562 = 1,    ///< 10xx - RFC 9562 (formerly RFC 4122)
    MICROSOFT = 2,  ///< 110x - Microsoft backward compatibility
    FUTURE = 3      ///< 111x - Reserved
};

/**
 * @brief Name of a version tag ("V7", "NIL", ...), "unknown" for unnamed tags.
 */
IDFORGE_CORE_API const char* versionToString(Version version);

IDFORGE_CORE_API const char* variantToString(Variant variant);

/**
 * @brief True if @p version is one of the named Version enumerators.
 */
IDFORGE_CORE_API bool isKnownVersion(Version version);

/**
 * @class Uuid
 * @brief 16-byte identifier value.
 *
 * Default construction yields the Nil identifier.
 */
class IDFORGE_CORE_API Uuid {
public:
    static constexpr size_t SIZE = 16;
    using Bytes = std::array<uint8_t, SIZE>;
    /// Millisecond precision covers the whole 48-bit field without overflow.
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    constexpr Uuid() noexcept : bytes_{} {}
    constexpr explicit Uuid(const Bytes& bytes) noexcept : bytes_(bytes) {}

    /**
     * @brief Version tag (byte 6 high nibble), returned without validation.
     */
    Version version() const noexcept {
        return static_cast<Version>(bytes_[6] >> 4);
    }

    /**
     * @brief Variant decoded from byte 8: 0xxx NCS, 10xx RFC 9562,
     * 110x Microsoft, 111x Future.
     */
    Variant variant() const noexcept;

    bool isNil() const noexcept;

    /**
     * @brief Copy of the raw bytes.
     */
    Bytes bytes() const noexcept { return bytes_; }

    /**
     * @brief Read-only view of the raw bytes (16 bytes).
     */
    const uint8_t* data() const noexcept { return bytes_.data(); }

    /**
     * @brief Millisecond timestamp held in bytes 0-5.
     *
     * Only meaningful when version() == Version::V7; other versions yield
     * an arbitrary instant. Callers check the version first.
     */
    TimePoint timestamp() const noexcept;

    /**
     * @brief Canonical 36-character lowercase hyphenated form.
     */
    std::string toString() const;

    /**
     * @brief "urn:uuid:" followed by the canonical form.
     */
    std::string toUrn() const;

    /**
     * @brief Byte-lexicographic comparison: -1, 0 or +1.
     */
    static int compare(const Uuid& a, const Uuid& b) noexcept;

    friend bool operator==(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ != b.bytes_; }
    friend bool operator<(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ < b.bytes_; }
    friend bool operator>(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ > b.bytes_; }
    friend bool operator<=(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ <= b.bytes_; }
    friend bool operator>=(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ >= b.bytes_; }

private:
    Bytes bytes_;
};

IDFORGE_CORE_API std::ostream& operator<<(std::ostream& os, const Uuid& id);

// =============================================================================
// Reserved Values
// =============================================================================

/// All-zero identifier, used to mean "absent / uninitialised".
inline constexpr Uuid NIL_UUID{};

/// All-0xFF identifier, the greatest possible value.
inline constexpr Uuid MAX_UUID{Uuid::Bytes{
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}};

// Pre-defined namespaces for name-based generation (RFC 9562 Appendix C).
inline constexpr Uuid NAMESPACE_DNS{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_URL{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_OID{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_X500{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

}  // namespace core
}  // namespace idforge

namespace std {

template<>
struct hash<idforge::core::Uuid> {
    size_t operator()(const idforge::core::Uuid& id) const noexcept {
        uint64_t hi = 0;
        uint64_t lo = 0;
        std::memcpy(&hi, id.data(), 8);
        std::memcpy(&lo, id.data() + 8, 8);
        return std::hash<uint64_t>{}(hi ^ (lo * 0x9E3779B97F4A7C15ULL));
    }
};

}  // namespace std
