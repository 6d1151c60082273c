/**
 * @file hex.hpp
 * @brief Fixed-layout hex codec for the 36-character hyphenated form.
 *
 * Encoding writes 32 lowercase digits with hyphens at offsets 8, 13, 18
 * and 23. Decoding goes through a 256-entry table keyed by the raw
 * character; every digit pair is decoded unconditionally and validity is
 * checked once at the end, so the hot path carries no per-digit branch.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/export.hpp"
#include "idforge/core/uuid.hpp"

#include <cstddef>
#include <string_view>

namespace idforge {
namespace core {
namespace hex {

/// Length of the hyphenated text form.
constexpr size_t ENCODED_SIZE = 36;

/// Length of the compact (separator-free) text form.
constexpr size_t COMPACT_SIZE = 32;

/**
 * @brief Write the hyphenated form of @p bytes into @p out.
 * @param out Buffer of at least ENCODED_SIZE chars; not NUL-terminated.
 */
IDFORGE_CORE_API void encode(const Uuid::Bytes& bytes, char* out) noexcept;

/**
 * @brief True if @p text has hyphens at 8, 13, 18 and 23 past @p offset.
 *
 * The caller guarantees text.size() >= offset + ENCODED_SIZE.
 */
IDFORGE_CORE_API bool hasHyphens(std::string_view text, size_t offset = 0) noexcept;

/**
 * @brief Decode the 32 digits of a hyphenated body starting at @p offset.
 *
 * Hyphen positions are skipped, not checked (see hasHyphens()).
 * @p out is written only on success.
 * @return False if any digit is not hexadecimal.
 */
IDFORGE_CORE_API bool decode(std::string_view text, size_t offset, Uuid::Bytes& out) noexcept;

/**
 * @brief Decode exactly COMPACT_SIZE contiguous digits.
 *
 * @p out is written only on success.
 */
IDFORGE_CORE_API bool decodeCompact(std::string_view text, Uuid::Bytes& out) noexcept;

}  // namespace hex
}  // namespace core
}  // namespace idforge
