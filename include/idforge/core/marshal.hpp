/**
 * @file marshal.hpp
 * @brief Text and binary encoding contracts for serialization layers.
 *
 * Unmarshalling is strict and returns a new value; nothing is written
 * through an output parameter, so a failed decode cannot leave a
 * half-updated identifier behind.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/errors.hpp"
#include "idforge/core/export.hpp"
#include "idforge/core/uuid.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace idforge {
namespace core {

/**
 * @brief Canonical 36-character form.
 */
IDFORGE_CORE_API std::string marshalText(const Uuid& id);

/**
 * @brief Strict parse of the canonical form.
 * @throws ParseError carrying @p text.
 */
IDFORGE_CORE_API Uuid unmarshalText(std::string_view text);

/**
 * @brief The raw 16 bytes.
 */
IDFORGE_CORE_API std::vector<uint8_t> marshalBinary(const Uuid& id);

/**
 * @throws LengthError unless @p data holds exactly 16 bytes.
 */
IDFORGE_CORE_API Uuid unmarshalBinary(const std::vector<uint8_t>& data);

/**
 * @brief Append the canonical form to @p out.
 *
 * Writes in place when @p out has 36 bytes of spare capacity; otherwise
 * reserves twice the required size before writing.
 */
IDFORGE_CORE_API void appendText(const Uuid& id, std::string& out);

IDFORGE_CORE_API void appendText(const Uuid& id, std::vector<uint8_t>& out);

/**
 * @brief Append the raw 16 bytes to @p out, same growth policy as appendText().
 */
IDFORGE_CORE_API void appendBinary(const Uuid& id, std::vector<uint8_t>& out);

}  // namespace core
}  // namespace idforge
