/**
 * @file parse.hpp
 * @brief Text and binary ingestion of identifiers.
 *
 * Strict parsing accepts only xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
 * Lenient parsing dispatches on length alone:
 * - 36  standard     xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
 * - 45  URN          urn:uuid:xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
 * - 38  braced       {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}
 * - 32  compact      xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx
 * Hex digits are case-insensitive in every form.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/errors.hpp"
#include "idforge/core/export.hpp"
#include "idforge/core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace idforge {
namespace core {

/**
 * @brief Parse the standard 36-character form.
 * @throws ParseError on any other input, including URN/braced/compact.
 */
IDFORGE_CORE_API Uuid parse(std::string_view text);

/**
 * @brief Parse any of the standard, URN, braced or compact forms.
 * @throws ParseError on malformed input or an unrecognised length.
 */
IDFORGE_CORE_API Uuid parseLenient(std::string_view text);

/**
 * @brief Non-throwing parse(); std::nullopt on failure.
 */
IDFORGE_CORE_API std::optional<Uuid> tryParse(std::string_view text) noexcept;

/**
 * @brief Non-throwing parseLenient(); std::nullopt on failure.
 */
IDFORGE_CORE_API std::optional<Uuid> tryParseLenient(std::string_view text) noexcept;

/**
 * @brief Strict parse for literals known to be valid.
 *
 * An invalid literal is a programming error: it is logged through
 * LOG_FATAL and the process aborts. Never use on untrusted input.
 */
IDFORGE_CORE_API Uuid mustParse(std::string_view text) noexcept;

/**
 * @brief Copy exactly Uuid::SIZE raw bytes into a new value.
 * @throws LengthError if @p length != Uuid::SIZE.
 */
IDFORGE_CORE_API Uuid fromBytes(const uint8_t* data, size_t length);

IDFORGE_CORE_API Uuid fromBytes(const std::vector<uint8_t>& data);

}  // namespace core
}  // namespace idforge
