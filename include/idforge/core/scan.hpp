/**
 * @file scan.hpp
 * @brief Ingestion from and production of database column values.
 *
 * Persistence layers may store an identifier as raw binary or as any
 * conventional text encoding, so scanning is more permissive than
 * unmarshalText(): a 16-byte byte vector is copied verbatim, while text
 * goes through parseLenient(). Production always emits the canonical
 * 36-character string.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/errors.hpp"
#include "idforge/core/export.hpp"
#include "idforge/core/uuid.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace idforge {
namespace core {

/**
 * @brief Column value as handed over by a database driver.
 */
using DbValue = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>,
    std::chrono::system_clock::time_point
>;

/**
 * @brief Build an identifier from a column value.
 *
 * - std::vector<uint8_t> of 16 bytes: raw binary
 * - other std::vector<uint8_t>: text bytes, parsed leniently
 * - std::string: parsed leniently
 *
 * @throws TypeError for NULL, bool, integer, floating point or timestamp.
 * @throws ParseError for malformed text.
 */
IDFORGE_CORE_API Uuid scan(const DbValue& value);

/**
 * @brief scan() for nullable columns: NULL yields std::nullopt.
 */
IDFORGE_CORE_API std::optional<Uuid> scanOptional(const DbValue& value);

/**
 * @brief Column value for @p id: always the canonical string.
 */
IDFORGE_CORE_API DbValue value(const Uuid& id);

}  // namespace core
}  // namespace idforge
