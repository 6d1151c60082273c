/**
 * @file generate.hpp
 * @brief Stateless identifier construction (v3, v4, v5, v8) and the
 * default-instance v7 shortcut.
 *
 * None of these functions has a recoverable failure path. A broken
 * randomness or digest engine is an environment fault and aborts through
 * LOG_FATAL.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/export.hpp"
#include "idforge/core/uuid.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace idforge {
namespace core {

/**
 * @brief Random identifier: 122 CSPRNG bits, version 4, RFC 9562 variant.
 */
IDFORGE_CORE_API Uuid newV4();

/**
 * @brief @p count random identifiers from a single bulk random read.
 */
IDFORGE_CORE_API std::vector<Uuid> newV4Batch(size_t count);

/**
 * @brief Name-based identifier, MD5 of namespace bytes followed by @p name.
 *
 * Deterministic. Prefer newV5() unless interoperating with v3 producers.
 */
IDFORGE_CORE_API Uuid newV3(const Uuid& ns, std::string_view name);

/**
 * @brief Name-based identifier, SHA-1 of namespace bytes followed by @p name.
 */
IDFORGE_CORE_API Uuid newV5(const Uuid& ns, std::string_view name);

/**
 * @brief Custom identifier.
 *
 * Only the version nibble (8) and variant bits are overwritten; the other
 * 122 bits are kept exactly as supplied. Uniqueness is up to the caller.
 */
IDFORGE_CORE_API Uuid newV8(const Uuid::Bytes& payload);

/**
 * @brief Time-ordered identifier from Generator::defaultInstance().
 *
 * Use a dedicated Generator when ordering must be isolated per stream.
 */
IDFORGE_CORE_API Uuid newV7();

}  // namespace core
}  // namespace idforge
