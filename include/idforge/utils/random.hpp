/**
 * @file random.hpp
 * @brief Cryptographically secure random bytes (OpenSSL RAND_bytes).
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/utils/export.hpp"

#include <cstddef>
#include <cstdint>

namespace idforge {
namespace utils {

/**
 * @brief Fill @p length bytes at @p out with CSPRNG output.
 *
 * Never returns on failure: an exhausted or broken entropy source is an
 * environment fault and is reported through LOG_FATAL.
 */
IDFORGE_UTILS_API void fillRandom(uint8_t* out, size_t length);

}  // namespace utils
}  // namespace idforge
