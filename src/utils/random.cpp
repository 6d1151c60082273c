/**
 * @file random.cpp
 * @brief CSPRNG wrapper over OpenSSL.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/utils/random.hpp"
#include "idforge/utils/logger.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>

namespace idforge {
namespace utils {

void fillRandom(uint8_t* out, size_t length) {
    // RAND_bytes takes an int count
    while (length > 0) {
        const int chunk = length > static_cast<size_t>(INT_MAX)
            ? INT_MAX
            : static_cast<int>(length);
        if (RAND_bytes(out, chunk) != 1) {
            LOG_FATAL("Random", "RAND_bytes failed for {} bytes: error {}",
                      chunk, ERR_get_error());
        }
        out += chunk;
        length -= static_cast<size_t>(chunk);
    }
}

}  // namespace utils
}  // namespace idforge
