/**
 * @file digest.hpp
 * @brief Incremental MD5 / SHA-1 digests with state duplication.
 *
 * Thin RAII wrapper over an OpenSSL EVP_MD_CTX. Copying a Digest clones
 * the absorbed state, so a context primed with a common prefix can be
 * reused for many messages.
 *
 * Usage:
 * @code
 * Digest primed(Digest::Algorithm::SHA1);
 * primed.update(prefix, 16);
 *
 * Digest d = primed;          // duplicate state
 * d.update(name.data(), name.size());
 * Digest::Output out = d.finalize();
 * @endcode
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/utils/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

// Forward declaration for the OpenSSL context
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace idforge {
namespace utils {

class IDFORGE_UTILS_API Digest {
public:
    enum class Algorithm {
        MD5,    ///< 16-byte output
        SHA1    ///< 20-byte output
    };

    /**
     * @brief Digest bytes plus the number of valid leading bytes.
     */
    struct Output {
        std::array<uint8_t, 64> bytes{};
        size_t size = 0;
    };

    explicit Digest(Algorithm algorithm);
    ~Digest();

    Digest(const Digest& other);
    Digest& operator=(const Digest& other);

    Digest(Digest&& other) noexcept;
    Digest& operator=(Digest&& other) noexcept;

    void update(const void* data, size_t length);

    /**
     * @brief Finish the computation.
     *
     * The context cannot be updated afterwards; copy it first if the
     * absorbed state is still needed.
     */
    Output finalize();

    Algorithm algorithm() const { return algorithm_; }

    static size_t outputSize(Algorithm algorithm);

private:
    Algorithm algorithm_;
    EVP_MD_CTX* ctx_;
};

}  // namespace utils
}  // namespace idforge
