/**
 * @file digest.cpp
 * @brief EVP-backed Digest implementation.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/utils/digest.hpp"
#include "idforge/utils/logger.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <utility>

namespace idforge {
namespace utils {

namespace {

const EVP_MD* evpMethod(Digest::Algorithm algorithm) {
    switch (algorithm) {
        case Digest::Algorithm::MD5:  return EVP_md5();
        case Digest::Algorithm::SHA1: return EVP_sha1();
    }
    return nullptr;
}

EVP_MD_CTX* newContext() {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        LOG_FATAL("Digest", "EVP_MD_CTX_new failed: error {}", ERR_get_error());
    }
    return ctx;
}

}  // namespace

Digest::Digest(Algorithm algorithm)
    : algorithm_(algorithm)
    , ctx_(newContext())
{
    if (EVP_DigestInit_ex(ctx_, evpMethod(algorithm_), nullptr) != 1) {
        LOG_FATAL("Digest", "EVP_DigestInit_ex failed: error {}", ERR_get_error());
    }
}

Digest::~Digest() {
    EVP_MD_CTX_free(ctx_);
}

Digest::Digest(const Digest& other)
    : algorithm_(other.algorithm_)
    , ctx_(newContext())
{
    if (EVP_MD_CTX_copy_ex(ctx_, other.ctx_) != 1) {
        LOG_FATAL("Digest", "EVP_MD_CTX_copy_ex failed: error {}", ERR_get_error());
    }
}

Digest& Digest::operator=(const Digest& other) {
    if (this != &other) {
        Digest copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Digest::Digest(Digest&& other) noexcept
    : algorithm_(other.algorithm_)
    , ctx_(std::exchange(other.ctx_, nullptr))
{}

Digest& Digest::operator=(Digest&& other) noexcept {
    if (this != &other) {
        EVP_MD_CTX_free(ctx_);
        algorithm_ = other.algorithm_;
        ctx_ = std::exchange(other.ctx_, nullptr);
    }
    return *this;
}

void Digest::update(const void* data, size_t length) {
    if (EVP_DigestUpdate(ctx_, data, length) != 1) {
        LOG_FATAL("Digest", "EVP_DigestUpdate failed: error {}", ERR_get_error());
    }
}

Digest::Output Digest::finalize() {
    static_assert(EVP_MAX_MD_SIZE <= 64, "Output buffer too small for EVP digests");

    Output out;
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_, out.bytes.data(), &length) != 1) {
        LOG_FATAL("Digest", "EVP_DigestFinal_ex failed: error {}", ERR_get_error());
    }
    out.size = length;
    return out;
}

size_t Digest::outputSize(Algorithm algorithm) {
    return static_cast<size_t>(EVP_MD_get_size(evpMethod(algorithm)));
}

}  // namespace utils
}  // namespace idforge
