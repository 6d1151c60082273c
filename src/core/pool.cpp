/**
 * @file pool.cpp
 * @brief Pool implementation.
 *
 * Buffers start empty (cursor == size) so no random material is read
 * until the first call.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/pool.hpp"
#include "idforge/core/generate.hpp"
#include "idforge/utils/logger.hpp"
#include "idforge/utils/random.hpp"

#include "layout.hpp"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace idforge {
namespace core {

namespace {

constexpr size_t TAIL_SIZE = 8;

size_t checkedSize(size_t size) {
    if (size == 0) {
        throw std::invalid_argument("Pool size must be greater than zero");
    }
    return size;
}

}  // namespace

Pool::Pool(size_t size)
    : Pool(size, systemTimeSource())
{}

Pool::Pool(size_t size, TimeSource clock)
    : size_(checkedSize(size))
    , clock_(clock ? std::move(clock) : systemTimeSource())
    , v4Cursor_(size_)
    , v7Cursor_(size_)
{}

Pool::Pool(const utils::Config& config)
    : Pool(config.pool_size)
{}

void Pool::refillV4() {
    v4Buffer_ = newV4Batch(size_);
    v4Cursor_ = 0;
    LOG_TRACE("Pool", "Refilled {} v4 identifiers", size_);
}

void Pool::refillV7() {
    v7Tails_.resize(size_ * TAIL_SIZE);
    utils::fillRandom(v7Tails_.data(), v7Tails_.size());
    v7Cursor_ = 0;
    LOG_TRACE("Pool", "Refilled {} v7 random tails", size_);
}

Uuid Pool::newV4() {
    std::lock_guard<std::mutex> lock(v4Mutex_);
    if (v4Cursor_ >= size_) {
        refillV4();
    }
    return v4Buffer_[v4Cursor_++];
}

Uuid Pool::newV7() {
    Uuid::Bytes bytes;
    const uint64_t candidate = layout::sequenceFor(clock_());

    std::lock_guard<std::mutex> lock(v7Mutex_);
    if (v7Cursor_ >= size_) {
        refillV7();
    }
    std::memcpy(bytes.data() + 8, v7Tails_.data() + v7Cursor_ * TAIL_SIZE, TAIL_SIZE);
    ++v7Cursor_;

    const uint64_t sequence = layout::nextSequence(candidate, lastSequence_);
    lastSequence_ = sequence;

    layout::stampV7(bytes.data(), sequence);
    return Uuid(bytes);
}

}  // namespace core
}  // namespace idforge
