/**
 * @file generator.cpp
 * @brief Generator implementation.
 *
 * Only the compare-and-bump of the sequence runs under the lock; the
 * random tail is read and the clock sampled before it is taken.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/generator.hpp"
#include "idforge/utils/logger.hpp"
#include "idforge/utils/random.hpp"

#include "layout.hpp"

#include <algorithm>
#include <utility>

namespace idforge {
namespace core {

TimeSource systemTimeSource() {
    return [] { return std::chrono::system_clock::now(); };
}

Generator::Generator()
    : clock_(systemTimeSource())
{}

Generator::Generator(TimeSource clock)
    : clock_(clock ? std::move(clock) : systemTimeSource())
{}

uint64_t Generator::reserve(uint64_t candidate, uint64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t first = layout::nextSequence(candidate, lastSequence_);
    lastSequence_ = first + count - 1;
    return first;
}

Uuid Generator::newV7() {
    Uuid::Bytes bytes;
    utils::fillRandom(bytes.data() + 8, 8);

    const uint64_t sequence = reserve(layout::sequenceFor(clock_()), 1);

    layout::stampV7(bytes.data(), sequence);
    return Uuid(bytes);
}

std::vector<Uuid> Generator::newV7Batch(size_t count) {
    std::vector<Uuid> ids;
    if (count == 0) {
        return ids;
    }
    ids.reserve(count);

    std::vector<uint8_t> tails(count * 8);
    utils::fillRandom(tails.data(), tails.size());

    const uint64_t first = reserve(layout::sequenceFor(clock_()), count);

    Uuid::Bytes bytes;
    for (size_t i = 0; i < count; ++i) {
        std::copy(tails.begin() + i * 8, tails.begin() + (i + 1) * 8, bytes.begin() + 8);
        layout::stampV7(bytes.data(), first + i);
        ids.emplace_back(bytes);
    }

    LOG_TRACE("Generator", "Issued batch of {} starting at sequence {}", count, first);
    return ids;
}

uint64_t Generator::lastSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSequence_;
}

Generator& Generator::defaultInstance() {
    static Generator instance = [] {
        LOG_DEBUG("Generator", "Creating process-wide default generator");
        return Generator();
    }();
    return instance;
}

}  // namespace core
}  // namespace idforge
