/**
 * @file generator.hpp
 * @brief Monotonic version 7 (Unix time-ordered) generation.
 *
 * Each Generator keeps a 60-bit "last sequence": the 48-bit millisecond
 * timestamp followed by a 12-bit sub-millisecond counter. Every call
 * derives a candidate from the clock and, if it does not exceed the last
 * sequence, uses last + 1 instead. The counter therefore carries into the
 * millisecond field when generation outpaces the clock, and the emitted
 * timestamp may run ahead of the wall clock.
 *
 * Guarantee: every identifier from one Generator compares greater than
 * every earlier identifier from the same Generator. Separate instances
 * give no ordering guarantee relative to each other.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/export.hpp"
#include "idforge/core/uuid.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace idforge {
namespace core {

/**
 * @brief Wall-clock reading used by time-ordered generation.
 */
using TimeSource = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief TimeSource reading std::chrono::system_clock.
 */
IDFORGE_CORE_API TimeSource systemTimeSource();

/**
 * @class Generator
 * @brief Thread-safe v7 generator with per-instance monotonicity.
 *
 * Usage:
 * @code
 * Generator gen;                       // isolated ordering stream
 * Uuid a = gen.newV7();
 * Uuid b = gen.newV7();                // b > a
 *
 * auto ids = gen.newV7Batch(1000);     // strictly increasing, all > b
 *
 * Uuid c = Generator::defaultInstance().newV7();
 * @endcode
 */
class IDFORGE_CORE_API Generator {
public:
    Generator();

    /**
     * @brief Create a generator reading time from @p clock.
     *
     * Lets hosts supply a corrected or simulated clock.
     */
    explicit Generator(TimeSource clock);

    ~Generator() = default;

    // Non-copyable: the sequence state defines the ordering stream
    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * @brief Generate one version 7 identifier.
     */
    Uuid newV7();

    /**
     * @brief Generate @p count identifiers with one clock read and one
     * bulk random read.
     *
     * The result is strictly increasing and ordered after every earlier
     * output of this instance, exactly as @p count calls to newV7() would be.
     */
    std::vector<Uuid> newV7Batch(size_t count);

    /**
     * @brief Last sequence handed out ((ms << 12) | counter), 0 if none.
     */
    uint64_t lastSequence() const;

    /**
     * @brief Process-wide shared instance, created on first use.
     */
    static Generator& defaultInstance();

private:
    // Reserve @p count consecutive sequences; returns the first.
    uint64_t reserve(uint64_t candidate, uint64_t count);

    TimeSource clock_;

    mutable std::mutex mutex_;
    uint64_t lastSequence_ = 0;
};

}  // namespace core
}  // namespace idforge
