/**
 * @file pool.hpp
 * @brief Buffered high-throughput generation.
 *
 * A Pool amortizes the random-source call across many identifiers. It
 * keeps two independent buffers, each refilled in one bulk read when its
 * cursor reaches the end:
 * - v4: fully stamped random identifiers
 * - v7: 8-byte random tails; clock read and sequence bump stay per call
 *
 * Output is indistinguishable from newV4() / Generator::newV7(). The v7
 * side keeps its own sequence state, so its ordering guarantee holds per
 * Pool and not across a Pool and a separate Generator.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/export.hpp"
#include "idforge/core/generator.hpp"
#include "idforge/core/uuid.hpp"
#include "idforge/utils/config.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace idforge {
namespace core {

/**
 * @class Pool
 * @brief Thread-safe buffered v4/v7 generator.
 *
 * Usage:
 * @code
 * Pool pool(utils::loadConfigFromEnv());
 * Uuid id = pool.newV7();
 * @endcode
 */
class IDFORGE_CORE_API Pool {
public:
    static constexpr size_t DEFAULT_SIZE = 256;

    /**
     * @brief Create a pool refilling @p size entries at a time.
     * @throws std::invalid_argument if @p size is 0.
     */
    explicit Pool(size_t size = DEFAULT_SIZE);

    Pool(size_t size, TimeSource clock);

    /**
     * @brief Create a pool sized by Config::pool_size.
     */
    explicit Pool(const utils::Config& config);

    ~Pool() = default;

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    Uuid newV4();

    Uuid newV7();

    size_t size() const { return size_; }

private:
    // Both called with the matching mutex held
    void refillV4();
    void refillV7();

    const size_t size_;
    TimeSource clock_;

    std::mutex v4Mutex_;
    std::vector<Uuid> v4Buffer_;
    size_t v4Cursor_;

    std::mutex v7Mutex_;
    std::vector<uint8_t> v7Tails_;
    size_t v7Cursor_;
    uint64_t lastSequence_ = 0;
};

}  // namespace core
}  // namespace idforge
