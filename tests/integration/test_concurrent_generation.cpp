/**
 * @file test_concurrent_generation.cpp
 * @brief Integration test: many threads sharing generators, pools and the
 * default instance
 */

#include <gtest/gtest.h>
#include <idforge/core/generate.hpp>
#include <idforge/core/generator.hpp>
#include <idforge/core/marshal.hpp>
#include <idforge/core/parse.hpp>
#include <idforge/core/pool.hpp>
#include <idforge/utils/config.hpp>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace idforge;

class ConcurrentGenerationTest : public ::testing::Test {
protected:
    static constexpr int NUM_THREADS = 8;
    static constexpr int PER_THREAD = 2000;

    void SetUp() override {
        utils::Config config;
        config.log_level = "WARN";
        utils::applyConfig(config);
    }

    // Runs fn(thread_index) on NUM_THREADS threads and joins them
    template<typename Fn>
    static void runThreads(Fn fn) {
        std::vector<std::thread> threads;
        for (int t = 0; t < NUM_THREADS; ++t) {
            threads.emplace_back(fn, t);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }
};

TEST_F(ConcurrentGenerationTest, SharedGeneratorKeepsPerThreadOrderAndUniqueness) {
    core::Generator generator;
    std::vector<std::vector<core::Uuid>> perThread(NUM_THREADS);

    runThreads([&](int t) {
        auto& out = perThread[t];
        out.reserve(PER_THREAD);
        for (int i = 0; i < PER_THREAD; ++i) {
            if (i % 100 == 0) {
                auto batch = generator.newV7Batch(10);
                out.insert(out.end(), batch.begin(), batch.end());
            } else {
                out.push_back(generator.newV7());
            }
        }
    });

    std::set<core::Uuid> all;
    for (const auto& ids : perThread) {
        // Each thread observes a strictly increasing stream
        for (size_t i = 1; i < ids.size(); ++i) {
            ASSERT_LT(ids[i - 1], ids[i]);
        }
        all.insert(ids.begin(), ids.end());
    }

    size_t total = 0;
    for (const auto& ids : perThread) {
        total += ids.size();
    }
    EXPECT_EQ(all.size(), total);

    // The last sequence is the largest one handed out
    const core::Uuid newest = *all.rbegin();
    const uint64_t ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        newest.timestamp().time_since_epoch()).count());
    EXPECT_EQ(generator.lastSequence() >> 12, ms);
}

TEST_F(ConcurrentGenerationTest, SharedPoolProducesUniqueValues) {
    core::Pool pool(32);
    std::mutex mutex;
    std::unordered_set<core::Uuid> v4s;
    std::unordered_set<core::Uuid> v7s;

    runThreads([&](int) {
        std::vector<core::Uuid> local4;
        std::vector<core::Uuid> local7;
        for (int i = 0; i < PER_THREAD; ++i) {
            local4.push_back(pool.newV4());
            local7.push_back(pool.newV7());
        }
        ASSERT_TRUE(std::is_sorted(local7.begin(), local7.end()));

        std::lock_guard<std::mutex> lock(mutex);
        v4s.insert(local4.begin(), local4.end());
        v7s.insert(local7.begin(), local7.end());
    });

    EXPECT_EQ(v4s.size(), static_cast<size_t>(NUM_THREADS * PER_THREAD));
    EXPECT_EQ(v7s.size(), static_cast<size_t>(NUM_THREADS * PER_THREAD));
}

TEST_F(ConcurrentGenerationTest, StatelessOperationsAreThreadSafe) {
    const core::Uuid expected = core::newV5(core::NAMESPACE_DNS, "www.example.com");
    std::mutex mutex;
    std::unordered_set<core::Uuid> randoms;

    runThreads([&](int) {
        std::vector<core::Uuid> local;
        for (int i = 0; i < PER_THREAD / 4; ++i) {
            EXPECT_EQ(core::newV5(core::NAMESPACE_DNS, "www.example.com"), expected);

            core::Uuid id = core::newV4();
            EXPECT_EQ(core::parse(core::marshalText(id)), id);
            local.push_back(id);
        }
        std::lock_guard<std::mutex> lock(mutex);
        randoms.insert(local.begin(), local.end());
    });

    EXPECT_EQ(randoms.size(), static_cast<size_t>(NUM_THREADS * (PER_THREAD / 4)));
}

TEST_F(ConcurrentGenerationTest, DefaultInstanceFromManyThreads) {
    std::mutex mutex;
    std::set<core::Uuid> all;

    runThreads([&](int) {
        std::vector<core::Uuid> local;
        for (int i = 0; i < PER_THREAD; ++i) {
            local.push_back(core::newV7());
        }
        ASSERT_TRUE(std::is_sorted(local.begin(), local.end()));

        std::lock_guard<std::mutex> lock(mutex);
        all.insert(local.begin(), local.end());
    });

    EXPECT_EQ(all.size(), static_cast<size_t>(NUM_THREADS * PER_THREAD));
}
