/**
 * @file test_generator.cpp
 * @brief Unit tests for monotonic v7 generation
 *
 * Tests cover:
 * - Layout of the timestamp, version and counter fields
 * - Strict ordering with a frozen or regressing clock
 * - Counter carry into the millisecond field
 * - Batch generation and interleaving with single calls
 */

#include <gtest/gtest.h>
#include <idforge/core/generate.hpp>
#include <idforge/core/generator.hpp>

#include <atomic>
#include <chrono>
#include <memory>

using namespace idforge::core;
using std::chrono::milliseconds;
using std::chrono::nanoseconds;
using std::chrono::system_clock;

namespace {

constexpr int64_t BASE_MS = 1645557742000LL;

system_clock::time_point at(int64_t ms, int64_t extraNanos = 0) {
    return system_clock::time_point(
        std::chrono::duration_cast<system_clock::duration>(
            milliseconds(ms) + nanoseconds(extraNanos)));
}

int64_t millisOf(const Uuid& id) {
    return std::chrono::duration_cast<milliseconds>(id.timestamp().time_since_epoch()).count();
}

// 12-bit counter stored in byte 6 (low nibble) and byte 7.
unsigned counterOf(const Uuid& id) {
    return (static_cast<unsigned>(id.data()[6] & 0x0F) << 8) | id.data()[7];
}

}  // namespace

class GeneratorTest : public ::testing::Test {
protected:
    // Clock that returns whatever now_ holds
    TimeSource manualClock() {
        return [this] { return now_; };
    }

    system_clock::time_point now_ = at(BASE_MS);
};

// =============================================================================
// Layout
// =============================================================================

TEST_F(GeneratorTest, EmbedsClockMilliseconds) {
    Generator gen(manualClock());
    Uuid id = gen.newV7();

    EXPECT_EQ(id.version(), Version::V7);
    EXPECT_EQ(id.variant(), Variant::RFC9562);
    EXPECT_EQ(millisOf(id), BASE_MS);
    EXPECT_EQ(id.toString().substr(0, 13), "017f22e2-79b0");
}

TEST_F(GeneratorTest, SubMillisecondFractionInCounter) {
    // 500000 ns into the millisecond -> 500000 * 4096 / 1e6 = 2048
    now_ = at(BASE_MS, 500000);
    Generator gen(manualClock());

    Uuid id = gen.newV7();
    EXPECT_EQ(millisOf(id), BASE_MS);
    EXPECT_EQ(counterOf(id), 2048u);
    EXPECT_EQ(gen.lastSequence(), (static_cast<uint64_t>(BASE_MS) << 12) | 2048u);
}

TEST_F(GeneratorTest, StartsWithZeroSequence) {
    Generator gen;
    EXPECT_EQ(gen.lastSequence(), 0u);
}

// =============================================================================
// Monotonicity
// =============================================================================

TEST_F(GeneratorTest, FrozenClockStaysStrictlyIncreasing) {
    Generator gen(manualClock());

    Uuid previous = gen.newV7();
    for (int i = 0; i < 5000; ++i) {
        Uuid next = gen.newV7();
        ASSERT_GT(next, previous) << "at iteration " << i;
        previous = next;
    }
}

TEST_F(GeneratorTest, CounterCarriesIntoMilliseconds) {
    Generator gen(manualClock());

    // Counter starts at 0 for an exact millisecond and wraps after 4096 calls
    Uuid first = gen.newV7();
    EXPECT_EQ(counterOf(first), 0u);

    Uuid last;
    for (int i = 1; i < 4096; ++i) {
        last = gen.newV7();
    }
    EXPECT_EQ(millisOf(last), BASE_MS);
    EXPECT_EQ(counterOf(last), 4095u);

    Uuid carried = gen.newV7();
    EXPECT_EQ(millisOf(carried), BASE_MS + 1);
    EXPECT_EQ(counterOf(carried), 0u);
    EXPECT_GT(carried, last);
}

TEST_F(GeneratorTest, ClockGoingBackwardsKeepsOrder) {
    Generator gen(manualClock());
    Uuid before = gen.newV7();

    now_ = at(BASE_MS - 10000);
    Uuid after = gen.newV7();

    EXPECT_GT(after, before);
    EXPECT_EQ(millisOf(after), BASE_MS);
}

TEST_F(GeneratorTest, AdvancingClockResetsToWallTime) {
    Generator gen(manualClock());
    gen.newV7();
    gen.newV7();

    now_ = at(BASE_MS + 5);
    Uuid id = gen.newV7();
    EXPECT_EQ(millisOf(id), BASE_MS + 5);
    EXPECT_EQ(counterOf(id), 0u);
}

TEST_F(GeneratorTest, InstancesAreIndependent) {
    Generator a(manualClock());
    Generator b(manualClock());

    Uuid fromA = a.newV7();
    Uuid fromB = b.newV7();

    // Same clock, fresh state: identical 60-bit sequence
    EXPECT_EQ(a.lastSequence(), b.lastSequence());
    EXPECT_EQ(millisOf(fromA), millisOf(fromB));
    EXPECT_NE(fromA, fromB);
}

TEST_F(GeneratorTest, NullTimeSourceFallsBackToSystemClock) {
    Generator gen{TimeSource()};
    Uuid id = gen.newV7();

    const auto now = std::chrono::duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
    EXPECT_NEAR(static_cast<double>(millisOf(id)), static_cast<double>(now), 5000.0);
}

// =============================================================================
// Batch
// =============================================================================

TEST_F(GeneratorTest, BatchIsStrictlyIncreasing) {
    Generator gen(manualClock());
    auto ids = gen.newV7Batch(10000);

    ASSERT_EQ(ids.size(), 10000u);
    for (size_t i = 1; i < ids.size(); ++i) {
        ASSERT_GT(ids[i], ids[i - 1]) << "at index " << i;
        EXPECT_EQ(ids[i].version(), Version::V7);
    }
}

TEST_F(GeneratorTest, BatchReadsClockOnce) {
    auto reads = std::make_shared<std::atomic<int>>(0);
    Generator gen([this, reads] {
        reads->fetch_add(1);
        return now_;
    });

    gen.newV7Batch(100);
    EXPECT_EQ(reads->load(), 1);
}

TEST_F(GeneratorTest, BatchAdvancesSequenceByCount) {
    Generator gen(manualClock());
    auto ids = gen.newV7Batch(3);

    const uint64_t base = static_cast<uint64_t>(BASE_MS) << 12;
    EXPECT_EQ(gen.lastSequence(), base + 2);
    EXPECT_EQ(counterOf(ids[0]), 0u);
    EXPECT_EQ(counterOf(ids[2]), 2u);
}

TEST_F(GeneratorTest, EmptyBatchLeavesStateUntouched) {
    Generator gen(manualClock());
    gen.newV7();
    const uint64_t before = gen.lastSequence();

    EXPECT_TRUE(gen.newV7Batch(0).empty());
    EXPECT_EQ(gen.lastSequence(), before);
}

TEST_F(GeneratorTest, InterleavedSingleAndBatchCalls) {
    Generator gen(manualClock());

    Uuid previous = gen.newV7();
    for (int round = 0; round < 50; ++round) {
        for (const auto& id : gen.newV7Batch(37)) {
            ASSERT_GT(id, previous);
            previous = id;
        }
        Uuid single = gen.newV7();
        ASSERT_GT(single, previous);
        previous = single;
    }
}

// =============================================================================
// Default Instance
// =============================================================================

TEST_F(GeneratorTest, DefaultInstanceIsShared) {
    Generator& a = Generator::defaultInstance();
    Generator& b = Generator::defaultInstance();
    EXPECT_EQ(&a, &b);

    Uuid first = a.newV7();
    Uuid second = b.newV7();
    EXPECT_GT(second, first);
}

TEST_F(GeneratorTest, DefaultInstanceBacksFreeFunction) {
    Uuid id = newV7();
    const uint64_t last = Generator::defaultInstance().lastSequence();

    EXPECT_EQ(static_cast<int64_t>(last >> 12), millisOf(id));
    EXPECT_EQ(last & 0xFFF, counterOf(id));
}
