/**
 * @file test_generate.cpp
 * @brief Unit tests for stateless generation (v3, v4, v5, v8)
 */

#include <gtest/gtest.h>
#include <idforge/core/generate.hpp>

#include <set>
#include <string>

using namespace idforge::core;

class GenerateTest : public ::testing::Test {};

// =============================================================================
// Random (v4)
// =============================================================================

TEST_F(GenerateTest, V4VersionAndVariant) {
    for (int i = 0; i < 100; ++i) {
        Uuid id = newV4();
        EXPECT_EQ(id.version(), Version::V4);
        EXPECT_EQ(id.variant(), Variant::RFC9562);
        EXPECT_EQ(id.toString()[14], '4');
    }
}

TEST_F(GenerateTest, V4Unique) {
    std::set<Uuid> ids;
    const int count = 10000;
    for (int i = 0; i < count; ++i) {
        ids.insert(newV4());
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(count));
}

TEST_F(GenerateTest, V4BatchStampsEveryEntry) {
    auto ids = newV4Batch(500);
    ASSERT_EQ(ids.size(), 500u);

    std::set<Uuid> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), ids.size());

    for (const auto& id : ids) {
        EXPECT_EQ(id.version(), Version::V4);
        EXPECT_EQ(id.variant(), Variant::RFC9562);
    }
}

TEST_F(GenerateTest, V4BatchEmpty) {
    EXPECT_TRUE(newV4Batch(0).empty());
}

// =============================================================================
// Name-based (v3 / v5)
// =============================================================================

TEST_F(GenerateTest, V5KnownAnswer) {
    Uuid id = newV5(NAMESPACE_DNS, "www.example.com");
    EXPECT_EQ(id.toString(), "2ed6657d-e927-568b-95e1-2665a8aea6a2");
    EXPECT_EQ(id.version(), Version::V5);
    EXPECT_EQ(id.variant(), Variant::RFC9562);
}

TEST_F(GenerateTest, V3KnownAnswer) {
    Uuid id = newV3(NAMESPACE_DNS, "www.example.com");
    EXPECT_EQ(id.toString(), "5df41881-3aed-3515-88a7-2f4a814cf09e");
    EXPECT_EQ(id.version(), Version::V3);
    EXPECT_EQ(id.variant(), Variant::RFC9562);
}

TEST_F(GenerateTest, NameBasedIsDeterministic) {
    EXPECT_EQ(newV5(NAMESPACE_URL, "https://example.com/a"),
              newV5(NAMESPACE_URL, "https://example.com/a"));
    EXPECT_EQ(newV3(NAMESPACE_OID, "1.3.6.1"), newV3(NAMESPACE_OID, "1.3.6.1"));
}

TEST_F(GenerateTest, NameBasedDiffersByAlgorithmNamespaceAndName) {
    EXPECT_NE(newV3(NAMESPACE_DNS, "host"), newV5(NAMESPACE_DNS, "host"));
    EXPECT_NE(newV5(NAMESPACE_DNS, "host"), newV5(NAMESPACE_URL, "host"));
    EXPECT_NE(newV5(NAMESPACE_DNS, "host"), newV5(NAMESPACE_DNS, "host2"));
}

TEST_F(GenerateTest, CustomNamespaceMatchesWellKnownPath) {
    // A namespace rebuilt from bytes takes the same digest path as the constant
    Uuid rebuilt(NAMESPACE_X500.bytes());
    EXPECT_EQ(newV5(rebuilt, "CN=test"), newV5(NAMESPACE_X500, "CN=test"));

    Uuid custom = newV4();
    Uuid id = newV5(custom, "name");
    EXPECT_EQ(id.version(), Version::V5);
    EXPECT_EQ(id, newV5(custom, "name"));
}

TEST_F(GenerateTest, EmptyAndBinaryNames) {
    Uuid empty = newV5(NAMESPACE_DNS, "");
    EXPECT_EQ(empty.version(), Version::V5);
    EXPECT_EQ(empty, newV5(NAMESPACE_DNS, std::string()));

    const std::string binary("\x00\xff\x00", 3);
    EXPECT_NE(newV5(NAMESPACE_DNS, binary), newV5(NAMESPACE_DNS, std::string("\x00", 1)));
}

// =============================================================================
// Custom (v8)
// =============================================================================

TEST_F(GenerateTest, V8KeepsPayloadBits) {
    Uuid::Bytes payload{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15};
    Uuid id = newV8(payload);

    EXPECT_EQ(id.version(), Version::V8);
    EXPECT_EQ(id.variant(), Variant::RFC9562);

    Uuid::Bytes out = id.bytes();
    for (size_t i = 0; i < out.size(); ++i) {
        if (i == 6) {
            EXPECT_EQ(out[i] & 0x0F, payload[i] & 0x0F);
        } else if (i == 8) {
            EXPECT_EQ(out[i] & 0x3F, payload[i] & 0x3F);
        } else {
            EXPECT_EQ(out[i], payload[i]) << "byte " << i;
        }
    }
}

TEST_F(GenerateTest, V8OverwritesExistingTags) {
    Uuid::Bytes payload{};
    payload.fill(0xFF);

    Uuid id = newV8(payload);
    EXPECT_EQ(id.toString(), "ffffffff-ffff-8fff-bfff-ffffffffffff");
}

// =============================================================================
// Default v7
// =============================================================================

TEST_F(GenerateTest, DefaultV7IsIncreasing) {
    Uuid previous = newV7();
    for (int i = 0; i < 1000; ++i) {
        Uuid next = newV7();
        EXPECT_EQ(next.version(), Version::V7);
        EXPECT_GT(next, previous);
        previous = next;
    }
}
