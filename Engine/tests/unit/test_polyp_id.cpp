/**
 * @file test_polyp_id.cpp
 * @brief UUIDv7 Polyp identifiers
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/polyp_id.hpp>
#include <utils/time.hpp>
#include <set>
#include <unordered_set>

using namespace Reef;

TEST(PolypIdTest, VersionAndVariantBits) {
    PolypId id = PolypId::generate();
    const auto& b = id.bytes();

    EXPECT_EQ(b[6] >> 4, 0x7);
    EXPECT_EQ(b[8] & 0xC0, 0x80);
    EXPECT_FALSE(id.is_nil());
}

TEST(PolypIdTest, EmbedsCreationTime) {
    Timestamp before = now_ms();
    PolypId id = PolypId::generate();
    Timestamp after = now_ms();

    // The sequence may borrow a millisecond ahead under heavy generation
    EXPECT_GE(id.timestamp_ms(), before);
    EXPECT_LE(id.timestamp_ms(), after + 1);
}

TEST(PolypIdTest, StrictlyIncreasingWithinProcess) {
    PolypId prev = PolypId::generate();
    for (int i = 0; i < 10000; ++i) {
        PolypId next = PolypId::generate();
        ASSERT_LT(prev, next);
        prev = next;
    }
}

TEST(PolypIdTest, TextRoundTrip) {
    PolypId id = PolypId::generate();
    std::string text = id.to_string();

    EXPECT_EQ(text.size(), 36u);
    EXPECT_EQ(text[14], '7');
    EXPECT_EQ(PolypId::parse(text), id);
}

TEST(PolypIdTest, ParseAcceptsUppercase) {
    PolypId id = PolypId::parse("0190F3A2-1B2C-7D3E-8F40-0123456789AB");
    EXPECT_EQ(id.to_string(), "0190f3a2-1b2c-7d3e-8f40-0123456789ab");
}

TEST(PolypIdTest, ParseRejectsMalformed) {
    EXPECT_THROW(PolypId::parse(""), ValidationError);
    EXPECT_THROW(PolypId::parse("0190f3a2-1b2c-7d3e-8f40-0123456789a"), ValidationError);
    EXPECT_THROW(PolypId::parse("0190f3a2x1b2c-7d3e-8f40-0123456789ab"), ValidationError);
    EXPECT_THROW(PolypId::parse("0190f3a2-1b2c-7d3e-8f40-0123456789zz"), ValidationError);
}

TEST(PolypIdTest, NilByDefault) {
    PolypId id;
    EXPECT_TRUE(id.is_nil());
    EXPECT_EQ(id.to_string(), "00000000-0000-0000-0000-000000000000");
}

TEST(PolypIdTest, UsableAsHashKey) {
    std::unordered_set<PolypId, PolypIdHash> ids;
    for (int i = 0; i < 1000; ++i) ids.insert(PolypId::generate());
    EXPECT_EQ(ids.size(), 1000u);
}
