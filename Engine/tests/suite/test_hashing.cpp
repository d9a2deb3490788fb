/**
 * @file test_hashing.cpp
 * @brief Unit tests for BLAKE3 hashing pipeline
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Reef;

TEST(HashingTest, Determinism) {
    std::string data = "The speed of light is 299792458 m/s";
    auto hash1 = BLAKE3Pipeline::hash(data);
    auto hash2 = BLAKE3Pipeline::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = BLAKE3Pipeline::hash("test1");
    auto hash2 = BLAKE3Pipeline::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, KnownEmptyDigest) {
    // BLAKE3 of the empty input
    EXPECT_EQ(BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("")),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(HashingTest, VectorHashIsLittleEndianFloatBytes) {
    std::vector<float> v = {1.0f, -0.5f};
    // 1.0f = 0x3F800000, -0.5f = 0xBF000000
    std::vector<uint8_t> bytes = {0x00, 0x00, 0x80, 0x3F, 0x00, 0x00, 0x00, 0xBF};

    EXPECT_EQ(BLAKE3Pipeline::hash_vector(v), BLAKE3Pipeline::hash(bytes));
}

TEST(HashingTest, VectorHashSpansChunks) {
    std::vector<float> v(1000);
    for (size_t i = 0; i < v.size(); ++i) v[i] = static_cast<float>(i) * 0.25f;

    std::vector<uint8_t> bytes;
    for (float f : v) {
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        for (int s = 0; s < 32; s += 8) bytes.push_back(static_cast<uint8_t>((bits >> s) & 0xFF));
    }

    EXPECT_EQ(BLAKE3Pipeline::hash_vector(v), BLAKE3Pipeline::hash(bytes));
}

TEST(HashingTest, KeyedHashDependsOnKey) {
    auto k1 = BLAKE3Pipeline::hash("key-one");
    auto k2 = BLAKE3Pipeline::hash("key-two");
    std::string msg = "message";

    auto a = BLAKE3Pipeline::keyed_hash(k1, msg.data(), msg.size());
    auto b = BLAKE3Pipeline::keyed_hash(k1, msg.data(), msg.size());
    auto c = BLAKE3Pipeline::keyed_hash(k2, msg.data(), msg.size());

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, BLAKE3Pipeline::hash(msg));
}

TEST(HashingTest, PairIsOrdered) {
    auto l = BLAKE3Pipeline::hash("left");
    auto r = BLAKE3Pipeline::hash("right");

    EXPECT_NE(BLAKE3Pipeline::hash_pair(l, r), BLAKE3Pipeline::hash_pair(r, l));
}

TEST(HashingTest, HexConversion) {
    std::string data = "hex_test";
    auto hash = BLAKE3Pipeline::hash(data);
    std::string hex = BLAKE3Pipeline::to_hex(hash);
    auto hash_rt = BLAKE3Pipeline::from_hex(hex);

    EXPECT_EQ(hash, hash_rt);
    EXPECT_EQ(hex.length(), 64u); // 32 bytes * 2
}

TEST(HashingTest, FromHexRejectsMalformed) {
    EXPECT_THROW(BLAKE3Pipeline::from_hex("abc"), std::invalid_argument);
    EXPECT_THROW(BLAKE3Pipeline::from_hex(std::string(64, 'z')), std::invalid_argument);
}

TEST(HashingTest, BatchHashing) {
    std::vector<std::string> inputs = {"a", "b", "c"};
    auto hashes = BLAKE3Pipeline::hash_batch(inputs);

    EXPECT_EQ(hashes.size(), 3u);
    EXPECT_EQ(hashes[0], BLAKE3Pipeline::hash("a"));
    EXPECT_EQ(hashes[1], BLAKE3Pipeline::hash("b"));
    EXPECT_EQ(hashes[2], BLAKE3Pipeline::hash("c"));
}
