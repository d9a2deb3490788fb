/**
 * @file test_format_utils.cpp
 * @brief Text encodings used for PostgreSQL parameters and results
 */

#include <gtest/gtest.h>
#include <storage/format_utils.hpp>
#include <cmath>
#include <stdexcept>

using namespace Reef;

TEST(FormatUtilsTest, ByteaHexLiteral) {
    const uint8_t bytes[] = {0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(bytes_to_bytea_hex(bytes, 4), "\\xdeadbeef");
    EXPECT_EQ(bytes_to_bytea_hex(bytes, 0), "\\x");
}

TEST(FormatUtilsTest, ByteaHexParse) {
    auto bytes = bytea_hex_to_bytes("\\xDEADbeef");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0xDE);
    EXPECT_EQ(bytes[3], 0xEF);

    EXPECT_THROW(bytea_hex_to_bytes("deadbeef"), std::invalid_argument);
    EXPECT_THROW(bytea_hex_to_bytes("\\xabc"), std::invalid_argument);
    EXPECT_THROW(bytea_hex_to_bytes("\\xzz"), std::invalid_argument);
}

TEST(FormatUtilsTest, HashFromBytea) {
    Hash256 h = BLAKE3Pipeline::hash("polyp");
    EXPECT_EQ(bytea_hex_to_hash(hash_to_bytea_hex(h)), h);
    EXPECT_THROW(bytea_hex_to_hash("\\xdeadbeef"), std::invalid_argument);
}

TEST(FormatUtilsTest, FloatArrayIsExact) {
    std::vector<float> v = {0.1f, -1.0f / 3.0f, 1e-20f, 123456.789f};
    std::string literal = float_array_literal(v);
    EXPECT_EQ(literal.front(), '{');
    EXPECT_EQ(literal.back(), '}');

    auto parsed = parse_float_array(literal);
    ASSERT_EQ(parsed.size(), v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        EXPECT_EQ(parsed[i], v[i]);
    }

    EXPECT_TRUE(parse_float_array("{}").empty());
    EXPECT_THROW(parse_float_array("1,2"), std::invalid_argument);
}

TEST(FormatUtilsTest, DoublesIncludingNaN) {
    EXPECT_EQ(format_double(std::nan("")), "NaN");
    EXPECT_TRUE(std::isnan(parse_double("NaN")));
    EXPECT_EQ(parse_double(format_double(0.1 + 0.2)), 0.1 + 0.2);
}
