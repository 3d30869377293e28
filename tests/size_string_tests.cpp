#include "errors.hpp"
#include "size_string.hpp"

#include <gtest/gtest.h>

#include <cstdint>

TEST(Parse_size, plain_byte_count)
{
   EXPECT_EQ(parse_size("100"), 100u);
   EXPECT_EQ(parse_size("0"), 0u);
   EXPECT_EQ(parse_size(" 42 "), 42u);
}

TEST(Parse_size, binary_suffixes)
{
   EXPECT_EQ(parse_size("512K"), 512u * 1024u);
   EXPECT_EQ(parse_size("10M"), 10u * 1024u * 1024u);
   EXPECT_EQ(parse_size("1G"), 1024ull * 1024ull * 1024ull);
   EXPECT_EQ(parse_size("2G"), 2ull * 1024ull * 1024ull * 1024ull);
}

TEST(Parse_size, suffixes_are_case_insensitive)
{
   EXPECT_EQ(parse_size("512k"), parse_size("512K"));
   EXPECT_EQ(parse_size("10m"), parse_size("10M"));
   EXPECT_EQ(parse_size("1g"), parse_size("1G"));
}

TEST(Parse_size, fractions_are_scaled_then_truncated)
{
   EXPECT_EQ(parse_size("1.5M"), 1572864u);
   EXPECT_EQ(parse_size("0.5K"), 512u);
   EXPECT_EQ(parse_size(".5K"), 512u);
   EXPECT_EQ(parse_size("1.001K"), 1025u);
}

TEST(Parse_size, malformed_text_throws)
{
   EXPECT_THROW(parse_size(""), Parse_error);
   EXPECT_THROW(parse_size("   "), Parse_error);
   EXPECT_THROW(parse_size("abc"), Parse_error);
   EXPECT_THROW(parse_size("10X"), Parse_error);
   EXPECT_THROW(parse_size("M"), Parse_error);
   EXPECT_THROW(parse_size(".M"), Parse_error);
   EXPECT_THROW(parse_size("1.2.3M"), Parse_error);
   EXPECT_THROW(parse_size("-5M"), Parse_error);
   EXPECT_THROW(parse_size("1.5"), Parse_error);
   EXPECT_THROW(parse_size("10 M"), Parse_error);
}

TEST(Parse_size, only_plain_decimal_digits)
{
   EXPECT_THROW(parse_size("+5"), Parse_error);
   EXPECT_THROW(parse_size("+5K"), Parse_error);
   EXPECT_THROW(parse_size("1e3K"), Parse_error);
   EXPECT_THROW(parse_size("1e3"), Parse_error);
   EXPECT_THROW(parse_size("0x10K"), Parse_error);
   EXPECT_THROW(parse_size("infK"), Parse_error);
}

TEST(Parse_size, overflow_throws)
{
   EXPECT_THROW(parse_size("99999999999999999999"), Parse_error);
   EXPECT_THROW(parse_size("17179869184G"), Parse_error);
   EXPECT_THROW(parse_size("17179869184.5G"), Parse_error);
}

TEST(Parse_count, accepts_decimal_integers)
{
   EXPECT_EQ(parse_count("4"), 4u);
   EXPECT_EQ(parse_count("0"), 0u);
   EXPECT_EQ(parse_count("1000"), 1000u);
}

TEST(Parse_count, rejects_anything_else)
{
   EXPECT_THROW(parse_count(""), Parse_error);
   EXPECT_THROW(parse_count("-2"), Parse_error);
   EXPECT_THROW(parse_count("2.5"), Parse_error);
   EXPECT_THROW(parse_count("four"), Parse_error);
   EXPECT_THROW(parse_count("99999999999999999999"), Parse_error);
}
