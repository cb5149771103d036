#include <gtest/gtest.h>

#include "common/string_utils.hpp"

using namespace ssdpkit::common;

class StringUtilsTest : public testing::Test {};

/**
 * @brief 测试基本的十六进制转换
 */
TEST_F(StringUtilsTest, BasicHexConversion) {
  EXPECT_EQ(to_hex(""), "");
  EXPECT_EQ(to_hex("A"), "41");
  EXPECT_EQ(to_hex("123"), "313233");
  EXPECT_EQ(to_hex("hello"), "68656c6c6f");
}

/**
 * @brief 测试特殊字符及二进制数据的十六进制转换
 */
TEST_F(StringUtilsTest, SpecialCharactersHex) {
  EXPECT_EQ(to_hex("\r\n"), "0d0a");
  EXPECT_EQ(to_hex(std::string(1, '\0')), "00");

  const std::string binary = {'\x00', '\x7f', '\x80', '\xff'};
  EXPECT_EQ(to_hex(binary), "007f80ff");
}

TEST_F(StringUtilsTest, Trim) {
  EXPECT_EQ(trim(""), "");
  EXPECT_EQ(trim("   "), "");
  EXPECT_EQ(trim("  ST: ssdp:all \r"), "ST: ssdp:all");
  EXPECT_EQ(trim("\t\nvalue\n"), "value");
  EXPECT_EQ(trim("in ner"), "in ner");
}

TEST_F(StringUtilsTest, ToUpper) {
  EXPECT_EQ(to_upper("cache-control"), "CACHE-CONTROL");
  EXPECT_EQ(to_upper("Nts"), "NTS");
  EXPECT_EQ(to_upper("123-abc"), "123-ABC");
}

TEST_F(StringUtilsTest, StartsWith) {
  EXPECT_TRUE(starts_with("M-SEARCH * HTTP/1.1", "M-SEARCH"));
  EXPECT_TRUE(starts_with("NOTIFY", "NOTIFY"));
  EXPECT_TRUE(starts_with("anything", ""));
  EXPECT_FALSE(starts_with("NOT", "NOTIFY"));
  EXPECT_FALSE(starts_with("notify * HTTP/1.1", "NOTIFY"));
}

/**
 * @brief 切分时保留空片段
 */
TEST_F(StringUtilsTest, SplitKeepsEmptyPieces) {
  const auto pieces = split("a\n\nb\n", '\n');
  ASSERT_EQ(pieces.size(), 4u);
  EXPECT_EQ(pieces[0], "a");
  EXPECT_EQ(pieces[1], "");
  EXPECT_EQ(pieces[2], "b");
  EXPECT_EQ(pieces[3], "");

  EXPECT_EQ(split("", '\n').size(), 1u);
  EXPECT_EQ(split("no-delimiter", '\n').size(), 1u);
}
