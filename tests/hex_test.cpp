#include "utils/hex.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(HexTest, DecodesWithAndWithoutPrefix) {
  std::vector<unsigned char> expected{0x00, 0xab, 0xCD, 0xff};
  EXPECT_EQ(HexToBytes("0x00abcdff"), expected);
  EXPECT_EQ(HexToBytes("00ABCDFF"), expected);
  EXPECT_EQ(HexToBytes("0X00abCDff"), expected);
  EXPECT_TRUE(HexToBytes("0x").empty());
}

TEST(HexTest, RejectsOddLengthAndBadCharacters) {
  EXPECT_THROW(HexToBytes("0xabc"), std::invalid_argument);
  EXPECT_THROW(HexToBytes("0xzz"), std::invalid_argument);
  EXPECT_THROW(HexToBytes("0x12 4"), std::invalid_argument);
  EXPECT_FALSE(IsHexString("0xabc"));
  EXPECT_FALSE(IsHexString("0xg0"));
  EXPECT_TRUE(IsHexString("0xABcd"));
}

TEST(HexTest, EncodesLowercaseWithPrefix) {
  std::vector<unsigned char> data{0x01, 0xAB, 0xff};
  EXPECT_EQ(BytesToHex0x(data), "0x01abff");
  EXPECT_EQ(BytesToHex(data.data(), data.size()), "01abff");
}

TEST(HexTest, PrefixHelpers) {
  EXPECT_EQ(Ensure0x("ab"), "0xab");
  EXPECT_EQ(Ensure0x("0xab"), "0xab");
  EXPECT_EQ(Strip0x("0Xab"), "ab");
  EXPECT_EQ(Strip0x("ab"), "ab");
  EXPECT_EQ(ToLowerHex("0xABcD"), "0xabcd");
}
