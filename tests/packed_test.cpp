#include "encoding/packed.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(PackedTest, ConcatenatesAtNaturalWidth) {
  std::vector<unsigned char> word(32, 0);
  word[31] = 0x07;
  auto hex = AbiPacked::EncodeHex({AbiPacked::Bytes32(word), AbiPacked::Uint8(0x1b)});
  EXPECT_EQ(hex, "0x" + std::string(62, '0') + "07" + "1b");
}

TEST(PackedTest, SignatureLayoutIsSixtyFiveBytes) {
  std::vector<unsigned char> r(32, 0x11), s(32, 0x22);
  auto bytes = AbiPacked::Encode({AbiPacked::Bytes32(r), AbiPacked::Bytes32(s), AbiPacked::Uint8(0x3c)});
  ASSERT_EQ(bytes.size(), 65u);
  EXPECT_EQ(bytes[0], 0x11);
  EXPECT_EQ(bytes[32], 0x22);
  EXPECT_EQ(bytes[64], 0x3c);
}

TEST(PackedTest, RejectsWrongWidths) {
  EXPECT_THROW(AbiPacked::Bytes32(std::vector<unsigned char>(31, 0)), std::invalid_argument);
  EXPECT_THROW(AbiPacked::FixedBytes(std::vector<unsigned char>(33, 0), 33), std::invalid_argument);
  EXPECT_THROW(AbiPacked::Uint8(256), std::out_of_range);
}
