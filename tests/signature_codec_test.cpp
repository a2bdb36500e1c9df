#include "encoding/signature.hpp"
#include "common/errors.hpp"
#include <gtest/gtest.h>

namespace {
  const std::string kSig =
    "0xb91467e570a6466aa9e9876cbcd013baba02900b8979d43fe208a4a4f339f5fd"
    "6007e74cd82e037b800186422fc2da167c747ef045e5d18a5f5d4300f8e1a029"
    "1c";

  void ExpectInvalid(const std::string& hex) {
    try {
      SignatureCodec::Parse(hex);
      ADD_FAILURE() << "parsed " << hex;
    } catch (const WalletError& e) {
      EXPECT_EQ(e.Kind(), ErrorKind::InvalidSignature) << hex;
    }
  }
}

TEST(SignatureCodecTest, SplitsComponents) {
  auto sig = SignatureCodec::Parse(kSig);
  EXPECT_EQ(sig.r[0], 0xb9);
  EXPECT_EQ(sig.r[31], 0xfd);
  EXPECT_EQ(sig.s[0], 0x60);
  EXPECT_EQ(sig.s[31], 0x29);
  EXPECT_EQ(sig.v, 0x1c);
}

TEST(SignatureCodecTest, RoundTripReproducesInput) {
  EXPECT_EQ(SignatureCodec::Serialize(SignatureCodec::Parse(kSig)), kSig);
  std::string upper = "0x" + std::string("B91467E570A6466AA9E9876CBCD013BABA02900B8979D43FE208A4A4F339F5FD") +
                      "6007e74cd82e037b800186422fc2da167c747ef045e5d18a5f5d4300f8e1a029" + "1C";
  EXPECT_EQ(SignatureCodec::Serialize(SignatureCodec::Parse(upper)), kSig);
}

TEST(SignatureCodecTest, AcceptsMissingPrefix) {
  EXPECT_EQ(SignatureCodec::Serialize(SignatureCodec::Parse(kSig.substr(2))), kSig);
}

TEST(SignatureCodecTest, RejectsMalformedInput) {
  ExpectInvalid("");
  ExpectInvalid("0x");
  ExpectInvalid(kSig.substr(0, kSig.size() - 1));  // odd length
  ExpectInvalid(kSig.substr(0, kSig.size() - 2));  // 64 bytes
  ExpectInvalid(kSig + "00");                        // 66 bytes
  std::string bad = kSig;
  bad[10] = 'g';
  ExpectInvalid(bad);
}
