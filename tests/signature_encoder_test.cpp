#include "wallet/signature_encoder.hpp"
#include "common/errors.hpp"
#include "crypto/keccak.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {
  const std::string kOwner = "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23";
  const std::string kOneDigest = "0x0000000000000000000000000000000000000000000000000000000000000001";
  const std::string kR = std::string(62, '0') + "01";
  const std::string kS = std::string(62, '0') + "02";

  RawSignature MakeSig(unsigned char v) {
    RawSignature sig;
    sig.r[31] = 0x01;
    sig.s[31] = 0x02;
    sig.v = v;
    return sig;
  }

  ErrorKind KindOfSign(const SignatureEncoder& encoder, const Owner& owner, const std::string& hash, bool gas) {
    try {
      encoder.Sign(owner, hash, gas);
    } catch (const WalletError& e) {
      return e.Kind();
    }
    ADD_FAILURE() << "expected WalletError";
    return ErrorKind::TransportFailure;
  }
}

TEST(SignatureEncoderTest, PlainSignatureIsUntagged) {
  SignatureEncoder encoder;
  auto packed = encoder.EncodePacked(MakeSig(27), false);
  EXPECT_EQ(packed, "0x" + kR + kS + "1b");
  EXPECT_EQ(packed.size(), 132u);
}

TEST(SignatureEncoderTest, UserOperationAddsDigestFlag) {
  SignatureEncoder encoder(2);
  EXPECT_EQ(encoder.EncodePacked(MakeSig(27), true), "0x" + kR + kS + "1d");
  SignatureEncoder contract_flag;
  EXPECT_EQ(contract_flag.DigestFlag(), 32u);
  EXPECT_EQ(contract_flag.EncodePacked(MakeSig(27), true), "0x" + kR + kS + "3b");
  EXPECT_EQ(contract_flag.EncodePacked(MakeSig(28), true), "0x" + kR + kS + "3c");
}

TEST(SignatureEncoderTest, EncodingIsIdempotent) {
  SignatureEncoder encoder;
  auto sig = MakeSig(28);
  EXPECT_EQ(encoder.EncodePacked(sig, true), encoder.EncodePacked(sig, true));
  EXPECT_EQ(encoder.EncodePacked(sig, false), encoder.EncodePacked(sig, false));
}

TEST(SignatureEncoderTest, TagOverflowIsRejected) {
  SignatureEncoder encoder(32);
  EXPECT_NO_THROW(encoder.EncodePacked(MakeSig(223), true));
  try {
    encoder.EncodePacked(MakeSig(224), true);
    FAIL() << "expected overflow";
  } catch (const WalletError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::InvalidSignature);
  }
  EXPECT_EQ(encoder.EncodePacked(MakeSig(255), false), "0x" + kR + kS + "ff");
  EXPECT_THROW(SignatureEncoder(256), std::invalid_argument);
}

TEST(SignatureEncoderTest, RawDigestIsSignedAsIs) {
  FakeOwner owner(kOwner, "0x" + kR + kS + "1c");
  SignatureEncoder encoder;
  EXPECT_EQ(encoder.Sign(owner, kOneDigest, false), "0x" + kR + kS + "1c");
  ASSERT_EQ(owner.SignedDigests().size(), 1u);
  EXPECT_EQ(owner.SignedDigests()[0], kOneDigest);
}

TEST(SignatureEncoderTest, UserOperationDigestIsPersonalHashed) {
  FakeOwner owner(kOwner, "0x" + kR + kS + "1b");
  SignatureEncoder encoder(2);
  EXPECT_EQ(encoder.Sign(owner, kOneDigest, true), "0x" + kR + kS + "1d");
  ASSERT_EQ(owner.SignedDigests().size(), 1u);
  EXPECT_NE(owner.SignedDigests()[0], kOneDigest);
  EXPECT_EQ(owner.SignedDigests()[0], "0xc9798da569c6ded6bd4b17373ef332b7c84d68cdec3f420f583dcd7b441ae31d");
  EXPECT_EQ(SignatureEncoder::SelectDigest(kOneDigest, true), owner.SignedDigests()[0]);
  EXPECT_EQ(SignatureEncoder::SelectDigest(kOneDigest, false), kOneDigest);
}

TEST(SignatureEncoderTest, MalformedSignerOutputIsInvalidSignature) {
  SignatureEncoder encoder;
  for (const std::string out : {std::string("0x"), "0x" + kR + kS, "0x" + kR + kS + "1", "0x" + kR + kS + "1b00",
                                "0x" + kR + kS + "zz"}) {
    FakeOwner owner(kOwner, out);
    EXPECT_EQ(KindOfSign(encoder, owner, kOneDigest, false), ErrorKind::InvalidSignature) << out;
  }
}

TEST(SignatureEncoderTest, SignerFailuresAreSigningFailed) {
  SignatureEncoder encoder;
  FakeOwner cancelled(kOwner, "");
  cancelled.fail_with_ = []{ throw WalletError(ErrorKind::SigningFailed, "user cancelled"); };
  EXPECT_EQ(KindOfSign(encoder, cancelled, kOneDigest, false), ErrorKind::SigningFailed);

  FakeOwner locked(kOwner, "");
  locked.fail_with_ = []{ throw std::runtime_error("device locked"); };
  EXPECT_EQ(KindOfSign(encoder, locked, kOneDigest, true), ErrorKind::SigningFailed);
}

TEST(SignatureEncoderTest, MalformedHashForUserOperationIsSigningFailed) {
  FakeOwner owner(kOwner, "0x" + kR + kS + "1b");
  SignatureEncoder encoder;
  EXPECT_EQ(KindOfSign(encoder, owner, "0x123", true), ErrorKind::SigningFailed);
  EXPECT_TRUE(owner.SignedDigests().empty());
}
