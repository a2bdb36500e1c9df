#pragma once
#include <array>
#include <cstddef>
#include <string>

// Recoverable secp256k1 signature split into its wire components.
struct RawSignature {
  std::array<unsigned char, 32> r{};
  std::array<unsigned char, 32> s{};
  unsigned char v = 0;
};

namespace SignatureCodec {
  constexpr size_t kLength = 65;

  // Decodes 0x-optional hex of exactly r(32) || s(32) || v(1).
  // Throws WalletError(ErrorKind::InvalidSignature) on odd length, non-hex
  // characters or any length other than 65 bytes.
  RawSignature Parse(const std::string& signature_hex);

  // 0x + hex(r || s || v), 130 lowercase hex characters.
  std::string Serialize(const RawSignature& sig);
}
