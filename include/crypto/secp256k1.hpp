#pragma once
#include <string>
#include <vector>

namespace Crypto {
  struct Signature { std::vector<unsigned char> r; std::vector<unsigned char> s; unsigned char v = 27; };
  // Sign 32-byte digest with secp256k1 (RFC 6979 nonce, low-s); private key is 32-byte raw.
  // v is 27 + recovery id.
  Signature SignDigest(const std::vector<unsigned char>& priv32, const std::vector<unsigned char>& digest32);
  // Derive uncompressed public key (65 bytes, 0x04 || X(32) || Y(32)) from private key
  std::vector<unsigned char> PublicKeyFromPrivate(const std::vector<unsigned char>& priv32);
  // False for wrong length, zero, or a scalar >= the curve order.
  bool IsValidPrivateKey(const std::vector<unsigned char>& priv32);
  // Recover the uncompressed public key that produced sig over digest32.
  // Accepts v as 0/1 or 27/28. Throws std::invalid_argument if recovery fails.
  std::vector<unsigned char> RecoverPublicKey(const std::vector<unsigned char>& digest32, const Signature& sig);
}
