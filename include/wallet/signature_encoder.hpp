#pragma once
#include "constants/circle.hpp"
#include "encoding/signature.hpp"
#include <string>

class Owner;

// Turns an owner's raw secp256k1 signature into the packed r || s || sigType
// blob the weighted multisig plugin verifies. Stateless; safe to share.
class SignatureEncoder {
public:
  // digest_flag is the contract's SIG_TYPE_FLAG_DIGEST for the targeted core.
  // Throws std::invalid_argument above 255.
  explicit SignatureEncoder(unsigned int digest_flag = CircleConstants::SIG_TYPE_FLAG_DIGEST);

  // hash-select -> sign -> parse -> tag -> pack.
  // Throws WalletError: SigningFailed if the owner cannot sign (or the hash is
  // not hex), InvalidSignature if its output is malformed or v + flag > 255.
  std::string Sign(const Owner& owner, const std::string& message_hash, bool has_user_op_gas) const;

  // The EIP-191 hash of the digest bytes for user operations, otherwise the
  // input unchanged. Throws std::invalid_argument for malformed hex when hashing.
  static std::string SelectDigest(const std::string& message_hash, bool has_user_op_gas);

  // 0x || r || s || (has_user_op_gas ? v + flag : v).
  std::string EncodePacked(const RawSignature& sig, bool has_user_op_gas) const;

  unsigned int DigestFlag() const { return digest_flag_; }
private:
  unsigned int digest_flag_;
};
