#include "wallet/signature_encoder.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/keccak.hpp"
#include "encoding/packed.hpp"
#include "wallet/owner.hpp"
#include <stdexcept>
#include <vector>

SignatureEncoder::SignatureEncoder(unsigned int digest_flag) : digest_flag_(digest_flag) {
  if (digest_flag_ > 0xFF) throw std::invalid_argument("signature type flag must fit in one byte");
}

std::string SignatureEncoder::SelectDigest(const std::string& message_hash, bool has_user_op_gas) {
  if (!has_user_op_gas) return message_hash;
  return Crypto::HashPersonalMessageHex(message_hash);
}

std::string SignatureEncoder::Sign(const Owner& owner, const std::string& message_hash, bool has_user_op_gas) const {
  std::string digest;
  try {
    digest = SelectDigest(message_hash, has_user_op_gas);
  } catch (const std::invalid_argument& e) {
    throw WalletError(ErrorKind::SigningFailed, std::string("invalid message hash: ") + e.what());
  }

  std::string signature;
  try {
    signature = owner.Sign(digest);
  } catch (const WalletError& e) {
    Logger::Error(std::string("owner failed to sign: ") + e.what());
    if (e.Kind() == ErrorKind::SigningFailed) throw;
    throw WalletError(ErrorKind::SigningFailed, e.what());
  } catch (const std::exception& e) {
    Logger::Error(std::string("owner failed to sign: ") + e.what());
    throw WalletError(ErrorKind::SigningFailed, e.what());
  }

  RawSignature raw;
  try {
    raw = SignatureCodec::Parse(signature);
  } catch (const WalletError& e) {
    Logger::Error(std::string("unexpected signature format from owner: ") + e.what());
    throw;
  }
  return EncodePacked(raw, has_user_op_gas);
}

std::string SignatureEncoder::EncodePacked(const RawSignature& sig, bool has_user_op_gas) const {
  unsigned int sig_type = sig.v;
  if (has_user_op_gas) sig_type += digest_flag_;
  if (sig_type > 0xFF)
    throw WalletError(ErrorKind::InvalidSignature,
                      "signature type overflow: v=" + std::to_string(sig.v) + " flag=" + std::to_string(digest_flag_));
  return AbiPacked::EncodeHex({
    AbiPacked::Bytes32(std::vector<unsigned char>(sig.r.begin(), sig.r.end())),
    AbiPacked::Bytes32(std::vector<unsigned char>(sig.s.begin(), sig.s.end())),
    AbiPacked::Uint8(sig_type),
  });
}
