#include "wallet/local_account.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/keccak.hpp"
#include "crypto/secp256k1.hpp"
#include "encoding/address.hpp"
#include "encoding/signature.hpp"
#include "encoding/typed_data.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <stdexcept>

LocalAccount::LocalAccount(const std::string& private_key_hex) {
  if (private_key_hex.empty()) throw std::invalid_argument("empty private key");
  if (!IsHexString(private_key_hex)) throw std::invalid_argument("invalid private key hex string");
  priv_ = HexToBytes(private_key_hex);
  if (priv_.size() != 32) throw std::invalid_argument("invalid private key length");
  if (!Crypto::IsValidPrivateKey(priv_)) throw std::invalid_argument("private key out of range");
  address_ = EthAddress::FromPublicKey(Crypto::PublicKeyFromPrivate(priv_));
}

LocalAccount::~LocalAccount() {
  std::fill(priv_.begin(), priv_.end(), static_cast<unsigned char>(0));
}

std::string LocalAccount::Address() const { return address_; }

std::string LocalAccount::Sign(const std::string& digest_hex) const {
  if (!IsHexString(digest_hex))
    throw WalletError(ErrorKind::SigningFailed, "invalid hex string for message hash");
  auto digest = HexToBytes(digest_hex);
  if (digest.size() != 32)
    throw WalletError(ErrorKind::SigningFailed,
                      "invalid hash length: " + std::to_string(digest.size()) + " bytes, expected 32 bytes");
  return SignDigestBytes(digest);
}

std::string LocalAccount::SignMessage(const std::string& message) const {
  auto hash = Crypto::HashPersonalMessage(std::vector<unsigned char>(message.begin(), message.end()));
  return SignDigestBytes(std::vector<unsigned char>(hash.begin(), hash.end()));
}

std::string LocalAccount::SignTypedData(const std::string& typed_data_json) const {
  Crypto::Hash256 hash;
  try {
    hash = TypedData::Hash(typed_data_json);
  } catch (const std::invalid_argument& e) {
    Logger::Error(std::string("typed data hash failure: ") + e.what());
    throw WalletError(ErrorKind::SigningFailed, std::string("failed to hash typed data: ") + e.what());
  }
  return SignDigestBytes(std::vector<unsigned char>(hash.begin(), hash.end()));
}

std::string LocalAccount::SignDigestBytes(const std::vector<unsigned char>& digest) const {
  Crypto::Signature sig;
  try {
    sig = Crypto::SignDigest(priv_, digest);
  } catch (const std::exception& e) {
    Logger::Error(std::string("secp256k1 signing failed: ") + e.what());
    throw WalletError(ErrorKind::SigningFailed, std::string("failed to sign message hash: ") + e.what());
  }
  RawSignature raw;
  std::copy(sig.r.begin(), sig.r.end(), raw.r.begin());
  std::copy(sig.s.begin(), sig.s.end(), raw.s.begin());
  raw.v = sig.v;
  return SignatureCodec::Serialize(raw);
}
