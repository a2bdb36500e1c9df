#pragma once
#include "wallet/owner.hpp"
#include <string>
#include <vector>

// Owner backed by an in-memory secp256k1 private key supplied by the caller.
class LocalAccount : public Owner {
public:
  // Throws std::invalid_argument for malformed hex, wrong length, or a key
  // outside the curve order.
  explicit LocalAccount(const std::string& private_key_hex);
  ~LocalAccount() override;
  LocalAccount(const LocalAccount&) = delete;
  LocalAccount& operator=(const LocalAccount&) = delete;

  // EIP-55 checksummed.
  std::string Address() const override;
  std::string Sign(const std::string& digest_hex) const override;
  // Signs the EIP-191 personal message hash of the UTF-8 bytes of message.
  std::string SignMessage(const std::string& message) const;
  // Signs the EIP-712 hash of a typed data JSON document. Malformed documents
  // raise WalletError(ErrorKind::SigningFailed).
  std::string SignTypedData(const std::string& typed_data_json) const;
private:
  std::vector<unsigned char> priv_;
  std::string address_;
  std::string SignDigestBytes(const std::vector<unsigned char>& digest) const;
};
