#pragma once
#include <string>

// The key holder behind a smart account. Exactly one per delegate.
// Sign() may be called from several threads at once; implementations whose key
// store is not reentrant must serialize internally.
class Owner {
public:
  virtual ~Owner() = default;
  // 0x-prefixed 20-byte address.
  virtual std::string Address() const = 0;
  // Signs a 0x-hex 32-byte digest as-is (no prefixing) and returns
  // 0x || r(32) || s(32) || v(1). Throws WalletError(ErrorKind::SigningFailed).
  virtual std::string Sign(const std::string& digest_hex) const = 0;
};
