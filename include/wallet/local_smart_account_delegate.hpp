#pragma once
#include "wallet/models.hpp"
#include "wallet/signature_encoder.hpp"
#include <memory>
#include <optional>
#include <string>

class ModularTransport;
class Owner;

// Smart account operations for a wallet whose single owner is a local key.
// Holds no mutable state; calls may run concurrently.
class LocalSmartAccountDelegate {
public:
  // Throws std::invalid_argument for a null owner.
  explicit LocalSmartAccountDelegate(std::shared_ptr<const Owner> owner,
                                     SignatureEncoder encoder = SignatureEncoder());

  // Derives the wallet for the owner's address. version is the scaCore.
  ModularWallet GetModularWalletAddress(ModularTransport& transport,
                                        const std::string& version,
                                        const std::optional<std::string>& name = std::nullopt) const;

  // Same, for an explicit owner address.
  ModularWallet GetModularWalletAddress(ModularTransport& transport,
                                        const std::string& address,
                                        const std::string& version,
                                        const std::optional<std::string>& name) const;

  // Signs hash with the owner and wraps it for the multisig plugin.
  std::string SignAndWrap(const std::string& hash, bool has_user_op_gas) const;

  const Owner& GetOwner() const { return *owner_; }
  const SignatureEncoder& Encoder() const { return encoder_; }
private:
  std::shared_ptr<const Owner> owner_;
  SignatureEncoder encoder_;
};
