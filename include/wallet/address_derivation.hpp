#pragma once
#include "wallet/models.hpp"
#include <optional>
#include <string>

class ModularTransport;

// Address derivation for a wallet secured by exactly one local key.
// Multi-owner and WebAuthn-owner configurations are not built here.
namespace AddressDerivation {
  // Validates owner_address and returns the canonical request:
  //   owners = [{EIP-55(owner_address), OWNER_WEIGHT}], thresholdWeight = THRESHOLD_WEIGHT,
  //   scaCore = format_version, metadata.name = name,
  //   ownershipContractAddress, webauthnOwners and initCode absent.
  // Throws WalletError(ErrorKind::InvalidAddress).
  AddressDerivationRequest BuildRequest(const std::string& owner_address,
                                        const std::string& format_version,
                                        const std::optional<std::string>& name = std::nullopt);

  // BuildRequest, then exactly one transport call. The transport's result is
  // returned as-is and its errors propagate unchanged; nothing is retried.
  ModularWallet DeriveWalletAddress(ModularTransport& transport,
                                    const std::string& owner_address,
                                    const std::string& format_version,
                                    const std::optional<std::string>& name = std::nullopt);
}
