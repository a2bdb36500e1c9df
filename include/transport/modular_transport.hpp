#pragma once
#include "wallet/models.hpp"

// Remote address-resolution capability. Owns the wire format, timeouts and
// any retry policy.
class ModularTransport {
public:
  virtual ~ModularTransport() = default;
  // Resolves the (possibly undeployed) wallet for a configuration.
  // Throws TransportError.
  virtual ModularWallet GetAddress(const AddressDerivationRequest& request) = 0;
};
