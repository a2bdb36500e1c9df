#include "wallet/address_derivation.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/circle.hpp"
#include "encoding/address.hpp"
#include "transport/modular_transport.hpp"

namespace AddressDerivation {
  AddressDerivationRequest BuildRequest(const std::string& owner_address,
                                        const std::string& format_version,
                                        const std::optional<std::string>& name) {
    std::string address;
    try {
      address = EthAddress::Canonicalize(owner_address);
    } catch (const WalletError& e) {
      Logger::Warning(std::string("rejecting owner address: ") + e.what());
      throw;
    }

    WeightedMultiSig multisig;
    multisig.owners = std::vector<WeightedOwner>{{address, CircleConstants::OWNER_WEIGHT}};
    multisig.webauthn_owners = std::nullopt;
    multisig.threshold_weight = CircleConstants::THRESHOLD_WEIGHT;

    AddressDerivationRequest req;
    req.sca_configuration.initial_ownership_configuration.ownership_contract_address = std::nullopt;
    req.sca_configuration.initial_ownership_configuration.weighted_multisig = multisig;
    req.sca_configuration.sca_core = format_version;
    req.sca_configuration.init_code = std::nullopt;
    req.metadata.name = name;
    return req;
  }

  ModularWallet DeriveWalletAddress(ModularTransport& transport,
                                    const std::string& owner_address,
                                    const std::string& format_version,
                                    const std::optional<std::string>& name) {
    auto request = BuildRequest(owner_address, format_version, name);
    const auto& owner = request.sca_configuration.initial_ownership_configuration.weighted_multisig->owners->front();
    Logger::Info("resolving wallet address for owner " + owner.address + " scaCore=" + format_version);
    return transport.GetAddress(request);
  }
}
