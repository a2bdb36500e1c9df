#include "wallet/local_smart_account_delegate.hpp"
#include "common/logger.hpp"
#include "transport/modular_transport.hpp"
#include "wallet/address_derivation.hpp"
#include "wallet/owner.hpp"
#include <stdexcept>
#include <utility>

LocalSmartAccountDelegate::LocalSmartAccountDelegate(std::shared_ptr<const Owner> owner, SignatureEncoder encoder)
  : owner_(std::move(owner)), encoder_(encoder) {
  if (!owner_) throw std::invalid_argument("owner must not be null");
}

ModularWallet LocalSmartAccountDelegate::GetModularWalletAddress(ModularTransport& transport,
                                                                 const std::string& version,
                                                                 const std::optional<std::string>& name) const {
  return GetModularWalletAddress(transport, owner_->Address(), version, name);
}

ModularWallet LocalSmartAccountDelegate::GetModularWalletAddress(ModularTransport& transport,
                                                                 const std::string& address,
                                                                 const std::string& version,
                                                                 const std::optional<std::string>& name) const {
  return AddressDerivation::DeriveWalletAddress(transport, address, version, name);
}

std::string LocalSmartAccountDelegate::SignAndWrap(const std::string& hash, bool has_user_op_gas) const {
  Logger::Debug(std::string("signing ") + (has_user_op_gas ? "user operation digest" : "raw digest") + " " + hash);
  return encoder_.Sign(*owner_, hash, has_user_op_gas);
}
