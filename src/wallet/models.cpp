#include "wallet/models.hpp"

using json = nlohmann::json;

namespace {
  template <typename T>
  void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
  }

  template <typename T>
  void GetOptional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) { out.reset(); return; }
    out = it->template get<T>();
  }
}

void to_json(json& j, const WeightedOwner& v) {
  j = json{{"address", v.address}, {"weight", v.weight}};
}

void from_json(const json& j, WeightedOwner& v) {
  j.at("address").get_to(v.address);
  j.at("weight").get_to(v.weight);
}

void to_json(json& j, const WebAuthnOwner& v) {
  j = json{{"publicKeyX", v.public_key_x}, {"publicKeyY", v.public_key_y}, {"weight", v.weight}};
}

void from_json(const json& j, WebAuthnOwner& v) {
  j.at("publicKeyX").get_to(v.public_key_x);
  j.at("publicKeyY").get_to(v.public_key_y);
  j.at("weight").get_to(v.weight);
}

void to_json(json& j, const WeightedMultiSig& v) {
  j = json::object();
  PutOptional(j, "owners", v.owners);
  PutOptional(j, "webauthnOwners", v.webauthn_owners);
  PutOptional(j, "thresholdWeight", v.threshold_weight);
}

void from_json(const json& j, WeightedMultiSig& v) {
  GetOptional(j, "owners", v.owners);
  GetOptional(j, "webauthnOwners", v.webauthn_owners);
  GetOptional(j, "thresholdWeight", v.threshold_weight);
}

// The API spells the multisig key "weightedMultisig".
void to_json(json& j, const OwnershipConfiguration& v) {
  j = json::object();
  PutOptional(j, "ownershipContractAddress", v.ownership_contract_address);
  PutOptional(j, "weightedMultisig", v.weighted_multisig);
}

void from_json(const json& j, OwnershipConfiguration& v) {
  GetOptional(j, "ownershipContractAddress", v.ownership_contract_address);
  GetOptional(j, "weightedMultisig", v.weighted_multisig);
}

void to_json(json& j, const ScaConfiguration& v) {
  j = json{{"initialOwnershipConfiguration", v.initial_ownership_configuration}};
  PutOptional(j, "scaCore", v.sca_core);
  PutOptional(j, "initCode", v.init_code);
}

void from_json(const json& j, ScaConfiguration& v) {
  j.at("initialOwnershipConfiguration").get_to(v.initial_ownership_configuration);
  GetOptional(j, "scaCore", v.sca_core);
  GetOptional(j, "initCode", v.init_code);
}

void to_json(json& j, const WalletMetadata& v) {
  j = json::object();
  PutOptional(j, "name", v.name);
}

void from_json(const json& j, WalletMetadata& v) {
  GetOptional(j, "name", v.name);
}

void to_json(json& j, const AddressDerivationRequest& v) {
  j = json{{"scaConfiguration", v.sca_configuration}, {"metadata", v.metadata}};
}

void to_json(json& j, const ModularWallet& v) {
  j = json::object();
  PutOptional(j, "id", v.id);
  PutOptional(j, "address", v.address);
  PutOptional(j, "blockchain", v.blockchain);
  PutOptional(j, "state", v.state);
  PutOptional(j, "name", v.name);
  PutOptional(j, "scaCore", v.sca_core);
  PutOptional(j, "scaConfiguration", v.sca_configuration);
  PutOptional(j, "createDate", v.create_date);
  PutOptional(j, "updateDate", v.update_date);
}

void from_json(const json& j, ModularWallet& v) {
  GetOptional(j, "id", v.id);
  GetOptional(j, "address", v.address);
  GetOptional(j, "blockchain", v.blockchain);
  GetOptional(j, "state", v.state);
  GetOptional(j, "name", v.name);
  GetOptional(j, "scaCore", v.sca_core);
  GetOptional(j, "scaConfiguration", v.sca_configuration);
  GetOptional(j, "createDate", v.create_date);
  GetOptional(j, "updateDate", v.update_date);
}

std::optional<std::string> ModularWallet::GetInitCode() const {
  if (!sca_configuration) return std::nullopt;
  return sca_configuration->init_code;
}
