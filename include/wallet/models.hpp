#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Wire model of the address derivation API. Absent optionals are omitted
// when serialized and JSON nulls decode as absent.

struct WeightedOwner {
  std::string address;
  int weight = 0;
};

struct WebAuthnOwner {
  std::string public_key_x;
  std::string public_key_y;
  int weight = 0;
};

struct WeightedMultiSig {
  std::optional<std::vector<WeightedOwner>> owners;
  std::optional<std::vector<WebAuthnOwner>> webauthn_owners;
  std::optional<int> threshold_weight;
};

struct OwnershipConfiguration {
  std::optional<std::string> ownership_contract_address;
  std::optional<WeightedMultiSig> weighted_multisig;
};

struct ScaConfiguration {
  OwnershipConfiguration initial_ownership_configuration;
  std::optional<std::string> sca_core;
  std::optional<std::string> init_code;
};

struct WalletMetadata {
  std::optional<std::string> name;
};

struct AddressDerivationRequest {
  ScaConfiguration sca_configuration;
  WalletMetadata metadata;
};

// Wallet descriptor returned by the transport; passed through untouched.
struct ModularWallet {
  std::optional<std::string> id;
  std::optional<std::string> address;
  std::optional<std::string> blockchain;
  std::optional<std::string> state;
  std::optional<std::string> name;
  std::optional<std::string> sca_core;
  std::optional<ScaConfiguration> sca_configuration;
  std::optional<std::string> create_date;
  std::optional<std::string> update_date;

  std::optional<std::string> GetInitCode() const;
};

void to_json(nlohmann::json& j, const WeightedOwner& v);
void from_json(const nlohmann::json& j, WeightedOwner& v);
void to_json(nlohmann::json& j, const WebAuthnOwner& v);
void from_json(const nlohmann::json& j, WebAuthnOwner& v);
void to_json(nlohmann::json& j, const WeightedMultiSig& v);
void from_json(const nlohmann::json& j, WeightedMultiSig& v);
void to_json(nlohmann::json& j, const OwnershipConfiguration& v);
void from_json(const nlohmann::json& j, OwnershipConfiguration& v);
void to_json(nlohmann::json& j, const ScaConfiguration& v);
void from_json(const nlohmann::json& j, ScaConfiguration& v);
void to_json(nlohmann::json& j, const WalletMetadata& v);
void from_json(const nlohmann::json& j, WalletMetadata& v);
void to_json(nlohmann::json& j, const AddressDerivationRequest& v);
void to_json(nlohmann::json& j, const ModularWallet& v);
void from_json(const nlohmann::json& j, ModularWallet& v);
