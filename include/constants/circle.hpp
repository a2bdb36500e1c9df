#pragma once
#include <string>

namespace CircleConstants {
  inline const std::string BASE_URL = "https://modular-sdk.circle.com/v1/rpc/w3s/buidl";
  // Public smart account version name and the contract core it maps to
  inline const std::string SMART_ACCOUNT_VERSION_V1 = "circle_passkey_account_v1";
  inline const std::string SCA_CORE_V1 = "circle_6900_v1";

  // Weighted multisig parameters for a wallet owned by one local key.
  // Part of the wire contract of circle_6900_v1; weights must sum to >= threshold.
  inline constexpr int OWNER_WEIGHT = 1;
  inline constexpr int THRESHOLD_WEIGHT = 1;
  static_assert(OWNER_WEIGHT >= THRESHOLD_WEIGHT, "single owner must meet the threshold");

  // Added to v by the multisig plugin's signature-type discriminator for
  // signatures over an EIP-191 digest (user operations).
  inline constexpr unsigned int SIG_TYPE_FLAG_DIGEST = 32;

  // Maps a public version name to its scaCore. Throws std::invalid_argument
  // for unknown names.
  std::string ResolveScaCore(const std::string& version);
}
