#pragma once
#include "crypto/keccak.hpp"
#include <string>
#include <nlohmann/json.hpp>

// EIP-712 structured data hashing. A typed data document is
// {"types", "primaryType", "domain", "message"} with "EIP712Domain" declared
// in types. All functions throw std::invalid_argument on malformed input.
namespace TypedData {
  // "Mail(Person from,Person to)Person(string name,address wallet)": the
  // primary type first, referenced struct types after it in name order.
  std::string EncodeType(const nlohmann::json& types, const std::string& primary_type);
  Crypto::Hash256 TypeHash(const nlohmann::json& types, const std::string& primary_type);
  Crypto::Hash256 HashStruct(const nlohmann::json& types, const std::string& type, const nlohmann::json& data);

  // keccak256("\x19\x01" || hashStruct(domain) || hashStruct(message)).
  // The message part is omitted when primaryType is EIP712Domain.
  Crypto::Hash256 Hash(const nlohmann::json& typed_data);
  Crypto::Hash256 Hash(const std::string& typed_data_json);
}
