#include "encoding/typed_data.hpp"
#include "utils/hex.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
  std::string Hex(const Crypto::Hash256& h) { return BytesToHex0x(h.data(), h.size()); }

  // The "Mail" example from EIP-712.
  json MailDocument() {
    return json::parse(R"({
      "types": {
        "EIP712Domain": [
          {"name": "name", "type": "string"},
          {"name": "version", "type": "string"},
          {"name": "chainId", "type": "uint256"},
          {"name": "verifyingContract", "type": "address"}
        ],
        "Person": [
          {"name": "name", "type": "string"},
          {"name": "wallet", "type": "address"}
        ],
        "Mail": [
          {"name": "from", "type": "Person"},
          {"name": "to", "type": "Person"},
          {"name": "contents", "type": "string"}
        ]
      },
      "primaryType": "Mail",
      "domain": {
        "name": "Ether Mail",
        "version": "1",
        "chainId": 1,
        "verifyingContract": "0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC"
      },
      "message": {
        "from": {"name": "Cow", "wallet": "0xCD2a3d9F938E13CD947Ec05AbC7FE734Df8DD826"},
        "to": {"name": "Bob", "wallet": "0xbBbBBBBbbBBBbbbBbbBbbbbBBbBbbbbBbBbbBBbB"},
        "contents": "Hello, Bob!"
      }
    })");
  }

  json OrderDocument() {
    return json::parse(R"({
      "types": {
        "EIP712Domain": [
          {"name": "name", "type": "string"},
          {"name": "chainId", "type": "uint256"}
        ],
        "Order": [
          {"name": "makers", "type": "address[]"},
          {"name": "amount", "type": "uint256"},
          {"name": "delta", "type": "int256"},
          {"name": "flag", "type": "bool"},
          {"name": "data", "type": "bytes"},
          {"name": "salt", "type": "bytes32"},
          {"name": "kind", "type": "uint8"}
        ]
      },
      "primaryType": "Order",
      "domain": {"name": "Test", "chainId": "137"},
      "message": {
        "makers": ["0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed", "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359"],
        "amount": "115792089237316195423570985008687907853269984665640564039457584007913129639935",
        "delta": -1,
        "flag": true,
        "data": "0xdeadbeef",
        "salt": "0x00000000000000000000000000000000000000000000000000000000000000ff",
        "kind": "0x10"
      }
    })");
  }
}

TEST(TypedDataTest, EncodeTypeListsReferencedStructs) {
  auto doc = MailDocument();
  EXPECT_EQ(TypedData::EncodeType(doc["types"], "Mail"),
            "Mail(Person from,Person to,string contents)Person(string name,address wallet)");
  EXPECT_EQ(Hex(TypedData::TypeHash(doc["types"], "Mail")),
            "0xa0cedeb2dc280ba39b857546d74f5549c3a1d7bdc2dd96bf881f76108e23dac2");
}

TEST(TypedDataTest, MailExample) {
  auto doc = MailDocument();
  EXPECT_EQ(Hex(TypedData::HashStruct(doc["types"], "EIP712Domain", doc["domain"])),
            "0xf2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090f");
  EXPECT_EQ(Hex(TypedData::HashStruct(doc["types"], "Mail", doc["message"])),
            "0xc52c0ee5d84264471806290a3f2c4cecfc5490626bf912d01f240d7a274b371e");
  EXPECT_EQ(Hex(TypedData::Hash(doc)), "0xbe609aee343fb3c4b28e1df9e632fca64fcfaede20f02e86244efddf30957bd2");
  EXPECT_EQ(Hex(TypedData::Hash(doc.dump())), Hex(TypedData::Hash(doc)));
}

TEST(TypedDataTest, AtomicArrayAndIntegerEncodings) {
  auto doc = OrderDocument();
  EXPECT_EQ(Hex(TypedData::HashStruct(doc["types"], "EIP712Domain", doc["domain"])),
            "0x7ca20292c81ef8b57799939d43300093ee44102eba1c1275ba4071921ad0d689");
  EXPECT_EQ(Hex(TypedData::HashStruct(doc["types"], "Order", doc["message"])),
            "0xfe38239baeae996a1d186837de623896d7e19a28223a24bb0368c417149951c1");
  EXPECT_EQ(Hex(TypedData::Hash(doc)), "0x58992518c350b251c9cdc0ab6663aa6fad9be24ff6257c4eab0acd4b71eb24d5");
}

TEST(TypedDataTest, RejectsOutOfRangeIntegers) {
  auto doc = OrderDocument();
  doc["message"]["kind"] = 256;
  EXPECT_THROW(TypedData::Hash(doc), std::invalid_argument);
  doc = OrderDocument();
  doc["message"]["amount"] = "-5";
  EXPECT_THROW(TypedData::Hash(doc), std::invalid_argument);
  doc = OrderDocument();
  doc["message"]["amount"] = "115792089237316195423570985008687907853269984665640564039457584007913129639936";
  EXPECT_THROW(TypedData::Hash(doc), std::invalid_argument);
}

TEST(TypedDataTest, RejectsMalformedDocuments) {
  EXPECT_THROW(TypedData::Hash(std::string("{not json")), std::invalid_argument);
  EXPECT_THROW(TypedData::Hash(json::array()), std::invalid_argument);

  auto no_domain_type = MailDocument();
  no_domain_type["types"].erase("EIP712Domain");
  EXPECT_THROW(TypedData::Hash(no_domain_type), std::invalid_argument);

  auto missing_field = MailDocument();
  missing_field["message"].erase("contents");
  EXPECT_THROW(TypedData::Hash(missing_field), std::invalid_argument);

  auto bad_address = MailDocument();
  bad_address["message"]["to"]["wallet"] = "0x0x" + std::string(38, 'b');
  EXPECT_THROW(TypedData::Hash(bad_address), std::invalid_argument);

  auto unknown_type = MailDocument();
  unknown_type["types"]["Mail"][2]["type"] = "uint7";
  EXPECT_THROW(TypedData::Hash(unknown_type), std::invalid_argument);
}
