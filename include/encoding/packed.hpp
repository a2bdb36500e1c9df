#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Solidity abi.encodePacked for fixed-width types: fields are concatenated at
// their natural width, big-endian, with no length prefixes or padding.
namespace AbiPacked {
  struct Field { std::vector<unsigned char> bytes; };

  // bytesN; throws std::invalid_argument unless data.size() == n.
  Field FixedBytes(const std::vector<unsigned char>& data, size_t n);
  Field Bytes32(const std::vector<unsigned char>& data);
  // uint8; throws std::out_of_range above 255.
  Field Uint8(unsigned int value);

  std::vector<unsigned char> Encode(const std::vector<Field>& fields);
  // 0x-prefixed lowercase hex of Encode(fields).
  std::string EncodeHex(const std::vector<Field>& fields);
}
