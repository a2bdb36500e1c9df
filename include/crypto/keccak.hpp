#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace Crypto {
  using Hash256 = std::array<unsigned char, 32>;

  Hash256 Keccak256(const unsigned char* data, size_t len);
  Hash256 Keccak256(const std::vector<unsigned char>& data);
  // Returns 0x-prefixed hex keccak256 hash of the input interpreted as raw bytes
  std::string Keccak256Raw(const std::string& raw);
  // Returns 0x-prefixed hex keccak256 of hex-encoded input (0x-hex or hex).
  // Throws std::invalid_argument on malformed hex.
  std::string Keccak256Hex(const std::string& hex_input);

  // EIP-191 personal message hash:
  // keccak256("\x19Ethereum Signed Message:\n" || decimal(len) || message)
  Hash256 HashPersonalMessage(const std::vector<unsigned char>& message);
  // Same, over the bytes of a hex string. Throws std::invalid_argument on malformed hex.
  std::string HashPersonalMessageHex(const std::string& hex_message);
}
