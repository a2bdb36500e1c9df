#pragma once
#include <cstddef>
#include <string>
#include <vector>

// 20-byte account addresses.
namespace EthAddress {
  constexpr size_t kLength = 20;

  // Decodes a 40-hex-char address (optional 0x, any case). Checksums are not
  // enforced. Throws WalletError(ErrorKind::InvalidAddress).
  std::vector<unsigned char> Parse(const std::string& address);
  bool IsValid(const std::string& address);

  // EIP-55 mixed-case encoding with 0x prefix.
  std::string ToChecksum(const std::vector<unsigned char>& addr20);
  // Parse + ToChecksum.
  std::string Canonicalize(const std::string& address);

  // Last 20 bytes of keccak256(X || Y) of an uncompressed (0x04-prefixed) key.
  std::string FromPublicKey(const std::vector<unsigned char>& pub65);
}
