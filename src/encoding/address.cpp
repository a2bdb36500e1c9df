#include "encoding/address.hpp"
#include "common/errors.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <cctype>
#include <stdexcept>

namespace EthAddress {
  std::vector<unsigned char> Parse(const std::string& address) {
    std::string body = Strip0x(address);
    if (body.size() != 2 * kLength)
      throw WalletError(ErrorKind::InvalidAddress,
                        "invalid address length: expected 40 hex chars, got " + std::to_string(body.size()));
    // A second 0x would be skipped by the hex decoder and leave 19 bytes.
    if (Has0x(body) || !IsHexString(body))
      throw WalletError(ErrorKind::InvalidAddress, "invalid address: non-hex characters in \"" + address + "\"");
    auto bytes = HexToBytes(body);
    if (bytes.size() != kLength)
      throw WalletError(ErrorKind::InvalidAddress, "address must be 20 bytes");
    return bytes;
  }

  bool IsValid(const std::string& address) {
    std::string body = Strip0x(address);
    return body.size() == 2 * kLength && !Has0x(body) && IsHexString(body);
  }

  std::string ToChecksum(const std::vector<unsigned char>& addr20) {
    if (addr20.size() != kLength)
      throw WalletError(ErrorKind::InvalidAddress, "address must be 20 bytes");
    std::string lower = BytesToHex(addr20.data(), addr20.size());
    auto hash = Crypto::Keccak256(reinterpret_cast<const unsigned char*>(lower.data()), lower.size());
    std::string out = "0x";
    out.reserve(2 + lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
      unsigned char nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
      char c = lower[i];
      out += (std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8)
               ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
               : c;
    }
    return out;
  }

  std::string Canonicalize(const std::string& address) {
    return ToChecksum(Parse(address));
  }

  std::string FromPublicKey(const std::vector<unsigned char>& pub65) {
    if (pub65.size() != 65 || pub65[0] != 0x04)
      throw std::invalid_argument("expected 65-byte uncompressed public key");
    auto hash = Crypto::Keccak256(pub65.data() + 1, pub65.size() - 1);
    return ToChecksum(std::vector<unsigned char>(hash.end() - kLength, hash.end()));
  }
}
