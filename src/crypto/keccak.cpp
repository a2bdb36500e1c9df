#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  static const char kPersonalMessagePrefix[] = "\x19" "Ethereum Signed Message:\n";

  Hash256 Keccak256(const unsigned char* data, size_t len) {
    Hash256 digest{};
    CryptoPP::Keccak_256 hash;
    hash.CalculateDigest(digest.data(), data, len);
    return digest;
  }

  Hash256 Keccak256(const std::vector<unsigned char>& data) {
    return Keccak256(data.data(), data.size());
  }

  std::string Keccak256Raw(const std::string& raw) {
    auto digest = Keccak256(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    return BytesToHex0x(digest.data(), digest.size());
  }

  std::string Keccak256Hex(const std::string& hex_input) {
    auto digest = Keccak256(HexToBytes(hex_input));
    return BytesToHex0x(digest.data(), digest.size());
  }

  Hash256 HashPersonalMessage(const std::vector<unsigned char>& message) {
    std::string prefix = kPersonalMessagePrefix + std::to_string(message.size());
    std::vector<unsigned char> buf;
    buf.reserve(prefix.size() + message.size());
    buf.insert(buf.end(), prefix.begin(), prefix.end());
    buf.insert(buf.end(), message.begin(), message.end());
    return Keccak256(buf);
  }

  std::string HashPersonalMessageHex(const std::string& hex_message) {
    auto digest = HashPersonalMessage(HexToBytes(hex_message));
    return BytesToHex0x(digest.data(), digest.size());
  }
}
