#include "utils/hex.hpp"
#include <stdexcept>

static int NibbleOf(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

bool IsHexString(const std::string& s) {
  size_t start = Has0x(s) ? 2 : 0;
  if ((s.size() - start) % 2 != 0) return false;
  for (size_t i = start; i < s.size(); ++i)
    if (NibbleOf(s[i]) < 0) return false;
  return true;
}

std::vector<unsigned char> HexToBytes(const std::string& hex) {
  size_t start = Has0x(hex) ? 2 : 0;
  if ((hex.size() - start) % 2 != 0)
    throw std::invalid_argument("odd-length hex string");
  std::vector<unsigned char> out; out.reserve((hex.size() - start) / 2);
  for (size_t i = start; i < hex.size(); i += 2) {
    int hi = NibbleOf(hex[i]), lo = NibbleOf(hex[i + 1]);
    if (hi < 0 || lo < 0) throw std::invalid_argument("invalid hex character at offset " + std::to_string(hi < 0 ? i : i + 1));
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return out;
}

std::string BytesToHex(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(2 * len);
  for (size_t i = 0; i < len; ++i) { out += hex[data[i] >> 4]; out += hex[data[i] & 0xF]; }
  return out;
}

std::string BytesToHex0x(const unsigned char* data, size_t len) {
  return "0x" + BytesToHex(data, len);
}

std::string BytesToHex0x(const std::vector<unsigned char>& data) {
  return BytesToHex0x(data.data(), data.size());
}
