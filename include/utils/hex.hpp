#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

inline bool Has0x(const std::string& s) {
  return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

inline std::string Ensure0x(const std::string& in) {
  if (Has0x(in)) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (Has0x(s)) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// True if s (after an optional 0x) is an even-length run of hex digits.
bool IsHexString(const std::string& s);

// Strict decode: optional 0x, even length, hex digits only. Throws
// std::invalid_argument otherwise; never truncates or pads.
std::vector<unsigned char> HexToBytes(const std::string& hex);

std::string BytesToHex(const unsigned char* data, size_t len);
std::string BytesToHex0x(const unsigned char* data, size_t len);
std::string BytesToHex0x(const std::vector<unsigned char>& data);
