#include "encoding/packed.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

namespace AbiPacked {
  Field FixedBytes(const std::vector<unsigned char>& data, size_t n) {
    if (n == 0 || n > 32) throw std::invalid_argument("bytesN width must be 1..32");
    if (data.size() != n)
      throw std::invalid_argument("bytes" + std::to_string(n) + " field has " + std::to_string(data.size()) + " bytes");
    return Field{data};
  }

  Field Bytes32(const std::vector<unsigned char>& data) { return FixedBytes(data, 32); }

  Field Uint8(unsigned int value) {
    if (value > 0xFF) throw std::out_of_range("uint8 overflow: " + std::to_string(value));
    return Field{{static_cast<unsigned char>(value)}};
  }

  std::vector<unsigned char> Encode(const std::vector<Field>& fields) {
    size_t total = 0;
    for (const auto& f : fields) total += f.bytes.size();
    std::vector<unsigned char> out;
    out.reserve(total);
    for (const auto& f : fields) out.insert(out.end(), f.bytes.begin(), f.bytes.end());
    return out;
  }

  std::string EncodeHex(const std::vector<Field>& fields) {
    return BytesToHex0x(Encode(fields));
  }
}
