#include "encoding/signature.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace SignatureCodec {
  RawSignature Parse(const std::string& signature_hex) {
    std::vector<unsigned char> bytes;
    try {
      bytes = HexToBytes(signature_hex);
    } catch (const std::invalid_argument& e) {
      throw WalletError(ErrorKind::InvalidSignature, std::string("malformed signature hex: ") + e.what());
    }
    if (bytes.size() != kLength)
      throw WalletError(ErrorKind::InvalidSignature,
                        "invalid signature length: expected 65 bytes, got " + std::to_string(bytes.size()));
    RawSignature sig;
    std::copy(bytes.begin(), bytes.begin() + 32, sig.r.begin());
    std::copy(bytes.begin() + 32, bytes.begin() + 64, sig.s.begin());
    sig.v = bytes[64];
    return sig;
  }

  std::string Serialize(const RawSignature& sig) {
    std::vector<unsigned char> out;
    out.reserve(kLength);
    out.insert(out.end(), sig.r.begin(), sig.r.end());
    out.insert(out.end(), sig.s.begin(), sig.s.end());
    out.push_back(sig.v);
    return BytesToHex0x(out);
  }
}
