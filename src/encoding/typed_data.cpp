#include "encoding/typed_data.hpp"
#include "common/errors.hpp"
#include "encoding/address.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace {
  using Word = std::array<unsigned char, 32>;

  const std::string kDomainType = "EIP712Domain";

  std::string BaseType(const std::string& type) {
    auto pos = type.find('[');
    return pos == std::string::npos ? type : type.substr(0, pos);
  }

  const json& FieldsOf(const json& types, const std::string& type) {
    auto it = types.find(type);
    if (it == types.end() || !it->is_array())
      throw std::invalid_argument("typed data: undefined struct type " + type);
    return *it;
  }

  void CollectDependencies(const json& types, const std::string& type, std::set<std::string>& found) {
    if (found.count(type) || !types.contains(type)) return;
    found.insert(type);
    for (const auto& field : FieldsOf(types, type))
      CollectDependencies(types, BaseType(field.at("type").get<std::string>()), found);
  }

  // Bit width of "uint<N>" / "int<N>": 256 without a suffix, 0 when invalid.
  unsigned IntWidth(const std::string& type, size_t prefix_len) {
    if (type.size() == prefix_len) return 256;
    unsigned bits = 0;
    for (size_t i = prefix_len; i < type.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(type[i]))) return 0;
      bits = bits * 10 + static_cast<unsigned>(type[i] - '0');
      if (bits > 256) return 0;
    }
    return (bits == 0 || bits % 8 != 0) ? 0 : bits;
  }

  // Big-endian 256-bit magnitude from a decimal or 0x-hex string.
  Word ParseMagnitude(const std::string& digits) {
    Word w{};
    if (Has0x(digits)) {
      std::string body = Strip0x(digits);
      if (body.empty() || body.size() > 64) throw std::invalid_argument("typed data: bad hex integer " + digits);
      if (body.size() % 2) body = "0" + body;
      if (!IsHexString(body) || Has0x(body)) throw std::invalid_argument("typed data: bad hex integer " + digits);
      auto bytes = HexToBytes(body);
      std::copy(bytes.begin(), bytes.end(), w.end() - bytes.size());
      return w;
    }
    if (digits.empty()) throw std::invalid_argument("typed data: empty integer");
    for (char c : digits) {
      if (!std::isdigit(static_cast<unsigned char>(c)))
        throw std::invalid_argument("typed data: bad decimal integer " + digits);
      unsigned carry = static_cast<unsigned>(c - '0');
      for (int i = 31; i >= 0; --i) {
        unsigned v = w[i] * 10u + carry;
        w[i] = static_cast<unsigned char>(v & 0xFF);
        carry = v >> 8;
      }
      if (carry) throw std::invalid_argument("typed data: integer exceeds 256 bits");
    }
    return w;
  }

  unsigned BitLength(const Word& w) {
    for (unsigned i = 0; i < 32; ++i) {
      if (!w[i]) continue;
      unsigned bits = 8;
      while (!(w[i] & (1u << (bits - 1)))) --bits;
      return (31 - i) * 8 + bits;
    }
    return 0;
  }

  bool IsPowerOfTwo(const Word& w) {
    unsigned set = 0;
    for (unsigned char b : w)
      for (unsigned char m = b; m; m &= static_cast<unsigned char>(m - 1)) ++set;
    return set == 1;
  }

  void Negate(Word& w) {
    unsigned carry = 1;
    for (int i = 31; i >= 0; --i) {
      unsigned v = static_cast<unsigned char>(~w[i]) + carry;
      w[i] = static_cast<unsigned char>(v & 0xFF);
      carry = v >> 8;
    }
  }

  Word EncodeInteger(const std::string& type, const json& value, bool is_signed) {
    unsigned bits = IntWidth(type, is_signed ? 3 : 4);
    if (!bits) throw std::invalid_argument("typed data: unsupported type " + type);

    bool negative = false;
    std::string text;
    if (value.is_number_unsigned()) text = std::to_string(value.get<unsigned long long>());
    else if (value.is_number_integer()) text = std::to_string(value.get<long long>());
    else if (value.is_string()) text = value.get<std::string>();
    else throw std::invalid_argument("typed data: " + type + " value must be an integer or a string");
    if (!text.empty() && text[0] == '-') { negative = true; text.erase(0, 1); }

    Word w = ParseMagnitude(text);
    unsigned len = BitLength(w);
    if (!is_signed) {
      if (negative && len) throw std::invalid_argument("typed data: negative value for " + type);
      if (len > bits) throw std::invalid_argument("typed data: value out of range for " + type);
      return w;
    }
    bool fits = negative ? (len < bits || (len == bits && IsPowerOfTwo(w))) : len < bits;
    if (!fits) throw std::invalid_argument("typed data: value out of range for " + type);
    if (negative && len) Negate(w);
    return w;
  }

  Word Hashed(const std::vector<unsigned char>& bytes) { return Crypto::Keccak256(bytes); }

  Word EncodeValue(const json& types, const std::string& type, const json& value);

  Word EncodeArray(const json& types, const std::string& type, const json& value) {
    auto open = type.rfind('[');
    if (open == std::string::npos || open == 0) throw std::invalid_argument("typed data: unsupported type " + type);
    std::string inner = type.substr(0, open);
    std::string size = type.substr(open + 1, type.size() - open - 2);
    if (!value.is_array()) throw std::invalid_argument("typed data: " + type + " value must be an array");
    if (!size.empty() && std::to_string(value.size()) != size)
      throw std::invalid_argument("typed data: " + type + " expects " + size + " elements");
    std::vector<unsigned char> packed;
    packed.reserve(32 * value.size());
    for (const auto& item : value) {
      Word w = EncodeValue(types, inner, item);
      packed.insert(packed.end(), w.begin(), w.end());
    }
    return Hashed(packed);
  }

  std::vector<unsigned char> HexValue(const std::string& type, const json& value) {
    if (!value.is_string()) throw std::invalid_argument("typed data: " + type + " value must be a hex string");
    const std::string& s = value.get_ref<const std::string&>();
    if (!IsHexString(s)) throw std::invalid_argument("typed data: bad hex for " + type);
    return HexToBytes(s);
  }

  Word EncodeValue(const json& types, const std::string& type, const json& value) {
    if (!type.empty() && type.back() == ']') return EncodeArray(types, type, value);
    if (types.contains(type)) return TypedData::HashStruct(types, type, value);

    if (type == "string") {
      if (!value.is_string()) throw std::invalid_argument("typed data: string value expected");
      const std::string& s = value.get_ref<const std::string&>();
      return Hashed(std::vector<unsigned char>(s.begin(), s.end()));
    }
    if (type == "bytes") return Hashed(HexValue(type, value));
    if (type == "bool") {
      if (!value.is_boolean()) throw std::invalid_argument("typed data: bool value expected");
      Word w{};
      w[31] = value.get<bool>() ? 1 : 0;
      return w;
    }
    if (type == "address") {
      if (!value.is_string()) throw std::invalid_argument("typed data: address value expected");
      std::vector<unsigned char> addr;
      try {
        addr = EthAddress::Parse(value.get<std::string>());
      } catch (const WalletError& e) {
        throw std::invalid_argument(std::string("typed data: ") + e.what());
      }
      Word w{};
      std::copy(addr.begin(), addr.end(), w.end() - addr.size());
      return w;
    }
    if (type.rfind("bytes", 0) == 0) {
      size_t n = 0;
      for (size_t i = 5; i < type.size() && n <= 32; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(type[i]))) { n = 0; break; }
        n = n * 10 + static_cast<size_t>(type[i] - '0');
      }
      if (n == 0 || n > 32 || type != "bytes" + std::to_string(n))
        throw std::invalid_argument("typed data: unsupported type " + type);
      auto bytes = HexValue(type, value);
      if (bytes.size() > n) throw std::invalid_argument("typed data: too many bytes for " + type);
      Word w{};
      std::copy(bytes.begin(), bytes.end(), w.begin());
      return w;
    }
    if (type.rfind("uint", 0) == 0) return EncodeInteger(type, value, false);
    if (type.rfind("int", 0) == 0) return EncodeInteger(type, value, true);
    throw std::invalid_argument("typed data: unsupported type " + type);
  }
}

namespace TypedData {
  std::string EncodeType(const json& types, const std::string& primary_type) {
    if (!types.is_object()) throw std::invalid_argument("typed data: types must be an object");
    FieldsOf(types, primary_type);
    std::set<std::string> deps;
    std::vector<std::string> order{primary_type};
    std::string out;
    try {
      CollectDependencies(types, primary_type, deps);
      deps.erase(primary_type);
      order.insert(order.end(), deps.begin(), deps.end());
      for (const auto& name : order) {
        out += name + "(";
        bool first = true;
        for (const auto& field : FieldsOf(types, name)) {
          if (!first) out += ",";
          first = false;
          out += field.at("type").get<std::string>() + " " + field.at("name").get<std::string>();
        }
        out += ")";
      }
    } catch (const json::exception& e) {
      throw std::invalid_argument(std::string("typed data: ") + e.what());
    }
    return out;
  }

  Crypto::Hash256 TypeHash(const json& types, const std::string& primary_type) {
    std::string encoded = EncodeType(types, primary_type);
    return Crypto::Keccak256(reinterpret_cast<const unsigned char*>(encoded.data()), encoded.size());
  }

  Crypto::Hash256 HashStruct(const json& types, const std::string& type, const json& data) {
    if (!data.is_object()) throw std::invalid_argument("typed data: " + type + " value must be an object");
    std::vector<unsigned char> encoded;
    auto type_hash = TypeHash(types, type);
    encoded.insert(encoded.end(), type_hash.begin(), type_hash.end());
    try {
      for (const auto& field : FieldsOf(types, type)) {
        const std::string name = field.at("name").get<std::string>();
        auto it = data.find(name);
        if (it == data.end()) throw std::invalid_argument("typed data: " + type + " is missing field " + name);
        Word w = EncodeValue(types, field.at("type").get<std::string>(), *it);
        encoded.insert(encoded.end(), w.begin(), w.end());
      }
    } catch (const json::exception& e) {
      throw std::invalid_argument(std::string("typed data: ") + e.what());
    }
    return Crypto::Keccak256(encoded);
  }

  Crypto::Hash256 Hash(const json& typed_data) {
    if (!typed_data.is_object()) throw std::invalid_argument("typed data must be a JSON object");
    for (const char* key : {"types", "primaryType", "domain"})
      if (!typed_data.contains(key)) throw std::invalid_argument(std::string("typed data: missing ") + key);
    if (!typed_data["primaryType"].is_string()) throw std::invalid_argument("typed data: primaryType must be a string");

    const json& types = typed_data["types"];
    const std::string primary = typed_data["primaryType"].get<std::string>();
    auto domain = HashStruct(types, kDomainType, typed_data["domain"]);

    std::vector<unsigned char> preimage{0x19, 0x01};
    preimage.insert(preimage.end(), domain.begin(), domain.end());
    if (primary != kDomainType) {
      if (!typed_data.contains("message")) throw std::invalid_argument("typed data: missing message");
      auto message = HashStruct(types, primary, typed_data["message"]);
      preimage.insert(preimage.end(), message.begin(), message.end());
    }
    return Crypto::Keccak256(preimage);
  }

  Crypto::Hash256 Hash(const std::string& typed_data_json) {
    json parsed = json::parse(typed_data_json, nullptr, false);
    if (parsed.is_discarded()) throw std::invalid_argument("typed data is not valid JSON");
    return Hash(parsed);
  }
}
