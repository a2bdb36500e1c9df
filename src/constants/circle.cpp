#include "constants/circle.hpp"
#include <stdexcept>
#include <unordered_map>

namespace CircleConstants {
  std::string ResolveScaCore(const std::string& version) {
    static const std::unordered_map<std::string, std::string> kVersions{
      {SMART_ACCOUNT_VERSION_V1, SCA_CORE_V1},
    };
    auto it = kVersions.find(version);
    if (it == kVersions.end()) throw std::invalid_argument("unknown smart account version: " + version);
    return it->second;
  }
}
