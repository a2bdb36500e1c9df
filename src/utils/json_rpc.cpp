#include "utils/json_rpc.hpp"
#include "common/errors.hpp"

using json = nlohmann::json;

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const json& params, long long id) {
    json j{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return j.dump();
  }

  json ExtractResult(const std::string& body, long http_status) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      throw TransportError("invalid JSON-RPC response", http_status, std::nullopt, body);
    if (j.contains("error") && !j["error"].is_null()) {
      const auto& err = j["error"];
      std::optional<long long> code;
      std::string message = err.dump();
      if (err.is_object()) {
        if (err.contains("code") && err["code"].is_number_integer()) code = err["code"].get<long long>();
        if (err.contains("message") && err["message"].is_string()) message = err["message"].get<std::string>();
      }
      throw TransportError("RPC error: " + message, http_status, code, err.dump());
    }
    if (!j.contains("result")) throw TransportError("missing result", http_status, std::nullopt, body);
    return j["result"];
  }

  std::string ExtractError(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error")) return std::string();
    const auto& err = j["error"];
    if (err.is_object() && err.contains("message") && err["message"].is_string())
      return err["message"].get<std::string>();
    return err.dump();
  }
}
