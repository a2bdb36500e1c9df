#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","id":id,"method":method,"params":params}
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, long long id);
  // Returns the "result" member. Throws TransportError for unparseable JSON,
  // a JSON-RPC error object (code and message preserved) or a missing result.
  // http_status is copied into the thrown error.
  nlohmann::json ExtractResult(const std::string& json_body, long http_status = 0);
  // Extract error message if present, empty otherwise
  std::string ExtractError(const std::string& json_body);
}
