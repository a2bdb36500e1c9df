#include "transport/http_modular_transport.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "net/http_client.hpp"
#include "utils/json_rpc.hpp"
#include <chrono>

#ifndef MODULAR_WALLET_VERSION
#define MODULAR_WALLET_VERSION "0.0.0"
#endif

using json = nlohmann::json;

static long long NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

HttpModularTransport::HttpModularTransport(HttpClient& http, const std::string& url, const HttpTransportOptions& options)
  : http_(http), url_(url), timeout_ms_(options.timeout_ms) {
  headers_["Content-Type"] = "application/json";
  headers_["X-AppInfo"] = std::string("platform=linux;version=") + MODULAR_WALLET_VERSION;
  for (const auto& kv : options.headers) headers_[kv.first] = kv.second;
}

HttpModularTransport HttpModularTransport::WithClientKey(HttpClient& http,
                                                         const std::string& client_key,
                                                         const std::string& url,
                                                         int timeout_ms) {
  HttpTransportOptions options;
  options.headers["Authorization"] = "Bearer " + client_key;
  options.timeout_ms = timeout_ms;
  return HttpModularTransport(http, url, options);
}

json HttpModularTransport::Call(const std::string& method, const json& params, long* status_out) {
  auto payload = JsonRpcUtil::BuildRequest(method, params, NowMillis());
  Logger::Debug("POST " + url_ + " method=" + method);
  auto resp = http_.Post(url_, payload, headers_, timeout_ms_);
  if (resp.status == 0) {
    Logger::Error(method + " request failed: " + resp.error);
    throw TransportError("HTTP request failed: " + (resp.error.empty() ? std::string("no response") : resp.error));
  }
  if (resp.status < 200 || resp.status >= 300) {
    std::string details = JsonRpcUtil::ExtractError(resp.body);
    if (details.empty()) details = "Request failed: " + resp.body;
    Logger::Error(method + " HTTP status=" + std::to_string(resp.status) + " " + details);
    throw TransportError("HTTP request failed with status " + std::to_string(resp.status), resp.status, std::nullopt, details);
  }
  if (status_out) *status_out = resp.status;
  try {
    return JsonRpcUtil::ExtractResult(resp.body, resp.status);
  } catch (const TransportError& e) {
    Logger::Error(method + " " + e.what() + (e.RpcCode() ? " code=" + std::to_string(*e.RpcCode()) : std::string()));
    throw;
  }
}

ModularWallet HttpModularTransport::GetAddress(const AddressDerivationRequest& request) {
  long status = 0;
  json result = Call("circle_getAddress", json::array({request}), &status);
  try {
    return result.get<ModularWallet>();
  } catch (const json::exception& e) {
    Logger::Error(std::string("[DecodingError] ModularWallet from content: ") + result.dump());
    throw TransportError("failed to decode circle_getAddress result", status, std::nullopt, e.what());
  }
}
