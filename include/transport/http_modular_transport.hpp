#pragma once
#include "transport/modular_transport.hpp"
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

struct HttpTransportOptions {
  std::unordered_map<std::string, std::string> headers;  // added to every request
  int timeout_ms = 10000;
};

// JSON-RPC 2.0 over HTTP POST.
class HttpModularTransport : public ModularTransport {
public:
  HttpModularTransport(HttpClient& http, const std::string& url, const HttpTransportOptions& options = {});

  // Adds "Authorization: Bearer <client_key>".
  static HttpModularTransport WithClientKey(HttpClient& http,
                                            const std::string& client_key,
                                            const std::string& url,
                                            int timeout_ms = 10000);

  // circle_getAddress
  ModularWallet GetAddress(const AddressDerivationRequest& request) override;

  const std::string& Url() const { return url_; }
  const std::unordered_map<std::string, std::string>& Headers() const { return headers_; }
private:
  HttpClient& http_;
  std::string url_;
  std::unordered_map<std::string, std::string> headers_;
  int timeout_ms_;
  nlohmann::json Call(const std::string& method, const nlohmann::json& params, long* status_out);
};
