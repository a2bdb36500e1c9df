#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;    // 0 when the request never got a response
  std::string body;
  std::string error;  // transport-level failure description, empty on success
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

// Optional tuning knobs for the curl client
struct HttpClientTuning {
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  bool verify_tls = true;
};

// libcurl-based client. One easy handle per request, so Post() may be called
// concurrently. Caller owns the result.
HttpClient* CreateCurlHttpClientTuned(const HttpClientTuning& tuning);
