#pragma once
#include <memory>
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;   // 0 when the request never reached the server
  std::string body;
  std::string error;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientTuning {
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  bool verify_tls = true;
  int connect_timeout_ms = 5000;
};

// libcurl-backed client.
std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning{});
