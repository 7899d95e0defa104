#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) throw std::runtime_error("curl_global_init failed");
    curl_ = curl_easy_init();
    if (!curl_) {
      curl_global_cleanup();
      throw std::runtime_error("curl_easy_init failed");
    }
  }
  ~CurlHttpClient() override {
    curl_easy_cleanup(curl_);
    curl_global_cleanup();
  }
  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    HttpResponse resp;
    std::lock_guard<std::mutex> lock(mu_);
    // One handle per client: reset clears options but keeps the connection cache
    CURL* curl = curl_;
    curl_easy_reset(curl);
    std::string response_string;
    struct curl_slist* header_list = nullptr;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(tuning_.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Keep-alive and HTTP/2
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    if (tuning_.enable_http2) curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    if (!tuning_.verify_tls) {
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      resp.error = std::string("curl_easy_perform failed: ") + curl_easy_strerror(rc);
      LOG_ERROR(resp.error);
    } else {
      long code = 0;
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
      resp.status = code;
      resp.body = std::move(response_string);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    if (header_list) curl_slist_free_all(header_list);
    return resp;
  }
private:
  HttpClientTuning tuning_;
  CURL* curl_ = nullptr;
  std::mutex mu_;
};
}

std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return std::unique_ptr<HttpClient>(new CurlHttpClient(tuning));
}
