#define MCPGATE_LOG_COMPONENT "auth.http"

#include "mcpgate/auth/http_client.h"

#include <atomic>
#include <mutex>

#include <curl/curl.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace auth {

namespace {

std::once_flag g_curl_init;

// CURL write callback
size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  std::string* response = static_cast<std::string*>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

// CURL header callback
size_t header_callback(char* buffer,
                       size_t size,
                       size_t nitems,
                       void* userdata) {
  auto* headers =
      static_cast<std::unordered_map<std::string, std::string>*>(userdata);
  std::string header(buffer, size * nitems);

  size_t colon_pos = header.find(':');
  if (colon_pos != std::string::npos) {
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);

    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t\r\n") + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    if (!name.empty()) {
      (*headers)[name] = value;
    }
  }

  return size * nitems;
}

// Strips the query string so tokens in URLs never reach the log
std::string redactUrl(const std::string& url) {
  auto pos = url.find('?');
  return pos == std::string::npos ? url : url.substr(0, pos) + "?...";
}

}  // namespace

std::string urlEncode(const std::string& value) {
  std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_ALL); });
  char* escaped =
      curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    return std::string();
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

std::string encodeForm(
    const std::initializer_list<std::pair<std::string, std::string>>& fields) {
  std::string body;
  for (const auto& field : fields) {
    if (!body.empty()) {
      body += '&';
    }
    body += urlEncode(field.first);
    body += '=';
    body += urlEncode(field.second);
  }
  return body;
}

class HttpClient::Impl {
 public:
  explicit Impl(const Config& config)
      : config_(config),
        total_requests_(0),
        failed_requests_(0),
        total_latency_ms_(0) {
    // curl_global_init is not thread-safe; run it once per process
    std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_ALL); });
  }

  HttpResponse request(const HttpRequest& request) {
    auto start = std::chrono::steady_clock::now();
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
      response.status_code = -1;
      response.error = "Failed to initialize CURL";
      ++failed_requests_;
      return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (request.method == HttpMethod::POST) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(request.body.size()));
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header_pair : request.headers) {
      std::string header = header_pair.first + ": " + header_pair.second;
      headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER,
                     request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST,
                     request.verify_ssl ? 2L : 0L);
    if (!config_.ca_bundle_path.empty()) {
      curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION,
                     request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS,
                     static_cast<long>(request.max_redirects));

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config_.connection_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                     static_cast<long>(request.timeout.count()));

    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);

    if (res != CURLE_OK) {
      response.error = curl_easy_strerror(res);
      if (response.status_code == 0) {
        response.status_code = -1;
      }
      ++failed_requests_;
    }

    auto end = std::chrono::steady_clock::now();
    response.latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    ++total_requests_;
    total_latency_ms_ += response.latency.count();

    if (headers) {
      curl_slist_free_all(headers);
    }
    curl_easy_cleanup(curl);

    if (response.transportFailed()) {
      MCPGATE_LOG(Warning, "{} {} failed after {}ms: {}",
                  request.method == HttpMethod::POST ? "POST" : "GET",
                  redactUrl(request.url), response.latency.count(),
                  response.error);
    } else {
      MCPGATE_LOG(Debug, "{} {} -> {} ({}ms)",
                  request.method == HttpMethod::POST ? "POST" : "GET",
                  redactUrl(request.url), response.status_code,
                  response.latency.count());
    }
    return response;
  }

  Stats stats() const {
    Stats stats;
    stats.total_requests = total_requests_;
    stats.failed_requests = failed_requests_;
    size_t total = total_requests_;
    stats.avg_latency = std::chrono::milliseconds(
        total > 0 ? total_latency_ms_ / static_cast<long long>(total) : 0);
    return stats;
  }

 private:
  Config config_;
  std::atomic<size_t> total_requests_;
  std::atomic<size_t> failed_requests_;
  std::atomic<long long> total_latency_ms_;
};

HttpClient::HttpClient(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::request(const HttpRequest& request) {
  return impl_->request(request);
}

HttpResponse HttpClient::get(
    const std::string& url,
    const std::unordered_map<std::string, std::string>& headers) {
  HttpRequest request;
  request.url = url;
  request.method = HttpMethod::GET;
  request.headers = headers;
  return impl_->request(request);
}

HttpResponse HttpClient::post(
    const std::string& url,
    const std::string& body,
    const std::unordered_map<std::string, std::string>& headers) {
  HttpRequest request;
  request.url = url;
  request.method = HttpMethod::POST;
  request.body = body;
  request.headers = headers;
  return impl_->request(request);
}

HttpClient::Stats HttpClient::stats() const { return impl_->stats(); }

}  // namespace auth
}  // namespace mcpgate
