#ifndef MCPGATE_AUTH_HTTP_CLIENT_H
#define MCPGATE_AUTH_HTTP_CLIENT_H

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

/**
 * @file http_client.h
 * @brief Blocking HTTPS client for the provider API and OAuth token endpoint
 *
 * Calls block the calling thread; run them on a worker pool, never on a
 * dispatcher thread.
 */

namespace mcpgate {
namespace auth {

/**
 * @brief HTTP request method
 */
enum class HttpMethod { GET, POST };

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
  int status_code{-1};  // -1 on transport failure
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  std::string error;  // Transport error text, empty on success
  std::chrono::milliseconds latency{0};

  bool transportFailed() const { return !error.empty(); }
  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }
};

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
  std::string url;
  HttpMethod method;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout;
  bool verify_ssl;
  bool follow_redirects;
  int max_redirects;

  HttpRequest()
      : method(HttpMethod::GET),
        timeout(30),
        verify_ssl(true),
        follow_redirects(true),
        max_redirects(5) {}
};

/**
 * @brief Percent-encode a string for a query or form body
 */
std::string urlEncode(const std::string& value);

/**
 * @brief Build "k1=v1&k2=v2" with both sides percent-encoded
 */
std::string encodeForm(
    const std::initializer_list<std::pair<std::string, std::string>>& fields);

/**
 * @brief Abstract client so tools and the OAuth flow can be tested offline
 */
class HttpClientBase {
 public:
  virtual ~HttpClientBase() = default;

  virtual HttpResponse request(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl-backed client
 */
class HttpClient : public HttpClientBase {
 public:
  struct Config {
    std::chrono::seconds connection_timeout;
    std::string ca_bundle_path;
    std::string user_agent;

    Config() : connection_timeout(10), user_agent("mcpgate/2.0.0") {}
  };

  struct Stats {
    size_t total_requests;
    size_t failed_requests;
    std::chrono::milliseconds avg_latency;
  };

  explicit HttpClient(const Config& config = Config());
  ~HttpClient() override;

  HttpResponse request(const HttpRequest& request) override;

  HttpResponse get(
      const std::string& url,
      const std::unordered_map<std::string, std::string>& headers = {});

  HttpResponse post(
      const std::string& url,
      const std::string& body,
      const std::unordered_map<std::string, std::string>& headers = {});

  Stats stats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace auth
}  // namespace mcpgate

#endif  // MCPGATE_AUTH_HTTP_CLIENT_H
