#ifndef MCPGATE_HTTP_HTTP_MESSAGE_H
#define MCPGATE_HTTP_HTTP_MESSAGE_H

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpgate {
namespace http {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method;  // "GET", "POST", ...
  std::string target;  // raw request target
  std::string path;    // percent-decoded, without query
  std::string query;   // raw query string without '?'
  HeaderList headers;
  std::string body;
  bool upgrade{false};

  // Case-insensitive lookup; empty when absent
  std::string header(const std::string& name) const;
  bool hasHeader(const std::string& name) const;

  // Case-insensitive token search in a comma-separated header
  bool headerContainsToken(const std::string& name,
                           const std::string& token) const;

  // Decoded query parameters; the first occurrence of a key wins
  std::map<std::string, std::string> queryParams() const;
};

struct HttpResponse {
  int status{200};
  HeaderList headers;
  std::string body;

  static HttpResponse json(int status, const nlohmann::json& body);

  void setHeader(const std::string& name, const std::string& value);

  // Status line, headers with Content-Length, blank line, body
  std::string serialize() const;
};

const char* statusReason(int status);

// Headers every response carries
void addSecurityHeaders(HttpResponse& response);

std::string percentDecode(const std::string& text, bool plus_as_space);

bool equalsIgnoreCase(const std::string& a, const std::string& b);

}  // namespace http
}  // namespace mcpgate

#endif  // MCPGATE_HTTP_HTTP_MESSAGE_H
