#include "mcpgate/http/http_message.h"

#include <cctype>

namespace mcpgate {
namespace http {

namespace {

const std::pair<const char*, const char*> kSecurityHeaders[] = {
    {"X-Content-Type-Options", "nosniff"},
    {"X-Frame-Options", "DENY"},
    {"X-XSS-Protection", "1; mode=block"},
    {"Strict-Transport-Security", "max-age=31536000; includeSubDomains"},
    {"Content-Security-Policy", "default-src 'self'; frame-ancestors 'none'"},
    {"Referrer-Policy", "strict-origin-when-cross-origin"}};

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string trim(const std::string& value) {
  auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::string();
  }
  auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

}  // namespace

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string percentDecode(const std::string& text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size()) {
      int hi = hexValue(text[i + 1]);
      int lo = hexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(plus_as_space && c == '+' ? ' ' : c);
  }
  return out;
}

std::string HttpRequest::header(const std::string& name) const {
  for (const auto& h : headers) {
    if (equalsIgnoreCase(h.first, name)) {
      return h.second;
    }
  }
  return std::string();
}

bool HttpRequest::hasHeader(const std::string& name) const {
  for (const auto& h : headers) {
    if (equalsIgnoreCase(h.first, name)) {
      return true;
    }
  }
  return false;
}

bool HttpRequest::headerContainsToken(const std::string& name,
                                      const std::string& token) const {
  for (const auto& h : headers) {
    if (!equalsIgnoreCase(h.first, name)) {
      continue;
    }
    size_t start = 0;
    while (start <= h.second.size()) {
      size_t comma = h.second.find(',', start);
      if (comma == std::string::npos) {
        comma = h.second.size();
      }
      if (equalsIgnoreCase(trim(h.second.substr(start, comma - start)),
                           token)) {
        return true;
      }
      start = comma + 1;
    }
  }
  return false;
}

std::map<std::string, std::string> HttpRequest::queryParams() const {
  std::map<std::string, std::string> params;
  size_t start = 0;
  while (start < query.size()) {
    size_t amp = query.find('&', start);
    if (amp == std::string::npos) {
      amp = query.size();
    }
    std::string pair = query.substr(start, amp - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      std::string key = percentDecode(pair.substr(0, eq), true);
      std::string value = eq == std::string::npos
                              ? std::string()
                              : percentDecode(pair.substr(eq + 1), true);
      params.emplace(std::move(key), std::move(value));
    }
    start = amp + 1;
  }
  return params;
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& body) {
  HttpResponse response;
  response.status = status;
  response.setHeader("Content-Type", "application/json");
  response.body =
      body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

void HttpResponse::setHeader(const std::string& name,
                             const std::string& value) {
  for (auto& h : headers) {
    if (equalsIgnoreCase(h.first, name)) {
      h.second = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

std::string HttpResponse::serialize() const {
  std::string out = "HTTP/1.1 " + std::to_string(status) + " " +
                    statusReason(status) + "\r\n";
  for (const auto& h : headers) {
    out += h.first;
    out += ": ";
    out += h.second;
    out += "\r\n";
  }
  if (status != 101) {
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  }
  out += "\r\n";
  if (status != 101) {
    out += body;
  }
  return out;
}

const char* statusReason(int status) {
  switch (status) {
    case 101: return "Switching Protocols";
    case 200: return "OK";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 426: return "Upgrade Required";
    case 429: return "Too Many Requests";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
  }
  return "Unknown";
}

void addSecurityHeaders(HttpResponse& response) {
  for (const auto& h : kSecurityHeaders) {
    response.setHeader(h.first, h.second);
  }
}

}  // namespace http
}  // namespace mcpgate
