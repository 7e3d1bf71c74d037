#ifndef MCPGATE_HTTP_REQUEST_PARSER_H
#define MCPGATE_HTTP_REQUEST_PARSER_H

#include <cstddef>
#include <memory>
#include <string>

#include "mcpgate/http/http_message.h"

// Forward declare llhttp types to avoid including llhttp.h in header
typedef struct llhttp__internal_s llhttp_t;
typedef struct llhttp_settings_s llhttp_settings_t;

namespace mcpgate {
namespace http {

enum class ParseStatus {
  NeedMore,  // request incomplete
  Complete,  // one full request parsed; further input is not consumed
  Error      // malformed or over a limit; see errorStatus()
};

struct RequestLimits {
  size_t max_header_bytes = 16 * 1024;  // request line plus headers
  size_t max_body_bytes = 64 * 1024;
};

/**
 * llhttp-based parser for exactly one HTTP/1.x request.
 *
 * Bytes following the request (a client that starts talking websocket
 * before reading the 101) are kept and available via takeTrailingBytes().
 * Not thread-safe; one instance per connection.
 */
class RequestParser {
 public:
  explicit RequestParser(const RequestLimits& limits = RequestLimits());
  ~RequestParser();

  RequestParser(const RequestParser&) = delete;
  RequestParser& operator=(const RequestParser&) = delete;

  ParseStatus feed(const char* data, size_t length);

  ParseStatus status() const { return status_; }
  const HttpRequest& request() const { return request_; }

  // 400, 413 or 431 once status() is Error
  int errorStatus() const { return error_status_; }
  const std::string& errorReason() const { return error_reason_; }

  std::string takeTrailingBytes();

 private:
  static int onUrl(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderField(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderValue(llhttp_t* parser, const char* data, size_t length);
  static int onHeadersComplete(llhttp_t* parser);
  static int onBody(llhttp_t* parser, const char* data, size_t length);
  static int onMessageComplete(llhttp_t* parser);

  bool countHeaderBytes(size_t length);
  void setError(int status, const std::string& reason);

  RequestLimits limits_;
  std::unique_ptr<llhttp_t> parser_;
  std::unique_ptr<llhttp_settings_t> settings_;

  HttpRequest request_;
  ParseStatus status_{ParseStatus::NeedMore};
  int error_status_{0};
  std::string error_reason_;
  size_t header_bytes_{0};
  bool last_was_value_{false};
  bool message_complete_{false};
  std::string trailing_;
};

}  // namespace http
}  // namespace mcpgate

#endif  // MCPGATE_HTTP_REQUEST_PARSER_H
