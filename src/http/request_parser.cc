#define MCPGATE_LOG_COMPONENT "http.parser"

#include "mcpgate/http/request_parser.h"

#include <llhttp.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace http {

RequestParser::RequestParser(const RequestLimits& limits)
    : limits_(limits),
      parser_(std::make_unique<llhttp_t>()),
      settings_(std::make_unique<llhttp_settings_t>()) {
  llhttp_settings_init(settings_.get());
  settings_->on_url = &RequestParser::onUrl;
  settings_->on_header_field = &RequestParser::onHeaderField;
  settings_->on_header_value = &RequestParser::onHeaderValue;
  settings_->on_headers_complete = &RequestParser::onHeadersComplete;
  settings_->on_body = &RequestParser::onBody;
  settings_->on_message_complete = &RequestParser::onMessageComplete;

  llhttp_init(parser_.get(), HTTP_REQUEST, settings_.get());
  parser_->data = this;
}

RequestParser::~RequestParser() = default;

ParseStatus RequestParser::feed(const char* data, size_t length) {
  if (status_ == ParseStatus::Complete) {
    trailing_.append(data, length);
    return status_;
  }
  if (status_ == ParseStatus::Error) {
    return status_;
  }

  llhttp_errno_t err = llhttp_execute(parser_.get(), data, length);

  if (err == HPE_OK) {
    return status_;
  }

  if ((err == HPE_PAUSED || err == HPE_PAUSED_UPGRADE) && message_complete_) {
    const char* stop = llhttp_get_error_pos(parser_.get());
    if (stop && stop >= data && stop < data + length) {
      trailing_.append(stop, static_cast<size_t>(data + length - stop));
    }
    status_ = ParseStatus::Complete;
    return status_;
  }

  if (status_ != ParseStatus::Error) {
    setError(400, llhttp_get_error_reason(parser_.get())
                      ? llhttp_get_error_reason(parser_.get())
                      : llhttp_errno_name(err));
  }
  return status_;
}

std::string RequestParser::takeTrailingBytes() {
  std::string out;
  out.swap(trailing_);
  return out;
}

void RequestParser::setError(int status, const std::string& reason) {
  status_ = ParseStatus::Error;
  error_status_ = status;
  error_reason_ = reason;
  MCPGATE_LOG(Debug, "Rejecting HTTP request ({}): {}", status, reason);
}

bool RequestParser::countHeaderBytes(size_t length) {
  header_bytes_ += length;
  if (header_bytes_ > limits_.max_header_bytes) {
    setError(431, "request headers exceed " +
                      std::to_string(limits_.max_header_bytes) + " bytes");
    return false;
  }
  return true;
}

int RequestParser::onUrl(llhttp_t* parser, const char* data, size_t length) {
  auto* self = static_cast<RequestParser*>(parser->data);
  if (!self->countHeaderBytes(length)) {
    return -1;
  }
  self->request_.target.append(data, length);
  return 0;
}

int RequestParser::onHeaderField(llhttp_t* parser,
                                 const char* data,
                                 size_t length) {
  auto* self = static_cast<RequestParser*>(parser->data);
  if (!self->countHeaderBytes(length)) {
    return -1;
  }
  if (self->last_was_value_ || self->request_.headers.empty()) {
    self->request_.headers.emplace_back(std::string(), std::string());
  }
  self->request_.headers.back().first.append(data, length);
  self->last_was_value_ = false;
  return 0;
}

int RequestParser::onHeaderValue(llhttp_t* parser,
                                 const char* data,
                                 size_t length) {
  auto* self = static_cast<RequestParser*>(parser->data);
  if (!self->countHeaderBytes(length)) {
    return -1;
  }
  if (self->request_.headers.empty()) {
    return -1;
  }
  self->request_.headers.back().second.append(data, length);
  self->last_was_value_ = true;
  return 0;
}

int RequestParser::onHeadersComplete(llhttp_t* parser) {
  auto* self = static_cast<RequestParser*>(parser->data);
  auto& request = self->request_;

  request.method = llhttp_method_name(static_cast<llhttp_method_t>(
      llhttp_get_method(parser)));
  request.upgrade = llhttp_get_upgrade(parser) != 0;

  for (auto& header : request.headers) {
    auto& value = header.second;
    auto last = value.find_last_not_of(" \t");
    value.erase(last == std::string::npos ? 0 : last + 1);
    value.erase(0, value.find_first_not_of(" \t"));
  }

  auto query_pos = request.target.find('?');
  request.path = percentDecode(request.target.substr(0, query_pos), false);
  if (query_pos != std::string::npos) {
    request.query = request.target.substr(query_pos + 1);
  }

  if ((parser->flags & F_CONTENT_LENGTH) &&
      parser->content_length > self->limits_.max_body_bytes) {
    self->setError(413, "request body exceeds " +
                            std::to_string(self->limits_.max_body_bytes) +
                            " bytes");
    return -1;
  }
  return 0;
}

int RequestParser::onBody(llhttp_t* parser, const char* data, size_t length) {
  auto* self = static_cast<RequestParser*>(parser->data);
  if (self->request_.body.size() + length > self->limits_.max_body_bytes) {
    self->setError(413, "request body exceeds " +
                            std::to_string(self->limits_.max_body_bytes) +
                            " bytes");
    return -1;
  }
  self->request_.body.append(data, length);
  return 0;
}

int RequestParser::onMessageComplete(llhttp_t* parser) {
  auto* self = static_cast<RequestParser*>(parser->data);
  self->message_complete_ = true;
  // Stop after one request; the connection answers and closes
  return HPE_PAUSED;
}

}  // namespace http
}  // namespace mcpgate
