#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "mcpgate/auth/http_client.h"

namespace mcpgate {
namespace auth {
namespace {

// Accepts one connection, reads the request head and replies with a
// canned response.
class OneShotServer {
 public:
  explicit OneShotServer(std::string response) : response_(std::move(response)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this]() {
      int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        return;
      }
      char buffer[4096];
      std::string received;
      while (received.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
        if (n <= 0) {
          break;
        }
        received.append(buffer, static_cast<size_t>(n));
      }
      request_ = received;
      ::send(client, response_.data(), response_.size(), 0);
      ::close(client);
    });
  }

  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(fd_);
  }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  const std::string& request() {
    thread_.join();
    return request_;
  }

 private:
  int fd_{-1};
  uint16_t port_{0};
  std::string response_;
  std::string request_;
  std::thread thread_;
};

TEST(HttpClientTest, UrlEncodeEscapesReservedCharacters) {
  EXPECT_EQ(urlEncode("abc-_.~123"), "abc-_.~123");
  EXPECT_EQ(urlEncode("a b"), "a%20b");
  EXPECT_EQ(urlEncode("x=1&y=2"), "x%3D1%26y%3D2");
  EXPECT_EQ(urlEncode("https://h/p"), "https%3A%2F%2Fh%2Fp");
  EXPECT_EQ(urlEncode(""), "");
}

TEST(HttpClientTest, EncodeFormJoinsFields) {
  EXPECT_EQ(encodeForm({{"a", "1"}, {"b", "two words"}}),
            "a=1&b=two%20words");
  EXPECT_EQ(encodeForm({}), "");
}

TEST(HttpClientTest, ResponseHelpers) {
  HttpResponse response;
  EXPECT_FALSE(response.ok());

  response.status_code = 204;
  EXPECT_TRUE(response.ok());

  response.status_code = 404;
  EXPECT_FALSE(response.ok());

  response.status_code = -1;
  response.error = "timeout";
  EXPECT_TRUE(response.transportFailed());
}

TEST(HttpClientTest, ConnectionRefusedIsTransportFailure) {
  HttpClient client;
  HttpRequest request;
  request.url = "http://127.0.0.1:1/unreachable";
  request.timeout = std::chrono::seconds(5);

  auto response = client.request(request);

  EXPECT_TRUE(response.transportFailed());
  EXPECT_EQ(response.status_code, -1);
  EXPECT_EQ(client.stats().failed_requests, 1u);
  EXPECT_EQ(client.stats().total_requests, 1u);
}

TEST(HttpClientTest, GetReturnsStatusHeadersAndBody) {
  OneShotServer server(
      "HTTP/1.1 200 OK\r\n"
      "Content-Type: application/json\r\n"
      "Content-Length: 11\r\n"
      "Connection: close\r\n\r\n"
      "{\"ok\":true}");
  HttpClient client;

  auto response =
      client.get(server.url("/v1/thing"), {{"Authorization", "Bearer abc"}});

  EXPECT_TRUE(response.ok());
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, "{\"ok\":true}");
  EXPECT_EQ(response.headers["Content-Type"], "application/json");

  const auto& raw = server.request();
  EXPECT_EQ(raw.rfind("GET /v1/thing HTTP/1.1\r\n", 0), 0u);
  EXPECT_NE(raw.find("Authorization: Bearer abc\r\n"), std::string::npos);
  EXPECT_NE(raw.find("User-Agent: mcpgate/"), std::string::npos);
}

TEST(HttpClientTest, ErrorStatusIsNotTransportFailure) {
  OneShotServer server(
      "HTTP/1.1 401 Unauthorized\r\n"
      "Content-Length: 0\r\n"
      "Connection: close\r\n\r\n");
  HttpClient client;

  auto response = client.get(server.url("/"));

  EXPECT_FALSE(response.transportFailed());
  EXPECT_FALSE(response.ok());
  EXPECT_EQ(response.status_code, 401);
}

}  // namespace
}  // namespace auth
}  // namespace mcpgate
