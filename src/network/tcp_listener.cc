#define MCPGATE_LOG_COMPONENT "network.listener"

#include "mcpgate/network/listener.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace network {

namespace {

// Accepted sockets handled per readiness event
constexpr int kMaxAcceptsPerEvent = 64;

std::string formatAddress(const sockaddr_storage& addr) {
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
    inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer));
  } else if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer));
  }
  return buffer[0] ? std::string(buffer) : std::string("unknown");
}

}  // namespace

TcpListener::TcpListener(event::Dispatcher& dispatcher,
                         ListenerCallbacks& callbacks)
    : dispatcher_(dispatcher), callbacks_(callbacks) {}

TcpListener::~TcpListener() { close(); }

void TcpListener::listen(const std::string& host, uint16_t port, int backlog) {
  if (fd_ >= 0) {
    throw std::runtime_error("listener already bound");
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

  addrinfo* results = nullptr;
  std::string service = std::to_string(port);
  int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(),
                       &hints, &results);
  if (rc != 0) {
    throw std::runtime_error("cannot resolve " + host + ": " +
                             gai_strerror(rc));
  }

  std::string last_error = "no usable address";
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family,
                      ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0 ||
        ::listen(fd, backlog) != 0) {
      last_error = std::strerror(errno);
      ::close(fd);
      continue;
    }
    fd_ = fd;
    break;
  }
  freeaddrinfo(results);

  if (fd_ < 0) {
    throw std::runtime_error("cannot listen on " + host + ":" + service +
                             ": " + last_error);
  }

  sockaddr_storage local{};
  socklen_t len = sizeof(local);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
    if (local.ss_family == AF_INET) {
      local_port_ = ntohs(reinterpret_cast<sockaddr_in*>(&local)->sin_port);
    } else if (local.ss_family == AF_INET6) {
      local_port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&local)->sin6_port);
    }
  }

  file_event_ = dispatcher_.createFileEvent(
      fd_, [this](uint32_t) { onAcceptReady(); },
      static_cast<uint32_t>(event::FileReadyType::Read));

  MCPGATE_LOG(Info, "Listening on {}:{}", host, local_port_);
}

void TcpListener::close() {
  if (fd_ < 0) {
    return;
  }
  file_event_.reset();
  ::close(fd_);
  fd_ = -1;
  MCPGATE_LOG(Info, "Listener on port {} closed", local_port_);
}

void TcpListener::onAcceptReady() {
  for (int i = 0; i < kMaxAcceptsPerEvent && fd_ >= 0; ++i) {
    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    int fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&peer), &len,
                       SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        MCPGATE_LOG(Error, "accept failed: {}", std::strerror(errno));
      }
      return;
    }
    callbacks_.onAccept(fd, formatAddress(peer));
  }
}

}  // namespace network
}  // namespace mcpgate
