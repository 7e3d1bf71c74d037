#ifndef MCPGATE_NETWORK_LISTENER_H
#define MCPGATE_NETWORK_LISTENER_H

#include <cstdint>
#include <string>

#include "mcpgate/event/event_loop.h"

namespace mcpgate {
namespace network {

class ListenerCallbacks {
 public:
  virtual ~ListenerCallbacks() = default;

  /**
   * Called for each accepted socket. fd is non-blocking and owned by the
   * callee from here on.
   */
  virtual void onAccept(int fd, const std::string& peer_address) = 0;
};

/**
 * Listening TCP socket bound to host:port (SO_REUSEADDR, non-blocking).
 */
class TcpListener {
 public:
  TcpListener(event::Dispatcher& dispatcher, ListenerCallbacks& callbacks);
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  /**
   * Bind and start accepting. Port 0 picks an ephemeral port.
   * @throws std::runtime_error when the address cannot be resolved or bound
   */
  void listen(const std::string& host, uint16_t port, int backlog = 128);

  // Stop accepting and close the socket. Idempotent.
  void close();

  bool isListening() const { return fd_ >= 0; }
  uint16_t localPort() const { return local_port_; }

 private:
  void onAcceptReady();

  event::Dispatcher& dispatcher_;
  ListenerCallbacks& callbacks_;
  int fd_{-1};
  uint16_t local_port_{0};
  event::FileEventPtr file_event_;
};

}  // namespace network
}  // namespace mcpgate

#endif  // MCPGATE_NETWORK_LISTENER_H
