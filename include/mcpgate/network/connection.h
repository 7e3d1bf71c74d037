#ifndef MCPGATE_NETWORK_CONNECTION_H
#define MCPGATE_NETWORK_CONNECTION_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "mcpgate/event/event_loop.h"

namespace mcpgate {
namespace network {

/**
 * Connection events
 */
enum class ConnectionEvent {
  RemoteClose,  // peer closed, reset, or a read/write error
  LocalClose    // close() was called
};

enum class ConnectionCloseType {
  FlushWrite,  // Flush pending write data before closing
  NoFlush      // Close immediately without flushing
};

struct ConnectionStats {
  uint64_t read_total{0};
  uint64_t write_total{0};
};

class ConnectionCallbacks {
 public:
  virtual ~ConnectionCallbacks() = default;

  // Bytes read from the socket, in order
  virtual void onData(const char* data, size_t length) = 0;

  // Called exactly once, when the socket is closed
  virtual void onEvent(ConnectionEvent event) = 0;
};

/**
 * Non-blocking TCP connection owned by one dispatcher thread.
 *
 * Callbacks may call close() or write() re-entrantly. Owners that destroy
 * the connection from inside a callback must go through
 * Dispatcher::deferredDelete().
 */
class TcpConnection : public event::DeferredDeletable {
 public:
  // Writes queued above this are treated as a stalled peer
  static constexpr size_t kMaxPendingWriteBytes = 8 * 1024 * 1024;

  TcpConnection(event::Dispatcher& dispatcher,
                int fd,
                const std::string& peer_address,
                uint64_t id);
  ~TcpConnection() override;

  TcpConnection(const TcpConnection&) = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;

  void setCallbacks(ConnectionCallbacks& callbacks) { callbacks_ = &callbacks; }

  void write(const std::string& data);
  void close(ConnectionCloseType type);

  /**
   * Stop (true) or resume (false) reading from the socket. Calls nest: reading
   * resumes once every disable has been matched by an enable. Bytes the peer
   * sends meanwhile stay in the kernel buffer.
   */
  void readDisable(bool disable);
  bool readEnabled() const { return read_disable_count_ == 0; }

  bool isOpen() const { return state_ == State::Open; }
  bool isClosed() const { return state_ == State::Closed; }
  const std::string& peerAddress() const { return peer_address_; }
  uint64_t id() const { return id_; }
  const ConnectionStats& stats() const { return stats_; }
  size_t pendingWriteBytes() const { return write_buffer_.size(); }

 private:
  enum class State { Open, Closing, Closed };

  void onFileEvent(uint32_t events);
  void doRead();
  void doWrite();
  void updateInterest();
  void closeSocket(ConnectionEvent event);

  event::Dispatcher& dispatcher_;
  int fd_;
  std::string peer_address_;
  uint64_t id_;
  ConnectionCallbacks* callbacks_{nullptr};
  event::FileEventPtr file_event_;
  std::string write_buffer_;
  State state_{State::Open};
  uint32_t enabled_events_;
  uint32_t read_disable_count_{0};
  ConnectionStats stats_;
};

using TcpConnectionPtr = std::unique_ptr<TcpConnection>;

}  // namespace network
}  // namespace mcpgate

#endif  // MCPGATE_NETWORK_CONNECTION_H
