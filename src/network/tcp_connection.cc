#define MCPGATE_LOG_COMPONENT "network.connection"

#include "mcpgate/network/connection.h"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace network {

namespace {

constexpr size_t kReadChunkSize = 16 * 1024;
// Bound per-event work so one busy peer cannot starve the loop
constexpr int kMaxReadsPerEvent = 16;

}  // namespace

TcpConnection::TcpConnection(event::Dispatcher& dispatcher,
                             int fd,
                             const std::string& peer_address,
                             uint64_t id)
    : dispatcher_(dispatcher),
      fd_(fd),
      peer_address_(peer_address),
      id_(id),
      enabled_events_(static_cast<uint32_t>(event::FileReadyType::Read)) {
  file_event_ = dispatcher_.createFileEvent(
      fd_, [this](uint32_t events) { onFileEvent(events); }, enabled_events_);
}

TcpConnection::~TcpConnection() {
  // No callbacks from the destructor; the owner is going away
  callbacks_ = nullptr;
  closeSocket(ConnectionEvent::LocalClose);
}

void TcpConnection::write(const std::string& data) {
  if (state_ != State::Open || data.empty()) {
    return;
  }
  if (write_buffer_.size() + data.size() > kMaxPendingWriteBytes) {
    MCPGATE_LOG(Warning,
                "Connection {} to {} has {} bytes pending; closing stalled "
                "peer",
                id_, peer_address_, write_buffer_.size());
    closeSocket(ConnectionEvent::LocalClose);
    return;
  }
  write_buffer_ += data;
  doWrite();
}

void TcpConnection::close(ConnectionCloseType type) {
  if (state_ == State::Closed) {
    return;
  }
  if (type == ConnectionCloseType::NoFlush || write_buffer_.empty()) {
    closeSocket(ConnectionEvent::LocalClose);
    return;
  }
  // Closed from doWrite() once the buffer drains
  state_ = State::Closing;
  doWrite();
}

void TcpConnection::readDisable(bool disable) {
  if (disable) {
    ++read_disable_count_;
  } else if (read_disable_count_ > 0) {
    --read_disable_count_;
  } else {
    MCPGATE_LOG(Warning, "Unbalanced read enable on connection {}", id_);
    return;
  }
  updateInterest();
}

void TcpConnection::onFileEvent(uint32_t events) {
  if (events & event::FileReadyType::Write) {
    doWrite();
  }
  if (state_ == State::Open && readEnabled() &&
      (events & event::FileReadyType::Read)) {
    doRead();
  }
}

void TcpConnection::doRead() {
  char buffer[kReadChunkSize];
  for (int i = 0;
       i < kMaxReadsPerEvent && state_ == State::Open && readEnabled(); ++i) {
    ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
    if (n > 0) {
      stats_.read_total += static_cast<uint64_t>(n);
      if (callbacks_) {
        callbacks_->onData(buffer, static_cast<size_t>(n));
      }
      if (static_cast<size_t>(n) < sizeof(buffer)) {
        return;
      }
      continue;
    }
    if (n == 0) {
      MCPGATE_LOG(Debug, "Connection {} closed by peer {}", id_,
                  peer_address_);
      closeSocket(ConnectionEvent::RemoteClose);
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    }
    MCPGATE_LOG(Debug, "Read error on connection {}: {}", id_,
                std::strerror(errno));
    closeSocket(ConnectionEvent::RemoteClose);
    return;
  }
}

void TcpConnection::doWrite() {
  while (!write_buffer_.empty() && state_ != State::Closed) {
    ssize_t n = ::send(fd_, write_buffer_.data(), write_buffer_.size(),
                       MSG_NOSIGNAL);
    if (n > 0) {
      stats_.write_total += static_cast<uint64_t>(n);
      write_buffer_.erase(0, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      break;
    }
    MCPGATE_LOG(Debug, "Write error on connection {}: {}", id_,
                std::strerror(errno));
    closeSocket(ConnectionEvent::RemoteClose);
    return;
  }

  if (state_ == State::Closing && write_buffer_.empty()) {
    closeSocket(ConnectionEvent::LocalClose);
    return;
  }
  updateInterest();
}

void TcpConnection::updateInterest() {
  if (state_ == State::Closed || !file_event_) {
    return;
  }
  uint32_t events = 0;
  if (readEnabled()) {
    events |= static_cast<uint32_t>(event::FileReadyType::Read);
  }
  if (!write_buffer_.empty()) {
    events |= static_cast<uint32_t>(event::FileReadyType::Write);
  }
  if (events == enabled_events_) {
    return;
  }
  enabled_events_ = events;
  file_event_->setEnabled(events);
}

void TcpConnection::closeSocket(ConnectionEvent event) {
  if (state_ == State::Closed) {
    return;
  }
  state_ = State::Closed;
  file_event_.reset();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  write_buffer_.clear();

  if (callbacks_) {
    callbacks_->onEvent(event);
  }
}

}  // namespace network
}  // namespace mcpgate
