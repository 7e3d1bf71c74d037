#ifndef MCPGATE_EVENT_EVENT_LOOP_H
#define MCPGATE_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mcpgate {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class SignalEvent;
class DeferredDeletable;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;
using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

enum class FileReadyType : uint32_t {
  Read = 0x01,
  Write = 0x02,
  Closed = 0x04
};

inline uint32_t operator|(FileReadyType a, FileReadyType b) {
  return static_cast<uint32_t>(a) | static_cast<uint32_t>(b);
}

inline uint32_t operator&(uint32_t a, FileReadyType b) {
  return a & static_cast<uint32_t>(b);
}

enum class RunType {
  Block,        // Run until no events remain
  NonBlock,     // Run one non-blocking iteration
  RunUntilExit  // Run until exit() is called
};

/**
 * Objects whose destruction must wait until the current callback stack has
 * unwound (a connection closing itself from inside its own read callback).
 */
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

/**
 * Level-triggered readiness notification on a file descriptor.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  // Replace the monitored set (FileReadyType bits)
  virtual void setEnabled(uint32_t events) = 0;
};

class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
  virtual bool enabled() = 0;
};

class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * Minimal dispatcher surface: enough for code that only needs to hop back
 * onto the event loop thread (tool completions, HTTP exchanges).
 */
class DispatcherBase {
 public:
  virtual ~DispatcherBase() = default;

  // Thread-safe; the callback runs on the dispatcher thread
  virtual void post(PostCb callback) = 0;

  virtual bool isThreadSafe() const = 0;
};

/**
 * Single-threaded event loop. All objects created from a dispatcher must be
 * used and destroyed on its thread; only post() and exit() may be called
 * from other threads.
 */
class Dispatcher : public DispatcherBase {
 public:
  ~Dispatcher() override = default;

  virtual const std::string& name() = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  virtual void exit() = 0;

  virtual void run(RunType type) = 0;
};

DispatcherPtr createLibeventDispatcher(const std::string& name);

}  // namespace event
}  // namespace mcpgate

#endif  // MCPGATE_EVENT_EVENT_LOOP_H
