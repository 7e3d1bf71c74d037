#ifndef MCPGATE_EVENT_LIBEVENT_DISPATCHER_H
#define MCPGATE_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "mcpgate/event/event_loop.h"

struct event_base;
struct event;

namespace mcpgate {
namespace event {

using libevent_event = struct event;

/**
 * Dispatcher backed by a libevent event_base. Cross-thread post() wakes the
 * loop through a self-pipe.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  // DispatcherBase
  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  // Dispatcher
  const std::string& name() override { return name_; }
  FileEventPtr createFileEvent(int fd, FileReadyCb cb, uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;
  void deferredDelete(DeferredDeletablePtr&& to_delete) override;
  void exit() override;
  void run(RunType type) override;

  event_base* base() { return base_; }

 private:
  class FileEventImpl : public FileEvent {
   public:
    FileEventImpl(LibeventDispatcher& dispatcher,
                  int fd,
                  FileReadyCb cb,
                  uint32_t events);
    ~FileEventImpl() override;

    void setEnabled(uint32_t events) override;

   private:
    static void eventCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    int fd_;
    FileReadyCb cb_;
    libevent_event* event_{nullptr};
  };

  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    TimerCb cb_;
    libevent_event* event_;
    bool enabled_{false};
  };

  class SignalEventImpl : public SignalEvent {
   public:
    SignalEventImpl(LibeventDispatcher& dispatcher, int signal_num, SignalCb cb);
    ~SignalEventImpl() override;

   private:
    static void signalCallback(int fd, short events, void* arg);

    SignalCb cb_;
    libevent_event* event_;
  };

  void initializeLibevent();
  void runPostCallbacks();
  void runDeferredDeletes();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};
  libevent_event* wakeup_event_{nullptr};

  std::vector<DeferredDeletablePtr> deferred_delete_list_;
  TimerPtr deferred_delete_timer_;
};

}  // namespace event
}  // namespace mcpgate

#endif  // MCPGATE_EVENT_LIBEVENT_DISPATCHER_H
