#define MCPGATE_LOG_COMPONENT "event.dispatcher"

#include "mcpgate/event/libevent_dispatcher.h"

#include <cerrno>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace event {

namespace {

short toLibeventEvents(uint32_t events) {
  short result = EV_PERSIST;
  if (events & FileReadyType::Read) {
    result |= EV_READ;
  }
  if (events & FileReadyType::Write) {
    result |= EV_WRITE;
  }
  return result;
}

uint32_t fromLibeventEvents(short events) {
  uint32_t result = 0;
  if (events & EV_READ) {
    result |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (events & EV_WRITE) {
    result |= static_cast<uint32_t>(FileReadyType::Write);
  }
  if (events & EV_CLOSED) {
    result |= static_cast<uint32_t>(FileReadyType::Closed);
  }
  return result;
}

void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

timeval toTimeval(std::chrono::milliseconds duration) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
  return tv;
}

}  // namespace

DispatcherPtr createLibeventDispatcher(const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  deferred_delete_timer_.reset();
  deferred_delete_list_.clear();

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  for (int fd : wakeup_fd_) {
    if (fd >= 0) {
      close(fd);
    }
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  event_config* config = event_config_new();
  if (config) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  MCPGATE_LOG(Debug, "Dispatcher '{}' using libevent backend {}", name_,
              event_base_get_method(base_));

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }
  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);
  evutil_make_socket_closeonexec(wakeup_fd_[0]);
  evutil_make_socket_closeonexec(wakeup_fd_[1]);

  wakeup_event_ = event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                            &LibeventDispatcher::postWakeupCallback, this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }
  event_add(wakeup_event_, nullptr);

  deferred_delete_timer_ =
      std::make_unique<TimerImpl>(*this, [this]() { runDeferredDeletes(); });
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  if (need_wakeup) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    if (rc < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      MCPGATE_LOG(Error, "Dispatcher '{}' wakeup write failed: errno={}",
                  name_, errno);
    }
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events) {
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return std::make_unique<SignalEventImpl>(*this, signal_num, std::move(cb));
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  deferred_delete_list_.push_back(std::move(to_delete));
  if (!deferred_delete_timer_->enabled()) {
    deferred_delete_timer_->enableTimer(std::chrono::milliseconds(0));
  }
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    post([]() {});
  }
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  switch (type) {
    case RunType::Block:
      event_base_loop(base_, 0);
      break;
    case RunType::NonBlock:
      event_base_loop(base_, EVLOOP_NONBLOCK);
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE);
      }
      break;
  }

  runPostCallbacks();
  runDeferredDeletes();
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    PostCb cb = std::move(callbacks.front());
    callbacks.pop();
    if (cb) {
      cb();
    }
  }
}

void LibeventDispatcher::runDeferredDeletes() {
  // Destructors may schedule further deletions
  while (!deferred_delete_list_.empty()) {
    std::vector<DeferredDeletablePtr> to_delete;
    to_delete.swap(deferred_delete_list_);
    to_delete.clear();
  }
}

void LibeventDispatcher::postWakeupCallback(int fd, short, void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
  }

  dispatcher->runPostCallbacks();
  if (dispatcher->exit_requested_) {
    event_base_loopbreak(dispatcher->base_);
  }
}

// FileEventImpl

LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events)
    : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)) {
  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (event_) {
    event_free(event_);
  }
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  if (event_) {
    event_free(event_);
    event_ = nullptr;
  }
  if (events == 0) {
    return;
  }

  event_ = event_new(dispatcher_.base(), fd_, toLibeventEvents(events),
                     &FileEventImpl::eventCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create file event");
  }
  event_add(event_, nullptr);
}

void LibeventDispatcher::FileEventImpl::eventCallback(int, short events,
                                                      void* arg) {
  auto* file_event = static_cast<FileEventImpl*>(arg);
  file_event->cb_(fromLibeventEvents(events));
}

// TimerImpl

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : cb_(std::move(cb)) {
  event_ = evtimer_new(dispatcher.base(), &TimerImpl::timerCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  evtimer_del(event_);
  enabled_ = false;
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  timeval tv = toTimeval(duration);
  evtimer_add(event_, &tv);
  enabled_ = true;
}

bool LibeventDispatcher::TimerImpl::enabled() { return enabled_; }

void LibeventDispatcher::TimerImpl::timerCallback(int, short, void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);
  timer->enabled_ = false;
  timer->cb_();
}

// SignalEventImpl

LibeventDispatcher::SignalEventImpl::SignalEventImpl(
    LibeventDispatcher& dispatcher, int signal_num, SignalCb cb)
    : cb_(std::move(cb)) {
  event_ = evsignal_new(dispatcher.base(), signal_num,
                        &SignalEventImpl::signalCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create signal event");
  }
  event_add(event_, nullptr);
}

LibeventDispatcher::SignalEventImpl::~SignalEventImpl() {
  if (event_) {
    event_free(event_);
  }
}

void LibeventDispatcher::SignalEventImpl::signalCallback(int, short,
                                                         void* arg) {
  static_cast<SignalEventImpl*>(arg)->cb_();
}

}  // namespace event
}  // namespace mcpgate
