#include "chatws/event/libevent_dispatcher.h"

#include <unistd.h>

#include <cassert>
#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#define CHATWS_LOG_COMPONENT "chatws.event"
#include "chatws/logging/log_macros.h"

namespace chatws {
namespace event {

namespace {

// Uses std::call_once so the first dispatcher on any thread initializes
// libevent locking
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();

  // thread_id_ is only set when run() is called
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  deferred_delete_list_.clear();
  deferred_delete_cb_.reset();
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    std::queue<PostCb> empty;
    post_callbacks_.swap(empty);
  }

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }

  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
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

  const char* method = event_base_get_method(base_);
  CHATWS_LOG(Debug, "dispatcher {} using backend {}", name_,
             method ? method : "unknown");

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }

  evutil_make_socket_nonblocking(static_cast<evutil_socket_t>(wakeup_fd_[0]));
  evutil_make_socket_nonblocking(static_cast<evutil_socket_t>(wakeup_fd_[1]));

  wakeup_event_ =
      event_new(base_, static_cast<evutil_socket_t>(wakeup_fd_[0]),
                EV_READ | EV_PERSIST,
                reinterpret_cast<event_callback_fn>(
                    &LibeventDispatcher::postWakeupCallback),
                this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }

  event_add(wakeup_event_, nullptr);

  deferred_delete_cb_ = std::make_unique<SchedulableCallbackImpl>(
      *this, [this]() { runDeferredDeletes(); });
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
    (void)rc;  // EAGAIN means a wakeup is already pending
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  assert(thread_id_.load() == std::thread::id() || isThreadSafe());
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

SchedulableCallbackPtr LibeventDispatcher::createSchedulableCallback(
    std::function<void()> cb) {
  assert(thread_id_.load() == std::thread::id() || isThreadSafe());
  return std::make_unique<SchedulableCallbackImpl>(*this, std::move(cb));
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  assert(thread_id_.load() == std::thread::id() || isThreadSafe());
  if (!to_delete) {
    return;
  }
  deferred_delete_list_.push_back(std::move(to_delete));

  if (!deferred_delete_cb_->enabled()) {
    deferred_delete_cb_->scheduleCallbackNextIteration();
  }
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;

  if (!isThreadSafe()) {
    // Re-asserted on the loop thread since run() clears the flag on entry
    post([this]() {
      exit_requested_ = true;
      event_base_loopbreak(base_);
    });
  } else {
    event_base_loopbreak(base_);
  }
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  assert(thread_id_.load() == std::thread::id() || isThreadSafe());
  return std::make_unique<SignalEventImpl>(*this, signal_num, std::move(cb));
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  int flags = 0;
  switch (type) {
    case RunType::Block:
      break;
    case RunType::NonBlock:
      flags = EVLOOP_NONBLOCK;
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      return;
  }

  event_base_loop(base_, flags);
  runPostCallbacks();
}

bool LibeventDispatcher::isRunning() const {
  return thread_id_.load() != std::thread::id();
}

void LibeventDispatcher::clearDeferredDeleteList() {
  assert(thread_id_.load() == std::thread::id() || isThreadSafe());
  std::vector<DeferredDeletablePtr> to_delete;
  to_delete.swap(deferred_delete_list_);
}

void LibeventDispatcher::shutdown() {
  if (!isThreadSafe()) {
    return;
  }
  thread_id_ = std::thread::id();

  // Callbacks see isRunning() == false and finish their work inline
  runPostCallbacks();
  clearDeferredDeleteList();
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
    // Drain the pipe
  }

  dispatcher->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    callbacks.front()();
    callbacks.pop();
  }
}

void LibeventDispatcher::runDeferredDeletes() {
  // Swap first; destructors may schedule further deletions
  std::vector<DeferredDeletablePtr> to_delete;
  to_delete.swap(deferred_delete_list_);
}

// TimerImpl implementation
LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)), enabled_(false) {
  event_ = evtimer_new(
      dispatcher_.base(),
      reinterpret_cast<event_callback_fn>(&TimerImpl::timerCallback), this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_ && event_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  struct timeval tv;
  tv.tv_sec = duration.count() / 1000;
  tv.tv_usec = (duration.count() % 1000) * 1000;

  event_add(event_, &tv);
  enabled_ = true;
}

bool LibeventDispatcher::TimerImpl::enabled() { return enabled_; }

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);

  timer->enabled_ = false;
  timer->cb_();
}

// SchedulableCallbackImpl implementation
LibeventDispatcher::SchedulableCallbackImpl::SchedulableCallbackImpl(
    LibeventDispatcher& dispatcher, std::function<void()> cb)
    : cb_(std::move(cb)), scheduled_(false) {
  // Zero-delay timer fires on the next loop iteration
  timer_ = std::make_unique<TimerImpl>(dispatcher, [this]() {
    scheduled_ = false;
    cb_();
  });
}

LibeventDispatcher::SchedulableCallbackImpl::~SchedulableCallbackImpl() {
  cancel();
}

void LibeventDispatcher::SchedulableCallbackImpl::
    scheduleCallbackNextIteration() {
  if (!scheduled_) {
    timer_->enableTimer(std::chrono::milliseconds(0));
    scheduled_ = true;
  }
}

void LibeventDispatcher::SchedulableCallbackImpl::cancel() {
  if (scheduled_) {
    timer_->disableTimer();
    scheduled_ = false;
  }
}

bool LibeventDispatcher::SchedulableCallbackImpl::enabled() {
  return scheduled_;
}

// SignalEventImpl implementation
LibeventDispatcher::SignalEventImpl::SignalEventImpl(
    LibeventDispatcher& dispatcher, int signal_num, SignalCb cb)
    : dispatcher_(dispatcher), signal_num_(signal_num), cb_(std::move(cb)) {
  event_ = evsignal_new(
      dispatcher_.base(), signal_num_,
      reinterpret_cast<event_callback_fn>(&SignalEventImpl::signalCallback),
      this);
  if (!event_) {
    throw std::runtime_error("Failed to create signal event");
  }

  event_add(event_, nullptr);
}

LibeventDispatcher::SignalEventImpl::~SignalEventImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::SignalEventImpl::signalCallback(int /*fd*/,
                                                         short /*events*/,
                                                         void* arg) {
  auto* signal_event = static_cast<SignalEventImpl*>(arg);

  signal_event->cb_();
}

// LibeventDispatcherFactory implementation
const std::string LibeventDispatcherFactory::backend_name_ = "libevent";

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  return backend_name_;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace chatws
