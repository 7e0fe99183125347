#ifndef CHATWS_EVENT_LIBEVENT_DISPATCHER_H
#define CHATWS_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "chatws/event/event_loop.h"

struct event_base;
struct event;

namespace chatws {
namespace event {

using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 *
 * base() is exposed so bufferevent-based transports can share the loop.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  const std::string& name() override { return name_; }

  TimerPtr createTimer(TimerCb cb) override;

  SchedulableCallbackPtr createSchedulableCallback(
      std::function<void()> cb) override;

  void deferredDelete(DeferredDeletablePtr&& to_delete) override;

  void exit() override;

  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;

  void run(RunType type) override;
  bool isRunning() const override;

  void clearDeferredDeleteList() override;

  void shutdown() override;

  event_base* base() { return base_; }

 private:
  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_;
    bool enabled_;
  };

  class SchedulableCallbackImpl : public SchedulableCallback {
   public:
    SchedulableCallbackImpl(LibeventDispatcher& dispatcher,
                            std::function<void()> cb);
    ~SchedulableCallbackImpl() override;

    void scheduleCallbackNextIteration() override;
    void cancel() override;
    bool enabled() override;

   private:
    std::function<void()> cb_;
    std::unique_ptr<TimerImpl> timer_;
    bool scheduled_;
  };

  class SignalEventImpl : public SignalEvent {
   public:
    SignalEventImpl(LibeventDispatcher& dispatcher,
                    int signal_num,
                    SignalCb cb);
    ~SignalEventImpl() override;

   private:
    static void signalCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    int signal_num_;
    SignalCb cb_;
    libevent_event* event_;
  };

  void runPostCallbacks();
  void runDeferredDeletes();
  void initializeLibevent();
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
  std::unique_ptr<SchedulableCallbackImpl> deferred_delete_cb_;
};

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;

 private:
  static const std::string backend_name_;
};

}  // namespace event
}  // namespace chatws

#endif  // CHATWS_EVENT_LIBEVENT_DISPATCHER_H
