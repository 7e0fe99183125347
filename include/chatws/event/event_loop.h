#ifndef CHATWS_EVENT_EVENT_LOOP_H
#define CHATWS_EVENT_EVENT_LOOP_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace chatws {
namespace event {

class Dispatcher;
class Timer;
class SignalEvent;
class SchedulableCallback;
class DeferredDeletable;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;
using SchedulableCallbackPtr = std::unique_ptr<SchedulableCallback>;
using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;

using PostCb = std::function<void()>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

enum class RunType {
  Block,        // Run until no events remain
  NonBlock,     // Run one iteration
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * @brief Interface for objects that should be deleted on a deferred basis.
 *
 * Deletion happens on a later loop iteration so an object is never destroyed
 * from inside one of its own callbacks.
 */
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

/**
 * @brief One-shot timer bound to a dispatcher
 */
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;

  /**
   * Enable the timer. Re-enabling an armed timer restarts it.
   */
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;

  virtual bool enabled() = 0;
};

/**
 * @brief Callback that runs on a later loop iteration
 */
class SchedulableCallback {
 public:
  virtual ~SchedulableCallback() = default;

  virtual void scheduleCallbackNextIteration() = 0;

  virtual void cancel() = 0;

  virtual bool enabled() = 0;
};

class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

class DispatcherBase {
 public:
  virtual ~DispatcherBase() = default;

  /**
   * Post a callback to run on the dispatcher thread. Safe from any thread.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * True when called from the thread currently running the dispatcher.
   */
  virtual bool isThreadSafe() const = 0;
};

/**
 * @brief Event loop abstraction
 *
 * Everything except post() and exit() must be called from the dispatcher
 * thread, or before the dispatcher starts running.
 */
class Dispatcher : public DispatcherBase {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  virtual SchedulableCallbackPtr createSchedulableCallback(
      std::function<void()> cb) = 0;

  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  virtual void exit() = 0;

  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  virtual void run(RunType type) = 0;

  /**
   * True from the first run() until shutdown(). Once this is false no loop
   * will run posted callbacks, timers or deferred deletes again, and work
   * must be done inline by the caller.
   */
  virtual bool isRunning() const = 0;

  virtual void clearDeferredDeleteList() = 0;

  /**
   * Called on the dispatcher thread after the loop has stopped. Releases
   * ownership of the dispatcher, then runs callbacks posted while the loop
   * was stopping and frees pending deferred deletes.
   */
  virtual void shutdown() = 0;
};

class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

DispatcherFactoryPtr createLibeventDispatcherFactory();

/**
 * @brief Runs one dispatcher on a dedicated thread
 */
class Worker {
 public:
  virtual ~Worker() = default;

  virtual void start() = 0;

  virtual void stop() = 0;

  virtual Dispatcher& dispatcher() = 0;
};

using WorkerPtr = std::unique_ptr<Worker>;

WorkerPtr createWorker(const std::string& name, DispatcherPtr dispatcher);

}  // namespace event
}  // namespace chatws

#endif  // CHATWS_EVENT_EVENT_LOOP_H
