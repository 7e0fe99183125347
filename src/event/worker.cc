#include <pthread.h>

#include <atomic>
#include <thread>

#include "chatws/event/event_loop.h"

namespace chatws {
namespace event {

namespace {

class WorkerImpl : public Worker {
 public:
  WorkerImpl(const std::string& name, DispatcherPtr dispatcher)
      : name_(name), dispatcher_(std::move(dispatcher)), running_(false) {}

  ~WorkerImpl() override { stop(); }

  void start() override {
    if (running_.exchange(true)) {
      return;  // Already running
    }

    thread_ = std::make_unique<std::thread>([this]() { threadRoutine(); });
  }

  void stop() override {
    if (!running_.exchange(false)) {
      return;  // Already stopped
    }

    dispatcher_->exit();

    if (thread_ && thread_->joinable()) {
      thread_->join();
    }
    thread_.reset();
  }

  Dispatcher& dispatcher() override { return *dispatcher_; }

 private:
  void threadRoutine() {
    // Linux limits thread names to 15 characters
    pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());

    dispatcher_->run(RunType::RunUntilExit);
    dispatcher_->shutdown();
  }

  std::string name_;
  DispatcherPtr dispatcher_;
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> thread_;
};

}  // namespace

WorkerPtr createWorker(const std::string& name, DispatcherPtr dispatcher) {
  return std::make_unique<WorkerImpl>(name, std::move(dispatcher));
}

}  // namespace event
}  // namespace chatws
