#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include <gtest/gtest.h>

#include "chatws/event/event_loop.h"
#include "chatws/event/libevent_dispatcher.h"

namespace chatws {
namespace event {
namespace {

class TrackedDeletable : public DeferredDeletable {
 public:
  explicit TrackedDeletable(std::atomic<bool>& deleted) : deleted_(deleted) {}
  ~TrackedDeletable() override { deleted_ = true; }

 private:
  std::atomic<bool>& deleted_;
};

class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    factory_ = createLibeventDispatcherFactory();
    dispatcher_ = factory_->createDispatcher("test");
  }

  template <typename Predicate>
  bool runUntil(Predicate predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      dispatcher_->run(RunType::NonBlock);
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
  }

  DispatcherFactoryPtr factory_;
  DispatcherPtr dispatcher_;
};

TEST_F(DispatcherTest, NameAndBackend) {
  EXPECT_EQ("test", dispatcher_->name());
  EXPECT_EQ("libevent", factory_->backendName());
}

TEST_F(DispatcherTest, ThreadSafetyBindsOnRun) {
  EXPECT_FALSE(dispatcher_->isThreadSafe());
  dispatcher_->run(RunType::NonBlock);
  EXPECT_TRUE(dispatcher_->isThreadSafe());

  bool other_thread_safe = true;
  std::thread other(
      [&]() { other_thread_safe = dispatcher_->isThreadSafe(); });
  other.join();
  EXPECT_FALSE(other_thread_safe);
}

TEST_F(DispatcherTest, PostRunsOnDispatcherThread) {
  std::atomic<int> count{0};
  std::thread poster([&]() {
    for (int i = 0; i < 10; ++i) {
      dispatcher_->post([&count]() { ++count; });
    }
  });
  poster.join();

  EXPECT_TRUE(runUntil([&count]() { return count == 10; }));
}

TEST_F(DispatcherTest, TimerFiresOnce) {
  int fired = 0;
  auto timer = dispatcher_->createTimer([&fired]() { ++fired; });
  timer->enableTimer(std::chrono::milliseconds(5));
  EXPECT_TRUE(timer->enabled());

  ASSERT_TRUE(runUntil([&fired]() { return fired > 0; }));
  EXPECT_FALSE(timer->enabled());

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  dispatcher_->run(RunType::NonBlock);
  EXPECT_EQ(1, fired);
}

TEST_F(DispatcherTest, DisabledTimerDoesNotFire) {
  bool fired = false;
  auto timer = dispatcher_->createTimer([&fired]() { fired = true; });
  timer->enableTimer(std::chrono::milliseconds(5));
  timer->disableTimer();

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  dispatcher_->run(RunType::NonBlock);
  EXPECT_FALSE(fired);
}

TEST_F(DispatcherTest, DestroyedTimerDoesNotFire) {
  bool fired = false;
  auto timer = dispatcher_->createTimer([&fired]() { fired = true; });
  timer->enableTimer(std::chrono::milliseconds(5));
  timer.reset();

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  dispatcher_->run(RunType::NonBlock);
  EXPECT_FALSE(fired);
}

TEST_F(DispatcherTest, SchedulableCallbackRunsNextIteration) {
  int runs = 0;
  auto callback = dispatcher_->createSchedulableCallback([&runs]() { ++runs; });
  callback->scheduleCallbackNextIteration();
  EXPECT_TRUE(callback->enabled());

  ASSERT_TRUE(runUntil([&runs]() { return runs > 0; }));
  EXPECT_EQ(1, runs);

  callback->scheduleCallbackNextIteration();
  callback->cancel();
  dispatcher_->run(RunType::NonBlock);
  EXPECT_EQ(1, runs);
}

TEST_F(DispatcherTest, DeferredDeleteWaitsForLaterIteration) {
  dispatcher_->run(RunType::NonBlock);
  std::atomic<bool> deleted{false};

  dispatcher_->post([this, &deleted]() {
    dispatcher_->deferredDelete(std::make_unique<TrackedDeletable>(deleted));
    EXPECT_FALSE(deleted);
  });

  ASSERT_TRUE(runUntil([&deleted]() { return deleted.load(); }));
}

TEST_F(DispatcherTest, ClearDeferredDeleteList) {
  std::atomic<bool> deleted{false};
  dispatcher_->deferredDelete(std::make_unique<TrackedDeletable>(deleted));
  EXPECT_FALSE(deleted);
  dispatcher_->clearDeferredDeleteList();
  EXPECT_TRUE(deleted);
}

TEST_F(DispatcherTest, ExitStopsRunUntilExit) {
  std::promise<void> started;
  std::thread loop([&]() {
    dispatcher_->post([&started]() { started.set_value(); });
    dispatcher_->run(RunType::RunUntilExit);
  });

  started.get_future().wait();
  dispatcher_->exit();
  loop.join();
  SUCCEED();
}

TEST_F(DispatcherTest, ShutdownReleasesOwnership) {
  EXPECT_FALSE(dispatcher_->isRunning());
  dispatcher_->run(RunType::NonBlock);
  EXPECT_TRUE(dispatcher_->isRunning());

  std::atomic<bool> deleted{false};
  dispatcher_->deferredDelete(std::make_unique<TrackedDeletable>(deleted));
  bool ran_unowned = false;
  dispatcher_->post([this, &ran_unowned]() {
    ran_unowned = !dispatcher_->isRunning();
  });

  dispatcher_->shutdown();

  EXPECT_TRUE(ran_unowned);
  EXPECT_TRUE(deleted);
  EXPECT_FALSE(dispatcher_->isRunning());
  EXPECT_FALSE(dispatcher_->isThreadSafe());
}

TEST(WorkerTest, RunsPostedWorkUntilStopped) {
  auto dispatcher = createLibeventDispatcherFactory()->createDispatcher("worker");
  auto worker = createWorker("chatws-worker", std::move(dispatcher));
  worker->start();

  std::promise<bool> on_loop_thread;
  auto result = on_loop_thread.get_future();
  Dispatcher& loop = worker->dispatcher();
  loop.post([&loop, &on_loop_thread]() {
    on_loop_thread.set_value(loop.isThreadSafe());
  });

  ASSERT_EQ(std::future_status::ready,
            result.wait_for(std::chrono::seconds(2)));
  EXPECT_TRUE(result.get());

  worker->stop();
  worker->stop();
  EXPECT_FALSE(loop.isRunning());
}

}  // namespace
}  // namespace event
}  // namespace chatws
