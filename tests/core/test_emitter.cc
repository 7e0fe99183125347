#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chatws/core/emitter.h"

namespace chatws {
namespace {

TEST(EmitterTest, DeliversInRegistrationOrder) {
  Emitter<int> emitter;
  std::vector<std::string> calls;
  auto a = emitter.registerListener(
      [&calls](int v) { calls.push_back("a" + std::to_string(v)); });
  auto b = emitter.registerListener(
      [&calls](int v) { calls.push_back("b" + std::to_string(v)); });

  emitter.emit(1);
  EXPECT_EQ((std::vector<std::string>{"a1", "b1"}), calls);
  EXPECT_EQ(2u, emitter.listenerCount());
}

TEST(EmitterTest, HandleResetRemovesListener) {
  Emitter<> emitter;
  int count = 0;
  auto handle = emitter.registerListener([&count]() { ++count; });
  EXPECT_TRUE(handle.isValid());

  emitter.emit();
  handle.reset();
  emitter.emit();

  EXPECT_EQ(1, count);
  EXPECT_FALSE(handle.isValid());
  EXPECT_EQ(0u, emitter.listenerCount());
}

TEST(EmitterTest, HandleDestructorRemovesListener) {
  Emitter<> emitter;
  int count = 0;
  {
    auto handle = emitter.registerListener([&count]() { ++count; });
  }
  emitter.emit();
  EXPECT_EQ(0, count);
}

TEST(EmitterTest, MovedHandleKeepsRegistration) {
  Emitter<> emitter;
  int count = 0;
  ListenerHandle outer;
  {
    auto inner = emitter.registerListener([&count]() { ++count; });
    outer = std::move(inner);
  }
  emitter.emit();
  EXPECT_EQ(1, count);
}

TEST(EmitterTest, HandleMayOutliveEmitter) {
  ListenerHandle handle;
  {
    Emitter<> emitter;
    handle = emitter.registerListener([]() {});
  }
  EXPECT_FALSE(handle.isValid());
  handle.reset();
}

TEST(EmitterTest, DisposeStopsDeliveryAndRegistration) {
  Emitter<const std::string&> emitter;
  int count = 0;
  auto handle =
      emitter.registerListener([&count](const std::string&) { ++count; });

  emitter.dispose();
  emitter.emit("ignored");
  auto late = emitter.registerListener([&count](const std::string&) { ++count; });

  EXPECT_EQ(0, count);
  EXPECT_TRUE(emitter.isDisposed());
  EXPECT_FALSE(late.isValid());
}

TEST(EmitterTest, ListenerMayRemoveItselfDuringEmit) {
  Emitter<> emitter;
  int count = 0;
  ListenerHandle handle;
  handle = emitter.registerListener([&]() {
    ++count;
    handle.reset();
  });

  emitter.emit();
  emitter.emit();
  EXPECT_EQ(1, count);
}

TEST(EmitterTest, ListenerRegisteredDuringEmitRunsNextTime) {
  Emitter<> emitter;
  int late_calls = 0;
  ListenerHandle late;
  auto first = emitter.registerListener([&]() {
    if (!late.isValid()) {
      late = emitter.registerListener([&late_calls]() { ++late_calls; });
    }
  });

  emitter.emit();
  EXPECT_EQ(0, late_calls);
  emitter.emit();
  EXPECT_EQ(1, late_calls);
}

TEST(EmitterTest, DisposeDuringEmitSkipsRemainingListeners) {
  Emitter<int> emitter;
  int second_calls = 0;
  auto first = emitter.registerListener([&emitter](int) { emitter.dispose(); });
  auto second =
      emitter.registerListener([&second_calls](int) { ++second_calls; });

  emitter.emit(1);

  EXPECT_TRUE(emitter.isDisposed());
  EXPECT_EQ(0, second_calls);
}

TEST(EmitterTest, ListenerRemovedDuringEmitIsSkipped) {
  Emitter<> emitter;
  int second_calls = 0;
  ListenerHandle second;
  auto first = emitter.registerListener([&second]() { second.reset(); });
  second = emitter.registerListener([&second_calls]() { ++second_calls; });

  emitter.emit();

  EXPECT_EQ(0, second_calls);
  EXPECT_EQ(1u, emitter.listenerCount());
}

}  // namespace
}  // namespace chatws
