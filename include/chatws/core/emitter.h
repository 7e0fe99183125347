/**
 * @file emitter.h
 * @brief Typed listener fan-out with RAII registration handles
 */

#ifndef CHATWS_CORE_EMITTER_H
#define CHATWS_CORE_EMITTER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace chatws {

namespace detail {

class ListenerSet {
 public:
  virtual ~ListenerSet() = default;
  virtual void remove(size_t id) = 0;
};

}  // namespace detail

/**
 * @brief Registration handle returned by Emitter and CancellationToken
 *
 * Removes the listener when destroyed or reset. The handle holds only a weak
 * reference, so it may outlive the emitter it came from.
 */
class ListenerHandle {
 public:
  ListenerHandle() = default;
  ListenerHandle(std::weak_ptr<detail::ListenerSet> set, size_t id)
      : set_(std::move(set)), id_(id) {}

  ~ListenerHandle() { reset(); }

  ListenerHandle(const ListenerHandle&) = delete;
  ListenerHandle& operator=(const ListenerHandle&) = delete;

  ListenerHandle(ListenerHandle&& other) noexcept
      : set_(std::move(other.set_)), id_(other.id_) {
    other.id_ = SIZE_MAX;
  }

  ListenerHandle& operator=(ListenerHandle&& other) noexcept {
    if (this != &other) {
      reset();
      set_ = std::move(other.set_);
      id_ = other.id_;
      other.id_ = SIZE_MAX;
    }
    return *this;
  }

  void reset() {
    if (id_ != SIZE_MAX) {
      if (auto set = set_.lock()) {
        set->remove(id_);
      }
    }
    set_.reset();
    id_ = SIZE_MAX;
  }

  bool isValid() const { return id_ != SIZE_MAX && !set_.expired(); }

 private:
  std::weak_ptr<detail::ListenerSet> set_;
  size_t id_ = SIZE_MAX;
};

/**
 * @brief Event fan-out to registered listeners
 *
 * Listeners are invoked synchronously on the emitting thread, in
 * registration order, outside the internal lock so a listener may register
 * or remove listeners. A listener removed or disposed during an emit() is
 * not invoked for the rest of it. After dispose() no listener is ever
 * invoked again and new registrations return an invalid handle.
 */
template <typename... Args>
class Emitter {
 public:
  using Listener = std::function<void(Args...)>;

  Emitter() : state_(std::make_shared<State>()) {}
  ~Emitter() { dispose(); }

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

  ListenerHandle registerListener(Listener listener) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->disposed || !listener) {
      return ListenerHandle();
    }
    size_t id = state_->next_id++;
    state_->listeners.emplace_back(
        id, std::make_shared<Listener>(std::move(listener)));
    return ListenerHandle(state_, id);
  }

  void emit(Args... args) const {
    // The emitter may be destroyed by one of its listeners
    std::shared_ptr<State> state = state_;
    std::vector<std::pair<size_t, std::shared_ptr<Listener>>> snapshot;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (state->disposed) {
        return;
      }
      snapshot = state->listeners;
    }
    for (const auto& entry : snapshot) {
      if (!state->isRegistered(entry.first)) {
        continue;
      }
      (*entry.second)(args...);
    }
  }

  void dispose() {
    std::vector<std::pair<size_t, std::shared_ptr<Listener>>> released;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->disposed = true;
      released.swap(state_->listeners);
    }
    // Listener destructors run outside the lock
  }

  bool isDisposed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->disposed;
  }

  size_t listenerCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->listeners.size();
  }

 private:
  struct State : public detail::ListenerSet {
    std::mutex mutex;
    std::vector<std::pair<size_t, std::shared_ptr<Listener>>> listeners;
    size_t next_id = 0;
    bool disposed = false;

    bool isRegistered(size_t id) {
      std::lock_guard<std::mutex> lock(mutex);
      if (disposed) {
        return false;
      }
      for (const auto& entry : listeners) {
        if (entry.first == id) {
          return true;
        }
      }
      return false;
    }

    void remove(size_t id) override {
      std::shared_ptr<Listener> released;
      std::lock_guard<std::mutex> lock(mutex);
      for (auto it = listeners.begin(); it != listeners.end(); ++it) {
        if (it->first == id) {
          released = std::move(it->second);
          listeners.erase(it);
          break;
        }
      }
    }
  };

  std::shared_ptr<State> state_;
};

}  // namespace chatws

#endif  // CHATWS_CORE_EMITTER_H
