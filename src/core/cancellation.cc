#include "chatws/core/cancellation.h"

#include <mutex>
#include <utility>
#include <vector>

namespace chatws {
namespace detail {

class CancellationState : public ListenerSet,
                          public std::enable_shared_from_this<CancellationState> {
 public:
  bool isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  bool cancel() {
    std::vector<std::pair<size_t, std::shared_ptr<CancellationToken::Callback>>>
        callbacks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_) {
        return false;
      }
      cancelled_ = true;
      callbacks.swap(callbacks_);
    }
    for (auto& entry : callbacks) {
      (*entry.second)();
    }
    return true;
  }

  ListenerHandle add(CancellationToken::Callback callback) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!cancelled_) {
        size_t id = next_id_++;
        callbacks_.emplace_back(id, std::make_shared<CancellationToken::Callback>(
                                        std::move(callback)));
        return ListenerHandle(shared_from_this(), id);
      }
    }
    callback();
    return ListenerHandle();
  }

  void remove(size_t id) override {
    std::shared_ptr<CancellationToken::Callback> released;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
      if (it->first == id) {
        released = std::move(it->second);
        callbacks_.erase(it);
        break;
      }
    }
  }

 private:
  mutable std::mutex mutex_;
  bool cancelled_ = false;
  size_t next_id_ = 0;
  std::vector<std::pair<size_t, std::shared_ptr<CancellationToken::Callback>>>
      callbacks_;
};

}  // namespace detail

bool CancellationToken::isCancellationRequested() const {
  return state_ && state_->isCancelled();
}

ListenerHandle CancellationToken::onCancellationRequested(
    Callback callback) const {
  if (!state_ || !callback) {
    return ListenerHandle();
  }
  return state_->add(std::move(callback));
}

CancellationTokenSource::CancellationTokenSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

bool CancellationTokenSource::cancel() { return state_->cancel(); }

bool CancellationTokenSource::isCancellationRequested() const {
  return state_->isCancelled();
}

}  // namespace chatws
