/**
 * @file cancellation.h
 * @brief Cooperative cancellation tokens
 *
 * A CancellationTokenSource owns the cancelled flag; any number of
 * CancellationToken copies observe it. Only the first cancel() has an effect.
 * cancel() and registration are safe from any thread. Callbacks run on the
 * thread that calls cancel(), or inline on registration when the token is
 * already cancelled.
 */

#ifndef CHATWS_CORE_CANCELLATION_H
#define CHATWS_CORE_CANCELLATION_H

#include <functional>
#include <memory>
#include <utility>

#include "chatws/core/emitter.h"

namespace chatws {

namespace detail {
class CancellationState;
}

class CancellationToken {
 public:
  using Callback = std::function<void()>;

  // A token that can never be cancelled
  CancellationToken() = default;
  static CancellationToken none() { return CancellationToken(); }

  bool isCancellationRequested() const;
  bool canBeCancelled() const { return state_ != nullptr; }

  /**
   * Register a callback for the cancellation request. If cancellation was
   * already requested the callback is invoked immediately and the returned
   * handle is empty.
   */
  ListenerHandle onCancellationRequested(Callback callback) const;

 private:
  friend class CancellationTokenSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

class CancellationTokenSource {
 public:
  CancellationTokenSource();

  CancellationToken token() const { return CancellationToken(state_); }

  // Returns true if this call performed the cancellation
  bool cancel();
  bool isCancellationRequested() const;

 private:
  std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace chatws

#endif  // CHATWS_CORE_CANCELLATION_H
