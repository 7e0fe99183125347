/**
 * @file active_request.h
 * @brief One streamed request and the events correlated to it
 */

#ifndef CHATWS_CHAT_ACTIVE_REQUEST_H
#define CHATWS_CHAT_ACTIVE_REQUEST_H

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "chatws/chat/errors.h"
#include "chatws/core/emitter.h"
#include "chatws/json/json_bridge.h"

namespace chatws {
namespace chat {

/**
 * Caller's view of a request sent over a ChatConnection.
 *
 * Listeners run on the connection's dispatcher thread. Registering after
 * the request settled returns an invalid handle and the listener is never
 * called. done() may be waited on from any other thread: it becomes ready
 * on completion and rethrows the RequestError on failure.
 */
class RequestHandle {
 public:
  using EventCallback = std::function<void(const json::JsonValue&)>;
  using ErrorCallback = std::function<void(const RequestError&)>;
  using CompleteCallback = std::function<void()>;

  virtual ~RequestHandle() = default;

  virtual ListenerHandle onEvent(EventCallback callback) = 0;
  virtual ListenerHandle onError(ErrorCallback callback) = 0;
  virtual ListenerHandle onComplete(CompleteCallback callback) = 0;

  virtual std::shared_future<void> done() const = 0;

  virtual bool isSettled() const = 0;
};

using RequestHandleSharedPtr = std::shared_ptr<RequestHandle>;

/**
 * Pending until the first terminal condition, then settled for good.
 *
 * Every entry point checks the settled flag first, so only the first of
 * completion, error event, socket close, transport error, cancellation,
 * supersession or disposal has any effect. Settling releases all
 * listeners.
 */
class ActiveRequest : public RequestHandle {
 public:
  ActiveRequest();
  ~ActiveRequest() override;

  ListenerHandle onEvent(EventCallback callback) override;
  ListenerHandle onError(ErrorCallback callback) override;
  ListenerHandle onComplete(CompleteCallback callback) override;
  std::shared_future<void> done() const override { return done_; }
  bool isSettled() const override { return settled_; }

  /**
   * Route one inbound frame. "error" fails the request, "response.completed"
   * is emitted as an event and then completes it, anything else is emitted.
   */
  void handleEvent(const json::JsonValue& event);

  void handleConnectionClose(int code, const std::string& reason);

  // The future rethrows `error` with its dynamic type
  template <typename ErrorType>
  void handleError(const ErrorType& error) {
    fail(std::make_exception_ptr(error), error);
  }

  // Released when the request settles
  void attachCancellation(ListenerHandle registration);

 private:
  void fail(std::exception_ptr exception, const RequestError& error);
  void release();

  Emitter<const json::JsonValue&> on_event_;
  Emitter<const RequestError&> on_error_;
  Emitter<> on_complete_;

  std::promise<void> promise_;
  std::shared_future<void> done_;
  std::atomic<bool> settled_{false};
  ListenerHandle cancellation_;
};

using ActiveRequestSharedPtr = std::shared_ptr<ActiveRequest>;

// "WebSocket closed unexpectedly (code: 1006 Abnormal Closure, reason: x)"
std::string formatCloseError(int code, const std::string& reason);

}  // namespace chat
}  // namespace chatws

#endif  // CHATWS_CHAT_ACTIVE_REQUEST_H
