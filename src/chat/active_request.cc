#include "chatws/chat/active_request.h"

#include "chatws/transport/close_code.h"

#define CHATWS_LOG_COMPONENT "chatws.request"
#include "chatws/logging/log_macros.h"

namespace chatws {
namespace chat {

namespace {

const char kErrorEvent[] = "error";
const char kCompletedEvent[] = "response.completed";

optional<std::string> errorCodeOf(const json::JsonValue& event) {
  json::JsonValue code = event.get("code");
  if (code.isString()) {
    std::string value = code.getString();
    if (!value.empty()) {
      return value;
    }
  } else if (code.isInteger()) {
    return std::to_string(code.getInt64());
  }
  return nullopt;
}

}  // namespace

std::string formatCloseError(int code, const std::string& reason) {
  std::string message = "WebSocket closed unexpectedly (code: " +
                        std::to_string(code) + " " +
                        transport::closeCodeToString(code);
  if (!reason.empty()) {
    message += ", reason: " + reason;
  }
  message += ")";
  return message;
}

ActiveRequest::ActiveRequest() : done_(promise_.get_future().share()) {}

ActiveRequest::~ActiveRequest() = default;

ListenerHandle ActiveRequest::onEvent(EventCallback callback) {
  return on_event_.registerListener(std::move(callback));
}

ListenerHandle ActiveRequest::onError(ErrorCallback callback) {
  return on_error_.registerListener(std::move(callback));
}

ListenerHandle ActiveRequest::onComplete(CompleteCallback callback) {
  return on_complete_.registerListener(std::move(callback));
}

void ActiveRequest::attachCancellation(ListenerHandle registration) {
  if (settled_) {
    registration.reset();
    return;
  }
  cancellation_ = std::move(registration);
}

void ActiveRequest::handleEvent(const json::JsonValue& event) {
  if (settled_) {
    return;
  }

  const std::string type = event.get("type").getString("");
  if (type == kErrorEvent) {
    std::string message = event.get("message").getString("");
    RequestError error(RequestErrorKind::Protocol,
                       message.empty() ? "Server error" : message,
                       errorCodeOf(event));
    fail(std::make_exception_ptr(error), error);
    return;
  }

  on_event_.emit(event);

  if (type == kCompletedEvent) {
    // A listener may have settled the request while handling the event
    if (settled_.exchange(true)) {
      return;
    }
    on_complete_.emit();
    promise_.set_value();
    release();
  }
}

void ActiveRequest::handleConnectionClose(int code, const std::string& reason) {
  if (settled_) {
    return;
  }
  RequestError error(RequestErrorKind::ConnectionClosed,
                     formatCloseError(code, reason), nullopt, code);
  fail(std::make_exception_ptr(error), error);
}

void ActiveRequest::fail(std::exception_ptr exception,
                         const RequestError& error) {
  if (settled_.exchange(true)) {
    return;
  }
  CHATWS_LOG(Debug, "Request failed ({}): {}",
             requestErrorKindToString(error.kind()), error.what());
  on_error_.emit(error);
  promise_.set_exception(exception);
  release();
}

void ActiveRequest::release() {
  on_event_.dispose();
  on_error_.dispose();
  on_complete_.dispose();
  cancellation_.reset();
}

}  // namespace chat
}  // namespace chatws
