#ifndef CHATWS_CHAT_ERRORS_H
#define CHATWS_CHAT_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>

#include "chatws/core/compat.h"

namespace chatws {
namespace chat {

enum class RequestErrorKind {
  Protocol,          // Server sent an "error" event
  ConnectionClosed,  // Socket closed before the request settled
  Transport,         // Socket-level failure
  Cancelled,
  Superseded,        // Replaced by a newer request on the same connection
  Disposed
};

const char* requestErrorKindToString(RequestErrorKind kind);

/**
 * Failure of a single streamed request. Delivered through the request's
 * error listeners and rethrown by its completion future.
 */
class RequestError : public std::runtime_error {
 public:
  RequestError(RequestErrorKind kind,
               const std::string& message,
               optional<std::string> code = nullopt,
               optional<int> close_code = nullopt)
      : std::runtime_error(message),
        kind_(kind),
        code_(std::move(code)),
        close_code_(close_code) {}

  RequestErrorKind kind() const { return kind_; }

  // Error code reported by the server, if any
  const optional<std::string>& code() const { return code_; }

  // WebSocket close code for ConnectionClosed errors
  const optional<int>& closeCode() const { return close_code_; }

 private:
  RequestErrorKind kind_;
  optional<std::string> code_;
  optional<int> close_code_;
};

class CancelledError : public RequestError {
 public:
  CancelledError() : RequestError(RequestErrorKind::Cancelled, "Canceled") {}
};

// Thrown by ChatConnection::send() when the connection is not open
class NotConnectedError : public std::runtime_error {
 public:
  NotConnectedError() : std::runtime_error("WebSocket is not connected") {}
};

}  // namespace chat
}  // namespace chatws

#endif  // CHATWS_CHAT_ERRORS_H
