#ifndef CHATWS_RESULT_H
#define CHATWS_RESULT_H

#include <string>
#include <utility>

#include "chatws/core/compat.h"

namespace chatws {

// Error codes reported through Error::code
namespace ErrorCode {
constexpr int kInvalidArgument = -32602;
constexpr int kInternalError = -32603;
constexpr int kNotAvailable = -33000;
constexpr int kConnectFailed = -33001;
constexpr int kHandshakeFailed = -33002;
constexpr int kHandshakeTimeout = -33003;
constexpr int kConnectionClosed = -33004;
constexpr int kConnectionDisposed = -33005;
constexpr int kNotConnected = -33006;
constexpr int kConfigError = -33100;
}  // namespace ErrorCode

struct Error {
  int code = 0;
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<T> makeSuccess(T&& value) {
  return Result<T>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool isSuccess(const Result<T>& result) {
  return holds_alternative<T>(result);
}

template <typename T>
const Error* getError(const Result<T>& result) {
  return get_if<Error>(&result);
}

}  // namespace chatws

#endif  // CHATWS_RESULT_H
