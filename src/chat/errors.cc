#include "chatws/chat/errors.h"

namespace chatws {
namespace chat {

const char* requestErrorKindToString(RequestErrorKind kind) {
  switch (kind) {
    case RequestErrorKind::Protocol:
      return "Protocol";
    case RequestErrorKind::ConnectionClosed:
      return "ConnectionClosed";
    case RequestErrorKind::Transport:
      return "Transport";
    case RequestErrorKind::Cancelled:
      return "Cancelled";
    case RequestErrorKind::Superseded:
      return "Superseded";
    case RequestErrorKind::Disposed:
      return "Disposed";
  }
  return "Unknown";
}

}  // namespace chat
}  // namespace chatws
