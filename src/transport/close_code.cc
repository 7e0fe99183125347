#include "chatws/transport/close_code.h"

namespace chatws {
namespace transport {

const char* closeCodeToString(int code) {
  switch (code) {
    case CloseCode::kNormalClosure:
      return "Normal Closure";
    case CloseCode::kGoingAway:
      return "Going Away";
    case CloseCode::kProtocolError:
      return "Protocol Error";
    case CloseCode::kUnsupportedData:
      return "Unsupported Data";
    case CloseCode::kNoStatusReceived:
      return "No Status Received";
    case CloseCode::kAbnormalClosure:
      return "Abnormal Closure";
    case CloseCode::kInvalidPayload:
      return "Invalid Payload";
    case CloseCode::kPolicyViolation:
      return "Policy Violation";
    case CloseCode::kMessageTooBig:
      return "Message Too Big";
    case CloseCode::kMissingExtension:
      return "Missing Extension";
    case CloseCode::kInternalError:
      return "Internal Error";
    case CloseCode::kServiceRestart:
      return "Service Restart";
    case CloseCode::kTryAgainLater:
      return "Try Again Later";
    case CloseCode::kBadGateway:
      return "Bad Gateway";
    case CloseCode::kTlsHandshakeFailed:
      return "TLS Handshake Failed";
    default:
      return "Unknown";
  }
}

bool isSendableCloseCode(int code) {
  if (code >= 3000 && code <= 4999) {
    return true;  // Registered and private-use ranges
  }
  switch (code) {
    case CloseCode::kNoStatusReceived:
    case CloseCode::kAbnormalClosure:
    case CloseCode::kTlsHandshakeFailed:
      return false;
    default:
      return code >= 1000 && code <= 1014 && code != 1004;
  }
}

}  // namespace transport
}  // namespace chatws
