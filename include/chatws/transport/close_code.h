#ifndef CHATWS_TRANSPORT_CLOSE_CODE_H
#define CHATWS_TRANSPORT_CLOSE_CODE_H

#include <cstdint>

namespace chatws {
namespace transport {

// RFC 6455 section 7.4 close codes plus the IANA-registered 1012-1015
namespace CloseCode {
constexpr uint16_t kNormalClosure = 1000;
constexpr uint16_t kGoingAway = 1001;
constexpr uint16_t kProtocolError = 1002;
constexpr uint16_t kUnsupportedData = 1003;
constexpr uint16_t kNoStatusReceived = 1005;  // Never sent on the wire
constexpr uint16_t kAbnormalClosure = 1006;   // Never sent on the wire
constexpr uint16_t kInvalidPayload = 1007;
constexpr uint16_t kPolicyViolation = 1008;
constexpr uint16_t kMessageTooBig = 1009;
constexpr uint16_t kMissingExtension = 1010;
constexpr uint16_t kInternalError = 1011;
constexpr uint16_t kServiceRestart = 1012;
constexpr uint16_t kTryAgainLater = 1013;
constexpr uint16_t kBadGateway = 1014;
constexpr uint16_t kTlsHandshakeFailed = 1015;  // Never sent on the wire
}  // namespace CloseCode

/**
 * Human-readable name of a close code, "Unknown" for anything unlisted.
 */
const char* closeCodeToString(int code);

// Codes an endpoint may put in a Close frame
bool isSendableCloseCode(int code);

}  // namespace transport
}  // namespace chatws

#endif  // CHATWS_TRANSPORT_CLOSE_CODE_H
