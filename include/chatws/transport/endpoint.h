#ifndef CHATWS_TRANSPORT_ENDPOINT_H
#define CHATWS_TRANSPORT_ENDPOINT_H

#include <cstdint>
#include <string>

#include "chatws/core/result.h"

namespace chatws {
namespace transport {

struct WebSocketUrl {
  bool secure{false};
  std::string host;  // Without IPv6 brackets
  uint16_t port{0};
  std::string path{"/"};  // Path plus query, as sent in the request line

  // Value for the Host header; default ports are omitted
  std::string hostHeader() const;
  std::string toString() const;
};

/**
 * Parse a ws:// or wss:// URL.
 */
Result<WebSocketUrl> parseWebSocketUrl(const std::string& url);

/**
 * Derive the streaming endpoint from the service base address.
 *
 * https maps to wss and http to ws (ws/wss are kept). The path is replaced
 * by `path`; query and fragment are dropped.
 */
Result<std::string> resolveStreamingEndpoint(const std::string& base_url,
                                             const std::string& path);

}  // namespace transport
}  // namespace chatws

#endif  // CHATWS_TRANSPORT_ENDPOINT_H
