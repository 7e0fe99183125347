/**
 * @file websocket_handshake.h
 * @brief Client side of the HTTP/1.1 WebSocket upgrade
 */

#ifndef CHATWS_TRANSPORT_WEBSOCKET_HANDSHAKE_H
#define CHATWS_TRANSPORT_WEBSOCKET_HANDSHAKE_H

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "chatws/core/result.h"
#include "chatws/http/http_parser.h"
#include "chatws/transport/endpoint.h"

namespace chatws {
namespace transport {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Base64 of 16 random bytes
std::string generateWebSocketKey();

// Expected Sec-WebSocket-Accept for a Sec-WebSocket-Key
std::string computeAcceptKey(const std::string& key);

/**
 * Build the upgrade request. Extra headers follow the protocol headers;
 * names or values containing CR or LF are rejected.
 */
Result<std::string> buildUpgradeRequest(const WebSocketUrl& url,
                                        const std::string& key,
                                        const HeaderList& extra_headers);

/**
 * Parses and validates the server's answer to the upgrade request.
 *
 * Bytes are buffered until the blank line ending the header block; only
 * the header block goes through the HTTP parser. Anything after it is the
 * start of the WebSocket stream and is kept in leftover().
 */
class HandshakeResponseParser : public http::HttpParserCallbacks {
 public:
  enum class State { Incomplete, Complete, Failed };

  static constexpr size_t kMaxHeaderBytes = 16 * 1024;

  explicit HandshakeResponseParser(std::string expected_accept);

  State feed(const char* data, size_t length);

  State state() const { return state_; }
  uint16_t statusCode() const { return status_code_; }
  const std::string& error() const { return error_; }
  std::string takeLeftover() { return std::move(leftover_); }

  // Lower-cased name; repeated headers are joined with ", "
  std::string header(const std::string& name) const;

  // HttpParserCallbacks
  http::ParserCallbackResult onMessageBegin() override;
  http::ParserCallbackResult onStatus(const char* data, size_t length) override;
  http::ParserCallbackResult onHeaderField(const char* data,
                                           size_t length) override;
  http::ParserCallbackResult onHeaderValue(const char* data,
                                           size_t length) override;
  http::ParserCallbackResult onHeadersComplete() override;
  http::ParserCallbackResult onBody(const char* data, size_t length) override;
  http::ParserCallbackResult onMessageComplete() override;
  void onError(const std::string& error) override;

 private:
  State fail(const std::string& error);
  State validate();
  void commitHeader();

  const std::string expected_accept_;
  http::HttpParserPtr parser_;
  State state_{State::Incomplete};
  std::string buffer_;
  std::string leftover_;
  std::string error_;
  uint16_t status_code_{0};
  bool headers_complete_{false};

  std::map<std::string, std::string> headers_;
  std::string current_field_;
  std::string current_value_;
  bool reading_value_{false};
};

}  // namespace transport
}  // namespace chatws

#endif  // CHATWS_TRANSPORT_WEBSOCKET_HANDSHAKE_H
