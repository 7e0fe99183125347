#ifndef CHATWS_HTTP_HTTP_PARSER_H
#define CHATWS_HTTP_HTTP_PARSER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace chatws {
namespace http {

enum class HttpStatusCode : uint16_t {
  SwitchingProtocols = 101,
  OK = 200,
  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  TooManyRequests = 429,
  InternalServerError = 500,
  BadGateway = 502,
  ServiceUnavailable = 503
};

enum class HttpParserType { REQUEST, RESPONSE };

/**
 * Return values for parser callbacks
 */
enum class ParserCallbackResult {
  Success = 0,
  Error = -1,
  Pause = 1
};

enum class ParserStatus {
  Ok,
  Paused,
  // Stopped after a complete message that switches protocols; bytes past
  // execute()'s return value belong to the new protocol
  Upgraded,
  Error
};

/**
 * Receives parse events. Data pointers are only valid during the call.
 */
class HttpParserCallbacks {
 public:
  virtual ~HttpParserCallbacks() = default;

  virtual ParserCallbackResult onMessageBegin() = 0;
  virtual ParserCallbackResult onStatus(const char* data, size_t length) = 0;
  virtual ParserCallbackResult onHeaderField(const char* data,
                                             size_t length) = 0;
  virtual ParserCallbackResult onHeaderValue(const char* data,
                                             size_t length) = 0;
  virtual ParserCallbackResult onHeadersComplete() = 0;
  virtual ParserCallbackResult onBody(const char* data, size_t length) = 0;
  virtual ParserCallbackResult onMessageComplete() = 0;

  virtual void onError(const std::string& error) = 0;
};

class HttpParser {
 public:
  virtual ~HttpParser() = default;

  /**
   * Feed bytes to the parser.
   * @return number of bytes consumed
   */
  virtual size_t execute(const char* data, size_t length) = 0;

  virtual void resume() = 0;
  virtual ParserStatus getStatus() const = 0;
  virtual bool isUpgrade() const = 0;
  virtual uint16_t statusCode() const = 0;
  virtual std::string getError() const = 0;
  virtual void reset() = 0;
};

using HttpParserPtr = std::unique_ptr<HttpParser>;

HttpParserPtr createLLHttpParser(HttpParserType type,
                                 HttpParserCallbacks* callbacks);

}  // namespace http
}  // namespace chatws

#endif  // CHATWS_HTTP_HTTP_PARSER_H
