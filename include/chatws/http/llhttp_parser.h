#ifndef CHATWS_HTTP_LLHTTP_PARSER_H
#define CHATWS_HTTP_LLHTTP_PARSER_H

#include <memory>

#include "chatws/http/http_parser.h"

// Forward declare llhttp types to avoid including llhttp.h in header
typedef struct llhttp__internal_s llhttp_t;
typedef struct llhttp_settings_s llhttp_settings_t;

namespace chatws {
namespace http {

/**
 * HttpParser backed by llhttp
 */
class LLHttpParser : public HttpParser {
 public:
  LLHttpParser(HttpParserType type, HttpParserCallbacks* callbacks);
  ~LLHttpParser() override;

  size_t execute(const char* data, size_t length) override;
  void resume() override;
  ParserStatus getStatus() const override;
  bool isUpgrade() const override;
  uint16_t statusCode() const override;
  std::string getError() const override;
  void reset() override;

 private:
  // Static callbacks for llhttp (bridge to HttpParserCallbacks)
  static int onMessageBegin(llhttp_t* parser);
  static int onStatus(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderField(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderValue(llhttp_t* parser, const char* data, size_t length);
  static int onHeadersComplete(llhttp_t* parser);
  static int onBody(llhttp_t* parser, const char* data, size_t length);
  static int onMessageComplete(llhttp_t* parser);

  static int toCallbackResult(ParserCallbackResult result);

  std::unique_ptr<llhttp_t> parser_;
  std::unique_ptr<llhttp_settings_t> settings_;
  HttpParserCallbacks* callbacks_;
  ParserStatus status_;
};

}  // namespace http
}  // namespace chatws

#endif  // CHATWS_HTTP_LLHTTP_PARSER_H
