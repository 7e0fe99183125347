#include "chatws/http/llhttp_parser.h"

#include <llhttp.h>

namespace chatws {
namespace http {

LLHttpParser::LLHttpParser(HttpParserType type, HttpParserCallbacks* callbacks)
    : callbacks_(callbacks), status_(ParserStatus::Ok) {
  parser_ = std::make_unique<llhttp_t>();
  settings_ = std::make_unique<llhttp_settings_t>();

  llhttp_settings_init(settings_.get());

  // All callbacks reach this instance through parser_->data
  settings_->on_message_begin = &LLHttpParser::onMessageBegin;
  settings_->on_status = &LLHttpParser::onStatus;
  settings_->on_header_field = &LLHttpParser::onHeaderField;
  settings_->on_header_value = &LLHttpParser::onHeaderValue;
  settings_->on_headers_complete = &LLHttpParser::onHeadersComplete;
  settings_->on_body = &LLHttpParser::onBody;
  settings_->on_message_complete = &LLHttpParser::onMessageComplete;

  llhttp_init(parser_.get(),
              type == HttpParserType::REQUEST ? HTTP_REQUEST : HTTP_RESPONSE,
              settings_.get());

  parser_->data = this;
}

LLHttpParser::~LLHttpParser() = default;

size_t LLHttpParser::execute(const char* data, size_t length) {
  if (status_ == ParserStatus::Error || status_ == ParserStatus::Upgraded) {
    return 0;
  }

  llhttp_errno_t err = llhttp_execute(parser_.get(), data, length);

  switch (err) {
    case HPE_OK:
      status_ = ParserStatus::Ok;
      return length;
    case HPE_PAUSED_UPGRADE:
      status_ = ParserStatus::Upgraded;
      return llhttp_get_error_pos(parser_.get()) - data;
    case HPE_PAUSED:
      status_ = ParserStatus::Paused;
      return llhttp_get_error_pos(parser_.get()) - data;
    default:
      status_ = ParserStatus::Error;
      if (callbacks_) {
        callbacks_->onError(llhttp_get_error_reason(parser_.get()));
      }
      return llhttp_get_error_pos(parser_.get()) - data;
  }
}

void LLHttpParser::resume() {
  if (status_ == ParserStatus::Paused) {
    llhttp_resume(parser_.get());
    status_ = ParserStatus::Ok;
  }
}

ParserStatus LLHttpParser::getStatus() const { return status_; }

bool LLHttpParser::isUpgrade() const { return parser_->upgrade != 0; }

uint16_t LLHttpParser::statusCode() const {
  return static_cast<uint16_t>(parser_->status_code);
}

std::string LLHttpParser::getError() const {
  if (status_ == ParserStatus::Error) {
    const char* reason = llhttp_get_error_reason(parser_.get());
    return reason ? reason : "parse error";
  }
  return "";
}

void LLHttpParser::reset() {
  llhttp_reset(parser_.get());
  parser_->data = this;
  status_ = ParserStatus::Ok;
}

int LLHttpParser::onMessageBegin(llhttp_t* parser) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onMessageBegin());
  }
  return 0;
}

int LLHttpParser::onStatus(llhttp_t* parser, const char* data, size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onStatus(data, length));
  }
  return 0;
}

int LLHttpParser::onHeaderField(llhttp_t* parser,
                                const char* data,
                                size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onHeaderField(data, length));
  }
  return 0;
}

int LLHttpParser::onHeaderValue(llhttp_t* parser,
                                const char* data,
                                size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onHeaderValue(data, length));
  }
  return 0;
}

int LLHttpParser::onHeadersComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onHeadersComplete());
  }
  return 0;
}

int LLHttpParser::onBody(llhttp_t* parser, const char* data, size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onBody(data, length));
  }
  return 0;
}

int LLHttpParser::onMessageComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onMessageComplete());
  }
  return 0;
}

int LLHttpParser::toCallbackResult(ParserCallbackResult result) {
  switch (result) {
    case ParserCallbackResult::Success:
      return HPE_OK;
    case ParserCallbackResult::Error:
      return HPE_USER;
    case ParserCallbackResult::Pause:
      return HPE_PAUSED;
    default:
      return HPE_OK;
  }
}

HttpParserPtr createLLHttpParser(HttpParserType type,
                                 HttpParserCallbacks* callbacks) {
  return std::make_unique<LLHttpParser>(type, callbacks);
}

}  // namespace http
}  // namespace chatws
