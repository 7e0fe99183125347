#include "chatws/transport/websocket_handshake.h"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>

namespace chatws {
namespace transport {

namespace {

const char kWebSocketGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string base64Encode(const unsigned char* data, size_t length) {
  std::string out(4 * ((length + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                data, static_cast<int>(length));
  out.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return out;
}

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::string trim(const std::string& str) {
  auto begin = str.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = str.find_last_not_of(" \t");
  return str.substr(begin, end - begin + 1);
}

bool containsLineBreak(const std::string& str) {
  return str.find_first_of("\r\n") != std::string::npos;
}

// True when the comma separated list contains `token` (case-insensitive)
bool headerHasToken(const std::string& value, const std::string& token) {
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (toLower(trim(item)) == token) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string generateWebSocketKey() {
  unsigned char nonce[16];
  if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
    std::random_device device;
    for (auto& byte : nonce) {
      byte = static_cast<unsigned char>(device());
    }
  }
  return base64Encode(nonce, sizeof(nonce));
}

std::string computeAcceptKey(const std::string& key) {
  std::string input = key + kWebSocketGuid;
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(),
       digest);
  return base64Encode(digest, sizeof(digest));
}

Result<std::string> buildUpgradeRequest(const WebSocketUrl& url,
                                        const std::string& key,
                                        const HeaderList& extra_headers) {
  std::ostringstream request;
  request << "GET " << url.path << " HTTP/1.1\r\n"
          << "Host: " << url.hostHeader() << "\r\n"
          << "Upgrade: websocket\r\n"
          << "Connection: Upgrade\r\n"
          << "Sec-WebSocket-Key: " << key << "\r\n"
          << "Sec-WebSocket-Version: 13\r\n";

  for (const auto& header : extra_headers) {
    if (header.first.empty() || containsLineBreak(header.first) ||
        containsLineBreak(header.second)) {
      return makeError<std::string>(ErrorCode::kInvalidArgument,
                                    "Invalid header: " + header.first);
    }
    request << header.first << ": " << header.second << "\r\n";
  }
  request << "\r\n";
  return request.str();
}

HandshakeResponseParser::HandshakeResponseParser(std::string expected_accept)
    : expected_accept_(std::move(expected_accept)),
      parser_(http::createLLHttpParser(http::HttpParserType::RESPONSE, this)) {}

HandshakeResponseParser::State HandshakeResponseParser::feed(const char* data,
                                                             size_t length) {
  if (state_ != State::Incomplete) {
    if (state_ == State::Complete) {
      leftover_.append(data, length);
    }
    return state_;
  }

  // Search from just before the new bytes; the terminator may straddle reads
  size_t search_from = buffer_.size() >= 3 ? buffer_.size() - 3 : 0;
  buffer_.append(data, length);
  auto end = buffer_.find("\r\n\r\n", search_from);
  if (end == std::string::npos) {
    if (buffer_.size() > kMaxHeaderBytes) {
      return fail("Handshake response headers too large");
    }
    return state_;
  }

  const size_t header_bytes = end + 4;
  if (header_bytes > kMaxHeaderBytes) {
    return fail("Handshake response headers too large");
  }

  parser_->execute(buffer_.data(), header_bytes);
  if (state_ == State::Failed) {
    return state_;
  }
  if (parser_->getStatus() == http::ParserStatus::Error) {
    return fail("Malformed handshake response: " + parser_->getError());
  }
  if (!headers_complete_) {
    return fail("Malformed handshake response");
  }

  leftover_ = buffer_.substr(header_bytes);
  buffer_.clear();
  return validate();
}

std::string HandshakeResponseParser::header(const std::string& name) const {
  auto it = headers_.find(toLower(name));
  return it == headers_.end() ? std::string() : it->second;
}

HandshakeResponseParser::State HandshakeResponseParser::fail(
    const std::string& error) {
  if (state_ == State::Incomplete) {
    state_ = State::Failed;
    error_ = error;
    buffer_.clear();
    leftover_.clear();
  }
  return state_;
}

HandshakeResponseParser::State HandshakeResponseParser::validate() {
  if (status_code_ !=
      static_cast<uint16_t>(http::HttpStatusCode::SwitchingProtocols)) {
    return fail("Unexpected HTTP status " + std::to_string(status_code_));
  }
  if (toLower(trim(header("upgrade"))) != "websocket") {
    return fail("Missing or invalid Upgrade header");
  }
  if (!headerHasToken(header("connection"), "upgrade")) {
    return fail("Missing or invalid Connection header");
  }
  if (trim(header("sec-websocket-accept")) != expected_accept_) {
    return fail("Sec-WebSocket-Accept mismatch");
  }
  state_ = State::Complete;
  return state_;
}

void HandshakeResponseParser::commitHeader() {
  if (current_field_.empty()) {
    return;
  }
  std::string name = toLower(current_field_);
  std::string value = trim(current_value_);
  auto it = headers_.find(name);
  if (it == headers_.end()) {
    headers_.emplace(std::move(name), std::move(value));
  } else {
    it->second += ", " + value;
  }
  current_field_.clear();
  current_value_.clear();
}

http::ParserCallbackResult HandshakeResponseParser::onMessageBegin() {
  return http::ParserCallbackResult::Success;
}

http::ParserCallbackResult HandshakeResponseParser::onStatus(const char*,
                                                             size_t) {
  return http::ParserCallbackResult::Success;
}

http::ParserCallbackResult HandshakeResponseParser::onHeaderField(
    const char* data,
    size_t length) {
  if (reading_value_) {
    commitHeader();
    reading_value_ = false;
  }
  current_field_.append(data, length);
  return http::ParserCallbackResult::Success;
}

http::ParserCallbackResult HandshakeResponseParser::onHeaderValue(
    const char* data,
    size_t length) {
  reading_value_ = true;
  current_value_.append(data, length);
  return http::ParserCallbackResult::Success;
}

http::ParserCallbackResult HandshakeResponseParser::onHeadersComplete() {
  commitHeader();
  reading_value_ = false;
  status_code_ = parser_->statusCode();
  headers_complete_ = true;
  return http::ParserCallbackResult::Success;
}

http::ParserCallbackResult HandshakeResponseParser::onBody(const char*,
                                                           size_t) {
  return http::ParserCallbackResult::Success;
}

http::ParserCallbackResult HandshakeResponseParser::onMessageComplete() {
  return http::ParserCallbackResult::Success;
}

void HandshakeResponseParser::onError(const std::string& error) {
  fail("Malformed handshake response: " + error);
}

}  // namespace transport
}  // namespace chatws
