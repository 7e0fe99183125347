#include "chatws/transport/libevent_websocket_transport.h"

#include <sys/socket.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/bufferevent_ssl.h>
#include <event2/dns.h>
#include <event2/event.h>
#include <event2/util.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "chatws/transport/close_code.h"
#include "chatws/transport/websocket_frame.h"

#define CHATWS_LOG_COMPONENT "chatws.transport"
#include "chatws/logging/log_macros.h"

namespace chatws {
namespace transport {

const char* transportStateToString(TransportState state) {
  switch (state) {
    case TransportState::Idle:
      return "Idle";
    case TransportState::Connecting:
      return "Connecting";
    case TransportState::Open:
      return "Open";
    case TransportState::Closing:
      return "Closing";
    case TransportState::Closed:
      return "Closed";
  }
  return "Unknown";
}

LibeventTransportOptions transportOptionsFromConfig(
    const config::ChatSocketConfig& config) {
  LibeventTransportOptions options;
  options.max_message_size = config.max_message_size;
  options.close_timeout = config.close_timeout;
  options.tls.verify_peer = config.tls.verify_peer;
  options.tls.ca_cert_file = config.tls.ca_cert_file;
  return options;
}

namespace detail {

class WebSocketSession;

struct LibeventTransportContext {
  LibeventTransportContext(event::LibeventDispatcher& dispatcher,
                           const LibeventTransportOptions& options)
      : dispatcher(dispatcher), options(options) {}

  Result<SslContextSharedPtr> sslContext() {
    if (!ssl_context) {
      auto created = SslContext::create(options.tls);
      if (auto* error = getError(created)) {
        return *error;
      }
      ssl_context = get<SslContextSharedPtr>(created);
    }
    return ssl_context;
  }

  event::LibeventDispatcher& dispatcher;
  const LibeventTransportOptions options;
  evdns_base* dns_base{nullptr};
  SslContextSharedPtr ssl_context;
  std::vector<std::weak_ptr<WebSocketSession>> sessions;
};

/**
 * One WebSocket connection over a bufferevent.
 *
 * While connecting, open or closing the session keeps itself alive through
 * self_, so a closing handshake can outlive the transport handle.
 */
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
 public:
  explicit WebSocketSession(std::shared_ptr<LibeventTransportContext> context)
      : context_(std::move(context)),
        decoder_(context_->options.max_message_size) {}

  ~WebSocketSession() { releaseSocket(); }

  void setCallbacks(WebSocketTransportCallbacks* callbacks) {
    callbacks_ = callbacks;
  }

  TransportState state() const { return state_; }

  VoidResult connect(const WebSocketUrl& url, const HeaderList& headers);
  VoidResult sendText(const std::string& payload);
  void close(int code, const std::string& reason);

  // Drop the socket without a closing handshake or callbacks
  void abort();

 private:
  static void readCallback(bufferevent* bev, void* arg);
  static void eventCallback(bufferevent* bev, short events, void* arg);

  void onReadable();
  void onEvent(short events);
  void onHandshakeData(const char* data, size_t length);
  void processFrames(const char* data, size_t length);
  void dispatchMessage(WebSocketMessage& message);

  void failConnecting(const std::string& message, int close_code);
  void failConnection(int close_code, const std::string& message);
  void startClosing();
  void finish(bool notify, int code, const std::string& reason);
  void reportClose(int code, const std::string& reason);
  void releaseSocket();

  VoidResult writeFrame(OpCode opcode, const std::string& payload);
  std::string describeSocketEvent(short events);

  std::shared_ptr<LibeventTransportContext> context_;
  WebSocketTransportCallbacks* callbacks_{nullptr};
  TransportState state_{TransportState::Idle};
  bufferevent* bev_{nullptr};
  WebSocketUrl url_;
  std::string request_;
  std::unique_ptr<HandshakeResponseParser> handshake_;
  FrameDecoder decoder_;
  event::TimerPtr close_timer_;
  bool close_reported_{false};
  std::shared_ptr<WebSocketSession> self_;
};

VoidResult WebSocketSession::connect(const WebSocketUrl& url,
                                     const HeaderList& headers) {
  if (state_ != TransportState::Idle) {
    return makeVoidError(Error(ErrorCode::kInternalError,
                               "Transport already used, state " +
                                   std::string(transportStateToString(state_))));
  }
  if (!context_->dns_base) {
    return makeVoidError(
        Error(ErrorCode::kNotAvailable, "Transport factory destroyed"));
  }

  const std::string key = generateWebSocketKey();
  auto request = buildUpgradeRequest(url, key, headers);
  if (auto* error = getError(request)) {
    return makeVoidError(*error);
  }

  event_base* base = context_->dispatcher.base();
  bufferevent* bev = nullptr;
  if (url.secure) {
    auto ssl_context = context_->sslContext();
    if (auto* error = getError(ssl_context)) {
      return makeVoidError(*error);
    }
    auto ssl = get<SslContextSharedPtr>(ssl_context)->newSsl(url.host);
    if (auto* error = getError(ssl)) {
      return makeVoidError(*error);
    }
    bev = bufferevent_openssl_socket_new(
        base, -1, get<SSL*>(ssl), BUFFEREVENT_SSL_CONNECTING,
        BEV_OPT_CLOSE_ON_FREE | BEV_OPT_DEFER_CALLBACKS);
    if (!bev) {
      SSL_free(get<SSL*>(ssl));
    } else {
      bufferevent_openssl_set_allow_dirty_shutdown(bev, 1);
    }
  } else {
    bev = bufferevent_socket_new(
        base, -1, BEV_OPT_CLOSE_ON_FREE | BEV_OPT_DEFER_CALLBACKS);
  }
  if (!bev) {
    return makeVoidError(
        Error(ErrorCode::kConnectFailed, "Failed to create bufferevent"));
  }

  url_ = url;
  request_ = std::move(get<std::string>(request));
  handshake_ = std::make_unique<HandshakeResponseParser>(computeAcceptKey(key));
  bev_ = bev;
  bufferevent_setcb(bev_, &WebSocketSession::readCallback, nullptr,
                    &WebSocketSession::eventCallback, this);
  bufferevent_enable(bev_, EV_READ | EV_WRITE);

  if (bufferevent_socket_connect_hostname(bev_, context_->dns_base, AF_UNSPEC,
                                          url_.host.c_str(), url_.port) != 0) {
    releaseSocket();
    return makeVoidError(Error(ErrorCode::kConnectFailed,
                               "Failed to start connecting to " +
                                   url_.hostHeader()));
  }

  CHATWS_LOG(Debug, "Connecting to {}", url_.toString());
  state_ = TransportState::Connecting;
  self_ = shared_from_this();
  return makeVoidSuccess();
}

VoidResult WebSocketSession::sendText(const std::string& payload) {
  if (state_ != TransportState::Open) {
    return makeVoidError(Error(ErrorCode::kNotConnected,
                               "Transport not open, state " +
                                   std::string(transportStateToString(state_))));
  }
  return writeFrame(OpCode::Text, payload);
}

void WebSocketSession::close(int code, const std::string& reason) {
  callbacks_ = nullptr;
  switch (state_) {
    case TransportState::Idle:
      state_ = TransportState::Closed;
      break;
    case TransportState::Connecting:
      finish(false, CloseCode::kAbnormalClosure, "");
      break;
    case TransportState::Open: {
      if (!context_->dispatcher.isRunning()) {
        // No loop left to wait for the peer's close frame
        finish(false, CloseCode::kAbnormalClosure, "");
        break;
      }
      int sent_code = isSendableCloseCode(code) ? code : CloseCode::kNormalClosure;
      auto written =
          writeFrame(OpCode::Close, encodeClosePayload(sent_code, reason));
      if (getError(written)) {
        finish(false, CloseCode::kAbnormalClosure, "");
        return;
      }
      startClosing();
      break;
    }
    case TransportState::Closing:
    case TransportState::Closed:
      break;
  }
}

void WebSocketSession::abort() {
  callbacks_ = nullptr;
  finish(false, CloseCode::kAbnormalClosure, "");
}

void WebSocketSession::readCallback(bufferevent*, void* arg) {
  auto self = static_cast<WebSocketSession*>(arg)->shared_from_this();
  self->onReadable();
}

void WebSocketSession::eventCallback(bufferevent*, short events, void* arg) {
  auto self = static_cast<WebSocketSession*>(arg)->shared_from_this();
  self->onEvent(events);
}

void WebSocketSession::onReadable() {
  char chunk[16384];
  while (bev_ && state_ != TransportState::Closed) {
    int read = evbuffer_remove(bufferevent_get_input(bev_), chunk,
                               sizeof(chunk));
    if (read <= 0) {
      break;
    }
    if (state_ == TransportState::Connecting) {
      onHandshakeData(chunk, static_cast<size_t>(read));
    } else {
      processFrames(chunk, static_cast<size_t>(read));
    }
  }
}

void WebSocketSession::onEvent(short events) {
  if (events & BEV_EVENT_CONNECTED) {
    if (state_ == TransportState::Connecting) {
      CHATWS_LOG(Debug, "Connected to {}, sending upgrade request",
                 url_.hostHeader());
      if (bufferevent_write(bev_, request_.data(), request_.size()) != 0) {
        failConnecting("Failed to write upgrade request",
                       CloseCode::kAbnormalClosure);
      }
      request_.clear();
    }
    return;
  }

  if (!(events & (BEV_EVENT_EOF | BEV_EVENT_ERROR))) {
    return;
  }

  switch (state_) {
    case TransportState::Connecting: {
      bool tls_failure = false;
      std::string message = describeSocketEvent(events);
      if (url_.secure && message.compare(0, 4, "TLS ") == 0) {
        tls_failure = true;
      }
      failConnecting(message, tls_failure ? CloseCode::kTlsHandshakeFailed
                                          : CloseCode::kAbnormalClosure);
      break;
    }
    case TransportState::Open: {
      std::string message = describeSocketEvent(events);
      CHATWS_LOG(Debug, "Connection to {} lost: {}", url_.hostHeader(),
                 message);
      if ((events & BEV_EVENT_ERROR) && callbacks_) {
        callbacks_->onError(message);
      }
      finish(true, CloseCode::kAbnormalClosure, "");
      break;
    }
    case TransportState::Closing:
      finish(false, CloseCode::kNormalClosure, "");
      break;
    case TransportState::Idle:
    case TransportState::Closed:
      break;
  }
}

void WebSocketSession::onHandshakeData(const char* data, size_t length) {
  auto state = handshake_->feed(data, length);
  if (state == HandshakeResponseParser::State::Incomplete) {
    return;
  }
  if (state == HandshakeResponseParser::State::Failed) {
    failConnecting("WebSocket handshake failed: " + handshake_->error(),
                   CloseCode::kAbnormalClosure);
    return;
  }

  std::string leftover = handshake_->takeLeftover();
  handshake_.reset();
  state_ = TransportState::Open;
  CHATWS_LOG(Debug, "WebSocket open to {}", url_.toString());
  if (callbacks_) {
    callbacks_->onOpen();
  }
  if (!leftover.empty() && (state_ == TransportState::Open ||
                            state_ == TransportState::Closing)) {
    processFrames(leftover.data(), leftover.size());
  }
}

void WebSocketSession::processFrames(const char* data, size_t length) {
  std::vector<WebSocketMessage> messages;
  auto result = decoder_.feed(data, length, messages);

  for (auto& message : messages) {
    if (state_ != TransportState::Open && state_ != TransportState::Closing) {
      return;
    }
    dispatchMessage(message);
  }

  if (auto* error = getError(result)) {
    if (state_ == TransportState::Open || state_ == TransportState::Closing) {
      failConnection(error->code, error->message);
    }
  }
}

void WebSocketSession::dispatchMessage(WebSocketMessage& message) {
  switch (message.opcode) {
    case OpCode::Text:
    case OpCode::Binary:
      if (state_ == TransportState::Open && callbacks_) {
        callbacks_->onMessage(message.payload, message.opcode == OpCode::Text
                                                   ? MessageType::Text
                                                   : MessageType::Binary);
      }
      break;
    case OpCode::Ping:
      if (state_ == TransportState::Open) {
        auto written = writeFrame(OpCode::Pong, message.payload);
        if (auto* error = getError(written)) {
          CHATWS_LOG(Warning, "Failed to answer ping: {}", error->message);
        }
      }
      break;
    case OpCode::Pong:
      break;
    case OpCode::Close: {
      if (state_ == TransportState::Closing) {
        // Reply to our own close frame
        finish(false, CloseCode::kNormalClosure, "");
        return;
      }
      auto parsed = parseClosePayload(message.payload);
      if (auto* error = getError(parsed)) {
        failConnection(error->code, error->message);
        return;
      }
      const auto& close = get<ClosePayload>(parsed);
      CHATWS_LOG(Debug, "Peer closed {} with {} {}", url_.hostHeader(),
                 close.code, close.reason);
      auto written = writeFrame(OpCode::Close,
                                close.code == CloseCode::kNoStatusReceived
                                    ? std::string()
                                    : encodeClosePayload(close.code, ""));
      if (getError(written)) {
        finish(true, close.code, close.reason);
        return;
      }
      startClosing();
      reportClose(close.code, close.reason);
      break;
    }
    case OpCode::Continuation:
      break;
  }
}

void WebSocketSession::failConnecting(const std::string& message,
                                      int close_code) {
  CHATWS_LOG(Debug, "Connecting to {} failed: {}", url_.hostHeader(), message);
  if (callbacks_) {
    callbacks_->onError(message);
  }
  finish(true, close_code, "");
}

void WebSocketSession::failConnection(int close_code,
                                      const std::string& message) {
  CHATWS_LOG(Warning, "Failing connection to {} with {}: {}",
             url_.hostHeader(), close_code, message);
  if (state_ == TransportState::Open) {
    auto written =
        writeFrame(OpCode::Close, encodeClosePayload(close_code, message));
    if (getError(written)) {
      finish(true, close_code, message);
      return;
    }
    startClosing();
  }
  reportClose(close_code, message);
}

void WebSocketSession::startClosing() {
  state_ = TransportState::Closing;
  if (!close_timer_) {
    std::weak_ptr<WebSocketSession> weak_self = shared_from_this();
    event::LibeventDispatcher* dispatcher = &context_->dispatcher;
    close_timer_ = dispatcher->createTimer([weak_self, dispatcher]() {
      // Finish outside the timer callback; finishing may destroy the timer
      dispatcher->post([weak_self]() {
        if (auto self = weak_self.lock()) {
          CHATWS_LOG(Debug, "Close handshake timed out");
          self->finish(false, CloseCode::kAbnormalClosure, "");
        }
      });
    });
  }
  close_timer_->enableTimer(context_->options.close_timeout);
}

void WebSocketSession::finish(bool notify, int code, const std::string& reason) {
  if (state_ == TransportState::Closed) {
    return;
  }
  state_ = TransportState::Closed;
  releaseSocket();
  if (close_timer_) {
    close_timer_->disableTimer();
  }
  auto keep_alive = std::move(self_);
  if (notify) {
    reportClose(code, reason);
  }
}

void WebSocketSession::reportClose(int code, const std::string& reason) {
  if (close_reported_) {
    return;
  }
  close_reported_ = true;
  if (callbacks_) {
    callbacks_->onClose(code, reason);
  }
}

void WebSocketSession::releaseSocket() {
  if (bev_) {
    bufferevent_setcb(bev_, nullptr, nullptr, nullptr, nullptr);
    bufferevent_free(bev_);
    bev_ = nullptr;
  }
  handshake_.reset();
}

VoidResult WebSocketSession::writeFrame(OpCode opcode,
                                        const std::string& payload) {
  if (!bev_) {
    return makeVoidError(Error(ErrorCode::kNotConnected, "Socket released"));
  }
  std::string frame = encodeClientFrame(opcode, payload);
  if (bufferevent_write(bev_, frame.data(), frame.size()) != 0) {
    return makeVoidError(
        Error(ErrorCode::kInternalError, "Failed to queue frame"));
  }
  return makeVoidSuccess();
}

std::string WebSocketSession::describeSocketEvent(short events) {
  int dns_error = bufferevent_socket_get_dns_error(bev_);
  if (dns_error != 0) {
    return "DNS lookup failed for " + url_.host + ": " +
           evutil_gai_strerror(dns_error);
  }

  std::string tls_errors;
  unsigned long ssl_error;
  while ((ssl_error = bufferevent_get_openssl_error(bev_)) != 0) {
    char buf[256];
    ERR_error_string_n(ssl_error, buf, sizeof(buf));
    if (!tls_errors.empty()) {
      tls_errors += "; ";
    }
    tls_errors += buf;
  }
  if (!tls_errors.empty()) {
    return "TLS error: " + tls_errors;
  }

  if (events & BEV_EVENT_EOF) {
    return "Connection closed by peer";
  }
  int socket_error = EVUTIL_SOCKET_ERROR();
  if (socket_error != 0) {
    return std::string("Socket error: ") +
           evutil_socket_error_to_string(socket_error);
  }
  return "Socket error";
}

}  // namespace detail

namespace {

class LibeventWebSocketTransport : public WebSocketTransport {
 public:
  explicit LibeventWebSocketTransport(
      std::shared_ptr<detail::WebSocketSession> session)
      : session_(std::move(session)) {}

  ~LibeventWebSocketTransport() override {
    session_->setCallbacks(nullptr);
    session_->close(CloseCode::kGoingAway, "");
  }

  void setCallbacks(WebSocketTransportCallbacks* callbacks) override {
    session_->setCallbacks(callbacks);
  }

  VoidResult connect(const WebSocketUrl& url,
                     const HeaderList& headers) override {
    return session_->connect(url, headers);
  }

  VoidResult sendText(const std::string& payload) override {
    return session_->sendText(payload);
  }

  void close(int code, const std::string& reason) override {
    session_->close(code, reason);
  }

  void abort() override { session_->abort(); }

  TransportState state() const override { return session_->state(); }

 private:
  std::shared_ptr<detail::WebSocketSession> session_;
};

}  // namespace

LibeventWebSocketTransportFactory::LibeventWebSocketTransportFactory(
    event::LibeventDispatcher& dispatcher,
    const LibeventTransportOptions& options)
    : context_(std::make_shared<detail::LibeventTransportContext>(dispatcher,
                                                                  options)) {
  context_->dns_base =
      evdns_base_new(dispatcher.base(), EVDNS_BASE_INITIALIZE_NAMESERVERS);
  if (!context_->dns_base) {
    throw std::runtime_error("Failed to create DNS resolver");
  }
}

LibeventWebSocketTransportFactory::~LibeventWebSocketTransportFactory() {
  auto sessions = std::move(context_->sessions);
  for (auto& weak_session : sessions) {
    if (auto session = weak_session.lock()) {
      session->abort();
    }
  }
  evdns_base_free(context_->dns_base, 0);
  context_->dns_base = nullptr;
}

WebSocketTransportPtr LibeventWebSocketTransportFactory::createTransport() {
  auto& sessions = context_->sessions;
  sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                [](const std::weak_ptr<detail::WebSocketSession>&
                                       session) { return session.expired(); }),
                 sessions.end());

  auto session = std::make_shared<detail::WebSocketSession>(context_);
  sessions.push_back(session);
  return std::make_unique<LibeventWebSocketTransport>(std::move(session));
}

size_t LibeventWebSocketTransportFactory::liveTransportCount() const {
  size_t count = 0;
  for (const auto& weak_session : context_->sessions) {
    auto session = weak_session.lock();
    if (session && (session->state() == TransportState::Connecting ||
                    session->state() == TransportState::Open ||
                    session->state() == TransportState::Closing)) {
      ++count;
    }
  }
  return count;
}

}  // namespace transport
}  // namespace chatws
