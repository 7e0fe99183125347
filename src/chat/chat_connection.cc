#include "chatws/chat/chat_connection.h"

#include <stdexcept>

#include "chatws/transport/close_code.h"
#include "chatws/transport/endpoint.h"

#define CHATWS_LOG_COMPONENT "chatws.connection"
#include "chatws/logging/log_macros.h"

namespace chatws {
namespace chat {

namespace {

const char kRequestType[] = "response.create";

}  // namespace

const char* connectionStateToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::Connecting:
      return "Connecting";
    case ConnectionState::Open:
      return "Open";
    case ConnectionState::Closed:
      return "Closed";
  }
  return "Unknown";
}

ChatConnectionImpl::ChatConnectionImpl(
    event::Dispatcher& dispatcher,
    transport::WebSocketTransportFactorySharedPtr factory,
    ChatConnectionOptions options)
    : dispatcher_(dispatcher),
      factory_(std::move(factory)),
      options_(std::move(options)) {}

ChatConnectionImpl::~ChatConnectionImpl() {
  if (active_request_) {
    active_request_->handleError(
        RequestError(RequestErrorKind::Disposed, "Connection disposed"));
  }
  if (transport_) {
    transport_->setCallbacks(nullptr);
    if (dispatcher_.isThreadSafe()) {
      transport_->close(transport::CloseCode::kNormalClosure, "");
      dispatcher_.deferredDelete(std::move(transport_));
    } else {
      // Off the dispatcher thread the loop cannot run a closing handshake
      transport_->abort();
      transport_.reset();
    }
  }
}

void ChatConnectionImpl::connect(ConnectCallback callback) {
  switch (state_.load()) {
    case ConnectionState::Open:
      callback(makeVoidSuccess());
      return;
    case ConnectionState::Closed:
      callback(makeVoidError(
          Error(ErrorCode::kConnectionDisposed, "Connection disposed")));
      return;
    case ConnectionState::Connecting:
      break;
  }

  pending_connects_.push_back(std::move(callback));
  if (transport_) {
    // Joins the handshake already in flight
    return;
  }

  auto url = transport::parseWebSocketUrl(options_.url);
  if (auto* error = getError(url)) {
    failConnect(Error(ErrorCode::kConnectFailed,
                      "WebSocket connection failed: " + error->message));
    return;
  }

  CHATWS_LOG(Debug, "Connecting to {} for conversation {} turn {}",
             options_.url, options_.conversation_id, options_.turn_id);

  transport_ = factory_->createTransport();
  transport_->setCallbacks(this);

  transport::HeaderList headers{
      {"Authorization", "Bearer " + options_.credential},
      {"Copilot-Integration-Id", options_.integration_id}};
  auto started = transport_->connect(get<transport::WebSocketUrl>(url), headers);
  if (auto* error = getError(started)) {
    failConnect(Error(ErrorCode::kConnectFailed,
                      "WebSocket connection failed: " + error->message));
    return;
  }

  std::weak_ptr<ChatConnectionImpl> weak_self = shared_from_this();
  event::Dispatcher* dispatcher = &dispatcher_;
  handshake_timer_ = dispatcher_.createTimer([weak_self, dispatcher]() {
    // Handled outside the timer callback; disposal may destroy the timer
    dispatcher->post([weak_self]() {
      if (auto self = weak_self.lock()) {
        self->onHandshakeTimeout();
      }
    });
  });
  handshake_timer_->enableTimer(options_.handshake_timeout);
}

RequestHandleSharedPtr ChatConnectionImpl::send(const json::JsonValue& body,
                                                const CancellationToken& token) {
  if (!isOpen() || !transport_) {
    throw NotConnectedError();
  }
  if (!body.isObject()) {
    throw std::invalid_argument("Request body must be a JSON object");
  }

  if (active_request_) {
    auto previous = std::move(active_request_);
    previous->handleError(RequestError(RequestErrorKind::Superseded,
                                       "Request superseded by new request"));
  }

  auto request = std::make_shared<ActiveRequest>();
  if (token.isCancellationRequested()) {
    request->handleError(CancelledError());
    return request;
  }
  active_request_ = request;

  std::weak_ptr<ChatConnectionImpl> weak_self = shared_from_this();
  std::weak_ptr<ActiveRequest> weak_request = request;
  request->attachCancellation(
      token.onCancellationRequested([weak_self, weak_request]() {
        if (auto self = weak_self.lock()) {
          self->runOnDispatcher([weak_self, weak_request]() {
            if (auto self = weak_self.lock()) {
              self->cancelRequest(weak_request);
            }
          });
        }
      }));
  if (request->isSettled()) {
    return request;
  }

  json::JsonValue message = json::JsonValue::object();
  message.set("type", kRequestType);
  for (const auto& key : body.keys()) {
    message.set(key, body.get(key));
  }
  // The socket always streams
  message.erase("stream");

  CHATWS_LOG(Debug, "Sending request for conversation {} turn {}",
             options_.conversation_id, options_.turn_id);
  auto written = transport_->sendText(message.toString());
  if (auto* error = getError(written)) {
    CHATWS_LOG(Error, "Failed to send request for conversation {} turn {}: {}",
               options_.conversation_id, options_.turn_id, error->message);
    if (active_request_ == request) {
      active_request_.reset();
    }
    request->handleError(RequestError(RequestErrorKind::Transport,
                                      "Failed to send request: " +
                                          error->message));
  }
  return request;
}

void ChatConnectionImpl::dispose() {
  auto self = shared_from_this();
  runOnDispatcher([self]() { self->disposeNow(); });
}

ListenerHandle ChatConnectionImpl::onDidDispose(std::function<void()> callback) {
  return on_did_dispose_.registerListener(std::move(callback));
}

void ChatConnectionImpl::onOpen() {
  auto self = shared_from_this();
  if (state_ != ConnectionState::Connecting) {
    return;
  }
  if (handshake_timer_) {
    handshake_timer_->disableTimer();
  }
  state_ = ConnectionState::Open;
  CHATWS_LOG(Debug, "Connected for conversation {} turn {}",
             options_.conversation_id, options_.turn_id);

  auto callbacks = std::move(pending_connects_);
  pending_connects_.clear();
  for (auto& callback : callbacks) {
    callback(makeVoidSuccess());
  }
}

void ChatConnectionImpl::onMessage(const std::string& data,
                                   transport::MessageType type) {
  auto self = shared_from_this();
  if (type != transport::MessageType::Text) {
    CHATWS_LOG(Debug, "Ignoring binary message for conversation {} turn {}",
               options_.conversation_id, options_.turn_id);
    return;
  }

  json::JsonValue event;
  try {
    event = json::JsonValue::parse(data);
  } catch (const json::JsonException& e) {
    CHATWS_LOG(Error, "Failed to parse message for conversation {} turn {}: {}",
               options_.conversation_id, options_.turn_id, e.what());
    return;
  }
  if (!event.isObject()) {
    CHATWS_LOG(Error,
               "Ignoring non-object message for conversation {} turn {}",
               options_.conversation_id, options_.turn_id);
    return;
  }

  if (!active_request_) {
    return;
  }
  auto request = active_request_;
  request->handleEvent(event);
  if (request->isSettled() && active_request_ == request) {
    active_request_.reset();
  }
}

void ChatConnectionImpl::onClose(int code, const std::string& reason) {
  auto self = shared_from_this();
  if (state_ == ConnectionState::Connecting) {
    CHATWS_LOG(Debug,
               "Connection closed during setup for conversation {} turn {}",
               options_.conversation_id, options_.turn_id);
    failConnect(Error(ErrorCode::kConnectionClosed,
                      "WebSocket closed during connection setup"));
    return;
  }
  if (state_ == ConnectionState::Closed) {
    return;
  }

  state_ = ConnectionState::Closed;
  CHATWS_LOG(Debug,
             "Connection closed for conversation {} turn {} (code: {} {}{})",
             options_.conversation_id, options_.turn_id, code,
             transport::closeCodeToString(code),
             reason.empty() ? std::string() : ", reason: " + reason);
  if (active_request_) {
    auto request = std::move(active_request_);
    request->handleConnectionClose(code, reason);
  }
  disposeNow();
}

void ChatConnectionImpl::onError(const std::string& message) {
  auto self = shared_from_this();
  if (state_ == ConnectionState::Connecting) {
    CHATWS_LOG(Error, "Connection error for conversation {} turn {}: {}",
               options_.conversation_id, options_.turn_id, message);
    failConnect(Error(ErrorCode::kConnectFailed,
                      message.empty() ? "WebSocket connection failed"
                                      : "WebSocket connection failed: " +
                                            message));
    return;
  }

  const std::string error_message = message.empty() ? "WebSocket error" : message;
  CHATWS_LOG(Error, "Error for conversation {} turn {}: {}",
             options_.conversation_id, options_.turn_id, error_message);
  if (active_request_) {
    active_request_->handleError(
        RequestError(RequestErrorKind::Transport, error_message));
  }
}

void ChatConnectionImpl::disposeNow() {
  if (disposed_) {
    return;
  }
  disposed_ = true;

  if (active_request_) {
    auto request = std::move(active_request_);
    request->handleError(
        RequestError(RequestErrorKind::Disposed, "Connection disposed"));
  }

  state_ = ConnectionState::Closed;
  if (handshake_timer_) {
    handshake_timer_->disableTimer();
  }
  releaseTransport();

  auto pending = std::move(pending_connects_);
  pending_connects_.clear();

  on_did_dispose_.emit();
  on_did_dispose_.dispose();

  for (auto& callback : pending) {
    callback(makeVoidError(
        Error(ErrorCode::kConnectionDisposed, "Connection disposed")));
  }
}

void ChatConnectionImpl::failConnect(const Error& error) {
  auto callbacks = std::move(pending_connects_);
  pending_connects_.clear();
  disposeNow();
  for (auto& callback : callbacks) {
    callback(makeVoidError(error));
  }
}

void ChatConnectionImpl::onHandshakeTimeout() {
  if (state_ != ConnectionState::Connecting || disposed_) {
    return;
  }
  CHATWS_LOG(Error, "Handshake timed out for conversation {} turn {}",
             options_.conversation_id, options_.turn_id);
  failConnect(Error(ErrorCode::kHandshakeTimeout,
                    "WebSocket handshake timed out after " +
                        std::to_string(options_.handshake_timeout.count()) +
                        "ms"));
}

void ChatConnectionImpl::cancelRequest(
    const std::weak_ptr<ActiveRequest>& weak_request) {
  auto request = weak_request.lock();
  if (!request || request != active_request_) {
    return;
  }
  CHATWS_LOG(Debug, "Request cancelled for conversation {} turn {}",
             options_.conversation_id, options_.turn_id);
  active_request_.reset();
  request->handleError(CancelledError());
}

void ChatConnectionImpl::releaseTransport() {
  if (!transport_) {
    return;
  }
  transport_->setCallbacks(nullptr);
  if (dispatcher_.isRunning()) {
    transport_->close(transport::CloseCode::kNormalClosure, "");
    dispatcher_.deferredDelete(std::move(transport_));
  } else {
    transport_->abort();
    transport_.reset();
  }
}

void ChatConnectionImpl::runOnDispatcher(std::function<void()> callback) {
  if (dispatcher_.isThreadSafe() || !dispatcher_.isRunning()) {
    callback();
  } else {
    dispatcher_.post(std::move(callback));
  }
}

}  // namespace chat
}  // namespace chatws
