#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "chatws/core/result.h"
#include "chatws/json/json_bridge.h"
#include "chatws/transport/websocket_transport.h"

namespace chatws {
namespace test {

/**
 * Observable state of one FakeWebSocketTransport. Outlives the transport so
 * tests can check what happened after the owner released it.
 */
struct FakeTransportState {
  transport::WebSocketTransportCallbacks* callbacks{nullptr};
  transport::TransportState state{transport::TransportState::Idle};
  transport::WebSocketUrl url;
  transport::HeaderList headers;
  std::vector<std::string> sent;
  bool close_called{false};
  bool aborted{false};
  int close_code{0};
  bool destroyed{false};

  VoidResult connect_result{makeVoidSuccess()};
  VoidResult send_result{makeVoidSuccess()};

  // Server side of the socket
  void acceptOpen() {
    state = transport::TransportState::Open;
    if (callbacks) {
      callbacks->onOpen();
    }
  }

  void deliverText(const std::string& text) {
    if (callbacks) {
      callbacks->onMessage(text, transport::MessageType::Text);
    }
  }

  void deliverJson(const json::JsonValue& value) {
    deliverText(value.toString());
  }

  void deliverBinary(const std::string& data) {
    if (callbacks) {
      callbacks->onMessage(data, transport::MessageType::Binary);
    }
  }

  void peerClose(int code, const std::string& reason = "") {
    state = transport::TransportState::Closed;
    if (callbacks) {
      callbacks->onClose(code, reason);
    }
  }

  void raiseError(const std::string& message) {
    if (callbacks) {
      callbacks->onError(message);
    }
  }

  std::string header(const std::string& name) const {
    for (const auto& header : headers) {
      if (header.first == name) {
        return header.second;
      }
    }
    return "";
  }

  json::JsonValue lastSent() const {
    return sent.empty() ? json::JsonValue::null()
                        : json::JsonValue::parse(sent.back());
  }
};

using FakeTransportStatePtr = std::shared_ptr<FakeTransportState>;

class FakeWebSocketTransport : public transport::WebSocketTransport {
 public:
  explicit FakeWebSocketTransport(FakeTransportStatePtr state)
      : state_(std::move(state)) {}

  ~FakeWebSocketTransport() override {
    state_->callbacks = nullptr;
    state_->destroyed = true;
  }

  void setCallbacks(transport::WebSocketTransportCallbacks* callbacks) override {
    state_->callbacks = callbacks;
  }

  VoidResult connect(const transport::WebSocketUrl& url,
                     const transport::HeaderList& headers) override {
    state_->url = url;
    state_->headers = headers;
    if (isSuccess(state_->connect_result)) {
      state_->state = transport::TransportState::Connecting;
    }
    return state_->connect_result;
  }

  VoidResult sendText(const std::string& payload) override {
    if (isSuccess(state_->send_result)) {
      state_->sent.push_back(payload);
    }
    return state_->send_result;
  }

  void close(int code, const std::string&) override {
    state_->callbacks = nullptr;
    state_->close_called = true;
    state_->close_code = code;
    state_->state = transport::TransportState::Closed;
  }

  void abort() override {
    state_->callbacks = nullptr;
    state_->aborted = true;
    state_->state = transport::TransportState::Closed;
  }

  transport::TransportState state() const override { return state_->state; }

 private:
  FakeTransportStatePtr state_;
};

class FakeWebSocketTransportFactory : public transport::WebSocketTransportFactory {
 public:
  transport::WebSocketTransportPtr createTransport() override {
    if (on_create) {
      on_create();
    }
    auto state = std::make_shared<FakeTransportState>();
    state->connect_result = next_connect_result;
    transports.push_back(state);
    return std::make_unique<FakeWebSocketTransport>(state);
  }

  FakeTransportStatePtr last() const {
    return transports.empty() ? nullptr : transports.back();
  }

  size_t created() const { return transports.size(); }

  std::vector<FakeTransportStatePtr> transports;
  VoidResult next_connect_result{makeVoidSuccess()};
  // Runs before each transport is created
  std::function<void()> on_create;
};

class MockTransportCallbacks : public transport::WebSocketTransportCallbacks {
 public:
  MOCK_METHOD(void, onOpen, (), (override));
  MOCK_METHOD(void,
              onMessage,
              (const std::string& data, transport::MessageType type),
              (override));
  MOCK_METHOD(void, onClose, (int code, const std::string& reason), (override));
  MOCK_METHOD(void, onError, (const std::string& message), (override));
};

}  // namespace test
}  // namespace chatws
