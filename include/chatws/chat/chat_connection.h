/**
 * @file chat_connection.h
 * @brief One WebSocket to the chat-completion service
 */

#ifndef CHATWS_CHAT_CHAT_CONNECTION_H
#define CHATWS_CHAT_CHAT_CONNECTION_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "chatws/chat/active_request.h"
#include "chatws/core/cancellation.h"
#include "chatws/core/emitter.h"
#include "chatws/core/result.h"
#include "chatws/event/event_loop.h"
#include "chatws/json/json_bridge.h"
#include "chatws/transport/websocket_transport.h"

namespace chatws {
namespace chat {

enum class ConnectionState { Connecting, Open, Closed };

const char* connectionStateToString(ConnectionState state);

class ChatConnection {
 public:
  virtual ~ChatConnection() = default;

  /**
   * Send a response.create request built from `body`, which must be a JSON
   * object. Any request still in flight fails as superseded first.
   *
   * @throws NotConnectedError when the connection is not open
   * @throws std::invalid_argument when body is not an object
   */
  virtual RequestHandleSharedPtr send(
      const json::JsonValue& body,
      const CancellationToken& token = CancellationToken::none()) = 0;

  virtual bool isOpen() const = 0;

  virtual ConnectionState state() const = 0;

  // Idempotent. Fails the current request and closes the socket.
  virtual void dispose() = 0;

  // Fires once, when the connection disposes for any reason
  virtual ListenerHandle onDidDispose(std::function<void()> callback) = 0;
};

using ChatConnectionSharedPtr = std::shared_ptr<ChatConnection>;

struct ChatConnectionOptions {
  std::string url;  // ws:// or wss:// endpoint
  std::string credential;
  std::string integration_id{"vscode-chat"};
  std::chrono::milliseconds handshake_timeout{30000};

  // Used in log lines only
  std::string conversation_id;
  std::string turn_id;
};

/**
 * ChatConnection over a WebSocketTransport.
 *
 * Bound to one dispatcher: connect(), send(), dispose() and all transport
 * callbacks run on its thread. dispose() and cancellation requested from
 * another thread are posted to it. Must be owned by a shared_ptr.
 */
class ChatConnectionImpl : public ChatConnection,
                           public transport::WebSocketTransportCallbacks,
                           public std::enable_shared_from_this<ChatConnectionImpl> {
 public:
  using ConnectCallback = std::function<void(const VoidResult&)>;

  ChatConnectionImpl(event::Dispatcher& dispatcher,
                     transport::WebSocketTransportFactorySharedPtr factory,
                     ChatConnectionOptions options);
  ~ChatConnectionImpl() override;

  /**
   * Open the socket. The callback runs once the upgrade completes or fails.
   * Succeeds immediately when already open; joins a handshake in progress;
   * fails immediately after dispose. On failure the connection disposes
   * itself.
   */
  void connect(ConnectCallback callback);

  // ChatConnection
  RequestHandleSharedPtr send(
      const json::JsonValue& body,
      const CancellationToken& token = CancellationToken::none()) override;
  bool isOpen() const override { return state_ == ConnectionState::Open; }
  ConnectionState state() const override { return state_; }
  void dispose() override;
  ListenerHandle onDidDispose(std::function<void()> callback) override;

  // transport::WebSocketTransportCallbacks
  void onOpen() override;
  void onMessage(const std::string& data,
                 transport::MessageType type) override;
  void onClose(int code, const std::string& reason) override;
  void onError(const std::string& message) override;

  const ChatConnectionOptions& options() const { return options_; }

 private:
  void disposeNow();
  void failConnect(const Error& error);
  void onHandshakeTimeout();
  void cancelRequest(const std::weak_ptr<ActiveRequest>& request);
  void releaseTransport();
  void runOnDispatcher(std::function<void()> callback);

  event::Dispatcher& dispatcher_;
  transport::WebSocketTransportFactorySharedPtr factory_;
  const ChatConnectionOptions options_;

  std::atomic<ConnectionState> state_{ConnectionState::Connecting};
  bool disposed_{false};
  transport::WebSocketTransportPtr transport_;
  event::TimerPtr handshake_timer_;
  std::vector<ConnectCallback> pending_connects_;
  ActiveRequestSharedPtr active_request_;
  Emitter<> on_did_dispose_;
};

}  // namespace chat
}  // namespace chatws

#endif  // CHATWS_CHAT_CHAT_CONNECTION_H
