/**
 * @file connection_registry.h
 * @brief Per-conversation ownership of chat connections
 */

#ifndef CHATWS_CHAT_CONNECTION_REGISTRY_H
#define CHATWS_CHAT_CONNECTION_REGISTRY_H

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "chatws/chat/chat_connection.h"
#include "chatws/config/chat_socket_config.h"
#include "chatws/core/compat.h"
#include "chatws/core/result.h"
#include "chatws/event/event_loop.h"
#include "chatws/transport/websocket_transport.h"

namespace chatws {
namespace chat {

class ConnectionRegistry {
 public:
  using ConnectCallback =
      std::function<void(const Result<ChatConnectionSharedPtr>&)>;

  virtual ~ConnectionRegistry() = default;

  /**
   * Deliver the connection for a conversation turn.
   *
   * An open connection registered for the same turn is reused. Otherwise
   * any previous connection for the conversation is disposed and a new one
   * is opened with `credential`; the callback runs once its handshake
   * completes or fails.
   */
  virtual void getOrCreate(const std::string& conversation_id,
                           const std::string& turn_id,
                           const std::string& credential,
                           ConnectCallback callback) = 0;

  // True iff the conversation's connection belongs to turn_id and is open
  virtual bool hasActive(const std::string& conversation_id,
                         const std::string& turn_id) const = 0;

  /**
   * Dispose and forget the conversation's connection. With a turn id the
   * call is a no-op unless that turn owns the connection.
   */
  virtual void close(const std::string& conversation_id,
                     const optional<std::string>& turn_id = nullopt) = 0;

  virtual void closeAll() = 0;
};

// Produces the ws(s):// address new connections dial
using EndpointResolver = std::function<Result<std::string>()>;

EndpointResolver defaultEndpointResolver(const config::ChatSocketConfig& config);

/**
 * Registry holding at most one connection per conversation.
 *
 * getOrCreate() must run on the dispatcher thread; hasActive(), close() and
 * closeAll() may be called from any thread. A connection that disposes
 * itself (peer close, socket error, failed handshake) removes its own
 * entry. The destructor closes everything.
 */
class ConnectionRegistryImpl : public ConnectionRegistry {
 public:
  ConnectionRegistryImpl(event::Dispatcher& dispatcher,
                         transport::WebSocketTransportFactorySharedPtr factory,
                         const config::ChatSocketConfig& config,
                         EndpointResolver resolver = nullptr);
  ~ConnectionRegistryImpl() override;

  void getOrCreate(const std::string& conversation_id,
                   const std::string& turn_id,
                   const std::string& credential,
                   ConnectCallback callback) override;
  bool hasActive(const std::string& conversation_id,
                 const std::string& turn_id) const override;
  void close(const std::string& conversation_id,
             const optional<std::string>& turn_id = nullopt) override;
  void closeAll() override;

  size_t size() const;

 private:
  struct Entry {
    std::string turn_id;
    std::shared_ptr<ChatConnectionImpl> connection;
    ListenerHandle dispose_subscription;
  };

  void removeIfCurrent(const std::string& conversation_id,
                       const ChatConnectionImpl* connection);

  event::Dispatcher& dispatcher_;
  transport::WebSocketTransportFactorySharedPtr factory_;
  const config::ChatSocketConfig config_;
  EndpointResolver resolver_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

/**
 * Registry for hosts without WebSocket support. getOrCreate() always fails
 * with "WebSocket not available".
 */
class NullConnectionRegistry : public ConnectionRegistry {
 public:
  void getOrCreate(const std::string& conversation_id,
                   const std::string& turn_id,
                   const std::string& credential,
                   ConnectCallback callback) override;
  bool hasActive(const std::string&, const std::string&) const override {
    return false;
  }
  void close(const std::string&, const optional<std::string>&) override {}
  void closeAll() override {}
};

}  // namespace chat
}  // namespace chatws

#endif  // CHATWS_CHAT_CONNECTION_REGISTRY_H
