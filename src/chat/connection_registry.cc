#include "chatws/chat/connection_registry.h"

#include "chatws/transport/endpoint.h"

#define CHATWS_LOG_COMPONENT "chatws.registry"
#include "chatws/logging/log_macros.h"

namespace chatws {
namespace chat {

EndpointResolver defaultEndpointResolver(const config::ChatSocketConfig& config) {
  std::string base_url = config.service_base_url;
  std::string path = config.endpoint_path;
  return [base_url, path]() {
    return transport::resolveStreamingEndpoint(base_url, path);
  };
}

ConnectionRegistryImpl::ConnectionRegistryImpl(
    event::Dispatcher& dispatcher,
    transport::WebSocketTransportFactorySharedPtr factory,
    const config::ChatSocketConfig& config,
    EndpointResolver resolver)
    : dispatcher_(dispatcher),
      factory_(std::move(factory)),
      config_(config),
      resolver_(resolver ? std::move(resolver)
                         : defaultEndpointResolver(config)) {}

ConnectionRegistryImpl::~ConnectionRegistryImpl() { closeAll(); }

void ConnectionRegistryImpl::getOrCreate(const std::string& conversation_id,
                                         const std::string& turn_id,
                                         const std::string& credential,
                                         ConnectCallback callback) {
  std::shared_ptr<ChatConnectionImpl> reused;
  std::shared_ptr<ChatConnectionImpl> stale;
  ListenerHandle stale_subscription;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(conversation_id);
    if (it != entries_.end()) {
      if (it->second.turn_id == turn_id && it->second.connection->isOpen()) {
        reused = it->second.connection;
      } else {
        stale = std::move(it->second.connection);
        stale_subscription = std::move(it->second.dispose_subscription);
        entries_.erase(it);
      }
    }
  }

  if (reused) {
    CHATWS_LOG(Debug, "Reusing connection for conversation {} turn {}",
               conversation_id, turn_id);
    callback(ChatConnectionSharedPtr(reused));
    return;
  }

  if (stale) {
    CHATWS_LOG(Debug,
               "Closing previous connection for conversation {} (turn changed)",
               conversation_id);
    stale_subscription.reset();
    stale->dispose();
  }

  auto endpoint = resolver_();
  if (auto* error = getError(endpoint)) {
    CHATWS_LOG(Error, "Cannot resolve streaming endpoint: {}", error->message);
    callback(*error);
    return;
  }

  ChatConnectionOptions options;
  options.url = get<std::string>(endpoint);
  options.credential = credential;
  options.integration_id = config_.integration_id;
  options.handshake_timeout = config_.handshake_timeout;
  options.conversation_id = conversation_id;
  options.turn_id = turn_id;

  auto connection =
      std::make_shared<ChatConnectionImpl>(dispatcher_, factory_, options);
  CHATWS_LOG(Debug, "Creating new connection for conversation {} turn {}",
             conversation_id, turn_id);

  const ChatConnectionImpl* raw_connection = connection.get();
  ListenerHandle subscription =
      connection->onDidDispose([this, conversation_id, raw_connection]() {
        removeIfCurrent(conversation_id, raw_connection);
      });
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[conversation_id] =
        Entry{turn_id, connection, std::move(subscription)};
  }

  connection->connect([connection, callback](const VoidResult& result) {
    if (auto* error = getError(result)) {
      callback(*error);
      return;
    }
    callback(ChatConnectionSharedPtr(connection));
  });
}

bool ConnectionRegistryImpl::hasActive(const std::string& conversation_id,
                                       const std::string& turn_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(conversation_id);
  return it != entries_.end() && it->second.turn_id == turn_id &&
         it->second.connection->isOpen();
}

void ConnectionRegistryImpl::close(const std::string& conversation_id,
                                   const optional<std::string>& turn_id) {
  std::shared_ptr<ChatConnectionImpl> connection;
  ListenerHandle subscription;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(conversation_id);
    if (it == entries_.end()) {
      return;
    }
    if (turn_id && !turn_id->empty() && it->second.turn_id != *turn_id) {
      CHATWS_LOG(Debug,
                 "Not closing connection for conversation {}: requested turn "
                 "{} does not match active turn {}",
                 conversation_id, *turn_id, it->second.turn_id);
      return;
    }
    connection = std::move(it->second.connection);
    subscription = std::move(it->second.dispose_subscription);
    entries_.erase(it);
  }

  CHATWS_LOG(Debug, "Closing connection for conversation {}", conversation_id);
  subscription.reset();
  connection->dispose();
}

void ConnectionRegistryImpl::closeAll() {
  std::map<std::string, Entry> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.swap(entries_);
  }
  for (auto& entry : entries) {
    entry.second.dispose_subscription.reset();
    entry.second.connection->dispose();
  }
}

size_t ConnectionRegistryImpl::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ConnectionRegistryImpl::removeIfCurrent(
    const std::string& conversation_id,
    const ChatConnectionImpl* connection) {
  std::shared_ptr<ChatConnectionImpl> removed;
  ListenerHandle subscription;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(conversation_id);
    if (it == entries_.end() || it->second.connection.get() != connection) {
      return;
    }
    removed = std::move(it->second.connection);
    subscription = std::move(it->second.dispose_subscription);
    entries_.erase(it);
  }
  CHATWS_LOG(Debug, "Connection for conversation {} disposed, entry removed",
             conversation_id);
}

void NullConnectionRegistry::getOrCreate(const std::string&,
                                         const std::string&,
                                         const std::string&,
                                         ConnectCallback callback) {
  callback(Error(ErrorCode::kNotAvailable, "WebSocket not available"));
}

}  // namespace chat
}  // namespace chatws
