#ifndef CHATWS_TRANSPORT_LIBEVENT_WEBSOCKET_TRANSPORT_H
#define CHATWS_TRANSPORT_LIBEVENT_WEBSOCKET_TRANSPORT_H

#include <chrono>
#include <cstddef>
#include <memory>

#include "chatws/config/chat_socket_config.h"
#include "chatws/event/libevent_dispatcher.h"
#include "chatws/transport/ssl_context.h"
#include "chatws/transport/websocket_transport.h"

namespace chatws {
namespace transport {

struct LibeventTransportOptions {
  size_t max_message_size{16 * 1024 * 1024};
  std::chrono::milliseconds close_timeout{5000};
  SslContextConfig tls;
};

LibeventTransportOptions transportOptionsFromConfig(
    const config::ChatSocketConfig& config);

namespace detail {
struct LibeventTransportContext;
}

/**
 * Creates WebSocket transports running on a libevent dispatcher.
 *
 * Name resolution uses one evdns base shared by all transports; wss://
 * connections share one SslContext created on first use. Destroying the
 * factory aborts every transport it created that is still alive, so the
 * factory must be destroyed before the dispatcher.
 */
class LibeventWebSocketTransportFactory : public WebSocketTransportFactory {
 public:
  // Throws std::runtime_error if the DNS resolver cannot be created
  LibeventWebSocketTransportFactory(event::LibeventDispatcher& dispatcher,
                                    const LibeventTransportOptions& options);
  ~LibeventWebSocketTransportFactory() override;

  WebSocketTransportPtr createTransport() override;

  // Transports that are connecting, open or closing
  size_t liveTransportCount() const;

 private:
  std::shared_ptr<detail::LibeventTransportContext> context_;
};

}  // namespace transport
}  // namespace chatws

#endif  // CHATWS_TRANSPORT_LIBEVENT_WEBSOCKET_TRANSPORT_H
