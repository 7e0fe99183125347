/**
 * @file websocket_transport.h
 * @brief Client WebSocket transport interface
 *
 * A transport carries one WebSocket connection. All methods and callbacks
 * run on the dispatcher thread that owns the transport.
 */

#ifndef CHATWS_TRANSPORT_WEBSOCKET_TRANSPORT_H
#define CHATWS_TRANSPORT_WEBSOCKET_TRANSPORT_H

#include <memory>
#include <string>

#include "chatws/core/result.h"
#include "chatws/event/event_loop.h"
#include "chatws/transport/endpoint.h"
#include "chatws/transport/websocket_handshake.h"

namespace chatws {
namespace transport {

enum class MessageType { Text, Binary };

enum class TransportState { Idle, Connecting, Open, Closing, Closed };

const char* transportStateToString(TransportState state);

class WebSocketTransportCallbacks {
 public:
  virtual ~WebSocketTransportCallbacks() = default;

  // Upgrade accepted; messages may now be sent
  virtual void onOpen() = 0;

  virtual void onMessage(const std::string& data, MessageType type) = 0;

  /**
   * The connection is gone. Delivered once, for a peer close frame, a lost
   * socket (1006) or a failed connect. Not delivered for a close started
   * through close().
   */
  virtual void onClose(int code, const std::string& reason) = 0;

  /**
   * Transport-level failure. A failure while connecting is always followed
   * by onClose().
   */
  virtual void onError(const std::string& message) = 0;
};

class WebSocketTransport : public event::DeferredDeletable {
 public:
  ~WebSocketTransport() override = default;

  // Pass nullptr to stop receiving callbacks
  virtual void setCallbacks(WebSocketTransportCallbacks* callbacks) = 0;

  /**
   * Start connecting. Only failures detected before any I/O is started are
   * returned; everything later arrives through the callbacks.
   */
  virtual VoidResult connect(const WebSocketUrl& url,
                             const HeaderList& headers) = 0;

  virtual VoidResult sendText(const std::string& payload) = 0;

  /**
   * Start the closing handshake, or abort a connect in progress. No
   * callbacks are delivered afterwards.
   */
  virtual void close(int code, const std::string& reason) = 0;

  /**
   * Drop the socket at once, without a closing handshake or callbacks.
   * Usable after the dispatcher stopped running.
   */
  virtual void abort() = 0;

  virtual TransportState state() const = 0;
};

using WebSocketTransportPtr = std::unique_ptr<WebSocketTransport>;

class WebSocketTransportFactory {
 public:
  virtual ~WebSocketTransportFactory() = default;

  virtual WebSocketTransportPtr createTransport() = 0;
};

using WebSocketTransportFactorySharedPtr =
    std::shared_ptr<WebSocketTransportFactory>;

}  // namespace transport
}  // namespace chatws

#endif  // CHATWS_TRANSPORT_WEBSOCKET_TRANSPORT_H
