/**
 * @file websocket_frame.h
 * @brief RFC 6455 frame encoding and client-side frame decoding
 */

#ifndef CHATWS_TRANSPORT_WEBSOCKET_FRAME_H
#define CHATWS_TRANSPORT_WEBSOCKET_FRAME_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "chatws/core/result.h"

namespace chatws {
namespace transport {

enum class OpCode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA
};

inline bool isControlOpCode(OpCode opcode) {
  return (static_cast<uint8_t>(opcode) & 0x08) != 0;
}

constexpr size_t kMaxControlPayload = 125;

/**
 * Encode one frame. When `mask_key` is non-null it must point at four bytes
 * and the payload is masked with it.
 */
std::string encodeFrame(OpCode opcode,
                        const std::string& payload,
                        const uint8_t* mask_key,
                        bool fin = true);

// Single masked frame with a fresh random masking key
std::string encodeClientFrame(OpCode opcode, const std::string& payload);

std::string encodeClosePayload(int code, const std::string& reason);

struct ClosePayload {
  int code;
  std::string reason;
};

/**
 * Decode the body of a close frame. An empty body means no status was
 * received (1005). A one-byte body or a code that may not appear on the
 * wire is an error carrying close code 1002.
 */
Result<ClosePayload> parseClosePayload(const std::string& payload);

struct WebSocketMessage {
  OpCode opcode;  // Text, Binary, Close, Ping or Pong
  std::string payload;
};

/**
 * Incremental decoder for frames sent by a server.
 *
 * Fragmented data messages are reassembled; control frames are delivered as
 * they arrive, including between fragments. A protocol violation returns an
 * Error whose code is the close code to fail the connection with (1002 or
 * 1009); the decoder then rejects all further input.
 */
class FrameDecoder {
 public:
  explicit FrameDecoder(size_t max_message_size);

  VoidResult feed(const char* data,
                  size_t length,
                  std::vector<WebSocketMessage>& messages);

  void reset();

  size_t bufferedBytes() const { return buffer_.size(); }

 private:
  VoidResult fail(int close_code, const std::string& message);

  const size_t max_message_size_;
  std::string buffer_;
  std::string fragments_;
  OpCode fragment_opcode_{OpCode::Text};
  bool in_fragment_{false};
  bool failed_{false};
};

}  // namespace transport
}  // namespace chatws

#endif  // CHATWS_TRANSPORT_WEBSOCKET_FRAME_H
