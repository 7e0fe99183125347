#include "chatws/transport/websocket_frame.h"

#include <openssl/rand.h>

#include <cstring>
#include <random>

#include "chatws/transport/close_code.h"

namespace chatws {
namespace transport {

std::string encodeFrame(OpCode opcode,
                        const std::string& payload,
                        const uint8_t* mask_key,
                        bool fin) {
  std::string frame;
  const uint64_t len = payload.size();
  frame.reserve(payload.size() + 14);

  frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) |
                                    static_cast<uint8_t>(opcode)));
  const uint8_t mask_bit = mask_key ? 0x80 : 0x00;
  if (len < 126) {
    frame.push_back(static_cast<char>(mask_bit | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(static_cast<char>(mask_bit | 126));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((len >> shift) & 0xFF));
    }
  }

  if (!mask_key) {
    frame += payload;
    return frame;
  }

  frame.append(reinterpret_cast<const char*>(mask_key), 4);
  const size_t offset = frame.size();
  frame += payload;
  for (size_t i = 0; i < payload.size(); ++i) {
    frame[offset + i] = static_cast<char>(frame[offset + i] ^ mask_key[i % 4]);
  }
  return frame;
}

std::string encodeClientFrame(OpCode opcode, const std::string& payload) {
  uint8_t mask_key[4];
  if (RAND_bytes(mask_key, sizeof(mask_key)) != 1) {
    std::random_device device;
    uint32_t value = device();
    std::memcpy(mask_key, &value, sizeof(mask_key));
  }
  return encodeFrame(opcode, payload, mask_key);
}

std::string encodeClosePayload(int code, const std::string& reason) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  // Reason is truncated so the frame stays a valid control frame
  payload += reason.substr(0, kMaxControlPayload - 2);
  return payload;
}

Result<ClosePayload> parseClosePayload(const std::string& payload) {
  if (payload.empty()) {
    return ClosePayload{CloseCode::kNoStatusReceived, std::string()};
  }
  if (payload.size() == 1) {
    return makeError<ClosePayload>(CloseCode::kProtocolError,
                                   "Close frame with truncated status code");
  }

  const auto* bytes = reinterpret_cast<const uint8_t*>(payload.data());
  int code = (bytes[0] << 8) | bytes[1];
  if (!isSendableCloseCode(code)) {
    return makeError<ClosePayload>(
        CloseCode::kProtocolError,
        "Close frame with invalid status code " + std::to_string(code));
  }
  return ClosePayload{code, payload.substr(2)};
}

FrameDecoder::FrameDecoder(size_t max_message_size)
    : max_message_size_(max_message_size) {}

void FrameDecoder::reset() {
  buffer_.clear();
  fragments_.clear();
  in_fragment_ = false;
  failed_ = false;
}

VoidResult FrameDecoder::fail(int close_code, const std::string& message) {
  failed_ = true;
  buffer_.clear();
  fragments_.clear();
  return makeVoidError(Error(close_code, message));
}

VoidResult FrameDecoder::feed(const char* data,
                              size_t length,
                              std::vector<WebSocketMessage>& messages) {
  if (failed_) {
    return makeVoidError(
        Error(CloseCode::kProtocolError, "Decoder already failed"));
  }
  buffer_.append(data, length);

  size_t pos = 0;
  while (buffer_.size() - pos >= 2) {
    const auto* header = reinterpret_cast<const uint8_t*>(buffer_.data() + pos);
    const bool fin = (header[0] & 0x80) != 0;
    const uint8_t rsv = header[0] & 0x70;
    const uint8_t raw_opcode = header[0] & 0x0F;
    const bool masked = (header[1] & 0x80) != 0;
    uint64_t payload_len = header[1] & 0x7F;
    size_t header_size = 2;

    if (rsv != 0) {
      return fail(CloseCode::kProtocolError, "Reserved bits set");
    }
    if (masked) {
      return fail(CloseCode::kProtocolError, "Masked frame from server");
    }

    if (payload_len == 126) {
      if (buffer_.size() - pos < 4) break;
      payload_len = (static_cast<uint64_t>(header[2]) << 8) | header[3];
      header_size = 4;
    } else if (payload_len == 127) {
      if (buffer_.size() - pos < 10) break;
      payload_len = 0;
      for (int i = 0; i < 8; ++i) {
        payload_len = (payload_len << 8) | header[2 + i];
      }
      if (payload_len & (1ULL << 63)) {
        return fail(CloseCode::kProtocolError, "Invalid payload length");
      }
      header_size = 10;
    }

    OpCode opcode = static_cast<OpCode>(raw_opcode);
    switch (opcode) {
      case OpCode::Continuation:
      case OpCode::Text:
      case OpCode::Binary:
      case OpCode::Close:
      case OpCode::Ping:
      case OpCode::Pong:
        break;
      default:
        return fail(CloseCode::kProtocolError,
                    "Unknown opcode " + std::to_string(raw_opcode));
    }

    if (isControlOpCode(opcode)) {
      if (!fin || payload_len > kMaxControlPayload) {
        return fail(CloseCode::kProtocolError, "Invalid control frame");
      }
    } else {
      if (opcode == OpCode::Continuation && !in_fragment_) {
        return fail(CloseCode::kProtocolError,
                    "Continuation frame without a message");
      }
      if (opcode != OpCode::Continuation && in_fragment_) {
        return fail(CloseCode::kProtocolError,
                    "New message started before the previous one finished");
      }
      if (fragments_.size() + payload_len > max_message_size_) {
        return fail(CloseCode::kMessageTooBig, "Message exceeds maximum size");
      }
    }

    if (buffer_.size() - pos - header_size < payload_len) break;

    std::string payload =
        buffer_.substr(pos + header_size, static_cast<size_t>(payload_len));
    pos += header_size + static_cast<size_t>(payload_len);

    if (isControlOpCode(opcode)) {
      messages.push_back(WebSocketMessage{opcode, std::move(payload)});
      continue;
    }

    if (opcode != OpCode::Continuation) {
      fragment_opcode_ = opcode;
    }
    if (fin && !in_fragment_) {
      messages.push_back(WebSocketMessage{opcode, std::move(payload)});
      continue;
    }

    fragments_ += payload;
    in_fragment_ = !fin;
    if (fin) {
      messages.push_back(WebSocketMessage{fragment_opcode_, std::move(fragments_)});
      fragments_.clear();
    }
  }

  buffer_.erase(0, pos);
  return makeVoidSuccess();
}

}  // namespace transport
}  // namespace chatws
