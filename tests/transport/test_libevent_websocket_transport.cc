#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chatws/event/libevent_dispatcher.h"
#include "chatws/transport/close_code.h"
#include "chatws/transport/libevent_websocket_transport.h"
#include "chatws/transport/websocket_frame.h"
#include "chatws/transport/websocket_handshake.h"

namespace chatws {
namespace transport {
namespace {

bool writeAll(int fd, const std::string& data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::send(fd, data.data() + written, data.size() - written,
                       MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

bool readExact(int fd, size_t length, std::string& out) {
  out.clear();
  char buf[4096];
  while (out.size() < length) {
    ssize_t n = ::recv(fd, buf, std::min(sizeof(buf), length - out.size()), 0);
    if (n <= 0) {
      return false;
    }
    out.append(buf, static_cast<size_t>(n));
  }
  return true;
}

std::string readRequest(int fd) {
  std::string request;
  char c;
  while (request.find("\r\n\r\n") == std::string::npos) {
    if (::recv(fd, &c, 1, 0) != 1) {
      break;
    }
    request.push_back(c);
  }
  return request;
}

std::string headerValue(const std::string& request, const std::string& name) {
  auto pos = request.find(name + ": ");
  if (pos == std::string::npos) {
    return "";
  }
  pos += name.size() + 2;
  return request.substr(pos, request.find("\r\n", pos) - pos);
}

// Reads one masked client frame
bool readClientFrame(int fd, WebSocketMessage& message) {
  std::string header;
  if (!readExact(fd, 2, header)) {
    return false;
  }
  message.opcode = static_cast<OpCode>(header[0] & 0x0F);
  uint64_t length = header[1] & 0x7F;
  std::string extended;
  if (length == 126) {
    if (!readExact(fd, 2, extended)) return false;
    length = (static_cast<uint8_t>(extended[0]) << 8) |
             static_cast<uint8_t>(extended[1]);
  } else if (length == 127) {
    if (!readExact(fd, 8, extended)) return false;
    length = 0;
    for (char byte : extended) {
      length = (length << 8) | static_cast<uint8_t>(byte);
    }
  }
  std::string mask;
  if (!(header[1] & 0x80) || !readExact(fd, 4, mask)) {
    return false;
  }
  if (!readExact(fd, static_cast<size_t>(length), message.payload)) {
    return false;
  }
  for (size_t i = 0; i < message.payload.size(); ++i) {
    message.payload[i] = static_cast<char>(message.payload[i] ^ mask[i % 4]);
  }
  return true;
}

std::string upgradeResponse(const std::string& request) {
  return "HTTP/1.1 101 Switching Protocols\r\n"
         "Upgrade: websocket\r\n"
         "Connection: Upgrade\r\n"
         "Sec-WebSocket-Accept: " +
         computeAcceptKey(headerValue(request, "Sec-WebSocket-Key")) +
         "\r\n\r\n";
}

// Single-connection blocking server on 127.0.0.1
class LoopbackServer {
 public:
  LoopbackServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(listen_fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~LoopbackServer() {
    ::shutdown(listen_fd_, SHUT_RDWR);
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(listen_fd_);
  }

  void serve(std::function<void(int)> session) {
    thread_ = std::thread([this, session]() {
      int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) {
        return;
      }
      session(fd);
      ::close(fd);
    });
  }

  void join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  uint16_t port() const { return port_; }

 private:
  int listen_fd_{-1};
  uint16_t port_{0};
  std::thread thread_;
};

class RecordingCallbacks : public WebSocketTransportCallbacks {
 public:
  void onOpen() override { opened = true; }
  void onMessage(const std::string& data, MessageType type) override {
    messages.push_back(data);
    if (on_message) {
      on_message(data, type);
    }
  }
  void onClose(int code, const std::string& reason) override {
    ++close_count;
    close_code = code;
    close_reason = reason;
  }
  void onError(const std::string& message) override { errors.push_back(message); }

  bool opened{false};
  std::vector<std::string> messages;
  std::function<void(const std::string&, MessageType)> on_message;
  int close_count{0};
  int close_code{0};
  std::string close_reason;
  std::vector<std::string> errors;
};

class LibeventWebSocketTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = std::make_unique<event::LibeventDispatcher>("transport-test");
    dispatcher_->run(event::RunType::NonBlock);
    LibeventTransportOptions options;
    options.close_timeout = std::chrono::milliseconds(500);
    factory_ = std::make_unique<LibeventWebSocketTransportFactory>(*dispatcher_,
                                                                   options);
  }

  void TearDown() override {
    transport_.reset();
    factory_.reset();
    dispatcher_->run(event::RunType::NonBlock);
  }

  WebSocketUrl loopbackUrl(uint16_t port) {
    WebSocketUrl url;
    url.host = "127.0.0.1";
    url.port = port;
    url.path = "/responses";
    return url;
  }

  template <typename Predicate>
  bool runUntil(Predicate predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      dispatcher_->run(event::RunType::NonBlock);
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
  }

  std::unique_ptr<event::LibeventDispatcher> dispatcher_;
  std::unique_ptr<LibeventWebSocketTransportFactory> factory_;
  RecordingCallbacks callbacks_;
  WebSocketTransportPtr transport_;
};

TEST_F(LibeventWebSocketTransportTest, ExchangesMessagesAndHonoursPeerClose) {
  LoopbackServer server;
  std::string request;
  WebSocketMessage client_text{OpCode::Binary, ""};
  WebSocketMessage client_close{OpCode::Binary, ""};
  server.serve([&](int fd) {
    request = readRequest(fd);
    // The first frame rides along with the upgrade response
    if (!writeAll(fd, upgradeResponse(request) +
                          encodeFrame(OpCode::Text, "{\"type\":\"hello\"}",
                                      nullptr))) {
      return;
    }
    if (!readClientFrame(fd, client_text)) {
      return;
    }
    writeAll(fd, encodeFrame(OpCode::Ping, "hb", nullptr));
    writeAll(fd, encodeFrame(OpCode::Text, "echo:" + client_text.payload,
                             nullptr));
    writeAll(fd, encodeFrame(OpCode::Close, encodeClosePayload(1000, "bye"),
                             nullptr));
    WebSocketMessage frame;
    while (readClientFrame(fd, frame)) {
      if (frame.opcode == OpCode::Close) {
        client_close = frame;
        break;
      }
    }
  });

  transport_ = factory_->createTransport();
  transport_->setCallbacks(&callbacks_);
  callbacks_.on_message = [this](const std::string& data, MessageType) {
    if (data == "{\"type\":\"hello\"}") {
      EXPECT_TRUE(isSuccess(transport_->sendText("from-client")));
    }
  };

  ASSERT_TRUE(isSuccess(transport_->connect(
      loopbackUrl(server.port()), {{"Authorization", "Bearer test-token"}})));
  EXPECT_EQ(TransportState::Connecting, transport_->state());

  ASSERT_TRUE(runUntil([this]() { return callbacks_.close_count > 0; }));
  server.join();

  EXPECT_TRUE(callbacks_.opened);
  EXPECT_EQ(0u, request.find("GET /responses HTTP/1.1\r\n"));
  EXPECT_EQ("Bearer test-token", headerValue(request, "Authorization"));
  EXPECT_EQ(OpCode::Text, client_text.opcode);
  EXPECT_EQ("from-client", client_text.payload);
  EXPECT_EQ((std::vector<std::string>{"{\"type\":\"hello\"}",
                                      "echo:from-client"}),
            callbacks_.messages);
  EXPECT_EQ(1000, callbacks_.close_code);
  EXPECT_EQ("bye", callbacks_.close_reason);
  EXPECT_EQ(OpCode::Close, client_close.opcode);
  EXPECT_TRUE(callbacks_.errors.empty());

  ASSERT_TRUE(runUntil(
      [this]() { return transport_->state() == TransportState::Closed; }));
  EXPECT_EQ(1, callbacks_.close_count);
}

TEST_F(LibeventWebSocketTransportTest, RejectedUpgradeReportsErrorThenClose) {
  LoopbackServer server;
  server.serve([](int fd) {
    readRequest(fd);
    writeAll(fd, "HTTP/1.1 401 Unauthorized\r\nContent-Length: 0\r\n\r\n");
  });

  transport_ = factory_->createTransport();
  transport_->setCallbacks(&callbacks_);
  ASSERT_TRUE(isSuccess(transport_->connect(loopbackUrl(server.port()), {})));

  ASSERT_TRUE(runUntil([this]() { return callbacks_.close_count > 0; }));
  EXPECT_FALSE(callbacks_.opened);
  ASSERT_EQ(1u, callbacks_.errors.size());
  EXPECT_NE(std::string::npos,
            callbacks_.errors[0].find("Unexpected HTTP status 401"));
  EXPECT_EQ(CloseCode::kAbnormalClosure, callbacks_.close_code);
  EXPECT_EQ(TransportState::Closed, transport_->state());
}

TEST_F(LibeventWebSocketTransportTest, RefusedConnectionReportsErrorThenClose) {
  uint16_t port = 0;
  {
    LoopbackServer unused;
    port = unused.port();
  }

  transport_ = factory_->createTransport();
  transport_->setCallbacks(&callbacks_);
  ASSERT_TRUE(isSuccess(transport_->connect(loopbackUrl(port), {})));

  ASSERT_TRUE(runUntil([this]() { return callbacks_.close_count > 0; }));
  EXPECT_FALSE(callbacks_.opened);
  EXPECT_EQ(1u, callbacks_.errors.size());
  EXPECT_EQ(CloseCode::kAbnormalClosure, callbacks_.close_code);
}

TEST_F(LibeventWebSocketTransportTest, LocalCloseSendsCloseFrame) {
  LoopbackServer server;
  WebSocketMessage received{OpCode::Binary, ""};
  server.serve([&](int fd) {
    std::string request = readRequest(fd);
    if (!writeAll(fd, upgradeResponse(request))) {
      return;
    }
    if (readClientFrame(fd, received) && received.opcode == OpCode::Close) {
      writeAll(fd, encodeFrame(OpCode::Close, received.payload, nullptr));
    }
  });

  transport_ = factory_->createTransport();
  transport_->setCallbacks(&callbacks_);
  ASSERT_TRUE(isSuccess(transport_->connect(loopbackUrl(server.port()), {})));
  ASSERT_TRUE(runUntil([this]() { return callbacks_.opened; }));
  EXPECT_EQ(1u, factory_->liveTransportCount());

  transport_->close(CloseCode::kNormalClosure, "done");
  EXPECT_EQ(TransportState::Closing, transport_->state());

  ASSERT_TRUE(
      runUntil([this]() { return factory_->liveTransportCount() == 0; }));
  server.join();

  EXPECT_EQ(OpCode::Close, received.opcode);
  auto parsed = parseClosePayload(received.payload);
  ASSERT_TRUE(isSuccess(parsed));
  EXPECT_EQ(1000, get<ClosePayload>(parsed).code);
  EXPECT_EQ("done", get<ClosePayload>(parsed).reason);
  // A local close is not reported back
  EXPECT_EQ(0, callbacks_.close_count);
}

TEST_F(LibeventWebSocketTransportTest, SendBeforeOpenFails) {
  transport_ = factory_->createTransport();
  EXPECT_EQ(TransportState::Idle, transport_->state());
  auto result = transport_->sendText("early");
  ASSERT_NE(nullptr, getError(result));
  EXPECT_EQ(ErrorCode::kNotConnected, getError(result)->code);
}

TEST_F(LibeventWebSocketTransportTest, TransportCannotBeReused) {
  transport_ = factory_->createTransport();
  transport_->close(CloseCode::kNormalClosure, "");
  EXPECT_NE(nullptr, getError(transport_->connect(loopbackUrl(1), {})));
}

TEST(TransportOptionsTest, FromConfig) {
  config::ChatSocketConfig config;
  config.max_message_size = 1024;
  config.close_timeout = std::chrono::milliseconds(250);
  config.tls.verify_peer = false;
  config.tls.ca_cert_file = "/tmp/ca.pem";

  auto options = transportOptionsFromConfig(config);
  EXPECT_EQ(1024u, options.max_message_size);
  EXPECT_EQ(std::chrono::milliseconds(250), options.close_timeout);
  EXPECT_FALSE(options.tls.verify_peer);
  EXPECT_EQ("/tmp/ca.pem", options.tls.ca_cert_file);
}

}  // namespace
}  // namespace transport
}  // namespace chatws
