#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "chatws/core/result.h"
#include "chatws/json/json_bridge.h"

namespace chatws {
namespace config {

struct TlsSettings {
  bool verify_peer{true};
  std::string ca_cert_file;  // System trust store when empty
};

struct LoggingSettings {
  std::string level{"info"};
  std::string file;  // stderr when empty
  std::string format{"text"};  // "text" or "json"
};

/**
 * Settings for the streaming chat connection subsystem.
 *
 * Durations accept "500ms", "30s", "2m", "1h" or integer milliseconds.
 * Sizes accept "512KB", "16MB" or integer bytes.
 */
struct ChatSocketConfig {
  // http(s) or ws(s) address of the chat-completion service
  std::string service_base_url;
  std::string endpoint_path{"/responses"};
  std::string integration_id{"vscode-chat"};

  std::chrono::milliseconds handshake_timeout{30000};
  // How long a locally started close waits for the peer's close frame
  std::chrono::milliseconds close_timeout{5000};
  size_t max_message_size{16 * 1024 * 1024};  // 16MB

  TlsSettings tls;
  LoggingSettings logging;
};

// Unknown keys are ignored; missing keys keep their defaults
Result<ChatSocketConfig> configFromJson(const json::JsonValue& root);

// .json, .yaml and .yml files
Result<ChatSocketConfig> loadConfigFile(const std::string& path);

// Applies level, destination and format to the global logger registry
VoidResult applyLoggingSettings(const LoggingSettings& settings);

}  // namespace config
}  // namespace chatws
