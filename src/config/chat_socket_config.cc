#include "chatws/config/chat_socket_config.h"

#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "chatws/config/units.h"
#include "chatws/logging/log_sink.h"
#include "chatws/logging/logger_registry.h"

#define CHATWS_LOG_COMPONENT "chatws.config"
#include "chatws/logging/log_macros.h"

namespace chatws {
namespace config {

namespace {

constexpr size_t kMaxConfigFileBytes = 1024 * 1024;

bool endsWith(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isLogLevelName(const std::string& level) {
  static const char* const kNames[] = {"debug",   "info",  "notice",
                                       "warning", "error", "critical",
                                       "off"};
  for (const char* name : kNames) {
    if (level == name) {
      return true;
    }
  }
  return false;
}

json::JsonValue yamlToJsonValue(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return json::JsonValue::null();
    case YAML::NodeType::Scalar: {
      const std::string scalar = node.Scalar();
      // Quoted scalars always stay strings
      if (node.Tag() == "!") {
        return json::JsonValue(scalar);
      }
      if (scalar == "true" || scalar == "false") {
        return json::JsonValue(scalar == "true");
      }
      int64_t integer = 0;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return json::JsonValue(integer);
      }
      double number = 0;
      if (scalar.find('.') != std::string::npos &&
          YAML::convert<double>::decode(node, number)) {
        return json::JsonValue(number);
      }
      return json::JsonValue(scalar);
    }
    case YAML::NodeType::Sequence: {
      auto result = json::JsonValue::array();
      for (const auto& item : node) {
        result.push_back(yamlToJsonValue(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = json::JsonValue::object();
      for (const auto& pair : node) {
        result.set(pair.first.as<std::string>(), yamlToJsonValue(pair.second));
      }
      return result;
    }
    default:
      break;
  }

  return json::JsonValue::null();
}

// Reads an optional string field; a present non-string value is an error
bool readString(const json::JsonValue& obj,
                const std::string& key,
                const std::string& path,
                std::string& out,
                Error& error) {
  if (!obj.contains(key)) {
    return true;
  }
  auto value = obj.get(key);
  if (!value.isString()) {
    error = Error(ErrorCode::kConfigError,
                  "Field '" + path + key + "' must be a string");
    return false;
  }
  out = value.getString();
  return true;
}

}  // namespace

Result<ChatSocketConfig> configFromJson(const json::JsonValue& root) {
  ChatSocketConfig config;
  if (root.isNull()) {
    return config;
  }
  if (!root.isObject()) {
    return makeError<ChatSocketConfig>(ErrorCode::kConfigError,
                                       "Configuration root must be an object");
  }

  Error error;
  if (!readString(root, "service_base_url", "", config.service_base_url,
                  error) ||
      !readString(root, "endpoint_path", "", config.endpoint_path, error) ||
      !readString(root, "integration_id", "", config.integration_id, error)) {
    return error;
  }

  try {
    if (root.contains("handshake_timeout")) {
      config.handshake_timeout =
          parseJsonDuration(root.get("handshake_timeout"), "handshake_timeout");
    }
    if (root.contains("close_timeout")) {
      config.close_timeout =
          parseJsonDuration(root.get("close_timeout"), "close_timeout");
    }
    if (root.contains("max_message_size")) {
      config.max_message_size =
          parseJsonSize(root.get("max_message_size"), "max_message_size");
    }
  } catch (const UnitParseError& e) {
    return makeError<ChatSocketConfig>(ErrorCode::kConfigError, e.what());
  }

  if (config.handshake_timeout.count() <= 0) {
    return makeError<ChatSocketConfig>(
        ErrorCode::kConfigError, "Field 'handshake_timeout' must be positive");
  }
  if (config.max_message_size == 0) {
    return makeError<ChatSocketConfig>(
        ErrorCode::kConfigError, "Field 'max_message_size' must be positive");
  }
  if (config.endpoint_path.empty() || config.endpoint_path[0] != '/') {
    return makeError<ChatSocketConfig>(
        ErrorCode::kConfigError, "Field 'endpoint_path' must start with '/'");
  }

  if (root.contains("tls")) {
    auto tls = root.get("tls");
    if (!tls.isObject()) {
      return makeError<ChatSocketConfig>(ErrorCode::kConfigError,
                                         "Field 'tls' must be an object");
    }
    if (tls.contains("verify_peer")) {
      auto verify = tls.get("verify_peer");
      if (!verify.isBoolean()) {
        return makeError<ChatSocketConfig>(
            ErrorCode::kConfigError, "Field 'tls.verify_peer' must be a boolean");
      }
      config.tls.verify_peer = verify.getBool();
    }
    if (!readString(tls, "ca_cert_file", "tls.", config.tls.ca_cert_file,
                    error)) {
      return error;
    }
  }

  if (root.contains("logging")) {
    auto logging = root.get("logging");
    if (!logging.isObject()) {
      return makeError<ChatSocketConfig>(ErrorCode::kConfigError,
                                         "Field 'logging' must be an object");
    }
    if (!readString(logging, "level", "logging.", config.logging.level,
                    error) ||
        !readString(logging, "file", "logging.", config.logging.file, error) ||
        !readString(logging, "format", "logging.", config.logging.format,
                    error)) {
      return error;
    }
    if (!isLogLevelName(config.logging.level)) {
      return makeError<ChatSocketConfig>(
          ErrorCode::kConfigError,
          "Unknown log level '" + config.logging.level + "'");
    }
    if (config.logging.format != "text" && config.logging.format != "json") {
      return makeError<ChatSocketConfig>(
          ErrorCode::kConfigError,
          "Field 'logging.format' must be \"text\" or \"json\"");
    }
  }

  return config;
}

Result<ChatSocketConfig> loadConfigFile(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return makeError<ChatSocketConfig>(
        ErrorCode::kConfigError, "Cannot open configuration file: " + path);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  const std::string content = buffer.str();
  if (content.size() > kMaxConfigFileBytes) {
    return makeError<ChatSocketConfig>(
        ErrorCode::kConfigError, "Configuration file too large: " + path);
  }

  json::JsonValue root;
  if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
    try {
      root = yamlToJsonValue(YAML::Load(content));
    } catch (const YAML::ParserException& e) {
      std::ostringstream error;
      error << "YAML parse error in " << path << " at line "
            << e.mark.line + 1 << ", column " << e.mark.column + 1;
      return makeError<ChatSocketConfig>(ErrorCode::kConfigError,
                                         error.str());
    }
  } else {
    try {
      root = json::JsonValue::parse(content);
    } catch (const json::JsonException& e) {
      return makeError<ChatSocketConfig>(ErrorCode::kConfigError,
                                         path + ": " + e.what());
    }
  }

  auto result = configFromJson(root);
  if (isSuccess(result)) {
    CHATWS_LOG(Info, "Loaded configuration from {}", path);
  }
  return result;
}

VoidResult applyLoggingSettings(const LoggingSettings& settings) {
  auto& registry = logging::LoggerRegistry::instance();

  std::shared_ptr<logging::LogSink> sink;
  if (settings.file.empty()) {
    sink = logging::SinkFactory::createStdioSink(true);
  } else {
    logging::RotatingFileSink::Config file_config;
    file_config.base_filename = settings.file;
    auto file_sink = std::make_shared<logging::RotatingFileSink>(file_config);
    if (!file_sink->isOpen()) {
      return makeVoidError(Error(ErrorCode::kConfigError,
                                 "Cannot open log file: " + settings.file));
    }
    sink = file_sink;
  }

  if (settings.format == "json") {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }

  registry.setDefaultSink(sink);
  registry.setGlobalLevel(logging::stringToLogLevel(settings.level));
  return makeVoidSuccess();
}

}  // namespace config
}  // namespace chatws
