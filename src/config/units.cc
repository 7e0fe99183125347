#include "chatws/config/units.h"

#include <limits>
#include <regex>

#define CHATWS_LOG_COMPONENT "chatws.config"
#include "chatws/logging/log_macros.h"

namespace chatws {
namespace config {

namespace {
constexpr size_t kKilobyte = 1024;
constexpr size_t kMegabyte = kKilobyte * 1024;
constexpr size_t kGigabyte = kMegabyte * 1024;
}  // namespace

std::pair<bool, std::chrono::milliseconds> Duration::parse(
    const std::string& str) {
  std::string error;
  return parseWithError(str, error);
}

std::pair<bool, std::chrono::milliseconds> Duration::parse(
    const json::JsonValue& value) {
  if (value.isString()) {
    return parse(value.getString());
  }

  if (value.isNumber()) {
    int64_t ms = value.isInteger() ? value.getInt64()
                                   : static_cast<int64_t>(value.getFloat());
    if (ms < 0) {
      CHATWS_LOG(Error, "Duration values must be non-negative: {}", ms);
      return {false, std::chrono::milliseconds(0)};
    }
    return {true, std::chrono::milliseconds(ms)};
  }

  CHATWS_LOG(Error, "Invalid duration value type: expected string or number");
  return {false, std::chrono::milliseconds(0)};
}

std::string Duration::toString(std::chrono::milliseconds duration) {
  auto ms = duration.count();

  if (ms == 0)
    return "0ms";
  if (ms % (60 * 60 * 1000) == 0)
    return std::to_string(ms / (60 * 60 * 1000)) + "h";
  if (ms % (60 * 1000) == 0)
    return std::to_string(ms / (60 * 1000)) + "m";
  if (ms % 1000 == 0)
    return std::to_string(ms / 1000) + "s";
  return std::to_string(ms) + "ms";
}

std::pair<bool, std::chrono::milliseconds> Duration::parseWithError(
    const std::string& str, std::string& error_message) {
  static const std::regex pattern("^([0-9]+)(ms|s|m|h)$");
  std::smatch match;

  if (!std::regex_match(str, match, pattern)) {
    error_message = "Invalid duration format '" + str +
                    "'. Expected format: <number><unit> where unit is ms, s, "
                    "m, or h (e.g., '30s', '5m', '1h')";
    CHATWS_LOG(Error, "{}", error_message);
    return {false, std::chrono::milliseconds(0)};
  }

  int64_t value = 0;
  try {
    value = std::stoll(match[1].str());
  } catch (const std::out_of_range&) {
    error_message = "Duration value out of range: " + str;
    CHATWS_LOG(Error, "{}", error_message);
    return {false, std::chrono::milliseconds(0)};
  }

  const std::string unit = match[2].str();
  int64_t multiplier = 1;
  if (unit == "s") {
    multiplier = 1000;
  } else if (unit == "m") {
    multiplier = 60 * 1000;
  } else if (unit == "h") {
    multiplier = 60 * 60 * 1000;
  }

  if (value > std::numeric_limits<int64_t>::max() / multiplier) {
    error_message = "Duration value out of range: " + str;
    CHATWS_LOG(Error, "{}", error_message);
    return {false, std::chrono::milliseconds(0)};
  }

  return {true, std::chrono::milliseconds(value * multiplier)};
}

std::pair<bool, size_t> Size::parse(const std::string& str) {
  std::string error;
  return parseWithError(str, error);
}

std::pair<bool, size_t> Size::parse(const json::JsonValue& value) {
  if (value.isString()) {
    return parse(value.getString());
  }

  if (value.isNumber()) {
    int64_t bytes = value.isInteger() ? value.getInt64()
                                      : static_cast<int64_t>(value.getFloat());
    if (bytes < 0) {
      CHATWS_LOG(Error, "Size values must be non-negative: {}", bytes);
      return {false, 0};
    }
    return {true, static_cast<size_t>(bytes)};
  }

  CHATWS_LOG(Error, "Invalid size value type: expected string or number");
  return {false, 0};
}

std::string Size::toString(size_t bytes) {
  if (bytes != 0 && bytes % kGigabyte == 0)
    return std::to_string(bytes / kGigabyte) + "GB";
  if (bytes != 0 && bytes % kMegabyte == 0)
    return std::to_string(bytes / kMegabyte) + "MB";
  if (bytes != 0 && bytes % kKilobyte == 0)
    return std::to_string(bytes / kKilobyte) + "KB";
  return std::to_string(bytes) + "B";
}

std::pair<bool, size_t> Size::parseWithError(const std::string& str,
                                              std::string& error_message) {
  static const std::regex pattern("^([0-9]+)(B|KB|MB|GB)$");
  std::smatch match;

  if (!std::regex_match(str, match, pattern)) {
    error_message = "Invalid size format '" + str +
                    "'. Expected format: <number><unit> where unit is B, KB, "
                    "MB, or GB (e.g., '512KB', '16MB')";
    CHATWS_LOG(Error, "{}", error_message);
    return {false, 0};
  }

  unsigned long long value = 0;
  try {
    value = std::stoull(match[1].str());
  } catch (const std::out_of_range&) {
    error_message = "Size value out of range: " + str;
    CHATWS_LOG(Error, "{}", error_message);
    return {false, 0};
  }

  const std::string unit = match[2].str();
  size_t multiplier = 1;
  if (unit == "KB") {
    multiplier = kKilobyte;
  } else if (unit == "MB") {
    multiplier = kMegabyte;
  } else if (unit == "GB") {
    multiplier = kGigabyte;
  }

  if (value > std::numeric_limits<size_t>::max() / multiplier) {
    error_message = "Size value out of range: " + str;
    CHATWS_LOG(Error, "{}", error_message);
    return {false, 0};
  }

  return {true, static_cast<size_t>(value) * multiplier};
}

}  // namespace config
}  // namespace chatws
