#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "chatws/json/json_bridge.h"

namespace chatws {
namespace config {

// Duration parsing
// Supports formats: 10ms, 5s, 2m, 1h; bare numbers are milliseconds
class Duration {
 public:
  static std::pair<bool, std::chrono::milliseconds> parse(
      const std::string& str);

  // String with unit, or a non-negative number of milliseconds
  static std::pair<bool, std::chrono::milliseconds> parse(
      const json::JsonValue& value);

  static std::string toString(std::chrono::milliseconds duration);

  static std::pair<bool, std::chrono::milliseconds> parseWithError(
      const std::string& str, std::string& error_message);
};

// Size parsing with binary multiples
// Supports formats: 1024B, 10KB, 5MB, 2GB; bare numbers are bytes
class Size {
 public:
  static std::pair<bool, size_t> parse(const std::string& str);

  static std::pair<bool, size_t> parse(const json::JsonValue& value);

  static std::string toString(size_t bytes);

  static std::pair<bool, size_t> parseWithError(const std::string& str,
                                                std::string& error_message);
};

class UnitParseError : public std::runtime_error {
 public:
  explicit UnitParseError(const std::string& message)
      : std::runtime_error(message) {}
};

inline std::chrono::milliseconds parseJsonDuration(
    const json::JsonValue& value, const std::string& field_name) {
  auto result = Duration::parse(value);
  if (!result.first) {
    throw UnitParseError("Invalid duration format for field '" + field_name +
                         "'");
  }
  return result.second;
}

inline size_t parseJsonSize(const json::JsonValue& value,
                            const std::string& field_name) {
  auto result = Size::parse(value);
  if (!result.first) {
    throw UnitParseError("Invalid size format for field '" + field_name + "'");
  }
  return result.second;
}

}  // namespace config
}  // namespace chatws
