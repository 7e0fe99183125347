#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace chatws {
namespace json {

class JsonValueImpl;

enum class JsonType { Null, Boolean, Integer, Float, String, Array, Object };

class JsonException : public std::runtime_error {
 public:
  explicit JsonException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * JSON value with value semantics.
 *
 * Keeps nlohmann::json out of public headers. Accessors return copies;
 * mutation goes through set(), erase() and push_back().
 */
class JsonValue {
 public:
  JsonValue();  // Creates null
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(int64_t value);
  JsonValue(double value);
  JsonValue(const std::string& value);
  JsonValue(const char* value);

  JsonValue(const JsonValue& other);
  JsonValue(JsonValue&& other) noexcept;

  JsonValue& operator=(const JsonValue& other);
  JsonValue& operator=(JsonValue&& other) noexcept;

  ~JsonValue();

  JsonType type() const;
  bool isNull() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isFloat() const;
  bool isNumber() const;  // Integer or Float
  bool isString() const;
  bool isArray() const;
  bool isObject() const;

  // Throw JsonException on type mismatch
  bool getBool() const;
  int getInt() const;
  int64_t getInt64() const;
  double getFloat() const;
  std::string getString() const;

  // Return the default on type mismatch
  bool getBool(bool defaultValue) const;
  int getInt(int defaultValue) const;
  int64_t getInt64(int64_t defaultValue) const;
  double getFloat(double defaultValue) const;
  std::string getString(const std::string& defaultValue) const;

  // Array operations
  size_t size() const;  // Array or object size
  JsonValue at(size_t index) const;
  void push_back(const JsonValue& value);

  // Object operations
  bool contains(const std::string& key) const;
  JsonValue get(const std::string& key) const;  // Null when absent
  void set(const std::string& key, const JsonValue& value);
  void erase(const std::string& key);
  std::vector<std::string> keys() const;

  bool operator==(const JsonValue& other) const;
  bool operator!=(const JsonValue& other) const { return !(*this == other); }

  std::string toString(bool pretty = false) const;

  static JsonValue null();
  static JsonValue array();
  static JsonValue object();
  // Throws JsonException on malformed input
  static JsonValue parse(const std::string& json_str);

  friend class JsonValueImpl;

 private:
  std::unique_ptr<JsonValueImpl> impl_;
};

class JsonObjectBuilder {
 public:
  JsonObjectBuilder() : value_(JsonValue::object()) {}

  JsonObjectBuilder& add(const std::string& key, const JsonValue& val) {
    value_.set(key, val);
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, bool val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, int val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const std::string& val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const char* val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

}  // namespace json
}  // namespace chatws
