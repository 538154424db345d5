/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

/**
 * @file JsonReader.hpp
 * @brief Minimal JSON document model and recursive-descent reader
 *
 * Used for runtime settings and for the JSON content source. Objects keep
 * their keys in an unordered map; callers that need a stable order (weather
 * weights, loot entries) sort or use arrays.
 */

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace AnchorMud {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
std::ostream &operator<<(std::ostream &os, JsonType type);

class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const std::string &value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  [[nodiscard]] JsonType getType() const;
  [[nodiscard]] bool isNull() const {
    return std::holds_alternative<std::nullptr_t>(m_value);
  }
  [[nodiscard]] bool isBool() const { return std::holds_alternative<bool>(m_value); }
  [[nodiscard]] bool isNumber() const { return std::holds_alternative<double>(m_value); }
  [[nodiscard]] bool isString() const {
    return std::holds_alternative<std::string>(m_value);
  }
  [[nodiscard]] bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  [[nodiscard]] bool isObject() const {
    return std::holds_alternative<JsonObject>(m_value);
  }

  // Throw std::bad_variant_access on type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  /**
   * @brief Object member lookup. Missing keys (or non-objects) yield a shared
   * null value so chained lookups never throw.
   */
  [[nodiscard]] bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;
  JsonValue &operator[](const std::string &key);

  const JsonValue &operator[](size_t index) const;
  [[nodiscard]] size_t size() const;

  // Typed lookups with defaults, used by loaders
  [[nodiscard]] std::string getString(const std::string &key,
                                      const std::string &fallback = "") const;
  [[nodiscard]] double getNumber(const std::string &key, double fallback = 0.0) const;
  [[nodiscard]] int getInt(const std::string &key, int fallback = 0) const;
  [[nodiscard]] bool getBool(const std::string &key, bool fallback = false) const;

  [[nodiscard]] std::string toString() const;

private:
  ValueType m_value;

  void writeToStream(std::ostream &stream) const;
};

class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  [[nodiscard]] const JsonValue &getRoot() const { return m_root; }
  [[nodiscard]] const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  std::string m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;

  bool parseValue(JsonValue &out, int depth);
  bool parseObject(JsonValue &out, int depth);
  bool parseArray(JsonValue &out, int depth);
  bool parseString(std::string &out);
  bool parseNumber(JsonValue &out);
  bool parseLiteral(const char *literal, JsonValue value, JsonValue &out);
  bool parseUnicodeEscape(std::string &out);

  void skipWhitespace();
  [[nodiscard]] char peek() const;
  char advance();
  [[nodiscard]] bool atEnd() const { return m_position >= m_input.size(); }
  bool fail(const std::string &message);

  static constexpr int MAX_DEPTH = 64;
};

} // namespace AnchorMud

#endif // JSONREADER_HPP
