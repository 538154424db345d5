/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace AnchorMud {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << "\\u" << std::hex << std::setw(4) << std::setfill('0')
               << static_cast<int>(c) << std::dec;
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}
} // namespace

std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

// ============================================================================
// JsonValue
// ============================================================================

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool()) {
    return asBool();
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber()) {
    return asNumber();
  }
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber()) {
    return asInt();
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString()) {
    return asString();
  }
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const auto *object = tryAsObject();
  return object && object->find(key) != object->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const auto *object = tryAsObject();
  if (!object) {
    return nullValue();
  }
  auto it = object->find(key);
  return it != object->end() ? it->second : nullValue();
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *array = tryAsArray();
  if (!array || index >= array->size()) {
    return nullValue();
  }
  return (*array)[index];
}

size_t JsonValue::size() const {
  if (const auto *array = tryAsArray()) {
    return array->size();
  }
  if (const auto *object = tryAsObject()) {
    return object->size();
  }
  return 0;
}

std::string JsonValue::getString(const std::string &key,
                                 const std::string &fallback) const {
  return (*this)[key].tryAsString().value_or(fallback);
}

double JsonValue::getNumber(const std::string &key, double fallback) const {
  return (*this)[key].tryAsNumber().value_or(fallback);
}

int JsonValue::getInt(const std::string &key, int fallback) const {
  return (*this)[key].tryAsInt().value_or(fallback);
}

bool JsonValue::getBool(const std::string &key, bool fallback) const {
  return (*this)[key].tryAsBool().value_or(fallback);
}

std::string JsonValue::toString() const {
  std::ostringstream stream;
  writeToStream(stream);
  return stream.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double number = asNumber();
    if (std::floor(number) == number && std::fabs(number) < 1e15) {
      stream << static_cast<long long>(number);
    } else {
      stream << std::setprecision(10) << number;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    stream << '[';
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first) {
        stream << ',';
      }
      first = false;
      element.writeToStream(stream);
    }
    stream << ']';
    break;
  }
  case JsonType::Object: {
    stream << '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first) {
        stream << ',';
      }
      first = false;
      writeEscaped(stream, key);
      stream << ':';
      value.writeToStream(stream);
    }
    stream << '}';
    break;
  }
  }
}

// ============================================================================
// JsonReader
// ============================================================================

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue result;
  skipWhitespace();
  if (atEnd()) {
    return fail("Empty document");
  }
  if (!parseValue(result, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }
  m_root = std::move(result);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }
  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character '") + peek() + "'");
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // {
  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }
    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after key \"" + key + "\"");
    }
    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    object[key] = std::move(value);

    skipWhitespace();
    char next = advance();
    if (next == '}') {
      break;
    }
    if (next != ',') {
      return fail("Expected ',' or '}' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // [
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth)) {
      return false;
    }
    array.push_back(std::move(element));

    skipWhitespace();
    char next = advance();
    if (next == ']') {
      break;
    }
    if (next != ',') {
      return fail("Expected ',' or ']' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  while (!atEnd()) {
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (c == '\\') {
      if (atEnd()) {
        break;
      }
      char escape = advance();
      switch (escape) {
      case '"':
      case '\\':
      case '/':
        out += escape;
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'u':
        if (!parseUnicodeEscape(out)) {
          return false;
        }
        break;
      default:
        return fail(std::string("Invalid escape sequence '\\") + escape + "'");
      }
    } else if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    } else {
      out += c;
    }
  }
  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(std::string &out) {
  if (m_position + 4 > m_input.size()) {
    return fail("Truncated unicode escape");
  }
  uint32_t codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    codepoint <<= 4;
    if (c >= '0' && c <= '9') {
      codepoint |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      codepoint |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      codepoint |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid hex digit in unicode escape");
    }
  }

  // UTF-8 encode (BMP only; surrogate pairs are passed through as-is)
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;
  if (peek() == '-') {
    advance();
  }
  if (!(peek() >= '0' && peek() <= '9')) {
    return fail("Invalid number");
  }
  while (peek() >= '0' && peek() <= '9') {
    advance();
  }
  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Expected digit after decimal point");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Expected digit in exponent");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }

  std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  std::string expected(literal);
  if (m_input.compare(m_position, expected.size(), expected) != 0) {
    return fail("Invalid literal, expected " + expected);
  }
  for (size_t i = 0; i < expected.size(); ++i) {
    advance();
  }
  out = std::move(value);
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
    } else {
      break;
    }
  }
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd()) {
    return '\0';
  }
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                  std::to_string(m_column) + ": " + message;
  }
  return false;
}

} // namespace AnchorMud
