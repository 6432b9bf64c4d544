/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace HexPath {

namespace {
// Parse errors unwind to JsonReader::parse, which records the message
class JsonParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
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

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr)
    return nullValue();
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray() || index >= asArray().size())
    return nullValue();
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
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
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    stream << "\"" << asString() << "\"";
    break;
  case JsonType::Array: {
    stream << "[";
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first)
        stream << ",";
      element.writeToStream(stream);
      first = false;
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ",";
      stream << "\"" << key << "\":";
      value.writeToStream(stream);
      first = false;
    }
    stream << "}";
    break;
  }
  }
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
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

  try {
    skipWhitespace();
    if (m_position >= m_input.size()) {
      fail("Empty JSON input");
    }
    JsonValue root = parseValue();
    skipWhitespace();
    if (m_position < m_input.size()) {
      fail("Unexpected token after JSON value");
    }
    m_root = std::move(root);
    return true;
  } catch (const JsonParseError &e) {
    m_lastError = "Parse error: " + std::string(e.what());
    return false;
  }
}

JsonValue JsonReader::parseValue() {
  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"':
    return JsonValue(parseString());
  case 't':
    expectLiteral("true");
    return JsonValue(true);
  case 'f':
    expectLiteral("false");
    return JsonValue(false);
  case 'n':
    expectLiteral("null");
    return JsonValue();
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parseNumber();
    }
    if (c == '\0') {
      fail("Unexpected end of input");
    }
    fail("Unexpected character: " + std::string(1, c));
  }
}

JsonValue JsonReader::parseObject() {
  advance(); // {
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key in object");
    }
    std::string key = parseString();

    skipWhitespace();
    if (advance() != ':') {
      fail("Expected ':' after object key");
    }

    object[key] = parseValue();

    skipWhitespace();
    char next = advance();
    if (next == '}') {
      break;
    }
    if (next != ',') {
      fail("Expected '}' or ',' in object");
    }
  }
  return JsonValue(std::move(object));
}

JsonValue JsonReader::parseArray() {
  advance(); // [
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    array.push_back(parseValue());

    skipWhitespace();
    char next = advance();
    if (next == ']') {
      break;
    }
    if (next != ',') {
      fail("Expected ']' or ',' in array");
    }
  }
  return JsonValue(std::move(array));
}

std::string JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (m_position < m_input.size()) {
    char c = advance();
    if (c == '"') {
      return result;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Unescaped control character in string");
    }
    if (c != '\\') {
      result += c;
      continue;
    }

    if (m_position >= m_input.size()) {
      fail("Unexpected end of input in string escape");
    }
    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result += escaped;
      break;
    case 'b':
      result += '\b';
      break;
    case 'f':
      result += '\f';
      break;
    case 'n':
      result += '\n';
      break;
    case 'r':
      result += '\r';
      break;
    case 't':
      result += '\t';
      break;
    case 'u': {
      uint32_t codepoint = parseHex4();
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u') {
          fail("Invalid Unicode escape sequence");
        }
        uint32_t low = parseHex4();
        if (low < 0xDC00 || low > 0xDFFF) {
          fail("Invalid Unicode escape sequence");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(result, codepoint);
      break;
    }
    default:
      fail("Invalid escape sequence: \\" + std::string(1, escaped));
    }
  }

  fail("Unterminated string");
}

JsonValue JsonReader::parseNumber() {
  size_t start = m_position;
  auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

  if (peek() == '-') {
    advance();
  }
  if (!isDigit(peek())) {
    fail("Invalid number format");
  }
  while (isDigit(peek())) {
    advance();
  }
  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      fail("Invalid number format: expected digit after decimal point");
    }
    while (isDigit(peek())) {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!isDigit(peek())) {
      fail("Invalid number format: expected digit in exponent");
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  std::string numStr = m_input.substr(start, m_position - start);
  errno = 0;
  double value = std::strtod(numStr.c_str(), nullptr);
  if (errno == ERANGE) {
    fail("Invalid number format: " + numStr);
  }
  return JsonValue(value);
}

void JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      fail("Invalid token starting with '" + std::string(1, literal[0]) + "'");
    }
    advance();
  }
}

uint32_t JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      fail("Invalid Unicode escape sequence");
    }
  }
  return value;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size()) {
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

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size()) {
    char c = m_input[m_position];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

void JsonReader::fail(const std::string &message) const {
  throw JsonParseError(message + " at line " + std::to_string(m_line) +
                       ", column " + std::to_string(m_column));
}

} // namespace HexPath
