/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

namespace Mythweave {

// Alternatives are declared in JsonType order
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

const JsonArray *JsonValue::tryAsArray() const {
  if (isArray())
    return &asArray();
  return nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  if (isObject())
    return &asObject();
  return nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  const auto &obj = asObject();
  return obj.find(key) != obj.end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

JsonValue &JsonValue::operator[](size_t index) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  auto &arr = asArray();
  if (index >= arr.size()) {
    arr.resize(index + 1);
  }
  return arr[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

void JsonValue::push_back(JsonValue value) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  asArray().push_back(std::move(value));
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss, 0, 0);
  return oss.str();
}

std::string JsonValue::toPrettyString(int indentWidth) const {
  std::ostringstream oss;
  writeToStream(oss, indentWidth, 0);
  return oss.str();
}

void JsonValue::writeEscaped(std::ostream &stream, const std::string &text) {
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
    case '\b':
      stream << "\\b";
      break;
    case '\f':
      stream << "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        stream << c;
      }
      break;
    }
  }
  stream << '"';
}

void JsonValue::writeToStream(std::ostream &stream, int indentWidth,
                              int depth) const {
  const bool pretty = indentWidth > 0;
  auto newline = [&](int level) {
    if (pretty) {
      stream << '\n' << std::string(static_cast<size_t>(level * indentWidth), ' ');
    }
  };

  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (!std::isfinite(num)) {
      stream << "null";
    } else if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      // Shortest representation that parses back to the same double
      stream << std::format("{}", num);
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    if (arr.empty()) {
      stream << "[]";
      break;
    }
    stream << "[";
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      newline(depth + 1);
      arr[i].writeToStream(stream, indentWidth, depth + 1);
    }
    newline(depth);
    stream << "]";
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    if (obj.empty()) {
      stream << "{}";
      break;
    }
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : obj) {
      if (!first)
        stream << ",";
      first = false;
      newline(depth + 1);
      writeEscaped(stream, key);
      stream << (pretty ? ": " : ":");
      value.writeToStream(stream, indentWidth, depth + 1);
    }
    newline(depth);
    stream << "}";
    break;
  }
  }
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_line = 1;
    m_column = 1;
    return fail("Could not open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;

  JsonValue document;
  skipWhitespace();
  if (atEnd()) {
    return fail("Empty JSON input");
  }
  if (!parseValue(document, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail(std::format("Unexpected '{}' after JSON value", peek()));
  }
  m_root = std::move(document);
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  return false;
}

char JsonReader::advance() {
  if (atEnd()) {
    return '\0';
  }
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
      return;
    }
    advance();
  }
}

bool JsonReader::parseValue(JsonValue &out, size_t depth) {
  if (depth > kMaxDepth) {
    return fail(std::format("Nesting deeper than {} levels", kMaxDepth));
  }

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
    if (!parseLiteral("true")) {
      return false;
    }
    out = JsonValue(true);
    return true;
  case 'f':
    if (!parseLiteral("false")) {
      return false;
    }
    out = JsonValue(false);
    return true;
  case 'n':
    if (!parseLiteral("null")) {
      return false;
    }
    out = JsonValue();
    return true;
  case '\0':
    if (atEnd()) {
      return fail("Unexpected end of input, expected a value");
    }
    break;
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    break;
  }
  return fail(std::format("Unexpected character '{}'", peek()));
}

bool JsonReader::parseObject(JsonValue &out, size_t depth) {
  advance(); // '{'
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
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }
    skipWhitespace();
    if (peek() != ':') {
      return fail("Expected ':' after object key");
    }
    advance();
    skipWhitespace();

    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    object[std::move(key)] = std::move(value);

    skipWhitespace();
    const char next = advance();
    if (next == '}') {
      break;
    }
    if (next != ',') {
      return fail("Expected '}' or ',' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, size_t depth) {
  advance(); // '['
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    array.push_back(std::move(value));

    skipWhitespace();
    const char next = advance();
    if (next == ']') {
      break;
    }
    if (next != ',') {
      return fail("Expected ']' or ',' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseLiteral(std::string_view word) {
  if (m_input.substr(m_position, word.size()) != word) {
    return fail(std::format("Invalid token, expected '{}'", word));
  }
  for (size_t i = 0; i < word.size(); ++i) {
    advance();
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (peek() == '-') {
    advance();
  }
  if (peek() == '0') {
    advance();
  } else if (digits() == 0) {
    return fail("Invalid number format");
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0) {
      return fail("Invalid number format: expected digit after decimal point");
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (digits() == 0) {
      return fail("Invalid number format: expected digit in exponent");
    }
  }

  double number = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  const auto [end, ec] = std::from_chars(first, last, number);
  if (ec != std::errc() || end != last) {
    return fail(std::format("Number out of range: {}", std::string_view(first, last - first)));
  }
  out = JsonValue(number);
  return true;
}

bool JsonReader::parseHex4(uint32_t &out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = peek();
    uint32_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid Unicode escape sequence");
    }
    advance();
    out = (out << 4) | digit;
  }
  return true;
}

namespace {

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

char simpleEscape(char c) {
  switch (c) {
  case '"':
  case '\\':
  case '/':
    return c;
  case 'b':
    return '\b';
  case 'f':
    return '\f';
  case 'n':
    return '\n';
  case 'r':
    return '\r';
  case 't':
    return '\t';
  default:
    return '\0';
  }
}

} // namespace

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!atEnd()) {
    const char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd()) {
      break;
    }
    const char escape = advance();
    if (escape != 'u') {
      const char decoded = simpleEscape(escape);
      if (decoded == '\0') {
        return fail(std::format("Invalid escape sequence: \\{}", escape));
      }
      out += decoded;
      continue;
    }

    uint32_t codepoint = 0;
    if (!parseHex4(codepoint)) {
      return false;
    }
    // A high surrogate combines with the \uDC00-\uDFFF escape after it
    if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\' &&
        m_position + 1 < m_input.size() && m_input[m_position + 1] == 'u') {
      advance();
      advance();
      uint32_t low = 0;
      if (!parseHex4(low)) {
        return false;
      }
      if (low >= 0xDC00 && low <= 0xDFFF) {
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      } else {
        appendUtf8(out, codepoint);
        codepoint = low;
      }
    }
    appendUtf8(out, codepoint);
  }

  return fail("Unterminated string");
}

} // namespace Mythweave
