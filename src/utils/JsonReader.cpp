/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace DelveEngine {

namespace {
const JsonValue NULL_VALUE;

bool isDigit(char c) { return c >= '0' && c <= '9'; }

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
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
} // anonymous namespace

// JsonValue implementation
JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  case 5:
    return JsonType::Object;
  default:
    return JsonType::Null;
  }
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
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (!obj)
    return NULL_VALUE;
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : NULL_VALUE;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *arr = tryAsArray();
  if (!arr || index >= arr->size())
    return NULL_VALUE;
  return (*arr)[index];
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
    stream << JsonReader::escapeString(asString());
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      arr[i].writeToStream(stream);
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
      first = false;
      stream << JsonReader::escapeString(key) << ":";
      value.writeToStream(stream);
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
    m_root = JsonValue();
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (atEnd()) {
    return fail("Empty JSON input");
  }
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }

  m_root = std::move(root);
  return true;
}

std::string JsonReader::escapeString(const std::string &text) {
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        static const char *hex = "0123456789abcdef";
        out += "\\u00";
        out += hex[(c >> 4) & 0x0F];
        out += hex[c & 0x0F];
      } else {
        out += c;
      }
    }
  }
  out += '"';
  return out;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                  std::to_string(m_column) + ": " + message;
  }
  return false;
}

char JsonReader::peek() const { return atEnd() ? '\0' : m_input[m_position]; }

char JsonReader::advance() {
  if (atEnd())
    return '\0';
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
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Nesting too deep");
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!parseLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!parseLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!parseLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || isDigit(peek()))
      return parseNumber(out);
    return fail(std::string("Unexpected character '") + peek() + "'");
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject obj;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(obj));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"')
      return fail("Expected string key in object");

    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':')
      return fail("Expected ':' after object key");

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    obj[key] = std::move(value);

    skipWhitespace();
    char next = advance();
    if (next == '}')
      break;
    if (next != ',')
      return fail("Expected ',' or '}' in object");
  }

  out = JsonValue(std::move(obj));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray arr;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(arr));
    return true;
  }

  while (true) {
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    arr.push_back(std::move(value));

    skipWhitespace();
    char next = advance();
    if (next == ']')
      break;
    if (next != ',')
      return fail("Expected ',' or ']' in array");
  }

  out = JsonValue(std::move(arr));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!atEnd()) {
    char c = advance();
    if (c == '"')
      return true;

    if (static_cast<unsigned char>(c) < 0x20)
      return fail("Unescaped control character in string");

    if (c != '\\') {
      out += c;
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
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
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseUnicodeEscape(codepoint))
        return false;
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\') {
        advance();
        if (advance() != 'u')
          return fail("Expected low surrogate escape");
        uint32_t low = 0;
        if (!parseUnicodeEscape(low))
          return false;
        if (low < 0xDC00 || low > 0xDFFF)
          return fail("Invalid low surrogate");
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail("Invalid escape sequence: \\" + std::string(1, escaped));
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid Unicode escape sequence");
    }
    codepoint = (codepoint << 4) | digit;
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    return fail("Invalid number format");
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek()))
      return fail("Invalid number format: expected digit after decimal point");
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek()))
      return fail("Invalid number format: expected digit in exponent");
    while (isDigit(peek()))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *literal) {
  const size_t length = std::strlen(literal);
  if (m_input.compare(m_position, length, literal) != 0) {
    return fail(std::string("Invalid literal, expected '") + literal + "'");
  }
  for (size_t i = 0; i < length; ++i)
    advance();
  return true;
}

} // namespace DelveEngine
