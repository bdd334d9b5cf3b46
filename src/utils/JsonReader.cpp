/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cerrno>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace GlyphRain {

namespace {
constexpr size_t MAX_NESTING_DEPTH = 64;

const JsonValue &nullValue() {
  static const JsonValue null_value;
  return null_value;
}
} // namespace

// JsonValue implementation
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

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  const auto &obj = asObject();
  return obj.find(key) != obj.end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray())
    return nullValue();
  const auto &arr = asArray();
  return index < arr.size() ? arr[index] : nullValue();
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_lastError = std::format("Could not open file: {}", path);
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
  m_depth = 0;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  JsonValue value = parseValue();
  if (failed()) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected trailing characters");
    return false;
  }

  m_root = std::move(value);
  return true;
}

JsonValue JsonReader::parseValue() {
  if (m_position >= m_input.size()) {
    setError("Unexpected end of input");
    return JsonValue();
  }

  const char c = peek();
  switch (c) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"':
    return JsonValue(parseString());
  case 't':
    if (parseLiteral("true"))
      return JsonValue(true);
    break;
  case 'f':
    if (parseLiteral("false"))
      return JsonValue(false);
    break;
  case 'n':
    if (parseLiteral("null"))
      return JsonValue();
    break;
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parseNumber();
    }
    setError(std::format("Unexpected character '{}'", c));
    return JsonValue();
  }

  if (!failed()) {
    setError("Invalid literal");
  }
  return JsonValue();
}

JsonValue JsonReader::parseObject() {
  if (++m_depth > MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return JsonValue();
  }

  advance(); // '{'
  JsonObject object;
  skipWhitespace();

  if (peek() == '}') {
    advance();
    --m_depth;
    return JsonValue(std::move(object));
  }

  while (!failed()) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key");
      break;
    }
    std::string key = parseString();
    if (failed())
      break;

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after key");
      break;
    }
    advance();
    skipWhitespace();

    JsonValue value = parseValue();
    if (failed())
      break;
    object[key] = std::move(value);

    skipWhitespace();
    const char next = peek();
    if (next == ',') {
      advance();
      continue;
    }
    if (next == '}') {
      advance();
      --m_depth;
      return JsonValue(std::move(object));
    }
    setError("Expected ',' or '}' in object");
  }
  return JsonValue();
}

JsonValue JsonReader::parseArray() {
  if (++m_depth > MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return JsonValue();
  }

  advance(); // '['
  JsonArray array;
  skipWhitespace();

  if (peek() == ']') {
    advance();
    --m_depth;
    return JsonValue(std::move(array));
  }

  while (!failed()) {
    skipWhitespace();
    array.push_back(parseValue());
    if (failed())
      break;

    skipWhitespace();
    const char next = peek();
    if (next == ',') {
      advance();
      continue;
    }
    if (next == ']') {
      advance();
      --m_depth;
      return JsonValue(std::move(array));
    }
    setError("Expected ',' or ']' in array");
  }
  return JsonValue();
}

JsonValue JsonReader::parseNumber() {
  const size_t start = m_position;
  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9')
      advance();
  } else {
    setError("Invalid number");
    return JsonValue();
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Expected digit after decimal point");
      return JsonValue();
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Expected digit in exponent");
      return JsonValue();
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  errno = 0;
  const double value = std::strtod(text.c_str(), nullptr);
  if (errno == ERANGE) {
    setError(std::format("Number out of range: {}", text));
    return JsonValue();
  }
  return JsonValue(value);
}

std::string JsonReader::parseString() {
  advance(); // opening quote
  std::string out;

  while (!failed()) {
    if (m_position >= m_input.size()) {
      setError("Unterminated string");
      break;
    }

    const char c = advance();
    if (c == '"') {
      return out;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Control character in string");
      break;
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    if (m_position >= m_input.size()) {
      setError("Unterminated escape sequence");
      break;
    }
    const char esc = advance();
    switch (esc) {
    case '"':
      out.push_back('"');
      break;
    case '\\':
      out.push_back('\\');
      break;
    case '/':
      out.push_back('/');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u': {
      uint32_t cp = parseHex4();
      if (failed())
        break;
      // Surrogate pair
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        if (peek() == '\\' && m_position + 1 < m_input.size() &&
            m_input[m_position + 1] == 'u') {
          advance();
          advance();
          const uint32_t low = parseHex4();
          if (failed())
            break;
          if (low < 0xDC00 || low > 0xDFFF) {
            setError("Invalid low surrogate");
            break;
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else {
          setError("Unpaired high surrogate");
          break;
        }
      }
      appendCodePoint(out, cp);
      break;
    }
    default:
      setError(std::format("Invalid escape '\\{}'", esc));
      break;
    }
  }
  return {};
}

bool JsonReader::parseLiteral(const char *literal) {
  const std::string_view expected(literal);
  if (m_input.compare(m_position, expected.size(), expected) != 0) {
    return false;
  }
  for (size_t i = 0; i < expected.size(); ++i) {
    advance();
  }
  return true;
}

uint32_t JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    if (m_position >= m_input.size()) {
      setError("Truncated unicode escape");
      return 0;
    }
    const char c = advance();
    value <<= 4;
    if (c >= '0' && c <= '9')
      value |= static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f')
      value |= static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      value |= static_cast<uint32_t>(c - 'A' + 10);
    else {
      setError("Invalid hex digit in unicode escape");
      return 0;
    }
  }
  return value;
}

void JsonReader::appendCodePoint(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
    return '\0';
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
  while (m_position < m_input.size()) {
    const char c = m_input[m_position];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  // Keep the first error; later ones are consequences of it
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, column {}: {}", m_line, m_column, message);
  }
}

} // namespace GlyphRain
