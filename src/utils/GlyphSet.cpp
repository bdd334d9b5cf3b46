/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/GlyphSet.hpp"
#include "events/RainEvent.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace GlyphRain {

namespace {

constexpr std::string_view KATAKANA =
    "アイウエオカキクケコサシスセソタチツテトナニヌネノ"
    "ハヒフヘホマミムメモヤユヨラリルレロワヲン";

constexpr std::string_view HALF_WIDTH =
    "ｱｲｳｴｵｶｷｸｹｺｻｼｽｾｿﾀﾁﾂﾃﾄﾅﾆﾇﾈﾉﾊﾋﾌﾍﾎ0123456789";

constexpr std::string_view NUMERIC = "0123456789";

constexpr std::string_view ALPHANUMERIC =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

constexpr std::string_view SYMBOLS = "◆◢⚠↕◐✓●○▲▼←→↑↓";

constexpr std::string_view SESSION_GLYPHS = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

constexpr size_t MAX_AGENT_GLYPHS = 3;
constexpr size_t SESSION_TAIL = 6;
constexpr size_t SESSION_GLYPH_COUNT = 3;
constexpr size_t TIMESTAMP_DIGITS = 4;

std::string_view builtInText(CharacterSet set) {
  switch (set) {
  case CharacterSet::Matrix:
    return HALF_WIDTH;
  case CharacterSet::Numeric:
    return NUMERIC;
  case CharacterSet::Alphanumeric:
    return ALPHANUMERIC;
  case CharacterSet::Symbols:
    return SYMBOLS;
  case CharacterSet::Katakana:
  case CharacterSet::Custom:
  default:
    return KATAKANA;
  }
}

} // namespace

std::optional<CharacterSet> characterSetFromString(std::string_view name) {
  if (name == "katakana") return CharacterSet::Katakana;
  if (name == "matrix") return CharacterSet::Matrix;
  if (name == "numeric" || name == "numbers") return CharacterSet::Numeric;
  if (name == "alphanumeric") return CharacterSet::Alphanumeric;
  if (name == "symbols") return CharacterSet::Symbols;
  if (name == "custom") return CharacterSet::Custom;
  return std::nullopt;
}

std::string_view characterSetToString(CharacterSet set) {
  switch (set) {
  case CharacterSet::Katakana: return "katakana";
  case CharacterSet::Matrix: return "matrix";
  case CharacterSet::Numeric: return "numeric";
  case CharacterSet::Alphanumeric: return "alphanumeric";
  case CharacterSet::Symbols: return "symbols";
  case CharacterSet::Custom: return "custom";
  default: return "unknown";
  }
}

std::vector<char32_t> decodeUtf8(std::string_view text) {
  std::vector<char32_t> out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    size_t length = 0;
    char32_t cp = 0;

    if (lead < 0x80) {
      length = 1;
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      cp = lead & 0x07;
    } else {
      ++i; // Stray continuation byte
      continue;
    }

    if (i + length > text.size()) {
      break;
    }

    bool valid = true;
    for (size_t k = 1; k < length; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }

    if (valid && cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF)) {
      out.push_back(cp);
      i += length;
    } else {
      ++i;
    }
  }
  return out;
}

std::string encodeUtf8(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return out;
}

void appendEventIdentityGlyphs(const RainEvent &event, std::mt19937 &rng,
                               std::vector<char32_t> &out) {
  out.push_back(eventKindSymbol(event.kind));
  if (event.timestampMs <= 0) {
    return;
  }

  static const std::vector<char32_t> katakana = decodeUtf8(KATAKANA);
  size_t agentGlyphs = 0;
  for (char c : event.agentName) {
    if (agentGlyphs == MAX_AGENT_GLYPHS) {
      break;
    }
    const int lower = std::tolower(static_cast<unsigned char>(c));
    if (lower >= 'a' && lower <= 'z') {
      out.push_back(katakana[static_cast<size_t>(lower - 'a')]);
      ++agentGlyphs;
    }
  }

  const std::string_view session(event.sessionId);
  const size_t tailStart = session.size() - std::min(SESSION_TAIL, session.size());
  std::uniform_int_distribution<size_t> pick(0, SESSION_GLYPHS.size() - 1);
  for (char c : session.substr(tailStart, SESSION_GLYPH_COUNT)) {
    const int upper = std::toupper(static_cast<unsigned char>(c));
    if (std::isalnum(upper)) {
      out.push_back(static_cast<char32_t>(upper));
    } else {
      out.push_back(static_cast<char32_t>(SESSION_GLYPHS[pick(rng)]));
    }
  }

  const std::string digits = std::to_string(event.timestampMs);
  const size_t digitStart = digits.size() - std::min(TIMESTAMP_DIGITS, digits.size());
  for (size_t i = digitStart; i < digits.size(); ++i) {
    out.push_back(static_cast<char32_t>(digits[i]));
  }
}

GlyphSet::GlyphSet(CharacterSet set, std::string_view customGlyphs)
    : m_set(set) {
  if (set == CharacterSet::Custom) {
    m_glyphs = decodeUtf8(customGlyphs);
    // Whitespace would render as gaps in the trail
    m_glyphs.erase(std::remove_if(m_glyphs.begin(), m_glyphs.end(),
                                  [](char32_t c) { return c <= U' '; }),
                   m_glyphs.end());
  }
  if (m_glyphs.empty()) {
    m_glyphs = decodeUtf8(builtInText(set));
  }
}

char32_t GlyphSet::randomGlyph(std::mt19937 &rng) const {
  std::uniform_int_distribution<size_t> pick(0, m_glyphs.size() - 1);
  return m_glyphs[pick(rng)];
}

} // namespace GlyphRain
