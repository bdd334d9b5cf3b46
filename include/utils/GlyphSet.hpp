/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GLYPH_SET_HPP
#define GLYPH_SET_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace GlyphRain {

struct RainEvent;

/**
 * @brief Built-in character sets for drop trails
 */
enum class CharacterSet : uint8_t {
  Katakana = 0,   // Full-width katakana
  Matrix = 1,     // Half-width katakana plus digits
  Numeric = 2,
  Alphanumeric = 3,
  Symbols = 4,
  Custom = 5
};

std::optional<CharacterSet> characterSetFromString(std::string_view name);
std::string_view characterSetToString(CharacterSet set);

/**
 * @brief Decodes UTF-8 into code points; malformed sequences are skipped
 */
std::vector<char32_t> decodeUtf8(std::string_view text);

/**
 * @brief Encodes a single code point as UTF-8
 */
std::string encodeUtf8(char32_t codePoint);

/**
 * @brief Appends the glyphs that identify an event's drop
 *
 * In trail order: the kind symbol; up to three katakana spelling the agent
 * name (a-z map onto the first 26 katakana, other characters are skipped);
 * the first three of the session id's last six characters, upper-cased, with
 * non-alphanumerics replaced at random; the last four timestamp digits.
 * Events without a positive timestamp contribute the kind symbol only.
 */
void appendEventIdentityGlyphs(const RainEvent &event, std::mt19937 &rng,
                               std::vector<char32_t> &out);

/**
 * @brief Immutable list of glyphs a drop can be built from
 */
class GlyphSet {
public:
  /**
   * @brief Builds a glyph set; Custom uses customGlyphs and falls back to
   * Katakana when the custom text holds no valid glyphs
   */
  explicit GlyphSet(CharacterSet set, std::string_view customGlyphs = {});

  char32_t randomGlyph(std::mt19937 &rng) const;

  const std::vector<char32_t> &glyphs() const { return m_glyphs; }
  size_t size() const { return m_glyphs.size(); }
  CharacterSet characterSet() const { return m_set; }

private:
  CharacterSet m_set;
  std::vector<char32_t> m_glyphs;
};

} // namespace GlyphRain

#endif // GLYPH_SET_HPP
