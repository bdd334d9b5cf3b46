/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLOR_UTILS_HPP
#define COLOR_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace GlyphRain {

// Colors are packed RGBA: 0xRRGGBBAA
constexpr uint32_t makeColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
  return (static_cast<uint32_t>(r) << 24) | (static_cast<uint32_t>(g) << 16) |
         (static_cast<uint32_t>(b) << 8) | static_cast<uint32_t>(a);
}

constexpr uint8_t colorRed(uint32_t c) { return (c >> 24) & 0xFF; }
constexpr uint8_t colorGreen(uint32_t c) { return (c >> 16) & 0xFF; }
constexpr uint8_t colorBlue(uint32_t c) { return (c >> 8) & 0xFF; }
constexpr uint8_t colorAlpha(uint32_t c) { return c & 0xFF; }

/**
 * @brief Parses "#RRGGBB" or "#RRGGBBAA" (leading '#' optional)
 * @return packed color, or std::nullopt for malformed input
 */
inline std::optional<uint32_t> parseHexColor(std::string_view text) {
  if (!text.empty() && text.front() == '#') {
    text.remove_prefix(1);
  }
  if (text.size() != 6 && text.size() != 8) {
    return std::nullopt;
  }

  uint32_t value = 0;
  for (char c : text) {
    uint32_t nibble = 0;
    if (c >= '0' && c <= '9') {
      nibble = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      nibble = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      nibble = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
    value = (value << 4) | nibble;
  }

  if (text.size() == 6) {
    value = (value << 8) | 0xFF;
  }
  return value;
}

} // namespace GlyphRain

#endif // COLOR_UTILS_HPP
