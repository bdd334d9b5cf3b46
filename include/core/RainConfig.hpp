/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAIN_CONFIG_HPP
#define RAIN_CONFIG_HPP

#include "events/RainEvent.hpp"
#include "utils/ColorUtils.hpp"
#include "utils/GlyphSet.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GlyphRain {

class JsonValue;

/**
 * @brief Head/trail colors of a drop
 */
struct DropColors {
  uint32_t head{makeColor(0xFF, 0xFF, 0xFF)};
  uint32_t trail{makeColor(0x00, 0xFF, 0x00)};
};

/**
 * @brief Color palette; event kinds may override the default drop colors
 */
struct RainPalette {
  DropColors ambient{};
  uint32_t background{makeColor(0x00, 0x00, 0x00)};
  std::array<std::optional<DropColors>, static_cast<size_t>(RainEventKind::COUNT)>
      kindOverrides{};
  // When set, ambient drops take their colors from here by column
  std::vector<uint32_t> spectrum{};

  /**
   * @brief Colors for an event-driven drop of the given kind
   */
  DropColors colorsFor(RainEventKind kind) const;

  /**
   * @brief Ambient colors for a column: head is the column's spectrum entry,
   * trail the next one. Falls back to ambient when the spectrum is empty.
   */
  DropColors spectrumColors(uint32_t column) const;

  static RainPalette classic();
  static RainPalette rainbow();
};

/**
 * @brief Named presets carried over from the dashboard's settings panel
 */
enum class RainPreset : uint8_t { Classic, Performance, Quality, Minimal, Rainbow };

std::optional<RainPreset> presetFromString(std::string_view name);

/**
 * @brief Engine options. Every field has a default; see sanitized() for the
 * accepted ranges.
 */
struct RainConfig {
  // Upper bounds enforced by sanitized()
  static constexpr size_t MAX_DROPS_LIMIT = 100000;
  static constexpr size_t MAX_TRAIL_LENGTH = 256;
  static constexpr size_t MAX_SPAWNS_PER_TICK = 1024;
  static constexpr size_t MAX_PENDING_EVENTS = 10000;
  static constexpr size_t MAX_PERFORMANCE_WINDOW = 3600;
  static constexpr uint32_t MAX_QUALITY_WINDOWS = 600;

  // Layout
  float columnDensity{0.05f};   // Columns per canvas unit (20-unit columns)
  float cellHeight{20.0f};      // Vertical spacing between trail cells
  float fontSize{14.0f};
  float bottomMargin{100.0f};

  // Glyphs and colors
  CharacterSet characterSet{CharacterSet::Katakana};
  std::string customGlyphs{};
  RainPalette palette{RainPalette::classic()};
  float glowIntensity{0.7f};
  float fadeAlpha{0.05f};       // Background fade per frame, 1.0 clears

  // Motion and spawning
  float minSpeed{100.0f};       // Canvas units per second
  float maxSpeed{200.0f};
  float spawnRate{6.0f};        // Ambient drops per second
  float maxStepSeconds{0.05f};
  double columnCooldownMs{250.0};

  // Capacity
  size_t maxDrops{1000};
  size_t trailLength{12};
  size_t maxSpawnsPerTick{16};
  size_t maxPendingEvents{256};
  double memoryLimitMB{50.0};

  // Performance and adaptive quality
  float targetFPS{60.0f};
  bool adaptiveQuality{true};
  double sampleIntervalMs{1000.0};
  size_t performanceWindow{60};
  float lowFrameRate{30.0f};
  float recoverFrameRate{55.0f};
  float renderBudgetMs{20.0f};
  uint32_t downgradeWindows{3};
  uint32_t upgradeWindows{5};

  // Status
  double transitionMs{300.0};

  /**
   * @brief Returns a copy with out-of-range values replaced by defaults
   */
  RainConfig sanitized() const;

  static RainConfig fromPreset(RainPreset preset);
};

/**
 * @brief Overlays recognised keys of a JSON object onto base
 * @details Unknown keys are ignored; values of the wrong type are logged and
 * skipped. The result is sanitized.
 */
RainConfig applyJsonConfig(const RainConfig &base, const JsonValue &root);

/**
 * @brief Loads a JSON config file on top of the defaults
 * @return std::nullopt if the file cannot be read or parsed
 */
std::optional<RainConfig> loadRainConfig(const std::string &path);

} // namespace GlyphRain

#endif // RAIN_CONFIG_HPP
