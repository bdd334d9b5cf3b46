/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/RainConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <format>
#include <limits>
#include <utility>
#include <vector>

namespace GlyphRain {

namespace {

constexpr size_t kindIndex(RainEventKind kind) {
  return static_cast<size_t>(kind);
}

bool isPositive(float value) { return std::isfinite(value) && value > 0.0f; }
bool isPositive(double value) { return std::isfinite(value) && value > 0.0; }

template <typename T>
void replaceIfInvalid(T &value, T fallback, bool valid, const char *name) {
  if (!valid) {
    CONFIG_WARN(std::format("Invalid value for '{}', using default", name));
    value = fallback;
  }
}

// Typed readers; a present key with the wrong type is logged and skipped
void readFloat(const JsonValue &root, const char *key, float &out) {
  if (!root.hasKey(key))
    return;
  if (auto number = root[key].tryAsNumber()) {
    out = static_cast<float>(*number);
  } else {
    CONFIG_WARN(std::format("Key '{}' must be a number", key));
  }
}

void readDouble(const JsonValue &root, const char *key, double &out) {
  if (!root.hasKey(key))
    return;
  if (auto number = root[key].tryAsNumber()) {
    out = *number;
  } else {
    CONFIG_WARN(std::format("Key '{}' must be a number", key));
  }
}

template <typename T>
void readCount(const JsonValue &root, const char *key, T &out) {
  if (!root.hasKey(key))
    return;
  auto number = root[key].tryAsNumber();
  if (!number || !std::isfinite(*number) || *number < 0.0) {
    CONFIG_WARN(std::format("Key '{}' must be a non-negative number", key));
    return;
  }
  // Doubles past the target range would make the cast undefined
  constexpr T limit = std::numeric_limits<T>::max();
  if (*number >= static_cast<double>(limit)) {
    out = limit;
    return;
  }
  out = static_cast<T>(*number);
}

bool inCountRange(size_t value, size_t limit) {
  return value > 0 && value <= limit;
}

void readBool(const JsonValue &root, const char *key, bool &out) {
  if (!root.hasKey(key))
    return;
  if (auto flag = root[key].tryAsBool()) {
    out = *flag;
  } else {
    CONFIG_WARN(std::format("Key '{}' must be a boolean", key));
  }
}

std::optional<uint32_t> readColor(const JsonValue &node, const char *key) {
  if (!node.hasKey(key))
    return std::nullopt;
  auto text = node[key].tryAsString();
  if (!text) {
    CONFIG_WARN(std::format("Color '{}' must be a string", key));
    return std::nullopt;
  }
  auto color = parseHexColor(*text);
  if (!color) {
    CONFIG_WARN(std::format("Color '{}' has invalid value '{}'", key, *text));
  }
  return color;
}

// A kind override may be a single color (head and trail derived) or
// an object {head, trail}
void readKindOverride(const JsonValue &palette, const char *key,
                      RainEventKind kind, RainPalette &out) {
  if (!palette.hasKey(key))
    return;

  const JsonValue &node = palette[key];
  if (node.isObject()) {
    DropColors colors = out.colorsFor(kind);
    if (auto head = readColor(node, "head"))
      colors.head = *head;
    if (auto trail = readColor(node, "trail"))
      colors.trail = *trail;
    out.kindOverrides[kindIndex(kind)] = colors;
    return;
  }

  if (auto color = readColor(palette, key)) {
    out.kindOverrides[kindIndex(kind)] = DropColors{*color, *color};
  }
}

// "spectrum": ["#ff0000", ...]; an empty array turns the spectrum off
void readSpectrum(const JsonValue &palette, RainPalette &out) {
  if (!palette.hasKey("spectrum"))
    return;
  const JsonValue &node = palette["spectrum"];
  if (!node.isArray()) {
    CONFIG_WARN("Key 'spectrum' must be an array of colors");
    return;
  }

  std::vector<uint32_t> colors;
  for (size_t i = 0; i < node.size(); ++i) {
    auto text = node[i].tryAsString();
    auto color = text ? parseHexColor(*text) : std::nullopt;
    if (!color) {
      CONFIG_WARN(std::format("Spectrum entry {} is not a color, ignoring the spectrum", i));
      return;
    }
    colors.push_back(*color);
  }
  out.spectrum = std::move(colors);
}

} // namespace

DropColors RainPalette::colorsFor(RainEventKind kind) const {
  const size_t index = kindIndex(kind);
  if (index < kindOverrides.size() && kindOverrides[index]) {
    return *kindOverrides[index];
  }
  return ambient;
}

RainPalette RainPalette::classic() {
  RainPalette palette;
  palette.kindOverrides[kindIndex(RainEventKind::Error)] =
      DropColors{makeColor(0xFF, 0x30, 0x30), makeColor(0xFF, 0x60, 0x60)};
  palette.kindOverrides[kindIndex(RainEventKind::Complete)] =
      DropColors{makeColor(0x00, 0xFF, 0xAA), makeColor(0x00, 0xAA, 0x55)};
  palette.kindOverrides[kindIndex(RainEventKind::Spawn)] =
      DropColors{makeColor(0x00, 0xAA, 0xFF), makeColor(0x00, 0x88, 0xCC)};
  palette.kindOverrides[kindIndex(RainEventKind::Start)] =
      DropColors{makeColor(0xFF, 0xAA, 0x00), makeColor(0x00, 0xFF, 0x00)};
  palette.kindOverrides[kindIndex(RainEventKind::Pending)] =
      DropColors{makeColor(0xAA, 0xAA, 0x00), makeColor(0x00, 0xFF, 0x00)};
  return palette;
}

DropColors RainPalette::spectrumColors(uint32_t column) const {
  if (spectrum.empty()) {
    return ambient;
  }
  const size_t index = column % spectrum.size();
  return DropColors{spectrum[index], spectrum[(index + 1) % spectrum.size()]};
}

RainPalette RainPalette::rainbow() {
  RainPalette palette = classic();
  palette.ambient = DropColors{makeColor(0xFF, 0x00, 0x00), makeColor(0xFF, 0x88, 0x00)};
  palette.spectrum = {makeColor(0xFF, 0x00, 0x00), makeColor(0xFF, 0x88, 0x00),
                      makeColor(0xFF, 0xFF, 0x00), makeColor(0x00, 0xFF, 0x00),
                      makeColor(0x00, 0x88, 0xFF), makeColor(0x88, 0x00, 0xFF)};
  return palette;
}

std::optional<RainPreset> presetFromString(std::string_view name) {
  if (name == "classic") return RainPreset::Classic;
  if (name == "performance") return RainPreset::Performance;
  if (name == "quality") return RainPreset::Quality;
  if (name == "minimal") return RainPreset::Minimal;
  if (name == "rainbow") return RainPreset::Rainbow;
  return std::nullopt;
}

RainConfig RainConfig::sanitized() const {
  const RainConfig defaults{};
  RainConfig out = *this;

  replaceIfInvalid(out.columnDensity, defaults.columnDensity,
                   isPositive(out.columnDensity), "columnDensity");
  replaceIfInvalid(out.cellHeight, defaults.cellHeight,
                   isPositive(out.cellHeight), "cellHeight");
  replaceIfInvalid(out.fontSize, defaults.fontSize, isPositive(out.fontSize),
                   "fontSize");
  replaceIfInvalid(out.bottomMargin, defaults.bottomMargin,
                   std::isfinite(out.bottomMargin) && out.bottomMargin >= 0.0f,
                   "bottomMargin");
  replaceIfInvalid(out.glowIntensity, defaults.glowIntensity,
                   std::isfinite(out.glowIntensity) &&
                       out.glowIntensity >= 0.0f && out.glowIntensity <= 1.0f,
                   "glowIntensity");
  replaceIfInvalid(out.fadeAlpha, defaults.fadeAlpha,
                   std::isfinite(out.fadeAlpha) && out.fadeAlpha > 0.0f &&
                       out.fadeAlpha <= 1.0f,
                   "fadeAlpha");

  // Speed range is replaced as a pair so min <= max always holds
  if (!isPositive(out.minSpeed) || !isPositive(out.maxSpeed) ||
      out.minSpeed > out.maxSpeed) {
    CONFIG_WARN("Invalid value for 'speedRange', using default");
    out.minSpeed = defaults.minSpeed;
    out.maxSpeed = defaults.maxSpeed;
  }

  replaceIfInvalid(out.spawnRate, defaults.spawnRate,
                   std::isfinite(out.spawnRate) && out.spawnRate >= 0.0f,
                   "spawnRate");
  replaceIfInvalid(out.maxStepSeconds, defaults.maxStepSeconds,
                   isPositive(out.maxStepSeconds), "maxStepSeconds");
  replaceIfInvalid(out.columnCooldownMs, defaults.columnCooldownMs,
                   std::isfinite(out.columnCooldownMs) &&
                       out.columnCooldownMs >= 0.0,
                   "columnCooldownMs");

  replaceIfInvalid(out.maxDrops, defaults.maxDrops,
                   inCountRange(out.maxDrops, MAX_DROPS_LIMIT), "maxDrops");
  replaceIfInvalid(out.trailLength, defaults.trailLength,
                   inCountRange(out.trailLength, MAX_TRAIL_LENGTH),
                   "trailLength");
  replaceIfInvalid(out.maxSpawnsPerTick, defaults.maxSpawnsPerTick,
                   inCountRange(out.maxSpawnsPerTick, MAX_SPAWNS_PER_TICK),
                   "maxSpawnsPerTick");
  replaceIfInvalid(out.maxPendingEvents, defaults.maxPendingEvents,
                   inCountRange(out.maxPendingEvents, MAX_PENDING_EVENTS),
                   "maxPendingEvents");
  replaceIfInvalid(out.memoryLimitMB, defaults.memoryLimitMB,
                   isPositive(out.memoryLimitMB), "memoryLimitMB");

  replaceIfInvalid(out.targetFPS, defaults.targetFPS, isPositive(out.targetFPS),
                   "targetFPS");
  replaceIfInvalid(out.sampleIntervalMs, defaults.sampleIntervalMs,
                   isPositive(out.sampleIntervalMs), "sampleIntervalMs");
  replaceIfInvalid(out.performanceWindow, defaults.performanceWindow,
                   inCountRange(out.performanceWindow, MAX_PERFORMANCE_WINDOW),
                   "performanceWindow");
  replaceIfInvalid(out.renderBudgetMs, defaults.renderBudgetMs,
                   isPositive(out.renderBudgetMs), "renderBudgetMs");

  if (!isPositive(out.lowFrameRate) || !isPositive(out.recoverFrameRate) ||
      out.lowFrameRate >= out.recoverFrameRate) {
    CONFIG_WARN("Invalid frame rate thresholds, using defaults");
    out.lowFrameRate = defaults.lowFrameRate;
    out.recoverFrameRate = defaults.recoverFrameRate;
  }

  // Upgrades need strictly more evidence than downgrades
  if (out.downgradeWindows == 0 || out.upgradeWindows <= out.downgradeWindows ||
      out.upgradeWindows > MAX_QUALITY_WINDOWS) {
    CONFIG_WARN("Invalid quality hysteresis windows, using defaults");
    out.downgradeWindows = defaults.downgradeWindows;
    out.upgradeWindows = defaults.upgradeWindows;
  }

  replaceIfInvalid(out.transitionMs, defaults.transitionMs,
                   std::isfinite(out.transitionMs) && out.transitionMs >= 0.0,
                   "transitionMs");

  return out;
}

RainConfig RainConfig::fromPreset(RainPreset preset) {
  RainConfig config{};
  switch (preset) {
  case RainPreset::Performance:
    config.maxDrops = 500;
    config.trailLength = 8;
    config.glowIntensity = 0.3f;
    config.adaptiveQuality = true;
    break;
  case RainPreset::Quality:
    config.maxDrops = 2000;
    config.trailLength = 20;
    config.glowIntensity = 1.0f;
    config.targetFPS = 120.0f;
    break;
  case RainPreset::Minimal:
    config.maxDrops = 100;
    config.trailLength = 5;
    config.glowIntensity = 0.0f;
    config.spawnRate = 0.1f;
    break;
  case RainPreset::Rainbow:
    config.palette = RainPalette::rainbow();
    break;
  case RainPreset::Classic:
  default:
    break;
  }
  return config;
}

RainConfig applyJsonConfig(const RainConfig &base, const JsonValue &root) {
  RainConfig config = base;
  if (!root.isObject()) {
    CONFIG_WARN("Config root is not an object, keeping current values");
    return config.sanitized();
  }

  // A preset, when present, replaces the base before the other keys apply
  if (root.hasKey("preset")) {
    auto name = root["preset"].tryAsString();
    auto preset = name ? presetFromString(*name) : std::nullopt;
    if (preset) {
      config = RainConfig::fromPreset(*preset);
    } else {
      CONFIG_WARN("Unknown preset, ignoring");
    }
  }

  readFloat(root, "columnDensity", config.columnDensity);
  readFloat(root, "cellHeight", config.cellHeight);
  readFloat(root, "fontSize", config.fontSize);
  readFloat(root, "bottomMargin", config.bottomMargin);

  if (root.hasKey("characterSet")) {
    auto name = root["characterSet"].tryAsString();
    auto set = name ? characterSetFromString(*name) : std::nullopt;
    if (set) {
      config.characterSet = *set;
    } else {
      CONFIG_WARN("Unknown characterSet, keeping current value");
    }
  }
  if (root.hasKey("customGlyphs")) {
    if (auto glyphs = root["customGlyphs"].tryAsString()) {
      config.customGlyphs = *glyphs;
    } else {
      CONFIG_WARN("Key 'customGlyphs' must be a string");
    }
  }

  if (root.hasKey("speedRange")) {
    const JsonValue &range = root["speedRange"];
    auto low = range[0].tryAsNumber();
    auto high = range[1].tryAsNumber();
    if (range.isArray() && range.size() == 2 && low && high) {
      config.minSpeed = static_cast<float>(*low);
      config.maxSpeed = static_cast<float>(*high);
    } else {
      CONFIG_WARN("Key 'speedRange' must be [min, max]");
    }
  }

  if (root.hasKey("palette")) {
    const JsonValue &palette = root["palette"];
    if (palette.isObject()) {
      if (auto head = readColor(palette, "head"))
        config.palette.ambient.head = *head;
      if (auto trail = readColor(palette, "trail"))
        config.palette.ambient.trail = *trail;
      if (auto background = readColor(palette, "background"))
        config.palette.background = *background;
      readKindOverride(palette, "start", RainEventKind::Start, config.palette);
      readKindOverride(palette, "progress", RainEventKind::Progress,
                       config.palette);
      readKindOverride(palette, "pending", RainEventKind::Pending,
                       config.palette);
      readKindOverride(palette, "complete", RainEventKind::Complete,
                       config.palette);
      readKindOverride(palette, "error", RainEventKind::Error, config.palette);
      readKindOverride(palette, "spawn", RainEventKind::Spawn, config.palette);
      readSpectrum(palette, config.palette);
    } else {
      CONFIG_WARN("Key 'palette' must be an object");
    }
  }

  readFloat(root, "glowIntensity", config.glowIntensity);
  readFloat(root, "fadeAlpha", config.fadeAlpha);
  readFloat(root, "spawnRate", config.spawnRate);
  readFloat(root, "maxStepSeconds", config.maxStepSeconds);
  readDouble(root, "columnCooldownMs", config.columnCooldownMs);

  readCount(root, "maxDrops", config.maxDrops);
  readCount(root, "trailLength", config.trailLength);
  readCount(root, "maxSpawnsPerTick", config.maxSpawnsPerTick);
  readCount(root, "maxPendingEvents", config.maxPendingEvents);
  readDouble(root, "memoryLimitMB", config.memoryLimitMB);

  readFloat(root, "targetFPS", config.targetFPS);
  readBool(root, "adaptiveQuality", config.adaptiveQuality);
  readDouble(root, "sampleIntervalMs", config.sampleIntervalMs);
  readCount(root, "performanceWindow", config.performanceWindow);
  readFloat(root, "lowFrameRate", config.lowFrameRate);
  readFloat(root, "recoverFrameRate", config.recoverFrameRate);
  readFloat(root, "renderBudgetMs", config.renderBudgetMs);
  readCount(root, "downgradeWindows", config.downgradeWindows);
  readCount(root, "upgradeWindows", config.upgradeWindows);

  readDouble(root, "transitionMs", config.transitionMs);

  return config.sanitized();
}

std::optional<RainConfig> loadRainConfig(const std::string &path) {
  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    CONFIG_ERROR(std::format("Failed to load config '{}': {}", path,
                             reader.getLastError()));
    return std::nullopt;
  }

  CONFIG_INFO(std::format("Loaded config from {}", path));
  return applyJsonConfig(RainConfig{}, reader.getRoot());
}

} // namespace GlyphRain
