/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/QualityController.hpp"
#include "core/Logger.hpp"
#include "utils/PerformanceMonitor.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <format>

namespace GlyphRain {

namespace {

struct LevelFractions {
  double drops;
  double trail;
  bool glow;
};

constexpr std::array<LevelFractions, 4> LEVEL_TABLE = {{
    {1.0, 1.0, true},   // High
    {0.5, 0.67, true},  // Medium
    {0.25, 0.5, false}, // Low
    {0.1, 0.4, false},  // Minimal
}};

constexpr size_t MIN_TRAIL = 3;

QualityLevel lowerLevel(QualityLevel level) {
  return level == QualityLevel::Minimal
             ? level
             : static_cast<QualityLevel>(static_cast<uint8_t>(level) + 1);
}

QualityLevel higherLevel(QualityLevel level) {
  return level == QualityLevel::High
             ? level
             : static_cast<QualityLevel>(static_cast<uint8_t>(level) - 1);
}

} // namespace

std::string_view qualityLevelToString(QualityLevel level) {
  switch (level) {
  case QualityLevel::High: return "high";
  case QualityLevel::Medium: return "medium";
  case QualityLevel::Low: return "low";
  case QualityLevel::Minimal: return "minimal";
  default: return "unknown";
  }
}

QualityParams qualityParamsFor(QualityLevel level, size_t ceiling,
                               size_t configuredTrail) {
  const auto &row = LEVEL_TABLE[static_cast<size_t>(level)];
  const size_t trailCap = std::max<size_t>(configuredTrail, 1);

  QualityParams params;
  params.maxDrops = std::clamp<size_t>(
      static_cast<size_t>(std::lround(static_cast<double>(ceiling) * row.drops)),
      1, std::max<size_t>(ceiling, 1));
  params.trailLength = std::clamp<size_t>(
      static_cast<size_t>(std::lround(static_cast<double>(trailCap) * row.trail)),
      std::min(MIN_TRAIL, trailCap), trailCap);
  params.glow = row.glow;
  return params;
}

QualityController::QualityController(PerformanceMonitor &monitor,
                                     size_t ceiling, size_t configuredTrail,
                                     uint32_t downgradeWindows,
                                     uint32_t upgradeWindows)
    : m_monitor(monitor), m_ceiling(ceiling), m_configuredTrail(configuredTrail),
      m_downgradeWindows(std::max<uint32_t>(downgradeWindows, 1)),
      m_upgradeWindows(std::max(upgradeWindows, m_downgradeWindows + 1)) {}

QualityParams QualityController::getParams() const {
  return qualityParamsFor(m_level, m_ceiling, m_configuredTrail);
}

void QualityController::setLimits(size_t ceiling, size_t configuredTrail) {
  m_ceiling = ceiling;
  m_configuredTrail = configuredTrail;
}

void QualityController::setHysteresis(uint32_t downgradeWindows,
                                      uint32_t upgradeWindows) {
  m_downgradeWindows = std::max<uint32_t>(downgradeWindows, 1);
  m_upgradeWindows = std::max(upgradeWindows, m_downgradeWindows + 1);
  m_badWindows = 0;
  m_goodWindows = 0;
}

bool QualityController::evaluate() {
  // A partial window carries no evidence either way
  if (!m_monitor.isWindowFull()) {
    return false;
  }

  if (m_monitor.shouldReduceQuality()) {
    ++m_badWindows;
    m_goodWindows = 0;
  } else if (m_monitor.shouldIncreaseQuality()) {
    ++m_goodWindows;
    m_badWindows = 0;
  } else {
    m_badWindows = 0;
    m_goodWindows = 0;
  }

  if (!m_adaptive) {
    return false;
  }

  if (m_badWindows >= m_downgradeWindows && m_level != QualityLevel::Minimal) {
    changeLevel(lowerLevel(m_level), true);
    return true;
  }
  if (m_goodWindows >= m_upgradeWindows && m_level != QualityLevel::High) {
    changeLevel(higherLevel(m_level), false);
    return true;
  }
  return false;
}

void QualityController::reset(QualityLevel level) {
  const QualityLevel from = m_level;
  m_level = level;
  m_badWindows = 0;
  m_goodWindows = 0;
  m_monitor.reset();

  QUALITY_INFO(std::format("Quality reset: {} -> {}", qualityLevelToString(from),
                           qualityLevelToString(level)));
  notifyLevel(from, level);
}

void QualityController::changeLevel(QualityLevel to, bool isDowngrade) {
  const QualityLevel from = m_level;
  const double avgFrameRate = m_monitor.getAverageFrameRate();
  const double avgRenderTime = m_monitor.getAverageRenderTime();

  m_level = to;
  m_badWindows = 0;
  m_goodWindows = 0;
  m_monitor.reset();

  QUALITY_INFO(std::format("Quality {}: {} -> {} ({:.1f} fps, {:.2f}ms render)",
                           isDowngrade ? "downgraded" : "upgraded",
                           qualityLevelToString(from), qualityLevelToString(to),
                           avgFrameRate, avgRenderTime));

  notifyLevel(from, to);

  if (isDowngrade && m_warningListener) {
    QualityWarning warning;
    warning.from = from;
    warning.to = to;
    warning.avgFrameRate = avgFrameRate;
    warning.avgRenderTimeMs = avgRenderTime;
    warning.message = std::format(
        "Rain quality reduced to {} (average {:.0f} fps)",
        qualityLevelToString(to), avgFrameRate);
    try {
      m_warningListener(warning);
    } catch (const std::exception &e) {
      QUALITY_ERROR(std::format("Exception in quality warning listener: {}",
                                e.what()));
    }
  }
}

void QualityController::notifyLevel(QualityLevel from, QualityLevel to) {
  if (!m_levelListener) {
    return;
  }
  try {
    m_levelListener(from, to, getParams());
  } catch (const std::exception &e) {
    QUALITY_ERROR(std::format("Exception in quality level listener: {}",
                              e.what()));
  }
}

} // namespace GlyphRain
