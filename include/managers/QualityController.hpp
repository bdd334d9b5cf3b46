/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef QUALITY_CONTROLLER_HPP
#define QUALITY_CONTROLLER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace GlyphRain {

class PerformanceMonitor;

enum class QualityLevel : uint8_t { High = 0, Medium = 1, Low = 2, Minimal = 3 };

std::string_view qualityLevelToString(QualityLevel level);

/**
 * @brief Simulation parameters bound to a quality level
 */
struct QualityParams {
  size_t maxDrops{1};
  size_t trailLength{3};
  bool glow{false};
};

/**
 * @brief Resolves a level against the configured ceiling and trail length
 * @details Caps are at least one drop; trails at least 3 cells and never above
 * the configured length
 */
QualityParams qualityParamsFor(QualityLevel level, size_t ceiling,
                               size_t configuredTrail);

struct QualityWarning {
  QualityLevel from{QualityLevel::High};
  QualityLevel to{QualityLevel::High};
  double avgFrameRate{0.0};
  double avgRenderTimeMs{0.0};
  std::string message;
};

/**
 * @brief Hysteresis state machine over the performance monitor
 *
 * evaluate() runs on the sampling cadence. Consecutive bad windows lead to a
 * one-level downgrade, a longer run of good windows to a one-level upgrade.
 * After each change the counters and the monitor window start over. Only
 * reset() may jump more than one level.
 */
class QualityController {
public:
  using LevelListener =
      std::function<void(QualityLevel from, QualityLevel to,
                         const QualityParams &params)>;
  using WarningListener = std::function<void(const QualityWarning &warning)>;

  QualityController(PerformanceMonitor &monitor, size_t ceiling,
                    size_t configuredTrail, uint32_t downgradeWindows = 3,
                    uint32_t upgradeWindows = 5);

  /**
   * @brief Classifies the current window and changes level when a run of
   * windows is long enough
   * @return true if the level changed
   */
  bool evaluate();

  /**
   * @brief Explicit hard reset; the only way to move more than one level
   */
  void reset(QualityLevel level = QualityLevel::High);

  QualityLevel getLevel() const { return m_level; }
  QualityParams getParams() const;

  void setLimits(size_t ceiling, size_t configuredTrail);
  void setHysteresis(uint32_t downgradeWindows, uint32_t upgradeWindows);

  /**
   * @brief When disabled evaluate() only observes and never changes level
   */
  void setAdaptive(bool adaptive) { m_adaptive = adaptive; }
  bool isAdaptive() const { return m_adaptive; }

  void setLevelListener(LevelListener listener) {
    m_levelListener = std::move(listener);
  }
  void setWarningListener(WarningListener listener) {
    m_warningListener = std::move(listener);
  }

  uint32_t getBadWindowCount() const { return m_badWindows; }
  uint32_t getGoodWindowCount() const { return m_goodWindows; }

private:
  void changeLevel(QualityLevel to, bool isDowngrade);
  void notifyLevel(QualityLevel from, QualityLevel to);

  PerformanceMonitor &m_monitor;
  QualityLevel m_level{QualityLevel::High};
  size_t m_ceiling;
  size_t m_configuredTrail;
  uint32_t m_downgradeWindows;
  uint32_t m_upgradeWindows;
  uint32_t m_badWindows{0};
  uint32_t m_goodWindows{0};
  bool m_adaptive{true};

  LevelListener m_levelListener;
  WarningListener m_warningListener;
};

} // namespace GlyphRain

#endif // QUALITY_CONTROLLER_HPP
