/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PERFORMANCE_MONITOR_HPP
#define PERFORMANCE_MONITOR_HPP

#include <boost/circular_buffer.hpp>
#include <cstddef>
#include <cstdint>

namespace GlyphRain {

struct PerformanceSample {
  double timestampMs{0.0};
  double frameTimeMs{0.0};
  double frameRate{0.0};    // Instantaneous, 1000 / frameTimeMs
  double renderTimeMs{0.0};
  double memoryMB{0.0};
};

struct PerformanceSummary {
  double avgFrameRate{0.0};
  double avgFrameTimeMs{0.0};
  double avgRenderTimeMs{0.0};
  double maxRenderTimeMs{0.0};  // Since the last reset
  double memoryMB{0.0};         // Latest sample
  size_t droppedFrames{0};      // Frames over DROPPED_FRAME_MS in the window
  size_t sampleCount{0};
  bool windowFull{false};
};

/**
 * @brief Rolling window of per-frame timings with threshold checks
 *
 * The window holds the last N frames; once full the oldest sample is
 * evicted. Quality decisions only fire on a full window so a handful of slow
 * frames cannot trigger a downgrade.
 */
class PerformanceMonitor {
public:
  static constexpr double DROPPED_FRAME_MS = 20.0;

  explicit PerformanceMonitor(size_t windowSize = 60);

  void recordFrame(double nowMs, double frameTimeMs, double renderTimeMs,
                   double memoryMB);

  /**
   * @param lowFrameRate Below this average the window counts as bad
   * @param recoverFrameRate At or above this average the window counts as good
   * @param renderBudgetMs Average render time above this is bad
   */
  void setThresholds(float lowFrameRate, float recoverFrameRate,
                     float renderBudgetMs);

  /**
   * @brief Changes the window size; keeps the newest samples that fit
   */
  void setWindowSize(size_t windowSize);
  size_t getWindowSize() const { return m_samples.capacity(); }

  bool isWindowFull() const { return m_samples.full(); }
  size_t getSampleCount() const { return m_samples.size(); }

  double getAverageFrameRate() const;
  double getAverageFrameTime() const;
  double getAverageRenderTime() const;
  double getMaxRenderTime() const { return m_maxRenderTimeMs; }
  size_t getDroppedFrames() const;
  double getLatestMemoryMB() const;

  bool shouldReduceQuality() const;
  bool shouldIncreaseQuality() const;

  PerformanceSummary getSummary() const;

  /**
   * @brief Drops every sample and the render-time peak
   */
  void reset();

private:
  boost::circular_buffer<PerformanceSample> m_samples;
  double m_maxRenderTimeMs{0.0};
  float m_lowFrameRate{30.0f};
  float m_recoverFrameRate{55.0f};
  float m_renderBudgetMs{20.0f};
};

} // namespace GlyphRain

#endif // PERFORMANCE_MONITOR_HPP
