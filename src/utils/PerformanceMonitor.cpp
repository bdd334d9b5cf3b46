/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/PerformanceMonitor.hpp"
#include <algorithm>
#include <cmath>

namespace GlyphRain {

PerformanceMonitor::PerformanceMonitor(size_t windowSize)
    : m_samples(std::max<size_t>(windowSize, 1)) {}

void PerformanceMonitor::recordFrame(double nowMs, double frameTimeMs,
                                     double renderTimeMs, double memoryMB) {
  PerformanceSample sample;
  sample.timestampMs = nowMs;
  sample.frameTimeMs = std::isfinite(frameTimeMs) ? std::max(frameTimeMs, 0.0) : 0.0;
  sample.frameRate = sample.frameTimeMs > 0.0 ? 1000.0 / sample.frameTimeMs : 0.0;
  sample.renderTimeMs = std::isfinite(renderTimeMs) ? std::max(renderTimeMs, 0.0) : 0.0;
  sample.memoryMB = std::isfinite(memoryMB) ? std::max(memoryMB, 0.0) : 0.0;

  m_maxRenderTimeMs = std::max(m_maxRenderTimeMs, sample.renderTimeMs);
  m_samples.push_back(sample);
}

void PerformanceMonitor::setThresholds(float lowFrameRate,
                                       float recoverFrameRate,
                                       float renderBudgetMs) {
  m_lowFrameRate = lowFrameRate;
  m_recoverFrameRate = recoverFrameRate;
  m_renderBudgetMs = renderBudgetMs;
}

void PerformanceMonitor::setWindowSize(size_t windowSize) {
  m_samples.rset_capacity(std::max<size_t>(windowSize, 1));
}

double PerformanceMonitor::getAverageFrameTime() const {
  if (m_samples.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto &sample : m_samples) {
    total += sample.frameTimeMs;
  }
  return total / static_cast<double>(m_samples.size());
}

double PerformanceMonitor::getAverageFrameRate() const {
  // Derived from the mean frame time so one tiny frame cannot skew it
  const double avgFrameTime = getAverageFrameTime();
  return avgFrameTime > 0.0 ? 1000.0 / avgFrameTime : 0.0;
}

double PerformanceMonitor::getAverageRenderTime() const {
  if (m_samples.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto &sample : m_samples) {
    total += sample.renderTimeMs;
  }
  return total / static_cast<double>(m_samples.size());
}

size_t PerformanceMonitor::getDroppedFrames() const {
  return static_cast<size_t>(std::count_if(
      m_samples.begin(), m_samples.end(), [](const PerformanceSample &s) {
        return s.frameTimeMs > DROPPED_FRAME_MS;
      }));
}

double PerformanceMonitor::getLatestMemoryMB() const {
  return m_samples.empty() ? 0.0 : m_samples.back().memoryMB;
}

bool PerformanceMonitor::shouldReduceQuality() const {
  if (!isWindowFull()) {
    return false;
  }
  return getAverageFrameRate() < m_lowFrameRate ||
         getAverageRenderTime() > m_renderBudgetMs;
}

bool PerformanceMonitor::shouldIncreaseQuality() const {
  if (!isWindowFull()) {
    return false;
  }
  return getAverageFrameRate() >= m_recoverFrameRate &&
         getAverageRenderTime() <= m_renderBudgetMs;
}

PerformanceSummary PerformanceMonitor::getSummary() const {
  PerformanceSummary summary;
  summary.avgFrameRate = getAverageFrameRate();
  summary.avgFrameTimeMs = getAverageFrameTime();
  summary.avgRenderTimeMs = getAverageRenderTime();
  summary.maxRenderTimeMs = m_maxRenderTimeMs;
  summary.memoryMB = getLatestMemoryMB();
  summary.droppedFrames = getDroppedFrames();
  summary.sampleCount = m_samples.size();
  summary.windowFull = isWindowFull();
  return summary;
}

void PerformanceMonitor::reset() {
  m_samples.clear();
  m_maxRenderTimeMs = 0.0;
}

} // namespace GlyphRain
