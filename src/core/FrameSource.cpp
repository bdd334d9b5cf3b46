/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/FrameSource.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace GlyphRain {

FrameHandle CooperativeFrameSource::requestFrame(FrameCallback callback) {
  if (!callback) {
    return INVALID_FRAME_HANDLE;
  }
  const FrameHandle handle = m_nextHandle++;
  m_frames.emplace(handle, std::move(callback));
  return handle;
}

void CooperativeFrameSource::cancelFrame(FrameHandle handle) {
  m_frames.erase(handle);
}

FrameHandle CooperativeFrameSource::startInterval(double intervalMs,
                                                  FrameCallback callback) {
  if (!callback || !(intervalMs > 0.0)) {
    return INVALID_FRAME_HANDLE;
  }
  const FrameHandle handle = m_nextHandle++;
  m_intervals.emplace(handle,
                      Interval{intervalMs, m_nowMs + intervalMs, std::move(callback)});
  return handle;
}

void CooperativeFrameSource::cancelInterval(FrameHandle handle) {
  m_intervals.erase(handle);
}

size_t CooperativeFrameSource::pump(double nowMs) {
  m_nowMs = std::max(m_nowMs, nowMs);
  size_t ran = 0;

  // Only frames requested before this pump are due
  std::vector<FrameHandle> due;
  due.reserve(m_frames.size());
  for (const auto &entry : m_frames) {
    due.push_back(entry.first);
  }
  for (FrameHandle handle : due) {
    auto it = m_frames.find(handle);
    if (it == m_frames.end()) {
      continue; // Cancelled by an earlier callback
    }
    FrameCallback callback = std::move(it->second);
    m_frames.erase(it);
    callback(m_nowMs);
    ++ran;
  }

  std::vector<FrameHandle> intervals;
  intervals.reserve(m_intervals.size());
  for (const auto &entry : m_intervals) {
    if (entry.second.nextDueMs <= m_nowMs) {
      intervals.push_back(entry.first);
    }
  }
  for (FrameHandle handle : intervals) {
    auto it = m_intervals.find(handle);
    if (it == m_intervals.end()) {
      continue;
    }
    // Skip missed periods rather than bursting to catch up
    Interval &interval = it->second;
    while (interval.nextDueMs <= m_nowMs) {
      interval.nextDueMs += interval.periodMs;
    }
    FrameCallback callback = interval.callback; // May cancel itself
    callback(m_nowMs);
    ++ran;
  }

  return ran;
}

} // namespace GlyphRain
