/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FRAME_SOURCE_HPP
#define FRAME_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace GlyphRain {

using FrameHandle = uint64_t;
constexpr FrameHandle INVALID_FRAME_HANDLE = 0;

using FrameCallback = std::function<void(double nowMs)>;

/**
 * @brief Frame-callback primitive the animation scheduler runs on
 *
 * requestFrame() schedules a one-shot callback for the next frame,
 * startInterval() a repeating callback on a fixed cadence. Cancelling an
 * unknown or already fired handle is a no-op.
 */
class FrameSource {
public:
  virtual ~FrameSource() = default;

  virtual FrameHandle requestFrame(FrameCallback callback) = 0;
  virtual void cancelFrame(FrameHandle handle) = 0;

  virtual FrameHandle startInterval(double intervalMs, FrameCallback callback) = 0;
  virtual void cancelInterval(FrameHandle handle) = 0;

  /**
   * @brief Current time in milliseconds on the source's clock
   */
  virtual double now() const = 0;
};

/**
 * @brief Single-threaded FrameSource driven by explicit pump() calls
 *
 * The host loop (or a test) calls pump(nowMs) once per display frame. Frame
 * callbacks requested during a pump run on the next pump.
 */
class CooperativeFrameSource : public FrameSource {
public:
  explicit CooperativeFrameSource(double startMs = 0.0) : m_nowMs(startMs) {}

  FrameHandle requestFrame(FrameCallback callback) override;
  void cancelFrame(FrameHandle handle) override;

  FrameHandle startInterval(double intervalMs, FrameCallback callback) override;
  void cancelInterval(FrameHandle handle) override;

  double now() const override { return m_nowMs; }

  /**
   * @brief Advances the clock, runs pending frame callbacks, then every due
   * interval (at most once each per pump)
   * @return Number of callbacks run
   */
  size_t pump(double nowMs);

  size_t getPendingFrameCount() const { return m_frames.size(); }
  size_t getActiveIntervalCount() const { return m_intervals.size(); }

private:
  struct Interval {
    double periodMs{0.0};
    double nextDueMs{0.0};
    FrameCallback callback;
  };

  // Ordered maps keep callbacks in request order
  std::map<FrameHandle, FrameCallback> m_frames;
  std::map<FrameHandle, Interval> m_intervals;
  FrameHandle m_nextHandle{1};
  double m_nowMs;
};

} // namespace GlyphRain

#endif // FRAME_SOURCE_HPP
