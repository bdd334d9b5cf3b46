/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <cstdint>

namespace GlyphRain {

/**
 * TimestepManager turns frame-callback timestamps into simulation steps.
 *
 * Frame time comes from the caller (the FrameSource clock) rather than a
 * system clock, so a paused or throttled loop and a test-driven loop behave
 * the same. The delta handed to the simulation is clamped so a long gap
 * (suspended tab, debugger stop) never turns into one giant step.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Target frames per second (e.g., 60.0f)
     * @param maxStepSeconds Largest simulation step in seconds (e.g., 0.05f)
     */
    explicit TimestepManager(float targetFPS = 60.0f, float maxStepSeconds = 0.05f);

    /**
     * Call this at the start of each frame with the frame timestamp.
     * The first frame after construction or reset() yields a zero delta.
     * @param nowMs frame timestamp in milliseconds
     */
    void startFrame(double nowMs);

    /**
     * Gets the simulation delta for this frame, clamped to [0, maxStep].
     * @return delta time in seconds
     */
    float getDeltaTime() const;

    /**
     * Gets the unclamped time since the previous frame.
     * @return frame time in milliseconds
     */
    double getFrameTimeMs() const;

    /**
     * Get current measured FPS
     * @return current frames per second (EMA smoothed)
     */
    float getCurrentFPS() const;

    /**
     * Get target FPS
     * @return target frames per second
     */
    float getTargetFPS() const;

    /**
     * Check if the last frame exceeded target time significantly
     * @return true if frame time was more than twice the target
     */
    bool isFrameTimeExcessive() const;

    /**
     * Set new target FPS
     * @param fps new target frames per second
     */
    void setTargetFPS(float fps);

    /**
     * Set the largest simulation step
     * @param seconds new maximum step in seconds
     */
    void setMaxStep(float seconds);
    float getMaxStep() const { return m_maxStepSeconds; }

    /**
     * Reset timing state (call when resuming from pause)
     */
    void reset();

    uint64_t getFrameCount() const { return m_frameCount; }

private:
    // Timing configuration
    float m_targetFPS;                  // Target frames per second
    float m_targetFrameTimeMs;          // 1000 / targetFPS
    float m_maxStepSeconds;             // Delta clamp

    // Frame timing
    double m_lastFrameMs{0.0};
    double m_lastFrameTimeMs{0.0};      // Unclamped delta of the last frame
    float m_deltaSeconds{0.0f};         // Clamped delta of the last frame
    float m_currentFPS{0.0f};           // Current measured FPS (EMA smoothed)
    float m_smoothingAlpha{0.05f};      // EMA smoothing factor
    uint64_t m_frameCount{0};

    bool m_firstFrame{true};

    void updateFPS();
};

} // namespace GlyphRain

#endif // TIMESTEP_MANAGER_HPP
