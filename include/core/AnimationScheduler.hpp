/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ANIMATION_SCHEDULER_HPP
#define ANIMATION_SCHEDULER_HPP

#include "core/FrameSource.hpp"
#include "core/TimestepManager.hpp"
#include <cstdint>
#include <functional>

namespace GlyphRain {

/**
 * @brief Reasons the loop is suspended; any set bit pauses it
 */
enum class PauseReason : uint8_t {
    DocumentHidden = 1 << 0,
    WindowBlurred = 1 << 1,
    ReducedMotion = 1 << 2,
    Disabled = 1 << 3       // Explicit disable; no ambient signal clears it
};

/**
 * AnimationScheduler drives the rain on a cooperative frame loop.
 *
 * Each tick runs the event, update and render handlers in that order and then
 * requests the next frame. A sampling interval runs alongside at a fixed
 * cadence. Both are registered with the FrameSource only while the loop is
 * started and not paused, so stop() or a pause leaves nothing scheduled.
 */
class AnimationScheduler {
public:
    // Callback function types
    using EventHandler = std::function<void()>;
    using UpdateHandler = std::function<void(float deltaTime, double nowMs)>;
    using RenderHandler = std::function<void()>;
    using SampleHandler = std::function<void(double nowMs)>;

    /**
     * Constructor
     * @param frameSource frame primitive; must outlive the scheduler
     * @param targetFPS target frames per second
     * @param maxStepSeconds largest delta handed to the update handler
     * @param sampleIntervalMs cadence of the sample handler
     */
    explicit AnimationScheduler(FrameSource& frameSource, float targetFPS = 60.0f,
                                float maxStepSeconds = 0.05f,
                                double sampleIntervalMs = 1000.0);

    /**
     * Destructor - cancels anything still registered with the frame source
     */
    ~AnimationScheduler();

    void setEventHandler(EventHandler handler);
    void setUpdateHandler(UpdateHandler handler);
    void setRenderHandler(RenderHandler handler);
    void setSampleHandler(SampleHandler handler);

    /**
     * Start the loop. Idempotent; the loop only runs once no pause reason
     * is set.
     */
    void start();

    /**
     * Stop the loop and cancel the pending frame and sampling interval.
     * Idempotent; a tick in progress completes but schedules nothing.
     */
    void stop();

    bool isStarted() const { return m_started; }

    /**
     * @return true when started, not paused and a frame is scheduled or
     * being processed
     */
    bool isRunning() const;

    /**
     * Set or clear one pause reason. Resuming resets the timestep so the
     * first delta after a pause is zero.
     */
    void setPauseReason(PauseReason reason, bool active);
    bool hasPauseReason(PauseReason reason) const;
    uint8_t getPauseReasons() const { return m_pauseReasons; }
    bool isPaused() const { return m_pauseReasons != 0; }

    void setSampleInterval(double intervalMs);
    double getSampleInterval() const { return m_sampleIntervalMs; }

    uint64_t getTickCount() const { return m_tickCount; }
    bool isInTick() const { return m_inTick; }

    float getCurrentFPS() const;
    TimestepManager& getTimestepManager() { return m_timestepManager; }
    const TimestepManager& getTimestepManager() const { return m_timestepManager; }

private:
    FrameSource& m_frameSource;
    TimestepManager m_timestepManager;
    double m_sampleIntervalMs;

    // Callback handlers
    EventHandler m_eventHandler;
    UpdateHandler m_updateHandler;
    RenderHandler m_renderHandler;
    SampleHandler m_sampleHandler;

    // Loop state
    bool m_started{false};
    bool m_inTick{false};
    uint8_t m_pauseReasons{0};
    FrameHandle m_frameHandle{INVALID_FRAME_HANDLE};
    FrameHandle m_intervalHandle{INVALID_FRAME_HANDLE};
    uint64_t m_tickCount{0};

    // Internal methods
    bool shouldRun() const { return m_started && m_pauseReasons == 0; }
    void tick(double nowMs);
    void sample(double nowMs);
    void scheduleFrame();
    void startSampling();
    void cancelScheduled();
    void applyRunState(bool wasRunning);

    // Exception-safe callback invocation
    void invokeEventHandler();
    void invokeUpdateHandler(float deltaTime, double nowMs);
    void invokeRenderHandler();

    // Prevent copying
    AnimationScheduler(const AnimationScheduler&) = delete;
    AnimationScheduler& operator=(const AnimationScheduler&) = delete;
};

} // namespace GlyphRain

#endif // ANIMATION_SCHEDULER_HPP
