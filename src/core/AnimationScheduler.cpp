/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/AnimationScheduler.hpp"
#include "core/Logger.hpp"
#include <exception>
#include <format>
#include <string>
#include <utility>

namespace GlyphRain {

AnimationScheduler::AnimationScheduler(FrameSource& frameSource, float targetFPS,
                                       float maxStepSeconds, double sampleIntervalMs)
    : m_frameSource(frameSource)
    , m_timestepManager(targetFPS, maxStepSeconds)
    , m_sampleIntervalMs(sampleIntervalMs > 0.0 ? sampleIntervalMs : 1000.0) {
}

AnimationScheduler::~AnimationScheduler() {
    cancelScheduled();
}

void AnimationScheduler::setEventHandler(EventHandler handler) {
    m_eventHandler = std::move(handler);
}

void AnimationScheduler::setUpdateHandler(UpdateHandler handler) {
    m_updateHandler = std::move(handler);
}

void AnimationScheduler::setRenderHandler(RenderHandler handler) {
    m_renderHandler = std::move(handler);
}

void AnimationScheduler::setSampleHandler(SampleHandler handler) {
    m_sampleHandler = std::move(handler);
}

void AnimationScheduler::start() {
    if (m_started) {
        return;
    }
    const bool wasRunning = shouldRun();
    m_started = true;
    SCHEDULER_DEBUG("AnimationScheduler started");
    applyRunState(wasRunning);
}

void AnimationScheduler::stop() {
    if (!m_started) {
        return;
    }
    m_started = false;
    cancelScheduled();
    SCHEDULER_DEBUG(std::format("AnimationScheduler stopped after {} ticks", m_tickCount));
}

bool AnimationScheduler::isRunning() const {
    return shouldRun() && (m_inTick || m_frameHandle != INVALID_FRAME_HANDLE);
}

void AnimationScheduler::setPauseReason(PauseReason reason, bool active) {
    const bool wasRunning = shouldRun();
    const auto bit = static_cast<uint8_t>(reason);
    if (active) {
        m_pauseReasons |= bit;
    } else {
        m_pauseReasons &= static_cast<uint8_t>(~bit);
    }
    applyRunState(wasRunning);
}

bool AnimationScheduler::hasPauseReason(PauseReason reason) const {
    return (m_pauseReasons & static_cast<uint8_t>(reason)) != 0;
}

void AnimationScheduler::setSampleInterval(double intervalMs) {
    if (!(intervalMs > 0.0)) {
        SCHEDULER_WARN(std::format("Ignoring invalid sample interval {}ms", intervalMs));
        return;
    }
    m_sampleIntervalMs = intervalMs;
    if (m_intervalHandle != INVALID_FRAME_HANDLE) {
        m_frameSource.cancelInterval(m_intervalHandle);
        m_intervalHandle = INVALID_FRAME_HANDLE;
        startSampling();
    }
}

float AnimationScheduler::getCurrentFPS() const {
    return m_timestepManager.getCurrentFPS();
}

void AnimationScheduler::applyRunState(bool wasRunning) {
    const bool nowRunning = shouldRun();
    if (wasRunning == nowRunning) {
        return;
    }

    if (nowRunning) {
        // First delta after a pause is zero; no catch-up
        m_timestepManager.reset();
        SCHEDULER_DEBUG("Animation loop resumed");
        if (!m_inTick) {
            scheduleFrame();
        }
        startSampling();
    } else {
        SCHEDULER_DEBUG(std::format("Animation loop suspended (reasons: 0x{:02X})", m_pauseReasons));
        cancelScheduled();
    }
}

void AnimationScheduler::scheduleFrame() {
    if (m_frameHandle != INVALID_FRAME_HANDLE) {
        return;
    }
    m_frameHandle = m_frameSource.requestFrame([this](double nowMs) { tick(nowMs); });
    if (m_frameHandle == INVALID_FRAME_HANDLE) {
        SCHEDULER_ERROR("Frame source rejected frame request");
    }
}

void AnimationScheduler::startSampling() {
    if (m_intervalHandle != INVALID_FRAME_HANDLE) {
        return;
    }
    m_intervalHandle = m_frameSource.startInterval(
        m_sampleIntervalMs, [this](double nowMs) { sample(nowMs); });
    if (m_intervalHandle == INVALID_FRAME_HANDLE) {
        SCHEDULER_ERROR("Frame source rejected sampling interval");
    }
}

void AnimationScheduler::cancelScheduled() {
    if (m_frameHandle != INVALID_FRAME_HANDLE) {
        m_frameSource.cancelFrame(m_frameHandle);
        m_frameHandle = INVALID_FRAME_HANDLE;
    }
    if (m_intervalHandle != INVALID_FRAME_HANDLE) {
        m_frameSource.cancelInterval(m_intervalHandle);
        m_intervalHandle = INVALID_FRAME_HANDLE;
    }
}

void AnimationScheduler::tick(double nowMs) {
    // The frame that invoked us has fired
    m_frameHandle = INVALID_FRAME_HANDLE;
    if (!shouldRun()) {
        return;
    }

    m_inTick = true;
    m_timestepManager.startFrame(nowMs);

    // Events first, then simulate, then paint
    invokeEventHandler();
    invokeUpdateHandler(m_timestepManager.getDeltaTime(), nowMs);
    invokeRenderHandler();

    ++m_tickCount;
    m_inTick = false;

    // Stop or pause during the tick leaves nothing scheduled
    if (shouldRun()) {
        scheduleFrame();
    }
}

void AnimationScheduler::sample(double nowMs) {
    if (!m_sampleHandler) {
        return;
    }
    try {
        m_sampleHandler(nowMs);
    } catch (const std::exception& e) {
        SCHEDULER_ERROR("Exception in sample handler: " + std::string(e.what()));
    }
}

void AnimationScheduler::invokeEventHandler() {
    if (m_eventHandler) {
        try {
            m_eventHandler();
        } catch (const std::exception& e) {
            SCHEDULER_ERROR("Exception in event handler: " + std::string(e.what()));
        }
    }
}

void AnimationScheduler::invokeUpdateHandler(float deltaTime, double nowMs) {
    if (m_updateHandler) {
        try {
            m_updateHandler(deltaTime, nowMs);
        } catch (const std::exception& e) {
            SCHEDULER_ERROR("Exception in update handler: " + std::string(e.what()));
        }
    }
}

void AnimationScheduler::invokeRenderHandler() {
    if (m_renderHandler) {
        try {
            m_renderHandler();
        } catch (const std::exception& e) {
            SCHEDULER_ERROR("Exception in render handler: " + std::string(e.what()));
        }
    }
}

} // namespace GlyphRain
