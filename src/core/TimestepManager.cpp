/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <algorithm>
#include <cmath>

namespace GlyphRain {

TimestepManager::TimestepManager(float targetFPS, float maxStepSeconds)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f)
    , m_targetFrameTimeMs(1000.0f / m_targetFPS)
    , m_maxStepSeconds(maxStepSeconds > 0.0f ? maxStepSeconds : 0.05f)
{
}

void TimestepManager::startFrame(double nowMs) {
    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameMs = nowMs;
        m_lastFrameTimeMs = 0.0;
        m_deltaSeconds = 0.0f;
        ++m_frameCount;
        return;
    }

    // Timestamps are not guaranteed monotonic across hosts
    double deltaMs = nowMs - m_lastFrameMs;
    if (!std::isfinite(deltaMs) || deltaMs < 0.0) {
        deltaMs = 0.0;
    }
    m_lastFrameMs = nowMs;
    m_lastFrameTimeMs = deltaMs;

    const float deltaSeconds = static_cast<float>(deltaMs / 1000.0);
    m_deltaSeconds = std::min(deltaSeconds, m_maxStepSeconds);
    ++m_frameCount;

    updateFPS();
}

float TimestepManager::getDeltaTime() const {
    return m_deltaSeconds;
}

double TimestepManager::getFrameTimeMs() const {
    return m_lastFrameTimeMs;
}

float TimestepManager::getCurrentFPS() const {
    return m_currentFPS;
}

float TimestepManager::getTargetFPS() const {
    return m_targetFPS;
}

bool TimestepManager::isFrameTimeExcessive() const {
    // Consider frame time excessive if it's more than 2x target frame time
    return m_lastFrameTimeMs > static_cast<double>(m_targetFrameTimeMs) * 2.0;
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTimeMs = 1000.0f / fps;
    }
}

void TimestepManager::setMaxStep(float seconds) {
    if (seconds > 0.0f) {
        m_maxStepSeconds = seconds;
    }
}

void TimestepManager::reset() {
    m_firstFrame = true;
    m_lastFrameTimeMs = 0.0;
    m_deltaSeconds = 0.0f;
}

void TimestepManager::updateFPS() {
    if (m_lastFrameTimeMs <= 0.0) {
        return;
    }

    const float instantFPS = static_cast<float>(1000.0 / m_lastFrameTimeMs);
    if (m_currentFPS <= 0.0f) {
        // Seed the average with the first real measurement
        m_currentFPS = instantFPS;
    } else {
        m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
    }
}

} // namespace GlyphRain
