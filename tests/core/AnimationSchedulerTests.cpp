/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AnimationSchedulerTests
#include <boost/test/unit_test.hpp>

#include "core/AnimationScheduler.hpp"
#include "core/FrameSource.hpp"
#include "core/TimestepManager.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace GlyphRain;

constexpr double FRAME_MS = 1000.0 / 60.0;

// ============================================================================
// FRAME SOURCE TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(CooperativeFrameSourceTests)

BOOST_AUTO_TEST_CASE(TestFrameRunsOncePerRequest) {
    CooperativeFrameSource source;
    int calls = 0;
    double seenNow = -1.0;
    FrameHandle handle = source.requestFrame([&](double nowMs) {
        ++calls;
        seenNow = nowMs;
    });
    BOOST_CHECK_NE(handle, INVALID_FRAME_HANDLE);
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 1);

    BOOST_CHECK_EQUAL(source.pump(16.0), 1);
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK_EQUAL(seenNow, 16.0);
    BOOST_CHECK_EQUAL(source.pump(32.0), 0);
    BOOST_CHECK_EQUAL(calls, 1);
}

BOOST_AUTO_TEST_CASE(TestCancelledFrameDoesNotRun) {
    CooperativeFrameSource source;
    int calls = 0;
    FrameHandle handle = source.requestFrame([&](double) { ++calls; });
    source.cancelFrame(handle);
    source.cancelFrame(handle);         // Already cancelled: no-op
    source.cancelFrame(12345);          // Unknown: no-op
    BOOST_CHECK_EQUAL(source.pump(16.0), 0);
    BOOST_CHECK_EQUAL(calls, 0);
}

BOOST_AUTO_TEST_CASE(TestFrameRequestedDuringPumpRunsNextPump) {
    CooperativeFrameSource source;
    int calls = 0;
    std::function<void(double)> reRequest = [&](double) {
        ++calls;
        source.requestFrame(reRequest);
    };
    source.requestFrame(reRequest);

    source.pump(16.0);
    BOOST_CHECK_EQUAL(calls, 1);
    source.pump(32.0);
    BOOST_CHECK_EQUAL(calls, 2);
}

BOOST_AUTO_TEST_CASE(TestIntervalCadence) {
    CooperativeFrameSource source(0.0);
    std::vector<double> fired;
    FrameHandle handle = source.startInterval(1000.0, [&](double nowMs) { fired.push_back(nowMs); });
    BOOST_CHECK_EQUAL(source.getActiveIntervalCount(), 1);

    source.pump(500.0);
    BOOST_CHECK(fired.empty());
    source.pump(1000.0);
    BOOST_CHECK_EQUAL(fired.size(), 1);

    // A long stall fires once, not once per missed period
    source.pump(4500.0);
    BOOST_CHECK_EQUAL(fired.size(), 2);
    source.pump(4900.0);
    BOOST_CHECK_EQUAL(fired.size(), 2);
    source.pump(5000.0);
    BOOST_CHECK_EQUAL(fired.size(), 3);

    source.cancelInterval(handle);
    source.pump(10000.0);
    BOOST_CHECK_EQUAL(fired.size(), 3);
    BOOST_CHECK_EQUAL(source.getActiveIntervalCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestInvalidRequestsRejected) {
    CooperativeFrameSource source;
    BOOST_CHECK_EQUAL(source.requestFrame(nullptr), INVALID_FRAME_HANDLE);
    BOOST_CHECK_EQUAL(source.startInterval(0.0, [](double) {}), INVALID_FRAME_HANDLE);
}

BOOST_AUTO_TEST_CASE(TestClockNeverRunsBackwards) {
    CooperativeFrameSource source(100.0);
    source.pump(50.0);
    BOOST_CHECK_EQUAL(source.now(), 100.0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TIMESTEP TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(TimestepManagerTests)

BOOST_AUTO_TEST_CASE(TestFirstFrameHasZeroDelta) {
    TimestepManager timestep(60.0f, 0.05f);
    timestep.startFrame(1000.0);
    BOOST_CHECK_EQUAL(timestep.getDeltaTime(), 0.0f);
    BOOST_CHECK_EQUAL(timestep.getFrameTimeMs(), 0.0);

    timestep.startFrame(1016.0);
    BOOST_CHECK_CLOSE(timestep.getDeltaTime(), 0.016f, 0.01);
    BOOST_CHECK_CLOSE(timestep.getFrameTimeMs(), 16.0, 0.01);
    BOOST_CHECK_EQUAL(timestep.getFrameCount(), 2);
}

BOOST_AUTO_TEST_CASE(TestDeltaClampedFrameTimeNot) {
    TimestepManager timestep(60.0f, 0.05f);
    timestep.startFrame(0.0);
    timestep.startFrame(2000.0);
    BOOST_CHECK_CLOSE(timestep.getDeltaTime(), 0.05f, 0.01);
    BOOST_CHECK_CLOSE(timestep.getFrameTimeMs(), 2000.0, 0.01);
    BOOST_CHECK(timestep.isFrameTimeExcessive());
}

BOOST_AUTO_TEST_CASE(TestBackwardsClockGivesZero) {
    TimestepManager timestep;
    timestep.startFrame(500.0);
    timestep.startFrame(400.0);
    BOOST_CHECK_EQUAL(timestep.getDeltaTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestResetRestartsDeltas) {
    TimestepManager timestep;
    timestep.startFrame(0.0);
    timestep.startFrame(16.0);
    timestep.reset();
    timestep.startFrame(60000.0);
    BOOST_CHECK_EQUAL(timestep.getDeltaTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestFPSTracksFrameRate) {
    TimestepManager timestep;
    double now = 0.0;
    for (int i = 0; i < 200; ++i) {
        timestep.startFrame(now);
        now += 20.0;
    }
    BOOST_CHECK_CLOSE(timestep.getCurrentFPS(), 50.0f, 1.0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SCHEDULER TESTS
// ============================================================================

class SchedulerFixture {
public:
    SchedulerFixture() : scheduler(source, 60.0f, 0.05f, 1000.0) {
        scheduler.setEventHandler([this]() { order.push_back("event"); });
        scheduler.setUpdateHandler([this](float dt, double) {
            order.push_back("update");
            deltas.push_back(dt);
        });
        scheduler.setRenderHandler([this]() { order.push_back("render"); });
        scheduler.setSampleHandler([this](double) { ++samples; });
    }

    void pumpFrames(int count) {
        for (int i = 0; i < count; ++i) {
            m_now += FRAME_MS;
            source.pump(m_now);
        }
    }

    void advance(double ms) {
        m_now += ms;
        source.pump(m_now);
    }

protected:
    CooperativeFrameSource source;
    AnimationScheduler scheduler;
    std::vector<std::string> order;
    std::vector<float> deltas;
    int samples{0};

private:
    double m_now{0.0};
};

BOOST_FIXTURE_TEST_SUITE(AnimationSchedulerTests, SchedulerFixture)

BOOST_AUTO_TEST_CASE(TestTickOrder) {
    scheduler.start();
    pumpFrames(2);

    BOOST_REQUIRE_EQUAL(order.size(), 6);
    BOOST_CHECK_EQUAL(order[0], "event");
    BOOST_CHECK_EQUAL(order[1], "update");
    BOOST_CHECK_EQUAL(order[2], "render");
    BOOST_CHECK_EQUAL(order[3], "event");
    BOOST_CHECK_EQUAL(scheduler.getTickCount(), 2);

    // First tick after start has a zero delta
    BOOST_CHECK_EQUAL(deltas[0], 0.0f);
    BOOST_CHECK_CLOSE(deltas[1], static_cast<float>(FRAME_MS / 1000.0), 0.1);
}

BOOST_AUTO_TEST_CASE(TestStartStopIdempotent) {
    scheduler.start();
    scheduler.start();
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 1);
    BOOST_CHECK_EQUAL(source.getActiveIntervalCount(), 1);
    BOOST_CHECK(scheduler.isRunning());

    scheduler.stop();
    scheduler.stop();
    BOOST_CHECK(!scheduler.isRunning());
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 0);
    BOOST_CHECK_EQUAL(source.getActiveIntervalCount(), 0);

    pumpFrames(3);
    BOOST_CHECK(order.empty());
}

BOOST_AUTO_TEST_CASE(TestSamplingCadence) {
    scheduler.start();
    for (int i = 0; i < 30; ++i) {
        advance(100.0);
    }
    BOOST_CHECK_EQUAL(samples, 3);

    scheduler.setSampleInterval(500.0);
    for (int i = 0; i < 10; ++i) {
        advance(100.0);
    }
    BOOST_CHECK_EQUAL(samples, 5);
}

BOOST_AUTO_TEST_CASE(TestPauseReasonsCombine) {
    scheduler.start();
    scheduler.setPauseReason(PauseReason::DocumentHidden, true);
    scheduler.setPauseReason(PauseReason::WindowBlurred, true);
    BOOST_CHECK(scheduler.isPaused());
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 0);

    scheduler.setPauseReason(PauseReason::DocumentHidden, false);
    BOOST_CHECK(scheduler.isPaused());
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 0);

    scheduler.setPauseReason(PauseReason::WindowBlurred, false);
    BOOST_CHECK(!scheduler.isPaused());
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 1);
}

BOOST_AUTO_TEST_CASE(TestResumeHasNoCatchUp) {
    scheduler.start();
    pumpFrames(3);
    scheduler.setPauseReason(PauseReason::DocumentHidden, true);
    advance(30000.0);
    const uint64_t ticksWhilePaused = scheduler.getTickCount();
    BOOST_CHECK_EQUAL(ticksWhilePaused, 3);

    deltas.clear();
    scheduler.setPauseReason(PauseReason::DocumentHidden, false);
    pumpFrames(2);
    BOOST_REQUIRE_EQUAL(deltas.size(), 2);
    BOOST_CHECK_EQUAL(deltas[0], 0.0f);
    BOOST_CHECK_LE(deltas[1], 0.05f);
}

BOOST_AUTO_TEST_CASE(TestStopInsideTickLeavesNothingScheduled) {
    scheduler.setRenderHandler([this]() { scheduler.stop(); });
    scheduler.start();
    pumpFrames(1);
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 0);
    BOOST_CHECK_EQUAL(source.getActiveIntervalCount(), 0);
    pumpFrames(2);
    BOOST_CHECK_EQUAL(scheduler.getTickCount(), 1);
}

BOOST_AUTO_TEST_CASE(TestResumeInsideTickSchedulesOnce) {
    scheduler.start();
    scheduler.setUpdateHandler([this](float, double) {
        scheduler.setPauseReason(PauseReason::ReducedMotion, true);
        scheduler.setPauseReason(PauseReason::ReducedMotion, false);
    });
    pumpFrames(1);
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 1);
}

BOOST_AUTO_TEST_CASE(TestThrowingHandlerIsContained) {
    scheduler.setUpdateHandler([](float, double) { throw std::runtime_error("update failed"); });
    scheduler.start();
    BOOST_CHECK_NO_THROW(pumpFrames(2));
    // Render still runs and the loop keeps going
    BOOST_CHECK_EQUAL(scheduler.getTickCount(), 2);
    BOOST_CHECK_EQUAL(source.getPendingFrameCount(), 1);
}

BOOST_AUTO_TEST_CASE(TestDestructorCancels) {
    CooperativeFrameSource other;
    {
        AnimationScheduler local(other);
        local.start();
        BOOST_CHECK_EQUAL(other.getPendingFrameCount(), 1);
    }
    BOOST_CHECK_EQUAL(other.getPendingFrameCount(), 0);
    BOOST_CHECK_EQUAL(other.getActiveIntervalCount(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
