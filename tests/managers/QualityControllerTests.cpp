/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE QualityControllerTests
#include <boost/test/unit_test.hpp>

#include "managers/QualityController.hpp"
#include "utils/PerformanceMonitor.hpp"
#include <cstdlib>
#include <stdexcept>
#include <vector>

using namespace GlyphRain;

constexpr double SLOW_FRAME_MS = 50.0;          // 20 fps
constexpr double FAST_FRAME_MS = 1000.0 / 58.0; // 58 fps

// ============================================================================
// Test Fixture
// ============================================================================

class QualityFixture {
public:
    QualityFixture() : monitor(60), quality(monitor, 1000, 12, 3, 5) {
        monitor.setThresholds(30.0f, 55.0f, 20.0f);
        quality.setLevelListener([this](QualityLevel from, QualityLevel to,
                                        const QualityParams& params) {
            transitions.push_back({from, to});
            lastParams = params;
        });
        quality.setWarningListener([this](const QualityWarning& warning) {
            warnings.push_back(warning);
        });
    }

    // One sampling window of identical frames, then an evaluation
    bool runWindow(double frameTimeMs, double renderTimeMs = 2.0) {
        for (size_t i = 0; i < monitor.getWindowSize(); ++i) {
            monitor.recordFrame(m_now, frameTimeMs, renderTimeMs, 4.0);
            m_now += frameTimeMs;
        }
        return quality.evaluate();
    }

protected:
    struct Transition {
        QualityLevel from;
        QualityLevel to;
    };

    PerformanceMonitor monitor;
    QualityController quality;
    std::vector<Transition> transitions;
    std::vector<QualityWarning> warnings;
    QualityParams lastParams;

private:
    double m_now{0.0};
};

// ============================================================================
// LEVEL TABLE TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(QualityParamsTests)

BOOST_AUTO_TEST_CASE(TestLevelTable) {
    QualityParams high = qualityParamsFor(QualityLevel::High, 1000, 12);
    BOOST_CHECK_EQUAL(high.maxDrops, 1000);
    BOOST_CHECK_EQUAL(high.trailLength, 12);
    BOOST_CHECK(high.glow);

    QualityParams medium = qualityParamsFor(QualityLevel::Medium, 1000, 12);
    BOOST_CHECK_EQUAL(medium.maxDrops, 500);
    BOOST_CHECK_EQUAL(medium.trailLength, 8);
    BOOST_CHECK(medium.glow);

    QualityParams low = qualityParamsFor(QualityLevel::Low, 1000, 12);
    BOOST_CHECK_EQUAL(low.maxDrops, 250);
    BOOST_CHECK_EQUAL(low.trailLength, 6);
    BOOST_CHECK(!low.glow);

    QualityParams minimal = qualityParamsFor(QualityLevel::Minimal, 1000, 12);
    BOOST_CHECK_EQUAL(minimal.maxDrops, 100);
    BOOST_CHECK_EQUAL(minimal.trailLength, 5);
    BOOST_CHECK(!minimal.glow);
}

BOOST_AUTO_TEST_CASE(TestParamsHaveFloors) {
    QualityParams tiny = qualityParamsFor(QualityLevel::Minimal, 3, 4);
    BOOST_CHECK_EQUAL(tiny.maxDrops, 1);
    BOOST_CHECK_EQUAL(tiny.trailLength, 3);

    // Configured trails shorter than the floor are never lengthened
    QualityParams shortTrail = qualityParamsFor(QualityLevel::Minimal, 100, 2);
    BOOST_CHECK_EQUAL(shortTrail.trailLength, 2);
}

BOOST_AUTO_TEST_CASE(TestLevelNames) {
    BOOST_CHECK_EQUAL(qualityLevelToString(QualityLevel::High), "high");
    BOOST_CHECK_EQUAL(qualityLevelToString(QualityLevel::Minimal), "minimal");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// HYSTERESIS TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(QualityHysteresisTests, QualityFixture)

BOOST_AUTO_TEST_CASE(TestThreeSlowWindowsDowngradeOnce) {
    BOOST_CHECK(!runWindow(SLOW_FRAME_MS));
    BOOST_CHECK(!runWindow(SLOW_FRAME_MS));
    BOOST_CHECK(runWindow(SLOW_FRAME_MS));

    BOOST_CHECK(quality.getLevel() == QualityLevel::Medium);
    BOOST_REQUIRE_EQUAL(transitions.size(), 1);
    BOOST_CHECK(transitions[0].from == QualityLevel::High);
    BOOST_CHECK(transitions[0].to == QualityLevel::Medium);
    BOOST_CHECK_EQUAL(lastParams.maxDrops, 500);

    BOOST_REQUIRE_EQUAL(warnings.size(), 1);
    BOOST_CHECK(warnings[0].to == QualityLevel::Medium);
    BOOST_CHECK_CLOSE(warnings[0].avgFrameRate, 20.0, 0.01);
    BOOST_CHECK(!warnings[0].message.empty());

    // The window and counters start over after a change
    BOOST_CHECK_EQUAL(monitor.getSampleCount(), 0);
    BOOST_CHECK_EQUAL(quality.getBadWindowCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestPartialWindowIsNeutral) {
    runWindow(SLOW_FRAME_MS);
    runWindow(SLOW_FRAME_MS);
    BOOST_CHECK_EQUAL(quality.getBadWindowCount(), 2);

    monitor.reset();
    monitor.recordFrame(0.0, SLOW_FRAME_MS, 1.0, 1.0);
    BOOST_CHECK(!quality.evaluate());
    BOOST_CHECK_EQUAL(quality.getBadWindowCount(), 2);
    BOOST_CHECK(quality.getLevel() == QualityLevel::High);
}

BOOST_AUTO_TEST_CASE(TestMixedWindowsResetRun) {
    runWindow(SLOW_FRAME_MS);
    runWindow(SLOW_FRAME_MS);
    runWindow(1000.0 / 45.0); // Neither good nor bad
    runWindow(SLOW_FRAME_MS);
    runWindow(SLOW_FRAME_MS);
    BOOST_CHECK(quality.getLevel() == QualityLevel::High);
    BOOST_CHECK(transitions.empty());
}

BOOST_AUTO_TEST_CASE(TestFastWindowsUpgradeOneLevelAtATime) {
    quality.reset(QualityLevel::Low);
    transitions.clear();

    for (int i = 0; i < 4; ++i) {
        BOOST_CHECK(!runWindow(FAST_FRAME_MS));
    }
    BOOST_CHECK(runWindow(FAST_FRAME_MS));
    BOOST_CHECK(quality.getLevel() == QualityLevel::Medium);

    for (int i = 0; i < 4; ++i) {
        BOOST_CHECK(!runWindow(FAST_FRAME_MS));
    }
    BOOST_CHECK(runWindow(FAST_FRAME_MS));
    BOOST_CHECK(quality.getLevel() == QualityLevel::High);

    BOOST_REQUIRE_EQUAL(transitions.size(), 2);
    BOOST_CHECK(transitions[0].from == QualityLevel::Low);
    BOOST_CHECK(transitions[0].to == QualityLevel::Medium);
    BOOST_CHECK(transitions[1].to == QualityLevel::High);

    // Upgrades never warn
    BOOST_CHECK(warnings.empty());
}

BOOST_AUTO_TEST_CASE(TestTransitionsMoveOneLevel) {
    for (int i = 0; i < 30; ++i) {
        runWindow(SLOW_FRAME_MS);
    }
    BOOST_CHECK(quality.getLevel() == QualityLevel::Minimal);
    for (const auto& t : transitions) {
        const int step = static_cast<int>(t.to) - static_cast<int>(t.from);
        BOOST_CHECK_EQUAL(std::abs(step), 1);
    }
    BOOST_CHECK_EQUAL(transitions.size(), 3);
}

BOOST_AUTO_TEST_CASE(TestResetJumpsDirectly) {
    for (int i = 0; i < 9; ++i) {
        runWindow(SLOW_FRAME_MS);
    }
    BOOST_REQUIRE(quality.getLevel() == QualityLevel::Minimal);

    quality.reset();
    BOOST_CHECK(quality.getLevel() == QualityLevel::High);
    BOOST_CHECK(transitions.back().from == QualityLevel::Minimal);
    BOOST_CHECK_EQUAL(lastParams.maxDrops, 1000);
}

BOOST_AUTO_TEST_CASE(TestNonAdaptiveKeepsLevel) {
    quality.setAdaptive(false);
    for (int i = 0; i < 6; ++i) {
        BOOST_CHECK(!runWindow(SLOW_FRAME_MS));
    }
    BOOST_CHECK(quality.getLevel() == QualityLevel::High);
}

BOOST_AUTO_TEST_CASE(TestThrowingListenerIsContained) {
    quality.setLevelListener([](QualityLevel, QualityLevel, const QualityParams&) {
        throw std::runtime_error("listener failure");
    });
    quality.setWarningListener([](const QualityWarning&) {
        throw std::runtime_error("warning failure");
    });

    runWindow(SLOW_FRAME_MS);
    runWindow(SLOW_FRAME_MS);
    BOOST_CHECK_NO_THROW(runWindow(SLOW_FRAME_MS));
    BOOST_CHECK(quality.getLevel() == QualityLevel::Medium);
}

BOOST_AUTO_TEST_SUITE_END()
