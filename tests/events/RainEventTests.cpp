/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE RainEventTests
#include <boost/test/unit_test.hpp>

#include "events/RainEvent.hpp"
#include <string>

using namespace GlyphRain;

BOOST_AUTO_TEST_SUITE(RainEventKindTests)

BOOST_AUTO_TEST_CASE(TestHookTypesClassified) {
  BOOST_CHECK(eventKindFromString("SessionStart") == RainEventKind::Start);
  BOOST_CHECK(eventKindFromString("PreToolUse") == RainEventKind::Progress);
  BOOST_CHECK(eventKindFromString("PostToolUse") == RainEventKind::Progress);
  BOOST_CHECK(eventKindFromString("UserPromptSubmit") == RainEventKind::Progress);
  BOOST_CHECK(eventKindFromString("SubagentSpawn") == RainEventKind::Spawn);
  BOOST_CHECK(eventKindFromString("SubagentStop") == RainEventKind::Complete);
  BOOST_CHECK(eventKindFromString("Stop") == RainEventKind::Complete);
  BOOST_CHECK(eventKindFromString("agent_error") == RainEventKind::Error);
  BOOST_CHECK(eventKindFromString("waiting_for_input") == RainEventKind::Pending);
}

BOOST_AUTO_TEST_CASE(TestClassificationIgnoresCase) {
  BOOST_CHECK(eventKindFromString("TASK_FAILED") == RainEventKind::Error);
  BOOST_CHECK(eventKindFromString("task_complete") == RainEventKind::Complete);
}

BOOST_AUTO_TEST_CASE(TestErrorWinsOverStop) {
  BOOST_CHECK(eventKindFromString("subagent_stop_error") == RainEventKind::Error);
}

BOOST_AUTO_TEST_CASE(TestUnknownTypesAreGeneric) {
  BOOST_CHECK(eventKindFromString("Notification") == RainEventKind::Generic);
  BOOST_CHECK(eventKindFromString("") == RainEventKind::Generic);
}

BOOST_AUTO_TEST_CASE(TestKindNames) {
  BOOST_CHECK_EQUAL(eventKindToString(RainEventKind::Progress), "in_progress");
  BOOST_CHECK_EQUAL(eventKindToString(RainEventKind::Error), "error");
  BOOST_CHECK_EQUAL(eventKindToString(RainEventKind::Generic), "generic");
}

BOOST_AUTO_TEST_CASE(TestSymbols) {
  BOOST_CHECK(eventKindSymbol(RainEventKind::Error) == U'⚠');
  BOOST_CHECK(eventKindSymbol(RainEventKind::Complete) == U'◆');
  BOOST_CHECK(eventKindSymbol(RainEventKind::Generic) == U'●');
}

BOOST_AUTO_TEST_CASE(TestSpeedFactors) {
  BOOST_CHECK_EQUAL(eventKindSpeedFactor(RainEventKind::Generic), 1.0f);
  BOOST_CHECK_EQUAL(eventKindSpeedFactor(RainEventKind::Start), 1.5f);
  BOOST_CHECK_EQUAL(eventKindSpeedFactor(RainEventKind::Pending), 0.8f);
  BOOST_CHECK_EQUAL(eventKindSpeedFactor(RainEventKind::Error), 1.8f);
  BOOST_CHECK_EQUAL(eventKindSpeedFactor(RainEventKind::Spawn), 2.0f);
  BOOST_CHECK_EQUAL(eventKindSpeedFactor(RainEventKind::COUNT), 1.0f);
}

BOOST_AUTO_TEST_CASE(TestTrailFactors) {
  BOOST_CHECK_EQUAL(eventKindTrailFactor(RainEventKind::Error), 1.2f);
  BOOST_CHECK_EQUAL(eventKindTrailFactor(RainEventKind::Complete), 1.2f);
  BOOST_CHECK_EQUAL(eventKindTrailFactor(RainEventKind::Progress), 1.0f);
  BOOST_CHECK_EQUAL(eventKindTrailFactor(RainEventKind::Generic), 1.0f);
}

BOOST_AUTO_TEST_CASE(TestAgeSpeedTiers) {
  constexpr int64_t MINUTE = 60 * 1000;
  BOOST_CHECK_EQUAL(eventAgeSpeedFactor(0), 1.0f);
  BOOST_CHECK_EQUAL(eventAgeSpeedFactor(MINUTE - 1), 1.0f);
  BOOST_CHECK_EQUAL(eventAgeSpeedFactor(MINUTE), 0.8f);
  BOOST_CHECK_EQUAL(eventAgeSpeedFactor(5 * MINUTE), 0.64f);
  BOOST_CHECK_EQUAL(eventAgeSpeedFactor(15 * MINUTE), 0.48f);
  BOOST_CHECK_EQUAL(eventAgeSpeedFactor(24 * 60 * MINUTE), 0.48f);
}

BOOST_AUTO_TEST_CASE(TestEventConstruction) {
  const RainEvent event("evt-1", 1234, RainEventKind::Start, "session-a");
  BOOST_CHECK_EQUAL(event.id, "evt-1");
  BOOST_CHECK_EQUAL(event.timestampMs, 1234);
  BOOST_CHECK(event.kind == RainEventKind::Start);
  BOOST_CHECK_EQUAL(event.sessionId, "session-a");
  BOOST_CHECK(event.agentName.empty());

  const RainEvent named("evt-2", 1, RainEventKind::Spawn, "s", "planner");
  BOOST_CHECK_EQUAL(named.agentName, "planner");

  const RainEvent bare;
  BOOST_CHECK(bare.id.empty());
  BOOST_CHECK(bare.kind == RainEventKind::Generic);
}

BOOST_AUTO_TEST_SUITE_END()
