/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/RainEvent.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace GlyphRain {

namespace {

bool containsAny(const std::string &haystack,
                 std::initializer_list<std::string_view> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) {
    return haystack.find(n) != std::string::npos;
  });
}

} // namespace

RainEventKind eventKindFromString(std::string_view eventType) {
  std::string lowered(eventType);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // Order matters: "subagent_stop_error" is an error before it is a stop
  if (containsAny(lowered, {"error", "fail"})) {
    return RainEventKind::Error;
  }
  if (containsAny(lowered, {"complete", "success", "finish", "stop"})) {
    return RainEventKind::Complete;
  }
  if (containsAny(lowered, {"spawn"})) {
    return RainEventKind::Spawn;
  }
  if (containsAny(lowered, {"start", "begin"})) {
    return RainEventKind::Start;
  }
  if (containsAny(lowered, {"pending", "wait"})) {
    return RainEventKind::Pending;
  }
  if (containsAny(lowered, {"progress", "tool", "response", "chunk", "prompt"})) {
    return RainEventKind::Progress;
  }
  return RainEventKind::Generic;
}

std::string_view eventKindToString(RainEventKind kind) {
  switch (kind) {
  case RainEventKind::Generic:
    return "generic";
  case RainEventKind::Start:
    return "start";
  case RainEventKind::Progress:
    return "in_progress";
  case RainEventKind::Pending:
    return "pending";
  case RainEventKind::Complete:
    return "complete";
  case RainEventKind::Error:
    return "error";
  case RainEventKind::Spawn:
    return "spawn";
  default:
    return "unknown";
  }
}

char32_t eventKindSymbol(RainEventKind kind) {
  switch (kind) {
  case RainEventKind::Start:
    return U'◢';
  case RainEventKind::Progress:
    return U'◐';
  case RainEventKind::Pending:
    return U'⧗';
  case RainEventKind::Complete:
    return U'◆';
  case RainEventKind::Error:
    return U'⚠';
  case RainEventKind::Spawn:
    return U'↕';
  default:
    return U'●';
  }
}

float eventKindSpeedFactor(RainEventKind kind) {
  static constexpr std::array<float, static_cast<size_t>(RainEventKind::COUNT)>
      factors{1.0f, 1.5f, 1.0f, 0.8f, 1.3f, 1.8f, 2.0f};
  const auto index = static_cast<size_t>(kind);
  return index < factors.size() ? factors[index] : 1.0f;
}

float eventKindTrailFactor(RainEventKind kind) {
  switch (kind) {
  case RainEventKind::Error:
  case RainEventKind::Complete:
    return 1.2f;
  default:
    return 1.0f;
  }
}

float eventAgeSpeedFactor(int64_t ageMs) {
  constexpr int64_t MINUTE_MS = 60 * 1000;
  if (ageMs < MINUTE_MS) {
    return 1.0f;
  }
  if (ageMs < 5 * MINUTE_MS) {
    return 0.8f;
  }
  if (ageMs < 15 * MINUTE_MS) {
    return 0.64f;
  }
  return 0.48f;
}

} // namespace GlyphRain
