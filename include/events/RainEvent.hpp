/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAIN_EVENT_HPP
#define RAIN_EVENT_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace GlyphRain {

/**
 * @brief Orchestration event categories that change how a drop looks
 */
enum class RainEventKind : uint8_t {
  Generic = 0,
  Start = 1,
  Progress = 2,
  Pending = 3,
  Complete = 4,
  Error = 5,
  Spawn = 6,
  COUNT = 7
};

/**
 * @brief One domain event pushed in by the dashboard's data layer.
 *
 * Timestamps may arrive out of order; ids may repeat (see EventSyncAdapter
 * for the de-duplication policy).
 */
struct RainEvent {
  std::string id;
  int64_t timestampMs{0};
  RainEventKind kind{RainEventKind::Generic};
  std::string sessionId; // Drops of one session share a column
  std::string agentName; // Spelled into the trail, may be empty

  RainEvent() = default;
  RainEvent(std::string eventId, int64_t timestamp, RainEventKind eventKind,
            std::string session = {}, std::string agent = {})
      : id(std::move(eventId)), timestampMs(timestamp), kind(eventKind),
        sessionId(std::move(session)), agentName(std::move(agent)) {}
};

/**
 * @brief Classifies a hook event type string ("PreToolUse", "agent_error", ...)
 */
RainEventKind eventKindFromString(std::string_view eventType);

std::string_view eventKindToString(RainEventKind kind);

/**
 * @brief Leading glyph used for event-driven drops of this kind
 */
char32_t eventKindSymbol(RainEventKind kind);

/**
 * @brief Fall-speed multiplier applied to event-driven drops of this kind
 */
float eventKindSpeedFactor(RainEventKind kind);

/**
 * @brief Trail length multiplier; errors and completions get longer trails
 */
float eventKindTrailFactor(RainEventKind kind);

/**
 * @brief Fall-speed multiplier by event age: 1.0 under a minute, 0.8 under
 * five minutes, 0.64 under fifteen, 0.48 after that
 */
float eventAgeSpeedFactor(int64_t ageMs);

} // namespace GlyphRain

#endif // RAIN_EVENT_HPP
