/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DROP_HPP
#define DROP_HPP

#include "events/RainEvent.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <string>

namespace GlyphRain {

using DropId = uint64_t;
constexpr DropId INVALID_DROP_ID = 0;

enum class DropOrigin : uint8_t {
  Ambient = 0,    // Background probability gate
  EventDriven = 1 // Spawned for a domain event, wins capacity over ambient
};

/**
 * @brief One glyph of a trail
 */
struct GlyphCell {
  char32_t glyph{U' '};
  float brightness{1.0f}; // [0, 1]
  uint16_t trailIndex{0}; // 0 is the leading cell
  bool leading{false};
};

// Inline capacity covers the default trail; longer trails spill to the heap
constexpr size_t DROP_INLINE_CELLS = 16;
using GlyphTrail = boost::container::small_vector<GlyphCell, DROP_INLINE_CELLS>;

/**
 * @brief A falling glyph trail
 *
 * Drops live in DropPoolManager slots and are recycled, so a Drop* is only
 * valid until the drop is released. Everyone but the pool reads drops through
 * const pointers.
 */
struct Drop {
  DropId id{INVALID_DROP_ID};
  uint32_t column{0};
  float position{0.0f}; // y of the leading cell, canvas units
  float velocity{0.0f}; // units per second
  float age{0.0f};      // seconds since spawn
  GlyphTrail cells;

  uint32_t headColor{0xFFFFFFFF};
  uint32_t trailColor{0x00FF00FF};

  DropOrigin origin{DropOrigin::Ambient};
  std::string sourceEventId;
  RainEventKind eventKind{RainEventKind::Generic};
  double spawnTimeMs{0.0};
  double lastUpdateMs{0.0};

  // Pool bookkeeping
  uint64_t spawnSequence{0};
  bool active{false};

  bool isActive() const { return active; }
  bool isEventDriven() const { return origin == DropOrigin::EventDriven; }
  size_t trailLength() const { return cells.size(); }

  /**
   * @brief Clears every mutable field; keeps the cell buffer's capacity
   */
  void reset() {
    id = INVALID_DROP_ID;
    column = 0;
    position = 0.0f;
    velocity = 0.0f;
    age = 0.0f;
    cells.clear();
    headColor = 0xFFFFFFFF;
    trailColor = 0x00FF00FF;
    origin = DropOrigin::Ambient;
    sourceEventId.clear();
    eventKind = RainEventKind::Generic;
    spawnTimeMs = 0.0;
    lastUpdateMs = 0.0;
    spawnSequence = 0;
    active = false;
  }
};

} // namespace GlyphRain

#endif // DROP_HPP
