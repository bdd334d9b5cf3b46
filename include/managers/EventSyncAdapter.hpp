/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_SYNC_ADAPTER_HPP
#define EVENT_SYNC_ADAPTER_HPP

#include "events/RainEvent.hpp"
#include <boost/circular_buffer.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace GlyphRain {

class DropPoolManager;
class RainSimulation;

struct BatchResult {
  size_t attempted{0};  // Spawn attempts made
  size_t spawned{0};
  size_t duplicates{0}; // Ids that already had an active drop
  size_t coalesced{0};  // Skipped because the per-tick cap was reached

  BatchResult &operator+=(const BatchResult &other) {
    attempted += other.attempted;
    spawned += other.spawned;
    duplicates += other.duplicates;
    coalesced += other.coalesced;
    return *this;
  }
};

/**
 * @brief Maps external domain events onto drop spawns
 *
 * De-duplication: an event whose id matches an active event-driven drop is
 * ignored until that drop is released. Out-of-order timestamps are accepted.
 * Bursts are capped per tick; the excess is coalesced rather than spawned.
 */
class EventSyncAdapter {
public:
  EventSyncAdapter(RainSimulation &simulation, DropPoolManager &pool,
                   size_t maxSpawnsPerTick = 16, size_t maxPendingEvents = 256);

  /**
   * @return true if a drop was spawned for the event
   */
  bool processEvent(const RainEvent &event, double nowMs);

  BatchResult processEventBatch(const std::vector<RainEvent> &events,
                                double nowMs);

  /**
   * @brief Buffers an event for the next tick; when the buffer is full the
   * oldest pending event is dropped
   */
  void enqueue(RainEvent event);

  /**
   * @brief Processes every buffered event as one batch
   */
  BatchResult drainPending(double nowMs);

  /**
   * @brief Recomputes the column layout for a new canvas size
   * @return false (geometry unchanged) for non-positive dimensions
   */
  bool resize(float width, float height);

  void setLimits(size_t maxSpawnsPerTick, size_t maxPendingEvents);
  size_t getMaxSpawnsPerTick() const { return m_maxSpawnsPerTick; }

  size_t getPendingCount() const { return m_pending.size(); }
  uint64_t getOverflowCount() const { return m_overflowCount; }
  const BatchResult &getTotals() const { return m_totals; }

private:
  RainSimulation &m_simulation;
  DropPoolManager &m_pool;
  size_t m_maxSpawnsPerTick;
  boost::circular_buffer<RainEvent> m_pending;
  std::vector<RainEvent> m_drainBuffer;
  uint64_t m_overflowCount{0};
  BatchResult m_totals;
};

} // namespace GlyphRain

#endif // EVENT_SYNC_ADAPTER_HPP
