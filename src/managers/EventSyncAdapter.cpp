/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EventSyncAdapter.hpp"
#include "core/Logger.hpp"
#include "managers/DropPoolManager.hpp"
#include "managers/RainSimulation.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace GlyphRain {

EventSyncAdapter::EventSyncAdapter(RainSimulation &simulation,
                                   DropPoolManager &pool,
                                   size_t maxSpawnsPerTick,
                                   size_t maxPendingEvents)
    : m_simulation(simulation), m_pool(pool),
      m_maxSpawnsPerTick(std::max<size_t>(maxSpawnsPerTick, 1)),
      m_pending(std::max<size_t>(maxPendingEvents, 1)) {
  m_drainBuffer.reserve(m_pending.capacity());
}

bool EventSyncAdapter::processEvent(const RainEvent &event, double nowMs) {
  if (!event.id.empty() && m_pool.hasActiveDropForEvent(event.id)) {
    ++m_totals.duplicates;
    return false;
  }

  ++m_totals.attempted;
  const DropId id =
      m_simulation.spawnDrop(DropOrigin::EventDriven, &event, nowMs);
  if (id == INVALID_DROP_ID) {
    return false;
  }
  ++m_totals.spawned;
  return true;
}

BatchResult EventSyncAdapter::processEventBatch(
    const std::vector<RainEvent> &events, double nowMs) {
  BatchResult result;

  for (const RainEvent &event : events) {
    if (!event.id.empty() && m_pool.hasActiveDropForEvent(event.id)) {
      ++result.duplicates;
      continue;
    }
    if (result.attempted >= m_maxSpawnsPerTick) {
      ++result.coalesced;
      continue;
    }

    ++result.attempted;
    if (m_simulation.spawnDrop(DropOrigin::EventDriven, &event, nowMs) !=
        INVALID_DROP_ID) {
      ++result.spawned;
    }
  }

  if (result.coalesced > 0) {
    SYNC_DEBUG(std::format("Burst of {} events: {} spawned, {} coalesced",
                           events.size(), result.spawned, result.coalesced));
  }

  m_totals += result;
  return result;
}

void EventSyncAdapter::enqueue(RainEvent event) {
  if (m_pending.full()) {
    ++m_overflowCount;
    if (m_overflowCount == 1 || m_overflowCount % 100 == 0) {
      SYNC_WARN(std::format("Pending event buffer full ({}), dropping oldest "
                            "(total dropped: {})",
                            m_pending.capacity(), m_overflowCount));
    }
  }
  m_pending.push_back(std::move(event));
}

BatchResult EventSyncAdapter::drainPending(double nowMs) {
  if (m_pending.empty()) {
    return {};
  }

  // Swap out first so handlers may enqueue while the batch runs
  m_drainBuffer.clear();
  for (auto &event : m_pending) {
    m_drainBuffer.push_back(std::move(event));
  }
  m_pending.clear();

  return processEventBatch(m_drainBuffer, nowMs);
}

bool EventSyncAdapter::resize(float width, float height) {
  if (!(width > 0.0f) || !(height > 0.0f)) {
    SYNC_WARN(std::format("Ignoring resize to {}x{}; keeping {}x{}", width,
                          height, m_simulation.getWidth(),
                          m_simulation.getHeight()));
    return false;
  }
  if (!m_simulation.setGeometry(width, height)) {
    return false;
  }
  SYNC_DEBUG(std::format("Resized to {}x{} ({} columns)", width, height,
                         m_simulation.getColumnCount()));
  return true;
}

void EventSyncAdapter::setLimits(size_t maxSpawnsPerTick,
                                 size_t maxPendingEvents) {
  m_maxSpawnsPerTick = std::max<size_t>(maxSpawnsPerTick, 1);
  m_pending.rset_capacity(std::max<size_t>(maxPendingEvents, 1));
}

} // namespace GlyphRain
