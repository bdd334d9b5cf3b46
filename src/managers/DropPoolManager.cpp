/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/DropPoolManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <limits>

namespace GlyphRain {

namespace {
constexpr double DROP_BYTES = 1024.0;
constexpr double CELL_BYTES = 200.0;
constexpr double BASELINE_MB = 2.0;
constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

// FNV-1a; stable across runs so a session lands on the same column
uint32_t hashSessionId(const std::string &sessionId) {
  uint32_t hash = 2166136261u;
  for (unsigned char c : sessionId) {
    hash ^= c;
    hash *= 16777619u;
  }
  return hash;
}
} // namespace

DropPoolManager::DropPoolManager(size_t ceiling, size_t maxTrailLength)
    : m_ceiling(std::max<size_t>(ceiling, 1)), m_activeCap(m_ceiling),
      m_maxTrailLength(std::max<size_t>(maxTrailLength, 1)) {
  m_slots.reserve(m_ceiling);
  m_idleIndices.reserve(m_ceiling);
  m_retiredIndices.reserve(m_ceiling);
  m_activeIndices.reserve(m_ceiling);
  m_snapshot.reserve(m_ceiling);
  m_columnLastUse.assign(1, -std::numeric_limits<double>::infinity());
  m_columnHeld.assign(1, 0);

  POOL_DEBUG(std::format("DropPoolManager created - ceiling: {}, trail: {}",
                         m_ceiling, m_maxTrailLength));
}

AcquireResult DropPoolManager::acquire(DropOrigin origin, double nowMs,
                                       const std::string &sourceEventId) {
  AcquireResult result;
  if (m_activeCount >= m_activeCap) {
    result.status = AcquireStatus::CapacityExhausted;
    return result;
  }
  if (m_idleIndices.empty()) {
    compactActive();
  }

  size_t slot = 0;
  if (!m_idleIndices.empty()) {
    slot = m_idleIndices.back();
    m_idleIndices.pop_back();
    result.status = AcquireStatus::Recycled;
    ++m_recycledCount;
  } else {
    // Active count is below the cap, so a new slot stays within the ceiling
    slot = m_slots.size();
    m_slots.emplace_back();
    m_slots.back().cells.reserve(m_maxTrailLength);
    result.status = AcquireStatus::Constructed;
  }

  Drop &drop = m_slots[slot];
  drop.reset();
  drop.id = m_nextId++;
  drop.origin = origin;
  drop.spawnTimeMs = nowMs;
  drop.lastUpdateMs = nowMs;
  drop.spawnSequence = m_nextSequence++;
  drop.active = true;

  if (!sourceEventId.empty()) {
    drop.sourceEventId = sourceEventId;
    m_eventToDrop[sourceEventId] = drop.id;
  }

  m_idToSlot.emplace(drop.id, slot);
  m_activeIndices.push_back(slot);
  ++m_activeCount;
  markChanged();

  result.drop = &drop;
  return result;
}

bool DropPoolManager::release(DropId id) {
  auto it = m_idToSlot.find(id);
  if (it == m_idToSlot.end()) {
    return false;
  }

  const size_t slot = it->second;
  if (!m_slots[slot].isActive()) {
    POOL_ERROR(std::format("Drop {} mapped to a slot that is not active", id));
    m_idToSlot.erase(it);
    return false;
  }

  retire(slot);
  return true;
}

void DropPoolManager::retire(size_t slot) {
  Drop &drop = m_slots[slot];

  if (!drop.sourceEventId.empty()) {
    auto eventIt = m_eventToDrop.find(drop.sourceEventId);
    if (eventIt != m_eventToDrop.end() && eventIt->second == drop.id) {
      m_eventToDrop.erase(eventIt);
    }
  }
  m_idToSlot.erase(drop.id);

  // The active list entry stays until the next compaction
  drop.reset();
  m_retiredIndices.push_back(slot);
  --m_activeCount;
  ++m_releaseCount;
  markChanged();
}

void DropPoolManager::compactActive() {
  if (m_retiredIndices.empty()) {
    return;
  }
  m_activeIndices.erase(std::remove_if(m_activeIndices.begin(),
                                       m_activeIndices.end(),
                                       [this](size_t slot) {
                                         return !m_slots[slot].isActive();
                                       }),
                        m_activeIndices.end());
  m_idleIndices.insert(m_idleIndices.end(), m_retiredIndices.begin(),
                       m_retiredIndices.end());
  m_retiredIndices.clear();
}

size_t DropPoolManager::releaseAll() {
  compactActive();
  const size_t count = m_activeIndices.size();
  if (count == 0) {
    return 0;
  }

  for (size_t slot : m_activeIndices) {
    m_slots[slot].reset();
    m_idleIndices.push_back(slot);
  }
  m_activeIndices.clear();
  m_activeCount = 0;
  m_idToSlot.clear();
  m_eventToDrop.clear();
  m_releaseCount += count;
  markChanged();

  POOL_DEBUG(std::format("Released all {} active drops", count));
  return count;
}

const std::vector<const Drop *> &DropPoolManager::listActive() {
  if (m_snapshotGeneration != m_changeGeneration) {
    compactActive();
    m_snapshot.clear();
    for (size_t slot : m_activeIndices) {
      m_snapshot.push_back(&m_slots[slot]);
    }
    m_snapshotGeneration = m_changeGeneration;
  }
  return m_snapshot;
}

bool DropPoolManager::evictFirstMatching(bool ambientOnly) {
  for (size_t slot : m_activeIndices) {
    const Drop &drop = m_slots[slot];
    if (!drop.isActive() || (ambientOnly && drop.isEventDriven())) {
      continue;
    }
    retire(slot);
    ++m_evictionCount;
    return true;
  }
  return false;
}

bool DropPoolManager::evictOldestAmbient() { return evictFirstMatching(true); }

bool DropPoolManager::evictOldest() { return evictFirstMatching(false); }

size_t DropPoolManager::setActiveCap(size_t cap) {
  const size_t clamped = std::clamp<size_t>(cap, 1, m_ceiling);
  if (clamped != m_activeCap) {
    POOL_INFO(std::format("Active cap changed: {} -> {}", m_activeCap, clamped));
  }
  m_activeCap = clamped;

  size_t evicted = 0;
  while (m_activeCount > m_activeCap) {
    if (!evictOldestAmbient() && !evictOldest()) {
      break;
    }
    ++evicted;
  }

  if (evicted > 0) {
    compactActive();
    POOL_DEBUG(std::format("Evicted {} drops to fit cap {}", evicted,
                           m_activeCap));
  }
  return evicted;
}

void DropPoolManager::setCeiling(size_t ceiling) {
  const size_t newCeiling = std::max<size_t>(ceiling, 1);
  if (newCeiling == m_ceiling) {
    return;
  }

  while (m_activeCount > newCeiling) {
    if (!evictOldestAmbient() && !evictOldest()) {
      break;
    }
  }
  compactActive();

  // Compact surviving drops into fresh storage, keeping spawn order
  std::vector<Drop> slots;
  slots.reserve(newCeiling);
  std::vector<size_t> active;
  active.reserve(newCeiling);
  m_idToSlot.clear();

  for (size_t slot : m_activeIndices) {
    m_idToSlot.emplace(m_slots[slot].id, slots.size());
    active.push_back(slots.size());
    slots.push_back(std::move(m_slots[slot]));
  }

  m_slots = std::move(slots);
  m_activeIndices = std::move(active);
  m_idleIndices.clear();
  m_idleIndices.reserve(newCeiling);
  m_retiredIndices.reserve(newCeiling);
  m_snapshot.reserve(newCeiling);

  POOL_INFO(std::format("Ceiling changed: {} -> {} ({} drops kept)", m_ceiling,
                        newCeiling, m_activeIndices.size()));
  m_ceiling = newCeiling;
  m_activeCap = std::min(m_activeCap, m_ceiling);
  markChanged();
}

void DropPoolManager::applyTrailLength(size_t length) {
  const size_t target = std::max<size_t>(length, 1);
  m_maxTrailLength = std::max(m_maxTrailLength, target);
  forEachActive([target](Drop &drop) {
    if (drop.cells.size() > target) {
      drop.cells.resize(target);
    }
  });
}

void DropPoolManager::setColumnCount(uint32_t columns) {
  const size_t count = std::max<uint32_t>(columns, 1);
  if (count == m_columnLastUse.size()) {
    return;
  }
  // Existing columns keep their last-use time; new ones start cold
  m_columnLastUse.resize(count, -std::numeric_limits<double>::infinity());
  m_columnHeld.resize(count, 0);

  // Sessions whose column no longer exists are placed again on their next drop
  for (auto it = m_sessionColumns.begin(); it != m_sessionColumns.end();) {
    if (it->second.column >= count) {
      it = m_sessionColumns.erase(it);
    } else {
      ++it;
    }
  }
}

uint32_t DropPoolManager::pickColumn(double nowMs, std::mt19937 &rng) {
  const size_t count = m_columnLastUse.size();

  // Reservoir pick among columns outside the cooldown window
  size_t chosen = count;
  size_t candidates = 0;
  size_t leastRecent = 0;
  for (size_t i = 0; i < count; ++i) {
    if (nowMs - m_columnLastUse[i] >= m_columnCooldownMs) {
      ++candidates;
      std::uniform_int_distribution<size_t> pick(0, candidates - 1);
      if (pick(rng) == 0) {
        chosen = i;
      }
    }
    if (m_columnLastUse[i] < m_columnLastUse[leastRecent]) {
      leastRecent = i;
    }
  }

  if (chosen == count) {
    chosen = leastRecent;
  }
  m_columnLastUse[chosen] = nowMs;
  return static_cast<uint32_t>(chosen);
}

uint32_t DropPoolManager::assignSessionColumn(const std::string &sessionId,
                                              double nowMs, std::mt19937 &rng) {
  if (sessionId.empty()) {
    return pickColumn(nowMs, rng);
  }

  auto it = m_sessionColumns.find(sessionId);
  if (it != m_sessionColumns.end()) {
    it->second.lastUseMs = nowMs;
    m_columnLastUse[it->second.column] = nowMs;
    return it->second.column;
  }

  const size_t count = m_columnLastUse.size();
  while (m_sessionColumns.size() >= count) {
    forgetLeastRecentSession();
  }

  const size_t start = hashSessionId(sessionId) % count;
  size_t chosen = start;
  for (size_t i = 0; i < count; ++i) {
    const size_t column = (start + i) % count;
    if (!m_columnHeld[column]) {
      chosen = column;
      break;
    }
  }

  m_columnHeld[chosen] = 1;
  m_columnLastUse[chosen] = nowMs;
  m_sessionColumns.emplace(
      sessionId, SessionColumn{static_cast<uint32_t>(chosen), nowMs});
  return static_cast<uint32_t>(chosen);
}

std::optional<uint32_t>
DropPoolManager::findSessionColumn(const std::string &sessionId) const {
  auto it = m_sessionColumns.find(sessionId);
  if (it == m_sessionColumns.end()) {
    return std::nullopt;
  }
  return it->second.column;
}

void DropPoolManager::forgetLeastRecentSession() {
  auto oldest = m_sessionColumns.begin();
  for (auto it = m_sessionColumns.begin(); it != m_sessionColumns.end(); ++it) {
    if (it->second.lastUseMs < oldest->second.lastUseMs) {
      oldest = it;
    }
  }
  if (oldest == m_sessionColumns.end()) {
    return;
  }
  m_columnHeld[oldest->second.column] = 0;
  m_sessionColumns.erase(oldest);
}

void DropPoolManager::clampPositions(float minY, float maxY) {
  forEachActive([minY, maxY](Drop &drop) {
    drop.position = std::clamp(drop.position, minY, maxY);
  });
}

bool DropPoolManager::hasActiveDropForEvent(const std::string &eventId) const {
  return m_eventToDrop.find(eventId) != m_eventToDrop.end();
}

Drop *DropPoolManager::findDrop(DropId id) {
  auto it = m_idToSlot.find(id);
  return it != m_idToSlot.end() ? &m_slots[it->second] : nullptr;
}

const Drop *DropPoolManager::findDrop(DropId id) const {
  auto it = m_idToSlot.find(id);
  return it != m_idToSlot.end() ? &m_slots[it->second] : nullptr;
}

size_t DropPoolManager::getTotalCellCount() const {
  // Retired slots are reset and hold no cells
  size_t total = 0;
  for (size_t slot : m_activeIndices) {
    total += m_slots[slot].cells.size();
  }
  return total;
}

double DropPoolManager::estimateMemoryMB() const {
  if (m_activeCount == 0) {
    return 0.0;
  }
  const double bytes =
      static_cast<double>(m_activeCount) * DROP_BYTES +
      static_cast<double>(getTotalCellCount()) * CELL_BYTES;
  return bytes / BYTES_PER_MB + BASELINE_MB;
}

size_t DropPoolManager::enforceMemoryLimit(double limitMB) {
  size_t evicted = 0;
  while (m_activeCount > 0 && estimateMemoryMB() > limitMB) {
    if (!evictOldest()) {
      break;
    }
    ++evicted;
  }

  if (evicted > 0) {
    compactActive();
    POOL_WARN(std::format("Memory limit {:.1f}MB exceeded, evicted {} drops",
                          limitMB, evicted));
  }
  return evicted;
}

DropPoolStats DropPoolManager::getStats() const {
  DropPoolStats stats;
  stats.activeDrops = m_activeCount;
  stats.idleDrops = m_idleIndices.size() + m_retiredIndices.size();
  stats.constructedSlots = m_slots.size();
  stats.ceiling = m_ceiling;
  stats.activeCap = m_activeCap;
  stats.recycledCount = m_recycledCount;
  stats.evictionCount = m_evictionCount;
  stats.releaseCount = m_releaseCount;
  return stats;
}

} // namespace GlyphRain
