/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DROP_POOL_MANAGER_HPP
#define DROP_POOL_MANAGER_HPP

/**
 * @file DropPoolManager.hpp
 * @brief Fixed-capacity, recycling storage for rain drops
 *
 * - Slots are reserved up front to the hard ceiling and never reallocated
 *   while the ceiling is unchanged, so Drop pointers stay stable
 * - Released slots go to an idle list and are recycled before new slots
 *   are constructed
 * - Active slots are kept in spawn order for oldest-first eviction
 * - Release is O(1): the slot is retired in place and the active list is
 *   compacted in one pass before the next recycle or snapshot
 * - A change generation replaces rescanning: the render snapshot is rebuilt
 *   only when membership changed
 */

#include "entities/Drop.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace GlyphRain {

enum class AcquireStatus : uint8_t {
  Recycled = 0,         // Idle slot reused
  Constructed = 1,      // New slot created below the ceiling
  CapacityExhausted = 2 // Active count reached the current cap
};

struct AcquireResult {
  Drop *drop{nullptr};
  AcquireStatus status{AcquireStatus::CapacityExhausted};

  bool succeeded() const { return drop != nullptr; }
};

/**
 * @brief Pool statistics for memory metrics and tests
 */
struct DropPoolStats {
  size_t activeDrops{0};
  size_t idleDrops{0};
  size_t constructedSlots{0};
  size_t ceiling{0};
  size_t activeCap{0};
  uint64_t recycledCount{0};
  uint64_t evictionCount{0};
  uint64_t releaseCount{0};
};

class DropPoolManager {
public:
  /**
   * @param ceiling Hard drop ceiling (at least 1)
   * @param maxTrailLength Trail length each slot's cell buffer is reserved to
   */
  explicit DropPoolManager(size_t ceiling, size_t maxTrailLength = 12);

  /**
   * @brief Takes an idle or new slot and marks it active
   * @param origin Ambient or event-driven
   * @param nowMs Spawn time
   * @param sourceEventId Event id for event-driven drops (dedup key)
   * @return CapacityExhausted when the active count is at the current cap.
   * The caller decides whether to evict and retry.
   */
  AcquireResult acquire(DropOrigin origin, double nowMs,
                        const std::string &sourceEventId = {});

  /**
   * @brief Returns a drop to the idle set and clears its fields
   * @return false if the id is unknown or already released
   */
  bool release(DropId id);

  /**
   * @brief Releases every active drop
   * @return Number of drops released
   */
  size_t releaseAll();

  /**
   * @brief Immutable snapshot of the active drops in spawn order
   * @details Rebuilt only when the change generation moved since the last call
   */
  const std::vector<const Drop *> &listActive();

  bool evictOldestAmbient();
  bool evictOldest();

  /**
   * @brief Sets the quality cap, clamped to [1, ceiling]
   * @details Evicts oldest ambient drops first, then oldest event-driven, until
   * the active count fits
   * @return Number of evicted drops
   */
  size_t setActiveCap(size_t cap);
  size_t getActiveCap() const { return m_activeCap; }

  /**
   * @brief Changes the hard ceiling; evicts oldest drops that no longer fit
   * and compacts the slot storage. Invalidates Drop pointers.
   */
  void setCeiling(size_t ceiling);
  size_t getCeiling() const { return m_ceiling; }

  /**
   * @brief Truncates every active trail to at most length cells
   */
  void applyTrailLength(size_t length);

  // Column layout
  void setColumnCount(uint32_t columns);
  uint32_t getColumnCount() const {
    return static_cast<uint32_t>(m_columnLastUse.size());
  }
  void setColumnCooldown(double cooldownMs) { m_columnCooldownMs = cooldownMs; }
  double getColumnCooldown() const { return m_columnCooldownMs; }

  /**
   * @brief Picks a column not used within the cooldown window; when every
   * column is cooling down the least recently used one is chosen
   */
  uint32_t pickColumn(double nowMs, std::mt19937 &rng);

  /**
   * @brief Column for a session's drops; the same session keeps its column
   * @details A new session starts at a hash of its id and scans for a column
   * no other session holds. At most one session per column is remembered;
   * the least recently seen session is forgotten to make room. An empty id
   * falls back to pickColumn().
   */
  uint32_t assignSessionColumn(const std::string &sessionId, double nowMs,
                               std::mt19937 &rng);
  std::optional<uint32_t> findSessionColumn(const std::string &sessionId) const;
  size_t getSessionCount() const { return m_sessionColumns.size(); }

  /**
   * @brief Clamps every active drop's position into [minY, maxY]
   */
  void clampPositions(float minY, float maxY);

  bool hasActiveDropForEvent(const std::string &eventId) const;

  Drop *findDrop(DropId id);
  const Drop *findDrop(DropId id) const;

  /**
   * @brief Visits every active drop in spawn order with mutable access
   * @details The callback must not acquire or release drops
   */
  template <typename Fn> void forEachActive(Fn &&fn) {
    for (size_t index : m_activeIndices) {
      Drop &drop = m_slots[index];
      if (drop.isActive()) {
        fn(drop);
      }
    }
  }

  /**
   * @brief Estimated memory use: 1 KB per active drop, 200 B per cell and a
   * 2 MB baseline; zero when no drop is active
   */
  double estimateMemoryMB() const;

  /**
   * @brief Evicts oldest drops while the memory estimate exceeds limitMB
   * @return Number of evicted drops
   */
  size_t enforceMemoryLimit(double limitMB);

  size_t getActiveCount() const { return m_activeCount; }
  size_t getIdleCount() const {
    return m_idleIndices.size() + m_retiredIndices.size();
  }
  size_t getTotalCellCount() const;
  uint64_t getChangeGeneration() const { return m_changeGeneration; }
  DropPoolStats getStats() const;

private:
  void retire(size_t slot);
  void compactActive();
  bool evictFirstMatching(bool ambientOnly);
  void markChanged() { ++m_changeGeneration; }
  void forgetLeastRecentSession();

  struct SessionColumn {
    uint32_t column{0};
    double lastUseMs{0.0};
  };

  std::vector<Drop> m_slots;             // Reserved to the ceiling
  std::vector<size_t> m_idleIndices;
  std::vector<size_t> m_retiredIndices;  // Released, still listed as active
  std::vector<size_t> m_activeIndices;   // Spawn order, oldest first
  size_t m_activeCount{0};
  std::unordered_map<DropId, size_t> m_idToSlot;
  std::unordered_map<std::string, DropId> m_eventToDrop;

  std::vector<const Drop *> m_snapshot;
  uint64_t m_snapshotGeneration{0};
  uint64_t m_changeGeneration{1};

  std::vector<double> m_columnLastUse;
  std::vector<uint8_t> m_columnHeld;     // 1 while a session owns the column
  std::unordered_map<std::string, SessionColumn> m_sessionColumns;
  double m_columnCooldownMs{250.0};

  size_t m_ceiling;
  size_t m_activeCap;
  size_t m_maxTrailLength;
  DropId m_nextId{1};
  uint64_t m_nextSequence{1};

  uint64_t m_recycledCount{0};
  uint64_t m_evictionCount{0};
  uint64_t m_releaseCount{0};

  // Prevent copying; snapshot pointers refer into m_slots
  DropPoolManager(const DropPoolManager &) = delete;
  DropPoolManager &operator=(const DropPoolManager &) = delete;
};

} // namespace GlyphRain

#endif // DROP_POOL_MANAGER_HPP
