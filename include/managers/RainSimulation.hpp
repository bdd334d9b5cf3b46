/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAIN_SIMULATION_HPP
#define RAIN_SIMULATION_HPP

#include "core/RainConfig.hpp"
#include "entities/Drop.hpp"
#include "events/RainEvent.hpp"
#include "utils/GlyphSet.hpp"
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace GlyphRain {

class DropPoolManager;

/**
 * @brief Outcome of one simulation step
 */
struct StepResult {
  float clampedDeltaTime{0.0f};
  size_t ambientSpawned{0};
  size_t released{0};
};

/**
 * @brief Advances drops and applies the spawn policy
 *
 * The simulation never owns drops; every acquire/release goes through the
 * pool it was given.
 */
class RainSimulation {
public:
  static constexpr float MIN_CELL_BRIGHTNESS = 0.05f;
  static constexpr float FADED_HEAD_BRIGHTNESS = 0.02f;
  static constexpr size_t MIN_TRAIL_LENGTH = 3;

  RainSimulation(DropPoolManager &pool, const RainConfig &config,
                 uint32_t seed = std::random_device{}());

  /**
   * @brief Re-reads layout, speed, spawn and color options. Active drops keep
   * their state; the trail length is reset to the configured one.
   */
  void applyConfig(const RainConfig &config);

  /**
   * @brief Advances every active drop by dt (clamped to [0, maxStepSeconds]),
   * releases drops that left the canvas or faded out, then spawns ambient
   * drops
   */
  StepResult step(float deltaTime, double nowMs);

  /**
   * @brief Spawns one drop
   * @details Event drops take their session's column, spell the event's
   * identity into the trail and fall slower the older the event is compared
   * with the newest one seen
   * @param event Source event for event-driven drops, nullptr for ambient
   * @return INVALID_DROP_ID when no capacity could be found. Event-driven
   * requests evict the oldest ambient drop first.
   */
  DropId spawnDrop(DropOrigin origin, const RainEvent *event, double nowMs);

  /**
   * @brief Trail brightness: exp(-3 i / len) * exp(-0.1 age), clamped to
   * [0.05, 1]
   */
  static float cellBrightness(size_t trailIndex, size_t trailLength, float age);

  /**
   * @brief Head brightness before clamping, used for the faded-out test
   */
  static float headBrightness(float age);

  /**
   * @brief Sets canvas size and recomputes the column layout; active drops
   * keep their column and are clamped vertically
   * @return false for non-positive dimensions (geometry unchanged)
   */
  bool setGeometry(float width, float height);
  float getWidth() const { return m_width; }
  float getHeight() const { return m_height; }
  float getColumnWidth() const { return m_columnWidth; }
  uint32_t getColumnCount() const;
  float columnX(uint32_t column) const {
    return static_cast<float>(column) * m_columnWidth;
  }

  /**
   * @brief Trail length for new drops; active trails are truncated. Clamped
   * to [min(3, configured), configured].
   */
  void setTrailLength(size_t length);
  size_t getTrailLength() const { return m_trailLength; }

  void setSpawnRate(float dropsPerSecond);
  float getSpawnRate() const { return m_spawnRate; }

  /**
   * @brief Bottom boundary a leading cell must pass before release
   */
  float releaseBoundary(size_t trailCells) const;

  const GlyphSet &getGlyphSet() const { return m_glyphs; }
  std::mt19937 &getRng() { return m_rng; }
  uint64_t getTotalSpawned() const { return m_totalSpawned; }

  /**
   * @brief Trail length for a new event drop: the current length scaled by
   * eventKindTrailFactor(), capped at RainConfig::MAX_TRAIL_LENGTH
   */
  size_t eventTrailLength(RainEventKind kind) const;

private:
  void initDrop(Drop &drop, const RainEvent *event, double nowMs);
  float eventAgeFactor(const RainEvent &event);
  size_t ambientSpawnCount(float deltaTime);

  DropPoolManager &m_pool;
  RainConfig m_config;
  GlyphSet m_glyphs;
  std::mt19937 m_rng;

  float m_width{0.0f};
  float m_height{0.0f};
  float m_columnWidth{20.0f};
  size_t m_trailLength;
  float m_spawnRate;

  uint64_t m_totalSpawned{0};
  int64_t m_newestEventMs{0}; // Event age is measured against this
  std::vector<DropId> m_pendingRelease;
  std::vector<char32_t> m_identityGlyphs;
};

} // namespace GlyphRain

#endif // RAIN_SIMULATION_HPP
