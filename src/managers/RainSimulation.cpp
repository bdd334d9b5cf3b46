/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/RainSimulation.hpp"
#include "core/Logger.hpp"
#include "managers/DropPoolManager.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace GlyphRain {

RainSimulation::RainSimulation(DropPoolManager &pool, const RainConfig &config,
                               uint32_t seed)
    : m_pool(pool), m_config(config.sanitized()),
      m_glyphs(m_config.characterSet, m_config.customGlyphs), m_rng(seed),
      m_trailLength(m_config.trailLength), m_spawnRate(m_config.spawnRate) {
  m_columnWidth = 1.0f / m_config.columnDensity;
  m_pool.setColumnCooldown(m_config.columnCooldownMs);
  m_pendingRelease.reserve(m_config.maxDrops);
  m_identityGlyphs.reserve(RainConfig::MAX_TRAIL_LENGTH);
}

void RainSimulation::applyConfig(const RainConfig &config) {
  m_config = config.sanitized();
  m_glyphs = GlyphSet(m_config.characterSet, m_config.customGlyphs);
  m_spawnRate = m_config.spawnRate;
  m_pool.setColumnCooldown(m_config.columnCooldownMs);
  m_columnWidth = 1.0f / m_config.columnDensity;
  m_trailLength = m_config.trailLength;
  m_pool.applyTrailLength(m_trailLength);

  if (m_width > 0.0f && m_height > 0.0f) {
    setGeometry(m_width, m_height);
  }
}

float RainSimulation::cellBrightness(size_t trailIndex, size_t trailLength,
                                     float age) {
  const float length = static_cast<float>(std::max<size_t>(trailLength, 1));
  const float trailFade =
      std::exp(-3.0f * static_cast<float>(trailIndex) / length);
  const float brightness = trailFade * headBrightness(age);
  return std::clamp(brightness, MIN_CELL_BRIGHTNESS, 1.0f);
}

float RainSimulation::headBrightness(float age) {
  return std::exp(-0.1f * std::max(age, 0.0f));
}

float RainSimulation::releaseBoundary(size_t trailCells) const {
  const float trailExtent = static_cast<float>(trailCells) * m_config.cellHeight;
  return m_height + std::max(m_config.bottomMargin, trailExtent);
}

StepResult RainSimulation::step(float deltaTime, double nowMs) {
  StepResult result;
  const float dt = std::isfinite(deltaTime)
                       ? std::clamp(deltaTime, 0.0f, m_config.maxStepSeconds)
                       : 0.0f;
  result.clampedDeltaTime = dt;

  // Advance, then collect drops to release at tick end
  m_pendingRelease.clear();
  m_pool.forEachActive([&](Drop &drop) {
    drop.position += drop.velocity * dt;
    drop.age += dt;
    drop.lastUpdateMs = nowMs;

    const size_t trailLength = drop.cells.size();
    for (GlyphCell &cell : drop.cells) {
      cell.brightness = cellBrightness(cell.trailIndex, trailLength, drop.age);
    }

    if (drop.position > releaseBoundary(drop.cells.size()) ||
        headBrightness(drop.age) < FADED_HEAD_BRIGHTNESS) {
      m_pendingRelease.push_back(drop.id);
    }
  });

  for (DropId id : m_pendingRelease) {
    if (m_pool.release(id)) {
      ++result.released;
    }
  }

  const size_t toSpawn = ambientSpawnCount(dt);
  for (size_t i = 0; i < toSpawn; ++i) {
    if (spawnDrop(DropOrigin::Ambient, nullptr, nowMs) == INVALID_DROP_ID) {
      break; // At capacity; ambient spawns are simply skipped
    }
    ++result.ambientSpawned;
  }

  return result;
}

size_t RainSimulation::ambientSpawnCount(float deltaTime) {
  const double expected = static_cast<double>(deltaTime) * m_spawnRate;
  if (expected <= 0.0) {
    return 0;
  }

  double whole = 0.0;
  const double fraction = std::modf(expected, &whole);
  size_t count = static_cast<size_t>(whole);
  if (fraction > 0.0) {
    std::uniform_real_distribution<double> gate(0.0, 1.0);
    if (gate(m_rng) < fraction) {
      ++count;
    }
  }
  return std::min(count, m_config.maxSpawnsPerTick);
}

DropId RainSimulation::spawnDrop(DropOrigin origin, const RainEvent *event,
                                 double nowMs) {
  const std::string eventId =
      (origin == DropOrigin::EventDriven && event) ? event->id : std::string{};

  AcquireResult acquired = m_pool.acquire(origin, nowMs, eventId);
  if (!acquired.succeeded() && origin == DropOrigin::EventDriven) {
    // Event drops outrank ambient ones
    if (m_pool.evictOldestAmbient()) {
      acquired = m_pool.acquire(origin, nowMs, eventId);
    }
  }

  if (!acquired.succeeded()) {
    if (origin == DropOrigin::EventDriven) {
      SIM_DEBUG("Event drop skipped: pool is full of event-driven drops");
    }
    return INVALID_DROP_ID;
  }

  initDrop(*acquired.drop, origin == DropOrigin::EventDriven ? event : nullptr,
           nowMs);
  ++m_totalSpawned;
  return acquired.drop->id;
}

size_t RainSimulation::eventTrailLength(RainEventKind kind) const {
  const auto scaled = static_cast<size_t>(
      std::floor(static_cast<float>(m_trailLength) * eventKindTrailFactor(kind)));
  return std::clamp<size_t>(scaled, 1, RainConfig::MAX_TRAIL_LENGTH);
}

float RainSimulation::eventAgeFactor(const RainEvent &event) {
  // Untimed events (manual drops) count as fresh
  if (event.timestampMs <= 0) {
    return 1.0f;
  }
  m_newestEventMs = std::max(m_newestEventMs, event.timestampMs);
  return eventAgeSpeedFactor(m_newestEventMs - event.timestampMs);
}

void RainSimulation::initDrop(Drop &drop, const RainEvent *event,
                              double nowMs) {
  drop.column = event ? m_pool.assignSessionColumn(event->sessionId, nowMs, m_rng)
                      : m_pool.pickColumn(nowMs, m_rng);
  drop.position = -m_config.cellHeight; // One cell above the canvas
  drop.age = 0.0f;

  std::uniform_real_distribution<float> speed(m_config.minSpeed,
                                              m_config.maxSpeed);
  const RainEventKind kind = event ? event->kind : RainEventKind::Generic;
  drop.eventKind = kind;
  drop.velocity = speed(m_rng);
  if (event) {
    drop.velocity *= eventKindSpeedFactor(kind) * eventAgeFactor(*event);
  }

  DropColors colors =
      event ? m_config.palette.colorsFor(kind) : m_config.palette.ambient;
  if (!event && !m_config.palette.spectrum.empty()) {
    colors = m_config.palette.spectrumColors(drop.column);
  }
  drop.headColor = colors.head;
  drop.trailColor = colors.trail;

  m_identityGlyphs.clear();
  if (event) {
    appendEventIdentityGlyphs(*event, m_rng, m_identityGlyphs);
  }

  const size_t length = event ? eventTrailLength(kind) : m_trailLength;
  drop.cells.clear();
  for (size_t i = 0; i < length; ++i) {
    GlyphCell cell;
    cell.trailIndex = static_cast<uint16_t>(i);
    cell.leading = (i == 0);
    cell.glyph = i < m_identityGlyphs.size() ? m_identityGlyphs[i]
                                             : m_glyphs.randomGlyph(m_rng);
    cell.brightness = cellBrightness(i, length, 0.0f);
    drop.cells.push_back(cell);
  }
}

bool RainSimulation::setGeometry(float width, float height) {
  if (!(width > 0.0f) || !(height > 0.0f) || !std::isfinite(width) ||
      !std::isfinite(height)) {
    SIM_WARN(std::format("Ignoring invalid geometry {}x{}", width, height));
    return false;
  }

  m_width = width;
  m_height = height;
  const auto columns = static_cast<uint32_t>(
      std::max(1.0f, std::floor(width * m_config.columnDensity)));
  m_pool.setColumnCount(columns);

  // Anything already below the release boundary leaves on the next step
  m_pool.clampPositions(-m_config.cellHeight,
                        releaseBoundary(m_trailLength));
  return true;
}

uint32_t RainSimulation::getColumnCount() const {
  return m_pool.getColumnCount();
}

void RainSimulation::setTrailLength(size_t length) {
  const size_t configured = m_config.trailLength;
  const size_t lower = std::min(MIN_TRAIL_LENGTH, configured);
  m_trailLength = std::clamp(length, lower, configured);
  m_pool.applyTrailLength(m_trailLength);
}

void RainSimulation::setSpawnRate(float dropsPerSecond) {
  if (!std::isfinite(dropsPerSecond) || dropsPerSecond < 0.0f) {
    SIM_WARN(std::format("Ignoring invalid spawn rate {}", dropsPerSecond));
    return;
  }
  m_spawnRate = dropsPerSecond;
}

} // namespace GlyphRain
