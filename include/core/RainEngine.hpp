/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAIN_ENGINE_HPP
#define RAIN_ENGINE_HPP

/**
 * @file RainEngine.hpp
 * @brief Owned glyph rain instance for one drawing surface
 *
 * RainEngine wires the drop pool, simulation, renderer, performance monitor,
 * quality controller, event adapter and animation scheduler together. There
 * is no global state: construct one engine per surface, dispose it when the
 * surface goes away.
 *
 * Per tick: buffered events are drained, the simulation steps, the snapshot is
 * painted and the frame is recorded. Every sampleIntervalMs the quality
 * controller evaluates the window and a performance update is emitted.
 */

#include "core/AnimationScheduler.hpp"
#include "core/RainConfig.hpp"
#include "entities/Drop.hpp"
#include "managers/DropPoolManager.hpp"
#include "managers/EventSyncAdapter.hpp"
#include "managers/QualityController.hpp"
#include "managers/RainSimulation.hpp"
#include "render/RainRenderer.hpp"
#include "utils/PerformanceMonitor.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace GlyphRain {

class FrameSource;
class RenderSurface;

enum class RainErrorCode : uint8_t {
  SurfaceUnavailable = 0,
  AlreadyInitialized = 1,
  Disposed = 2
};

struct RainError {
  RainErrorCode code{RainErrorCode::SurfaceUnavailable};
  std::string message;
};

enum class RainStatus : uint8_t { Disabled = 0, Enabled = 1, Transitioning = 2 };

std::string_view rainStatusToString(RainStatus status);

struct PerformanceUpdate {
  double avgFrameRate{0.0};
  double avgRenderTime{0.0};
  size_t activeDrops{0};
  double memoryUsageMB{0.0};
  QualityLevel quality{QualityLevel::High};
};

struct MemoryMetrics {
  size_t activeDrops{0};
  size_t pooledDrops{0};      // Idle slots ready for reuse
  double memoryUsageMB{0.0};  // Pool estimate
  double residentMemoryMB{0.0}; // Whole process, 0 when unavailable
};

class RainEngine {
public:
  using PerformanceListener = std::function<void(const PerformanceUpdate &)>;
  using QualityWarningListener = std::function<void(const QualityWarning &)>;
  using StatusListener =
      std::function<void(RainStatus status, const std::string &description)>;

  /**
   * @param frameSource Frame primitive; must outlive the engine
   * @param config Options; sanitized on construction
   * @param seed Seed for glyph, column and speed randomness
   */
  explicit RainEngine(FrameSource &frameSource, const RainConfig &config = {},
                      uint32_t seed = std::random_device{}());
  ~RainEngine();

  /**
   * @brief Takes ownership of the surface and starts the scheduler
   * @return An error when the surface is null or unavailable; the engine then
   * stays disabled and inert
   */
  std::optional<RainError> init(std::unique_ptr<RenderSurface> surface);

  /**
   * @brief Stops the loop, releases every drop and destroys the surface.
   * The status listener sees the final Disabled state. Idempotent; every
   * later call is a no-op.
   */
  void dispose();

  bool isInitialized() const { return m_initialized; }
  bool isDisposed() const { return m_disposed; }

  // Control surface; safe before init
  void enable();
  void disable();
  void toggle();
  bool isEnabled() const { return m_enabled; }

  /**
   * @brief Spawns a drop by hand
   * @param kind Event kind for an event-driven drop; ambient when empty
   * @return INVALID_DROP_ID before init, while disabled or without capacity
   */
  DropId addDrop(std::optional<RainEventKind> kind = std::nullopt);
  bool removeDrop(DropId id);
  size_t clearAll();

  /**
   * @brief New canvas size; ignored (with a warning) for non-positive values
   */
  bool resize(float width, float height);

  MemoryMetrics getMemoryMetrics() const;

  /**
   * @brief Buffers an event for the next tick. Ignored once initialized while
   * the engine is disabled.
   */
  void pushEvent(RainEvent event);

  /**
   * @brief Spawns drops for events right away
   * @details Returns false / an empty result before init and while disabled
   */
  bool processEvent(const RainEvent &event);
  BatchResult processEventBatch(const std::vector<RainEvent> &events);

  // Lifecycle signals from the host
  void setDocumentHidden(bool hidden);
  void setWindowFocused(bool focused);
  void setReducedMotion(bool reduced);

  RainStatus getStatus() const { return m_status; }
  const std::string &getStatusText() const { return m_statusText; }

  void resetQuality(QualityLevel level = QualityLevel::High);
  QualityLevel getQualityLevel() const { return m_quality.getLevel(); }
  bool isGlowEnabled() const { return m_glowEnabled; }

  void applyPreset(RainPreset preset);
  void updateConfig(const RainConfig &config);
  const RainConfig &getConfig() const { return m_config; }

  void setPerformanceListener(PerformanceListener listener);
  void setQualityWarningListener(QualityWarningListener listener);
  void setStatusListener(StatusListener listener);

  size_t getActiveDropCount() const { return m_pool.getActiveCount(); }
  const DropPoolManager &getPool() const { return m_pool; }
  const AnimationScheduler &getScheduler() const { return m_scheduler; }
  const PerformanceMonitor &getPerformanceMonitor() const { return m_monitor; }
  const RenderStats &getLastRenderStats() const { return m_lastRenderStats; }

private:
  void handleEvents();
  void handleUpdate(float deltaTime, double nowMs);
  void handleRender();
  void handleSample(double nowMs);

  void applyQualityParams(const QualityParams &params);
  void applyGeometry(float width, float height);
  RenderOptions buildRenderOptions() const;

  void setStatus(RainStatus status);
  void refreshStatus();
  std::string describeStatus() const;

  FrameSource &m_frameSource;
  RainConfig m_config;
  DropPoolManager m_pool;
  RainSimulation m_simulation;
  EventSyncAdapter m_sync;
  PerformanceMonitor m_monitor;
  QualityController m_quality;
  std::unique_ptr<RainRenderer> m_renderer;
  AnimationScheduler m_scheduler;

  bool m_initialized{false};
  bool m_disposed{false};
  bool m_enabled{false};
  bool m_glowEnabled{true};
  RainStatus m_status{RainStatus::Disabled};
  std::string m_statusText;
  double m_transitionElapsedMs{0.0};

  std::optional<std::pair<float, float>> m_pendingGeometry;
  RenderStats m_lastRenderStats;

  PerformanceListener m_performanceListener;
  QualityWarningListener m_warningListener;
  StatusListener m_statusListener;

  RainEngine(const RainEngine &) = delete;
  RainEngine &operator=(const RainEngine &) = delete;
};

} // namespace GlyphRain

#endif // RAIN_ENGINE_HPP
