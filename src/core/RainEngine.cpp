/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/RainEngine.hpp"
#include "core/FrameSource.hpp"
#include "core/Logger.hpp"
#include "render/RenderSurface.hpp"
#include "utils/MemoryProbe.hpp"
#include <exception>
#include <format>

namespace GlyphRain {

std::string_view rainStatusToString(RainStatus status) {
  switch (status) {
  case RainStatus::Disabled: return "disabled";
  case RainStatus::Enabled: return "enabled";
  case RainStatus::Transitioning: return "transitioning";
  default: return "unknown";
  }
}

RainEngine::RainEngine(FrameSource &frameSource, const RainConfig &config,
                       uint32_t seed)
    : m_frameSource(frameSource), m_config(config.sanitized()),
      m_pool(m_config.maxDrops, m_config.trailLength),
      m_simulation(m_pool, m_config, seed),
      m_sync(m_simulation, m_pool, m_config.maxSpawnsPerTick,
             m_config.maxPendingEvents),
      m_monitor(m_config.performanceWindow),
      m_quality(m_monitor, m_config.maxDrops, m_config.trailLength,
                m_config.downgradeWindows, m_config.upgradeWindows),
      m_scheduler(frameSource, m_config.targetFPS, m_config.maxStepSeconds,
                  m_config.sampleIntervalMs) {
  m_monitor.setThresholds(m_config.lowFrameRate, m_config.recoverFrameRate,
                          m_config.renderBudgetMs);
  m_quality.setAdaptive(m_config.adaptiveQuality);
  m_quality.setLevelListener(
      [this](QualityLevel, QualityLevel, const QualityParams &params) {
        applyQualityParams(params);
      });
  m_quality.setWarningListener([this](const QualityWarning &warning) {
    ENGINE_WARN(warning.message);
    if (m_warningListener) {
      m_warningListener(warning);
    }
  });

  // Nothing runs until init() and enable()
  m_scheduler.setPauseReason(PauseReason::Disabled, true);
  m_statusText = describeStatus();
}

RainEngine::~RainEngine() {
  // Listeners may capture objects that are already gone
  m_statusListener = nullptr;
  m_performanceListener = nullptr;
  m_warningListener = nullptr;
  dispose();
}

std::optional<RainError> RainEngine::init(std::unique_ptr<RenderSurface> surface) {
  if (m_disposed) {
    return RainError{RainErrorCode::Disposed, "Engine has been disposed"};
  }
  if (m_initialized) {
    ENGINE_WARN("RainEngine already initialized");
    return RainError{RainErrorCode::AlreadyInitialized,
                     "Engine is already initialized"};
  }
  if (!surface || !surface->isAvailable()) {
    ENGINE_ERROR("Drawing surface unavailable; rain stays disabled");
    return RainError{RainErrorCode::SurfaceUnavailable,
                     "Drawing surface is unavailable"};
  }

  m_renderer = std::make_unique<RainRenderer>(std::move(surface));

  if (m_pendingGeometry) {
    applyGeometry(m_pendingGeometry->first, m_pendingGeometry->second);
    m_pendingGeometry.reset();
  } else {
    const RenderSurface *target = m_renderer->getSurface();
    applyGeometry(target->getWidth(), target->getHeight());
  }
  m_renderer->clear(m_config.palette.background);

  m_scheduler.setEventHandler([this]() { handleEvents(); });
  m_scheduler.setUpdateHandler(
      [this](float deltaTime, double nowMs) { handleUpdate(deltaTime, nowMs); });
  m_scheduler.setRenderHandler([this]() { handleRender(); });
  m_scheduler.setSampleHandler([this](double nowMs) { handleSample(nowMs); });

  m_initialized = true;
  applyQualityParams(m_quality.getParams());
  m_scheduler.start();

  ENGINE_INFO(std::format("RainEngine initialized: {}x{}, {} columns, ceiling {}",
                          m_simulation.getWidth(), m_simulation.getHeight(),
                          m_simulation.getColumnCount(), m_config.maxDrops));

  // Apply an enable() requested before init
  if (m_enabled) {
    m_scheduler.setPauseReason(PauseReason::Disabled, false);
    m_transitionElapsedMs = 0.0;
    setStatus(m_config.transitionMs > 0.0 ? RainStatus::Transitioning
                                          : RainStatus::Enabled);
  } else {
    refreshStatus();
  }
  return std::nullopt;
}

void RainEngine::dispose() {
  if (m_disposed) {
    return;
  }
  m_scheduler.stop();
  m_scheduler.setEventHandler(nullptr);
  m_scheduler.setUpdateHandler(nullptr);
  m_scheduler.setRenderHandler(nullptr);
  m_scheduler.setSampleHandler(nullptr);

  const size_t released = m_pool.releaseAll();
  m_renderer.reset();
  m_enabled = false;
  setStatus(RainStatus::Disabled);
  m_initialized = false;
  m_disposed = true;

  ENGINE_DEBUG(std::format("RainEngine disposed ({} drops released)", released));
}

void RainEngine::enable() {
  if (m_disposed || m_enabled) {
    return;
  }
  m_enabled = true;
  if (!m_initialized) {
    ENGINE_DEBUG("enable() before init; deferred");
    return;
  }

  m_transitionElapsedMs = 0.0;
  m_scheduler.setPauseReason(PauseReason::Disabled, false);
  setStatus(m_config.transitionMs > 0.0 ? RainStatus::Transitioning
                                        : RainStatus::Enabled);
}

void RainEngine::disable() {
  if (m_disposed || !m_enabled) {
    return;
  }
  m_enabled = false;
  if (!m_initialized) {
    return;
  }

  // Explicit disable wins over every ambient resume signal
  m_scheduler.setPauseReason(PauseReason::Disabled, true);
  setStatus(RainStatus::Disabled);
}

void RainEngine::toggle() {
  if (m_enabled) {
    disable();
  } else {
    enable();
  }
}

DropId RainEngine::addDrop(std::optional<RainEventKind> kind) {
  if (!m_initialized || !m_enabled) {
    return INVALID_DROP_ID;
  }

  const double nowMs = m_frameSource.now();
  if (!kind) {
    return m_simulation.spawnDrop(DropOrigin::Ambient, nullptr, nowMs);
  }

  // Manual event drops carry no id or timestamp: no dedup, no aging
  const RainEvent manual({}, 0, *kind);
  return m_simulation.spawnDrop(DropOrigin::EventDriven, &manual, nowMs);
}

bool RainEngine::removeDrop(DropId id) {
  if (!m_initialized) {
    return false;
  }
  return m_pool.release(id);
}

size_t RainEngine::clearAll() {
  if (!m_initialized) {
    return 0;
  }
  const size_t released = m_pool.releaseAll();
  if (m_renderer) {
    m_renderer->clear(m_config.palette.background);
  }
  return released;
}

bool RainEngine::resize(float width, float height) {
  if (m_disposed) {
    return false;
  }
  if (!(width > 0.0f) || !(height > 0.0f)) {
    ENGINE_WARN(std::format("Ignoring resize to {}x{}", width, height));
    return false;
  }

  if (!m_initialized) {
    m_pendingGeometry = std::make_pair(width, height);
    return true;
  }

  applyGeometry(width, height);
  return true;
}

void RainEngine::applyGeometry(float width, float height) {
  if (!m_sync.resize(width, height)) {
    return;
  }
  if (m_renderer) {
    m_renderer->resize(width, height);
  }
}

MemoryMetrics RainEngine::getMemoryMetrics() const {
  MemoryMetrics metrics;
  metrics.activeDrops = m_pool.getActiveCount();
  metrics.pooledDrops = m_pool.getIdleCount();
  metrics.memoryUsageMB = m_pool.estimateMemoryMB();
  metrics.residentMemoryMB = residentMemoryMB();
  return metrics;
}

void RainEngine::pushEvent(RainEvent event) {
  if (m_disposed) {
    return;
  }
  // Events pushed before init wait for the first ticks. Once running, a
  // disabled engine drops them
  if (m_initialized && !m_enabled) {
    ENGINE_DEBUG(std::format("Event {} ignored while disabled", event.id));
    return;
  }
  m_sync.enqueue(std::move(event));
}

bool RainEngine::processEvent(const RainEvent &event) {
  if (!m_initialized || !m_enabled) {
    return false;
  }
  return m_sync.processEvent(event, m_frameSource.now());
}

BatchResult RainEngine::processEventBatch(const std::vector<RainEvent> &events) {
  if (!m_initialized || !m_enabled) {
    return {};
  }
  return m_sync.processEventBatch(events, m_frameSource.now());
}

void RainEngine::setDocumentHidden(bool hidden) {
  if (m_disposed) {
    return;
  }
  m_scheduler.setPauseReason(PauseReason::DocumentHidden, hidden);
  refreshStatus();
}

void RainEngine::setWindowFocused(bool focused) {
  if (m_disposed) {
    return;
  }
  m_scheduler.setPauseReason(PauseReason::WindowBlurred, !focused);
  refreshStatus();
}

void RainEngine::setReducedMotion(bool reduced) {
  if (m_disposed) {
    return;
  }
  m_scheduler.setPauseReason(PauseReason::ReducedMotion, reduced);
  refreshStatus();
}

void RainEngine::resetQuality(QualityLevel level) {
  if (m_disposed) {
    return;
  }
  m_quality.reset(level);
}

void RainEngine::applyPreset(RainPreset preset) {
  updateConfig(RainConfig::fromPreset(preset));
}

void RainEngine::updateConfig(const RainConfig &config) {
  if (m_disposed) {
    return;
  }
  const RainConfig next = config.sanitized();

  if (next.maxDrops != m_config.maxDrops) {
    m_pool.setCeiling(next.maxDrops);
  }
  m_config = next;

  m_simulation.applyConfig(m_config);
  m_sync.setLimits(m_config.maxSpawnsPerTick, m_config.maxPendingEvents);

  m_monitor.setWindowSize(m_config.performanceWindow);
  m_monitor.setThresholds(m_config.lowFrameRate, m_config.recoverFrameRate,
                          m_config.renderBudgetMs);
  m_quality.setLimits(m_config.maxDrops, m_config.trailLength);
  m_quality.setHysteresis(m_config.downgradeWindows, m_config.upgradeWindows);
  m_quality.setAdaptive(m_config.adaptiveQuality);

  TimestepManager &timestep = m_scheduler.getTimestepManager();
  timestep.setTargetFPS(m_config.targetFPS);
  timestep.setMaxStep(m_config.maxStepSeconds);
  m_scheduler.setSampleInterval(m_config.sampleIntervalMs);

  // The current level re-applies against the new limits
  applyQualityParams(m_quality.getParams());

  ENGINE_DEBUG(std::format("Config updated: ceiling {}, trail {}, spawn rate {}",
                           m_config.maxDrops, m_config.trailLength,
                           m_config.spawnRate));
}

void RainEngine::setPerformanceListener(PerformanceListener listener) {
  m_performanceListener = std::move(listener);
}

void RainEngine::setQualityWarningListener(QualityWarningListener listener) {
  m_warningListener = std::move(listener);
}

void RainEngine::setStatusListener(StatusListener listener) {
  m_statusListener = std::move(listener);
}

void RainEngine::handleEvents() { m_sync.drainPending(m_frameSource.now()); }

void RainEngine::handleUpdate(float deltaTime, double nowMs) {
  m_simulation.step(deltaTime, nowMs);
  m_pool.enforceMemoryLimit(m_config.memoryLimitMB);

  if (m_status == RainStatus::Transitioning) {
    m_transitionElapsedMs += m_scheduler.getTimestepManager().getFrameTimeMs();
    if (m_transitionElapsedMs >= m_config.transitionMs) {
      setStatus(RainStatus::Enabled);
    }
  }
}

void RainEngine::handleRender() {
  if (!m_renderer) {
    return;
  }

  m_lastRenderStats = m_renderer->render(m_pool.listActive(), buildRenderOptions());

  // The first frame after a resume has no meaningful frame time
  const double frameTimeMs = m_scheduler.getTimestepManager().getFrameTimeMs();
  if (frameTimeMs > 0.0) {
    m_monitor.recordFrame(m_frameSource.now(), frameTimeMs,
                          m_lastRenderStats.renderTimeMs,
                          m_pool.estimateMemoryMB());
  }
}

void RainEngine::handleSample(double nowMs) {
  // Summarize before evaluating; a level change clears the window
  const PerformanceSummary summary = m_monitor.getSummary();
  m_quality.evaluate();

  PerformanceUpdate update;
  update.avgFrameRate = summary.avgFrameRate;
  update.avgRenderTime = summary.avgRenderTimeMs;
  update.activeDrops = m_pool.getActiveCount();
  update.memoryUsageMB = m_pool.estimateMemoryMB();
  update.quality = m_quality.getLevel();

  ENGINE_DEBUG(std::format("t={:.0f}ms fps={:.1f} render={:.2f}ms drops={} "
                           "mem={:.2f}MB quality={}",
                           nowMs, update.avgFrameRate, update.avgRenderTime,
                           update.activeDrops, update.memoryUsageMB,
                           qualityLevelToString(update.quality)));

  if (m_performanceListener) {
    try {
      m_performanceListener(update);
    } catch (const std::exception &e) {
      ENGINE_ERROR(std::format("Exception in performance listener: {}", e.what()));
    }
  }
}

void RainEngine::applyQualityParams(const QualityParams &params) {
  m_pool.setActiveCap(params.maxDrops);
  m_simulation.setTrailLength(params.trailLength);
  m_glowEnabled = params.glow;
}

RenderOptions RainEngine::buildRenderOptions() const {
  RenderOptions options;
  options.columnWidth = m_simulation.getColumnWidth();
  options.columnCount = m_simulation.getColumnCount();
  options.cellHeight = m_config.cellHeight;
  options.canvasHeight = m_simulation.getHeight();
  options.background = m_config.palette.background;
  options.fadeAlpha = m_config.fadeAlpha;
  options.glow = m_glowEnabled;
  options.glowIntensity = m_config.glowIntensity;
  return options;
}

std::string RainEngine::describeStatus() const {
  if (m_status == RainStatus::Disabled) {
    return "Glyph rain animation off";
  }
  if (m_scheduler.hasPauseReason(PauseReason::ReducedMotion)) {
    return "Glyph rain animation on, paused for reduced motion";
  }
  if (m_scheduler.hasPauseReason(PauseReason::DocumentHidden) ||
      m_scheduler.hasPauseReason(PauseReason::WindowBlurred)) {
    return "Glyph rain animation on, paused in background";
  }
  return m_status == RainStatus::Transitioning ? "Glyph rain animation starting"
                                               : "Glyph rain animation on";
}

void RainEngine::setStatus(RainStatus status) {
  m_status = status;
  refreshStatus();
}

void RainEngine::refreshStatus() {
  std::string text = describeStatus();
  if (text == m_statusText) {
    return;
  }
  m_statusText = std::move(text);
  ENGINE_DEBUG(std::format("Status: {} ({})", rainStatusToString(m_status),
                           m_statusText));

  if (!m_statusListener) {
    return;
  }
  try {
    m_statusListener(m_status, m_statusText);
  } catch (const std::exception &e) {
    ENGINE_ERROR(std::format("Exception in status listener: {}", e.what()));
  }
}

} // namespace GlyphRain
