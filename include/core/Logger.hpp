/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace GlyphRain {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Glyph Rain - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define GLYPHRAIN_CRITICAL(system, msg)                                        \
  GlyphRain::Logger::Log(GlyphRain::LogLevel::CRITICAL, system, msg)
#define GLYPHRAIN_ERROR(system, msg)                                           \
  GlyphRain::Logger::Log(GlyphRain::LogLevel::ERROR_LEVEL, system, msg)
#define GLYPHRAIN_WARN(system, msg)                                            \
  GlyphRain::Logger::Log(GlyphRain::LogLevel::WARNING, system, msg)
#define GLYPHRAIN_INFO(system, msg)                                            \
  GlyphRain::Logger::Log(GlyphRain::LogLevel::INFO, system, msg)
#define GLYPHRAIN_DEBUG(system, msg)                                           \
  GlyphRain::Logger::Log(GlyphRain::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a rotating file log (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  /**
   * @brief Sets the directory release logs are written to (default "logs")
   * @note Must be called before the first message is logged
   */
  static void SetLogDirectory(const std::string &directory);

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define GLYPHRAIN_CRITICAL(system, msg)                                        \
  GlyphRain::Logger::Log("CRITICAL", system, msg)

#define GLYPHRAIN_ERROR(system, msg)                                           \
  GlyphRain::Logger::Log("ERROR", system, msg)

#define GLYPHRAIN_WARN(system, msg) ((void)0)  // Zero overhead
#define GLYPHRAIN_INFO(system, msg) ((void)0)  // Zero overhead
#define GLYPHRAIN_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Engine facade and scheduling
#define ENGINE_CRITICAL(msg) GLYPHRAIN_CRITICAL("RainEngine", msg)
#define ENGINE_ERROR(msg) GLYPHRAIN_ERROR("RainEngine", msg)
#define ENGINE_WARN(msg) GLYPHRAIN_WARN("RainEngine", msg)
#define ENGINE_INFO(msg) GLYPHRAIN_INFO("RainEngine", msg)
#define ENGINE_DEBUG(msg) GLYPHRAIN_DEBUG("RainEngine", msg)

#define SCHEDULER_CRITICAL(msg) GLYPHRAIN_CRITICAL("AnimationScheduler", msg)
#define SCHEDULER_ERROR(msg) GLYPHRAIN_ERROR("AnimationScheduler", msg)
#define SCHEDULER_WARN(msg) GLYPHRAIN_WARN("AnimationScheduler", msg)
#define SCHEDULER_INFO(msg) GLYPHRAIN_INFO("AnimationScheduler", msg)
#define SCHEDULER_DEBUG(msg) GLYPHRAIN_DEBUG("AnimationScheduler", msg)

// Managers
#define POOL_CRITICAL(msg) GLYPHRAIN_CRITICAL("DropPoolManager", msg)
#define POOL_ERROR(msg) GLYPHRAIN_ERROR("DropPoolManager", msg)
#define POOL_WARN(msg) GLYPHRAIN_WARN("DropPoolManager", msg)
#define POOL_INFO(msg) GLYPHRAIN_INFO("DropPoolManager", msg)
#define POOL_DEBUG(msg) GLYPHRAIN_DEBUG("DropPoolManager", msg)

#define SIM_CRITICAL(msg) GLYPHRAIN_CRITICAL("RainSimulation", msg)
#define SIM_ERROR(msg) GLYPHRAIN_ERROR("RainSimulation", msg)
#define SIM_WARN(msg) GLYPHRAIN_WARN("RainSimulation", msg)
#define SIM_INFO(msg) GLYPHRAIN_INFO("RainSimulation", msg)
#define SIM_DEBUG(msg) GLYPHRAIN_DEBUG("RainSimulation", msg)

#define QUALITY_CRITICAL(msg) GLYPHRAIN_CRITICAL("QualityController", msg)
#define QUALITY_ERROR(msg) GLYPHRAIN_ERROR("QualityController", msg)
#define QUALITY_WARN(msg) GLYPHRAIN_WARN("QualityController", msg)
#define QUALITY_INFO(msg) GLYPHRAIN_INFO("QualityController", msg)
#define QUALITY_DEBUG(msg) GLYPHRAIN_DEBUG("QualityController", msg)

#define SYNC_CRITICAL(msg) GLYPHRAIN_CRITICAL("EventSyncAdapter", msg)
#define SYNC_ERROR(msg) GLYPHRAIN_ERROR("EventSyncAdapter", msg)
#define SYNC_WARN(msg) GLYPHRAIN_WARN("EventSyncAdapter", msg)
#define SYNC_INFO(msg) GLYPHRAIN_INFO("EventSyncAdapter", msg)
#define SYNC_DEBUG(msg) GLYPHRAIN_DEBUG("EventSyncAdapter", msg)

// Rendering
#define RENDER_CRITICAL(msg) GLYPHRAIN_CRITICAL("RainRenderer", msg)
#define RENDER_ERROR(msg) GLYPHRAIN_ERROR("RainRenderer", msg)
#define RENDER_WARN(msg) GLYPHRAIN_WARN("RainRenderer", msg)
#define RENDER_INFO(msg) GLYPHRAIN_INFO("RainRenderer", msg)
#define RENDER_DEBUG(msg) GLYPHRAIN_DEBUG("RainRenderer", msg)

// Configuration
#define CONFIG_CRITICAL(msg) GLYPHRAIN_CRITICAL("RainConfig", msg)
#define CONFIG_ERROR(msg) GLYPHRAIN_ERROR("RainConfig", msg)
#define CONFIG_WARN(msg) GLYPHRAIN_WARN("RainConfig", msg)
#define CONFIG_INFO(msg) GLYPHRAIN_INFO("RainConfig", msg)
#define CONFIG_DEBUG(msg) GLYPHRAIN_DEBUG("RainConfig", msg)

// Host application
#define HOST_CRITICAL(msg) GLYPHRAIN_CRITICAL("Host", msg)
#define HOST_ERROR(msg) GLYPHRAIN_ERROR("Host", msg)
#define HOST_WARN(msg) GLYPHRAIN_WARN("Host", msg)
#define HOST_INFO(msg) GLYPHRAIN_INFO("Host", msg)
#define HOST_DEBUG(msg) GLYPHRAIN_DEBUG("Host", msg)

// Benchmark mode convenience macros
#define GLYPHRAIN_ENABLE_BENCHMARK_MODE()                                      \
  GlyphRain::Logger::SetBenchmarkMode(true)
#define GLYPHRAIN_DISABLE_BENCHMARK_MODE()                                     \
  GlyphRain::Logger::SetBenchmarkMode(false)

} // namespace GlyphRain

#endif // LOGGER_HPP
