/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release-only sink; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <string_view>
#include <vector>

namespace GlyphRain {
namespace {

constexpr size_t MAX_LOG_FILES = 5;
constexpr size_t FLUSH_INTERVAL = 32;
constexpr std::string_view LOG_FILE_PREFIX = "glyph_rain_";
constexpr const char *LOG_DIR_ENV = "GLYPHRAIN_LOG_DIR";

std::tm localTime(std::time_t time) {
  std::tm out{};
#ifdef _WIN32
  localtime_s(&out, &time);
#else
  localtime_r(&time, &out);
#endif
  return out;
}

/**
 * Rotating file log for CRITICAL and ERROR in release builds. CRITICAL is
 * mirrored to stderr, as is everything when no file could be opened.
 */
class ReleaseLogSink {
public:
  static ReleaseLogSink &get() {
    static ReleaseLogSink sink;
    return sink;
  }

  void setDirectory(const std::string &directory) {
    std::lock_guard<std::mutex> lock(Logger::s_logMutex);
    if (m_opened) {
      return; // Too late, the file is already chosen
    }
    m_directory = directory;
  }

  void write(std::string_view level, const char *system, std::string_view message) {
    std::lock_guard<std::mutex> lock(Logger::s_logMutex);
    if (!m_opened) {
      open();
    }

    const auto now = std::chrono::system_clock::now();
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    const std::string line = std::format(
        "{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} [{}] [{}] {}\n",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
        tm.tm_sec, millis, level, system, message);

    const bool critical = level == "CRITICAL";
    if (critical || !m_file.is_open()) {
      std::fputs(line.c_str(), stderr);
    }
    if (!m_file.is_open()) {
      return;
    }

    m_file << line;
    if (critical || ++m_pending >= FLUSH_INTERVAL) {
      m_file.flush();
      m_pending = 0;
    }
  }

private:
  ReleaseLogSink() {
    if (const char *fromEnv = std::getenv(LOG_DIR_ENV); fromEnv && *fromEnv) {
      m_directory = fromEnv;
    }
  }

  ~ReleaseLogSink() {
    if (m_file.is_open()) {
      m_file.flush();
    }
  }

  ReleaseLogSink(const ReleaseLogSink &) = delete;
  ReleaseLogSink &operator=(const ReleaseLogSink &) = delete;

  void open() {
    namespace fs = std::filesystem;
    m_opened = true;

    std::error_code ec;
    const fs::path dir(m_directory);
    fs::create_directories(dir, ec);
    if (ec) {
      std::fputs(std::format("Glyph Rain - log directory '{}' unavailable: {}\n",
                             m_directory, ec.message()).c_str(), stderr);
      return;
    }
    pruneOldFiles(dir);

    const std::tm tm = localTime(std::time(nullptr));
    const fs::path file = dir / std::format(
        "{}{:04}{:02}{:02}_{:02}{:02}{:02}.log", LOG_FILE_PREFIX,
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
        tm.tm_sec);
    m_file.open(file, std::ios::out | std::ios::app);
    if (m_file.is_open()) {
      m_file << "=== Glyph Rain error log ===\n";
      m_file.flush();
    }
  }

  // Keeps the newest MAX_LOG_FILES - 1 so the new file makes MAX_LOG_FILES
  void pruneOldFiles(const std::filesystem::path &dir) {
    namespace fs = std::filesystem;
    std::vector<fs::directory_entry> logs;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(dir, ec)) {
      const std::string name = entry.path().filename().string();
      if (entry.path().extension() == ".log" && name.starts_with(LOG_FILE_PREFIX)) {
        logs.push_back(entry);
      }
    }
    if (logs.size() < MAX_LOG_FILES) {
      return;
    }

    std::sort(logs.begin(), logs.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
              });
    const size_t excess = logs.size() - MAX_LOG_FILES + 1;
    for (size_t i = 0; i < excess; ++i) {
      fs::remove(logs[i].path(), ec);
    }
  }

  std::ofstream m_file;
  std::string m_directory{"logs"};
  size_t m_pending{0};
  bool m_opened{false};
};

} // namespace

void Logger::SetLogDirectory(const std::string &directory) {
  ReleaseLogSink::get().setDirectory(directory);
}

void Logger::Log(const char *level, const char *system, const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  ReleaseLogSink::get().write(level, system, message);
}

} // namespace GlyphRain

#endif // DEBUG
