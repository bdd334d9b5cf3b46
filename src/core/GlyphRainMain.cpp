/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/FrameSource.hpp"
#include "core/Logger.hpp"
#include "core/RainConfig.hpp"
#include "core/RainEngine.hpp"
#include "events/RainEvent.hpp"
#include "render/SdlRenderSurface.hpp"
#include <SDL3/SDL.h>
#include <SDL3_ttf/SDL_ttf.h>
#include <array>
#include <cstdint>
#include <format>
#include <memory>
#include <random>
#include <string>
#include <string_view>

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{720};
const std::string APP_NAME{"Glyph Rain"};
const std::string CONFIG_PATH{"res/glyph_rain.json"};
const std::string FONT_PATH{"res/fonts/NotoSansJP-Regular.ttf"};

namespace {

// Stand-in for the dashboard's event feed: hook event types as they arrive
constexpr std::array<std::string_view, 9> DEMO_EVENT_TYPES{
    "SessionStart", "UserPromptSubmit", "PreToolUse", "PostToolUse",
    "Notification", "SubagentSpawn", "SubagentStop", "agent_error", "Stop"};

constexpr std::array<std::string_view, 3> DEMO_AGENTS{"planner", "builder",
                                                     "reviewer"};

constexpr double DEMO_EVENT_INTERVAL_MS{180.0};

double nowMs() { return static_cast<double>(SDL_GetTicksNS()) / 1000000.0; }

struct HostOptions {
  bool reducedMotion{false};
  bool demoEvents{true};
  std::string configPath{CONFIG_PATH};
  std::string logDirectory;
};

HostOptions parseArgs(int argc, char *argv[]) {
  HostOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--reduced-motion") {
      options.reducedMotion = true;
    } else if (arg == "--no-demo") {
      options.demoEvents = false;
    } else if (arg == "--config" && i + 1 < argc) {
      options.configPath = argv[++i];
    } else if (arg == "--log-dir" && i + 1 < argc) {
      options.logDirectory = argv[++i];
    } else {
      HOST_WARN(std::format("Unknown argument: {}", arg));
    }
  }
  return options;
}

void handleWindowEvent(const SDL_Event &event, GlyphRain::RainEngine &engine,
                       SDL_Renderer *renderer) {
  switch (event.type) {
  case SDL_EVENT_WINDOW_HIDDEN:
  case SDL_EVENT_WINDOW_MINIMIZED:
    engine.setDocumentHidden(true);
    break;
  case SDL_EVENT_WINDOW_SHOWN:
  case SDL_EVENT_WINDOW_RESTORED:
    engine.setDocumentHidden(false);
    break;
  case SDL_EVENT_WINDOW_FOCUS_LOST:
    engine.setWindowFocused(false);
    break;
  case SDL_EVENT_WINDOW_FOCUS_GAINED:
    engine.setWindowFocused(true);
    break;
  case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED: {
    int width = 0;
    int height = 0;
    if (SDL_GetCurrentRenderOutputSize(renderer, &width, &height)) {
      engine.resize(static_cast<float>(width), static_cast<float>(height));
    } else {
      HOST_WARN(std::format("Could not query output size: {}", SDL_GetError()));
    }
    break;
  }
  default:
    break;
  }
}

void handleKey(SDL_Keycode key, GlyphRain::RainEngine &engine, bool &running) {
  switch (key) {
  case SDLK_ESCAPE:
    running = false;
    break;
  case SDLK_M:
    engine.toggle();
    break;
  case SDLK_R:
    engine.resetQuality();
    break;
  case SDLK_C:
    engine.clearAll();
    break;
  case SDLK_SPACE:
    engine.addDrop(GlyphRain::RainEventKind::Spawn);
    break;
  case SDLK_1:
    engine.applyPreset(GlyphRain::RainPreset::Classic);
    break;
  case SDLK_2:
    engine.applyPreset(GlyphRain::RainPreset::Performance);
    break;
  case SDLK_3:
    engine.applyPreset(GlyphRain::RainPreset::Quality);
    break;
  case SDLK_4:
    engine.applyPreset(GlyphRain::RainPreset::Minimal);
    break;
  case SDLK_5:
    engine.applyPreset(GlyphRain::RainPreset::Rainbow);
    break;
  default:
    break;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  const HostOptions options = parseArgs(argc, argv);
#ifndef DEBUG
  if (!options.logDirectory.empty()) {
    GlyphRain::Logger::SetLogDirectory(options.logDirectory);
  }
#endif
  HOST_INFO(std::format("Initializing {}", APP_NAME));

  GlyphRain::RainConfig config;
  if (auto loaded = GlyphRain::loadRainConfig(options.configPath)) {
    config = *loaded;
    HOST_INFO(std::format("Config loaded from {}", options.configPath));
  } else {
    HOST_WARN(std::format("Failed to load {} - using defaults", options.configPath));
  }

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
    HOST_CRITICAL(std::format("SDL could not initialize: {}", SDL_GetError()));
    return -1;
  }
  if (!TTF_Init()) {
    HOST_CRITICAL(std::format("SDL_ttf could not initialize: {}", SDL_GetError()));
    SDL_Quit();
    return -1;
  }

  SDL_Window *window = SDL_CreateWindow(APP_NAME.c_str(), WINDOW_WIDTH,
                                        WINDOW_HEIGHT, SDL_WINDOW_RESIZABLE);
  if (!window) {
    HOST_CRITICAL(std::format("Window could not be created: {}", SDL_GetError()));
    TTF_Quit();
    SDL_Quit();
    return -1;
  }

  SDL_Renderer *renderer = SDL_CreateRenderer(window, nullptr);
  if (!renderer) {
    HOST_CRITICAL(std::format("Renderer could not be created: {}", SDL_GetError()));
    SDL_DestroyWindow(window);
    TTF_Quit();
    SDL_Quit();
    return -1;
  }
  if (!SDL_SetRenderVSync(renderer, 1)) {
    HOST_WARN(std::format("VSync unavailable: {}", SDL_GetError()));
  }

  int outputWidth = WINDOW_WIDTH;
  int outputHeight = WINDOW_HEIGHT;
  if (!SDL_GetCurrentRenderOutputSize(renderer, &outputWidth, &outputHeight)) {
    HOST_WARN(std::format("Could not query output size: {}", SDL_GetError()));
  }

  int exitCode = 0;
  {
    GlyphRain::CooperativeFrameSource frameSource(nowMs());
    GlyphRain::RainEngine engine(frameSource, config);

    engine.setPerformanceListener([](const GlyphRain::PerformanceUpdate &update) {
      HOST_DEBUG(std::format("{:.1f} fps, {:.2f}ms render, {} drops, {:.2f}MB, {}",
                             update.avgFrameRate, update.avgRenderTime,
                             update.activeDrops, update.memoryUsageMB,
                             GlyphRain::qualityLevelToString(update.quality)));
    });
    engine.setQualityWarningListener([](const GlyphRain::QualityWarning &warning) {
      HOST_WARN(warning.message);
    });
    engine.setStatusListener(
        [window](GlyphRain::RainStatus, const std::string &description) {
          const std::string title = std::format("{} - {}", APP_NAME, description);
          SDL_SetWindowTitle(window, title.c_str());
        });

    auto surface = std::make_unique<GlyphRain::SdlRenderSurface>(
        renderer, FONT_PATH, config.fontSize, outputWidth, outputHeight);
    if (auto error = engine.init(std::move(surface))) {
      HOST_CRITICAL(std::format("Rain engine failed to start: {}", error->message));
      exitCode = -1;
    } else {
      engine.setReducedMotion(options.reducedMotion);
      engine.enable();

      std::mt19937 demoRng(std::random_device{}());
      std::uniform_int_distribution<size_t> pickType(0, DEMO_EVENT_TYPES.size() - 1);
      double nextDemoEventMs = nowMs() + DEMO_EVENT_INTERVAL_MS;
      uint64_t demoEventCount = 0;

      HOST_INFO("Starting Main Loop");

      bool running = true;
      SDL_Event event;
      while (running) {
        while (SDL_PollEvent(&event)) {
          if (event.type == SDL_EVENT_QUIT) {
            running = false;
          } else if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
            handleKey(event.key.key, engine, running);
          } else {
            handleWindowEvent(event, engine, renderer);
          }
        }

        const double frameStartMs = nowMs();
        if (options.demoEvents && frameStartMs >= nextDemoEventMs) {
          const std::string_view type = DEMO_EVENT_TYPES[pickType(demoRng)];
          const size_t agent = demoEventCount % DEMO_AGENTS.size();
          engine.pushEvent(GlyphRain::RainEvent(
              std::format("demo-{}", ++demoEventCount),
              static_cast<int64_t>(frameStartMs),
              GlyphRain::eventKindFromString(type),
              std::format("demo-session-{:04x}", agent + 1),
              std::string(DEMO_AGENTS[agent])));
          nextDemoEventMs = frameStartMs + DEMO_EVENT_INTERVAL_MS;
        }

        const bool painted = frameSource.pump(frameStartMs) > 0;
        if (painted) {
          SDL_RenderPresent(renderer);
        } else {
          // Paused or disabled: nothing requested a frame, so don't spin
          SDL_Delay(16);
        }
      }

      const GlyphRain::MemoryMetrics metrics = engine.getMemoryMetrics();
      HOST_INFO(std::format("Shutting down: {} active, {} pooled, {:.2f}MB resident",
                            metrics.activeDrops, metrics.pooledDrops,
                            metrics.residentMemoryMB));
    }

    engine.dispose();
  }

  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  TTF_Quit();
  SDL_Quit();

  return exitCode;
}
