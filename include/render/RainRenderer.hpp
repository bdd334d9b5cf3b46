/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAIN_RENDERER_HPP
#define RAIN_RENDERER_HPP

#include "entities/Drop.hpp"
#include "render/RenderSurface.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace GlyphRain {

/**
 * @brief Per-frame paint options, filled from config and quality level
 */
struct RenderOptions {
  float columnWidth{20.0f};
  uint32_t columnCount{1};
  float cellHeight{20.0f};
  float canvasHeight{0.0f};
  uint32_t background{0x000000FF};
  float fadeAlpha{0.05f};   // >= 1 clears the surface
  bool glow{true};
  float glowIntensity{0.7f};
};

struct RenderStats {
  size_t dropsPainted{0};
  size_t dropsSkipped{0};   // Column outside the current layout
  size_t cellsPainted{0};
  size_t glowsPainted{0};
  double renderTimeMs{0.0};
};

/**
 * @brief Paints a drop snapshot onto the surface it owns
 *
 * Holds no simulation state and never mutates drops.
 */
class RainRenderer {
public:
  explicit RainRenderer(std::unique_ptr<RenderSurface> surface);

  bool isAvailable() const;

  /**
   * @brief Fades (or clears) the surface, then paints every visible cell
   */
  RenderStats render(const std::vector<const Drop *> &drops,
                     const RenderOptions &options);

  /**
   * @brief Clears the surface to the background color
   */
  void clear(uint32_t background);

  bool resize(float width, float height);

  RenderSurface *getSurface() { return m_surface.get(); }
  const RenderSurface *getSurface() const { return m_surface.get(); }

private:
  std::unique_ptr<RenderSurface> m_surface;

  RainRenderer(const RainRenderer &) = delete;
  RainRenderer &operator=(const RainRenderer &) = delete;
};

} // namespace GlyphRain

#endif // RAIN_RENDERER_HPP
