/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/RainRenderer.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <format>

namespace GlyphRain {

RainRenderer::RainRenderer(std::unique_ptr<RenderSurface> surface)
    : m_surface(std::move(surface)) {}

bool RainRenderer::isAvailable() const {
  return m_surface && m_surface->isAvailable();
}

RenderStats RainRenderer::render(const std::vector<const Drop *> &drops,
                                 const RenderOptions &options) {
  RenderStats stats;
  if (!isAvailable()) {
    return stats;
  }

  auto renderStart = std::chrono::high_resolution_clock::now();

  m_surface->beginFrame();
  if (options.fadeAlpha >= 1.0f) {
    m_surface->clear(options.background);
  } else {
    m_surface->fade(options.background, options.fadeAlpha);
  }

  const float minY = -options.cellHeight;
  const float maxY = options.canvasHeight + options.cellHeight;
  const bool glow = options.glow && options.glowIntensity > 0.0f;

  for (const Drop *drop : drops) {
    if (!drop || !drop->isActive()) {
      continue;
    }
    // Drops keep their column across resizes; hidden until the canvas widens
    if (drop->column >= options.columnCount) {
      ++stats.dropsSkipped;
      continue;
    }

    const float x = static_cast<float>(drop->column) * options.columnWidth;
    bool painted = false;

    for (const GlyphCell &cell : drop->cells) {
      const float y =
          drop->position - static_cast<float>(cell.trailIndex) * options.cellHeight;
      if (y < minY || y > maxY) {
        continue;
      }

      const uint32_t color = cell.leading ? drop->headColor : drop->trailColor;
      if (cell.leading && glow) {
        m_surface->drawGlow(cell.glyph, x, y, color,
                            options.glowIntensity * cell.brightness);
        ++stats.glowsPainted;
      }
      m_surface->drawGlyph(cell.glyph, x, y, color, cell.brightness);
      ++stats.cellsPainted;
      painted = true;
    }

    if (painted) {
      ++stats.dropsPainted;
    }
  }
  m_surface->endFrame();

  auto renderEnd = std::chrono::high_resolution_clock::now();
  stats.renderTimeMs =
      std::chrono::duration<double, std::milli>(renderEnd - renderStart).count();
  return stats;
}

void RainRenderer::clear(uint32_t background) {
  if (!isAvailable()) {
    return;
  }
  m_surface->beginFrame();
  m_surface->clear(background);
  m_surface->endFrame();
}

bool RainRenderer::resize(float width, float height) {
  if (!isAvailable()) {
    return false;
  }
  if (!m_surface->resize(width, height)) {
    RENDER_ERROR(std::format("Surface resize to {}x{} failed", width, height));
    return false;
  }
  return true;
}

} // namespace GlyphRain
