/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RENDER_SURFACE_HPP
#define RENDER_SURFACE_HPP

#include <cstdint>

namespace GlyphRain {

/**
 * @brief Drawing surface the rain is painted onto
 *
 * Colors are packed 0xRRGGBBAA; alpha arguments multiply the color's own
 * alpha. Coordinates are canvas units with y growing downwards.
 */
class RenderSurface {
public:
  virtual ~RenderSurface() = default;

  /**
   * @brief False when the backing device could not be created
   */
  virtual bool isAvailable() const = 0;

  virtual float getWidth() const = 0;
  virtual float getHeight() const = 0;

  /**
   * @brief Resizes the backing store
   * @return false if the surface could not be resized
   */
  virtual bool resize(float width, float height) = 0;

  virtual void beginFrame() {}
  virtual void endFrame() {}

  /**
   * @brief Blends color over the whole surface with the given alpha, leaving
   * older paint partially visible
   */
  virtual void fade(uint32_t color, float alpha) = 0;

  virtual void clear(uint32_t color) = 0;

  virtual void drawGlyph(char32_t glyph, float x, float y, uint32_t color,
                         float alpha) = 0;

  /**
   * @brief Soft halo behind a glyph
   */
  virtual void drawGlow(char32_t glyph, float x, float y, uint32_t color,
                        float intensity) = 0;
};

} // namespace GlyphRain

#endif // RENDER_SURFACE_HPP
