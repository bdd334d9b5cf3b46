/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_RENDER_SURFACE_HPP
#define SDL_RENDER_SURFACE_HPP

#include "render/RenderSurface.hpp"
#include <SDL3/SDL.h>
#include <SDL3_ttf/SDL_ttf.h>
#include <memory>
#include <string>
#include <unordered_map>

namespace GlyphRain {

/**
 * @brief RenderSurface backed by an SDL3 renderer and an SDL3_ttf font
 *
 * Paints into an intermediate target texture so the previous frame survives
 * for the partial fade; endFrame() composites it to the window. Glyphs are
 * rendered white once per code point and tinted per draw.
 *
 * TTF_Init() must have succeeded before construction. The SDL_Renderer is
 * not owned and must outlive the surface.
 */
class SdlRenderSurface : public RenderSurface {
public:
  SdlRenderSurface(SDL_Renderer *renderer, const std::string &fontPath,
                   float fontSize, int width, int height);
  ~SdlRenderSurface() override;

  bool isAvailable() const override;
  float getWidth() const override { return static_cast<float>(m_width); }
  float getHeight() const override { return static_cast<float>(m_height); }
  bool resize(float width, float height) override;

  void beginFrame() override;
  void endFrame() override;

  void fade(uint32_t color, float alpha) override;
  void clear(uint32_t color) override;
  void drawGlyph(char32_t glyph, float x, float y, uint32_t color,
                 float alpha) override;
  void drawGlow(char32_t glyph, float x, float y, uint32_t color,
                float intensity) override;

  size_t getCachedGlyphCount() const { return m_glyphCache.size(); }

private:
  struct GlyphTexture {
    std::shared_ptr<SDL_Texture> texture;
    float width{0.0f};
    float height{0.0f};
  };

  bool createTarget(int width, int height);
  const GlyphTexture *getGlyph(char32_t glyph);
  void setDrawColor(uint32_t color, float alpha);

  SDL_Renderer *m_renderer{nullptr};
  std::shared_ptr<TTF_Font> m_font;
  std::shared_ptr<SDL_Texture> m_target;
  std::unordered_map<char32_t, GlyphTexture> m_glyphCache;
  int m_width{0};
  int m_height{0};
  bool m_frameActive{false};

  SdlRenderSurface(const SdlRenderSurface &) = delete;
  SdlRenderSurface &operator=(const SdlRenderSurface &) = delete;
};

} // namespace GlyphRain

#endif // SDL_RENDER_SURFACE_HPP
