/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/SdlRenderSurface.hpp"
#include "core/Logger.hpp"
#include "utils/ColorUtils.hpp"
#include <algorithm>
#include <format>

namespace GlyphRain {

namespace {
// Glow is the glyph drawn additively at this scale around its center
constexpr float GLOW_SCALE = 1.6f;

Uint8 scaledAlpha(uint32_t color, float alpha) {
  const float a = static_cast<float>(colorAlpha(color)) * std::clamp(alpha, 0.0f, 1.0f);
  return static_cast<Uint8>(a + 0.5f);
}
} // namespace

SdlRenderSurface::SdlRenderSurface(SDL_Renderer *renderer,
                                   const std::string &fontPath, float fontSize,
                                   int width, int height)
    : m_renderer(renderer) {
  if (!m_renderer) {
    RENDER_ERROR("SdlRenderSurface created without a renderer");
    return;
  }

  m_font = std::shared_ptr<TTF_Font>(TTF_OpenFont(fontPath.c_str(), fontSize),
                                     TTF_CloseFont);
  if (!m_font) {
    RENDER_ERROR(std::format("Failed to load font '{}': {}", fontPath,
                             SDL_GetError()));
    return;
  }
  TTF_SetFontHinting(m_font.get(), TTF_HINTING_NORMAL);

  if (!createTarget(width, height)) {
    m_font.reset();
    return;
  }
  clear(makeColor(0, 0, 0));

  RENDER_INFO(std::format("SDL surface ready {}x{} (font {} @ {}pt)", width,
                          height, fontPath, fontSize));
}

SdlRenderSurface::~SdlRenderSurface() {
  // Textures must go before the renderer does; the owner guarantees order
  m_glyphCache.clear();
  m_target.reset();
  m_font.reset();
}

bool SdlRenderSurface::isAvailable() const {
  return m_renderer && m_font && m_target;
}

bool SdlRenderSurface::createTarget(int width, int height) {
  if (width <= 0 || height <= 0) {
    RENDER_ERROR(std::format("Invalid surface size {}x{}", width, height));
    return false;
  }

  SDL_Texture *tex = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGBA8888,
                                       SDL_TEXTUREACCESS_TARGET, width, height);
  if (!tex) {
    RENDER_ERROR(std::format("Failed to create target texture {}x{}: {}",
                             width, height, SDL_GetError()));
    return false;
  }
  SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_NONE);

  m_target = std::shared_ptr<SDL_Texture>(tex, SDL_DestroyTexture);
  m_width = width;
  m_height = height;
  return true;
}

bool SdlRenderSurface::resize(float width, float height) {
  const int w = static_cast<int>(width);
  const int h = static_cast<int>(height);
  if (w == m_width && h == m_height && m_target) {
    return true;
  }

  auto previous = m_target;
  if (!createTarget(w, h)) {
    m_target = previous;
    return false;
  }
  clear(makeColor(0, 0, 0));
  return true;
}

void SdlRenderSurface::beginFrame() {
  if (!isAvailable()) {
    return;
  }
  SDL_SetRenderTarget(m_renderer, m_target.get());
  m_frameActive = true;
}

void SdlRenderSurface::endFrame() {
  if (!m_frameActive) {
    return;
  }
  m_frameActive = false;

  // Composite to the window; presenting is the host's job
  SDL_SetRenderTarget(m_renderer, nullptr);
  SDL_RenderTexture(m_renderer, m_target.get(), nullptr, nullptr);
}

void SdlRenderSurface::setDrawColor(uint32_t color, float alpha) {
  SDL_SetRenderDrawColor(m_renderer, colorRed(color), colorGreen(color),
                         colorBlue(color), scaledAlpha(color, alpha));
}

void SdlRenderSurface::fade(uint32_t color, float alpha) {
  if (!isAvailable()) {
    return;
  }
  SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);
  setDrawColor(color, alpha);
  SDL_RenderFillRect(m_renderer, nullptr);
}

void SdlRenderSurface::clear(uint32_t color) {
  if (!isAvailable()) {
    return;
  }
  const bool ownsTarget = !m_frameActive;
  if (ownsTarget) {
    SDL_SetRenderTarget(m_renderer, m_target.get());
  }
  SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_NONE);
  setDrawColor(color, 1.0f);
  SDL_RenderClear(m_renderer);
  if (ownsTarget) {
    SDL_SetRenderTarget(m_renderer, nullptr);
  }
}

const SdlRenderSurface::GlyphTexture *SdlRenderSurface::getGlyph(char32_t glyph) {
  auto it = m_glyphCache.find(glyph);
  if (it != m_glyphCache.end()) {
    return it->second.texture ? &it->second : nullptr;
  }

  GlyphTexture entry;
  const SDL_Color white = {255, 255, 255, 255};
  auto surface = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
      TTF_RenderGlyph_Blended(m_font.get(), static_cast<Uint32>(glyph), white),
      SDL_DestroySurface);

  if (surface) {
    SDL_Texture *tex = SDL_CreateTextureFromSurface(m_renderer, surface.get());
    if (tex) {
      SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
      entry.texture = std::shared_ptr<SDL_Texture>(tex, SDL_DestroyTexture);
      entry.width = static_cast<float>(surface->w);
      entry.height = static_cast<float>(surface->h);
    }
  }

  if (!entry.texture) {
    // Cache the miss so a missing glyph is reported once
    RENDER_WARN(std::format("Font has no glyph U+{:04X}: {}",
                            static_cast<uint32_t>(glyph), SDL_GetError()));
  }

  auto inserted = m_glyphCache.emplace(glyph, std::move(entry));
  return inserted.first->second.texture ? &inserted.first->second : nullptr;
}

void SdlRenderSurface::drawGlyph(char32_t glyph, float x, float y,
                                 uint32_t color, float alpha) {
  if (!m_frameActive) {
    return;
  }
  const GlyphTexture *entry = getGlyph(glyph);
  if (!entry) {
    return;
  }

  SDL_Texture *tex = entry->texture.get();
  SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
  SDL_SetTextureColorMod(tex, colorRed(color), colorGreen(color), colorBlue(color));
  SDL_SetTextureAlphaMod(tex, scaledAlpha(color, alpha));

  // y is the glyph baseline row; draw the cell above it
  const SDL_FRect dest = {x, y - entry->height, entry->width, entry->height};
  SDL_RenderTexture(m_renderer, tex, nullptr, &dest);
}

void SdlRenderSurface::drawGlow(char32_t glyph, float x, float y,
                                uint32_t color, float intensity) {
  if (!m_frameActive || intensity <= 0.0f) {
    return;
  }
  const GlyphTexture *entry = getGlyph(glyph);
  if (!entry) {
    return;
  }

  SDL_Texture *tex = entry->texture.get();
  SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_ADD);
  SDL_SetTextureColorMod(tex, colorRed(color), colorGreen(color), colorBlue(color));
  SDL_SetTextureAlphaMod(tex, scaledAlpha(color, intensity * 0.5f));

  const float w = entry->width * GLOW_SCALE;
  const float h = entry->height * GLOW_SCALE;
  const float cx = x + entry->width * 0.5f;
  const float cy = y - entry->height * 0.5f;
  const SDL_FRect dest = {cx - w * 0.5f, cy - h * 0.5f, w, h};
  SDL_RenderTexture(m_renderer, tex, nullptr, &dest);
  SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
}

} // namespace GlyphRain
