#pragma once

#include <SDL3/SDL_render.h>

#include "visual/Palette.h"

namespace Visual {

// Shape rendering primitives
class ShapeRenderer {
 public:
  explicit ShapeRenderer(SDL_Renderer* r) : renderer_(r) {}

  void setColor(Color c) { SDL_SetRenderDrawColor(renderer_, c.r, c.g, c.b, c.a); }

  // Top-left anchored; empty rects draw nothing
  void fillRect(float x, float y, float w, float h, Color color);

  // 8x8 debug-font text, top-left anchored
  void text(float x, float y, const char* str, Color color);

 private:
  SDL_Renderer* renderer_;
};

}  // namespace Visual
