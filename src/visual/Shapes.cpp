#include "visual/Shapes.h"

#include <SDL3/SDL_rect.h>
#include <SDL3/SDL_render.h>

namespace Visual {

void ShapeRenderer::fillRect(float x, float y, float w, float h, Color color) {
  if (w <= 0.0F || h <= 0.0F) {
    return;
  }
  setColor(color);
  SDL_FRect rect = {x, y, w, h};
  SDL_RenderFillRect(renderer_, &rect);
}

void ShapeRenderer::text(float x, float y, const char* str, Color color) {
  if (str == nullptr || *str == 0) {
    return;
  }
  setColor(color);
  SDL_RenderDebugText(renderer_, x, y, str);
}

}  // namespace Visual
