#pragma once

#include <cstdint>

struct TimeStep {
  float dt = 0.0F;  // seconds (wall-clock derived, variable)
  uint64_t frame = 0;

  [[nodiscard]] TimeStep next(float nextDt) const { return TimeStep{nextDt, frame + 1}; }
};
