#pragma once

namespace util {

inline int signOrZero(float v) {
  if (v > 0.0F)
    return 1;
  if (v < 0.0F)
    return -1;
  return 0;
}

inline float metersToPixels(float m, float pixelsPerMeter) {
  return m * pixelsPerMeter;
}

inline float pixelsToMeters(float px, float pixelsPerMeter) {
  return (pixelsPerMeter > 0.0F) ? px / pixelsPerMeter : 0.0F;
}

}  // namespace util
