#pragma once

#include <string_view>

struct WorldConfig {
  static constexpr float kDefaultPixelsPerMeter = 50.0F;
  static constexpr float kDefaultFixedTimestep = 1.0F / 60.0F;

  float pixelsPerMeter = kDefaultPixelsPerMeter;
  float fixedTimestep = kDefaultFixedTimestep;  // 0 = one engine step per frame with frame dt
  int maxSubsteps = 10;                         // accumulator clamp, in fixed steps
  float groundNormalMin = 0.7F;                 // |n.y| needed to call a contact "ground"
  float wallNormalMin = 0.7F;                   // |n.x| needed to call a contact "wall"

  bool loadFromToml(const char* path);
  bool parse(std::string_view text, const char* sourceName = nullptr);

 private:
  bool load(std::string_view source, const char* name, bool fromFile);
};
