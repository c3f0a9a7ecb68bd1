#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace Visual {

struct Color {
  uint8_t r = 0, g = 0, b = 0, a = 255;

  constexpr Color() = default;
  constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
      : r(r_), g(g_), b(b_), a(a_) {}

  constexpr bool operator==(const Color&) const = default;

  // "#RRGGBB" or "#RRGGBBAA", leading '#' optional. Anything else is opaque black.
  static Color fromHex(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
      hex.remove_prefix(1);
    }
    if (hex.size() != 6 && hex.size() != 8) {
      return {};
    }
    uint32_t val = 0;
    const auto [end, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), val, 16);
    if (ec != std::errc{} || end != hex.data() + hex.size()) {
      return {};
    }
    if (hex.size() == 6) {
      val = (val << 8) | 0xFFU;
    }
    auto byte = [val](int shift) { return static_cast<uint8_t>((val >> shift) & 0xFFU); };
    return {byte(24), byte(16), byte(8), byte(0)};
  }
};

// Scale alpha by a 0..1 opacity.
inline Color withOpacity(Color c, float opacity) {
  const float a = static_cast<float>(c.a) * std::clamp(opacity, 0.0F, 1.0F);
  return {c.r, c.g, c.b, static_cast<uint8_t>(a)};
}

// Scale rgb toward black by amount (0..1); alpha untouched.
inline Color darken(Color c, float amount) {
  const float keep = 1.0F - std::clamp(amount, 0.0F, 1.0F);
  auto scale = [keep](uint8_t v) { return static_cast<uint8_t>(static_cast<float>(v) * keep); };
  return {scale(c.r), scale(c.g), scale(c.b), c.a};
}

}  // namespace Visual
