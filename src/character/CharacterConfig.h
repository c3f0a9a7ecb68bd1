#pragma once

#include <string>
#include <string_view>

#include "visual/Palette.h"

// Player movement / combat tuning. SI units, Y-down (negative vy = up).
struct CharacterConfig {
  int version = 0;
  std::string id = "player";
  std::string displayName;

  struct Move {
    static constexpr float kDefaultRunSpeed = 6.0F;
    static constexpr float kDefaultAirControl = 0.7F;

    float runSpeed = kDefaultRunSpeed;      // m/s
    float airControl = kDefaultAirControl;  // fraction of run speed while airborne
  } move;

  struct Jump {
    float impulse = -8.0F;  // m/s, applied as vy
    int maxJumps = 2;       // ground jump counts as the first
  } jump;

  struct Wall {
    float slideSpeed = 2.0F;     // max fall speed while wall sliding (m/s)
    float jumpImpulseX = 5.0F;   // m/s away from the wall
    float jumpImpulseY = -7.0F;  // m/s
  } wall;

  struct Combat {
    float maxHealth = 100.0F;
    float invincibilitySeconds = 1.0F;
    float deadAlpha = 0.3F;
    float knockbackX = 5.0F;   // m/s away from the enemy on contact damage
    float knockbackY = -3.0F;  // m/s
  } combat;

  // Auto-fire at the nearest enemy in range. fireRate 0 disables it.
  struct Weapon {
    float damage = 10.0F;
    float fireRate = 3.0F;          // shots per second
    float range = 6.0F;             // m
    float projectileSpeed = 15.0F;  // m/s
  } weapon;

  struct Render {
    float width = 24.0F;   // px
    float height = 40.0F;  // px
    Visual::Color color{0x44, 0x88, 0xFF};
  } render;

  bool loadFromToml(const char* path);
  bool parse(std::string_view text, const char* sourceName = nullptr);

 private:
  bool load(std::string_view source, const char* name, bool fromFile);
};
