#pragma once

#include "character/CharacterConfig.h"
#include "ecs/Components.h"

class World;
struct TimeStep;

// Player movement state machine. Sole writer of Player::state, jumpCount and
// facingDirection, and of the player's target velocity.
class CharacterController {
 public:
  static void tick(World& w, TimeStep ts);

  // One player for one frame. `health` may be null (no damage capability).
  static void step(const CharacterConfig& cfg,
                   const InputState& in,
                   const Health* health,
                   Player& p,
                   Velocity& vel);

  // Applies a jump (or wall jump) if the jump budget allows. A rejected jump
  // leaves `p` and `vel` untouched.
  static bool tryJump(const CharacterConfig& cfg, Player& p, Velocity& vel);
};
