#include "character/CharacterController.h"

#include <algorithm>

#include "core/Time.h"
#include "ecs/World.h"

void CharacterController::tick(World& w, TimeStep ts) {
  (void)ts;  // velocities are targets; the engine integrates them
  const CharacterConfig& cfg = w.character();

  for (EntityId id : w.store.query<Player, Velocity, InputState>()) {
    auto& p = *w.store.get<Player>(id);
    auto& vel = *w.store.get<Velocity>(id);
    const auto& in = *w.store.get<InputState>(id);

    const bool wasDead = (p.state == PlayerState::Dead);
    step(cfg, in, w.store.get<Health>(id), p, vel);

    if (!wasDead && p.state == PlayerState::Dead) {
      if (auto* op = w.store.get<Opacity>(id)) {
        op->alpha = cfg.combat.deadAlpha;
      } else {
        w.store.add(id, Opacity{cfg.combat.deadAlpha});
      }
    }
  }
}

void CharacterController::step(const CharacterConfig& cfg,
                               const InputState& in,
                               const Health* health,
                               Player& p,
                               Velocity& vel) {
  if (p.state == PlayerState::Dead || (health != nullptr && health->isDead)) {
    p.state = PlayerState::Dead;
    vel.v.x = 0.0F;
    return;
  }

  if (p.justLanded)
    p.jumpCount = 0;

  const int dir = in.moveX();
  if (dir != 0)
    p.facingDirection = dir;

  const float control = p.isGrounded ? 1.0F : cfg.move.airControl;
  vel.v.x = static_cast<float>(dir) * cfg.move.runSpeed * control;

  if (in.jumpPressed && tryJump(cfg, p, vel)) {
    p.state = PlayerState::Jumping;
    return;
  }

  // Y-down: vy >= 0 is falling or resting.
  if (!p.isGrounded && p.wallDirection != 0 && dir == p.wallDirection && vel.v.y >= 0.0F) {
    p.state = PlayerState::WallSliding;
    vel.v.y = std::min(vel.v.y, cfg.wall.slideSpeed);
    return;
  }

  if (p.isGrounded) {
    p.state = (dir != 0) ? PlayerState::Running : PlayerState::Idle;
    return;
  }

  p.state = (vel.v.y < 0.0F) ? PlayerState::Jumping : PlayerState::Falling;
}

bool CharacterController::tryJump(const CharacterConfig& cfg, Player& p, Velocity& vel) {
  if (p.jumpCount >= cfg.jump.maxJumps)
    return false;

  if (!p.isGrounded && p.wallDirection != 0) {
    // kick off the wall, facing away from it
    vel.v.x = -static_cast<float>(p.wallDirection) * cfg.wall.jumpImpulseX;
    vel.v.y = cfg.wall.jumpImpulseY;
    p.facingDirection = -p.wallDirection;
  } else {
    vel.v.y = cfg.jump.impulse;
  }
  ++p.jumpCount;
  return true;
}
