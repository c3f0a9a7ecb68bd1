#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "animation/Animation.h"
#include "ecs/Entity.h"
#include "physics/PhysicsEngine.h"
#include "render/SceneGraph.h"
#include "visual/Palette.h"

// Positions are metres, velocities m/s, Y points down.
struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
};

struct Transform {
  Vec2 pos{};
};

struct Velocity {
  Vec2 v{};
};

// Display object is owned by the render collaborator; we only keep its handle.
struct Sprite {
  RenderNode node = kInvalidRenderNode;
  float width = 0.0F;   // px, layout only
  float height = 0.0F;  // px, layout only
};

struct PhysicsBody {
  BodyHandle handle = kInvalidBody;
  BodyType type = BodyType::Dynamic;
};

enum class PlayerState : std::uint8_t {
  Idle,
  Running,
  Jumping,
  Falling,
  WallSliding,
  Dead,
};

struct Player {
  bool isGrounded = false;
  bool justLanded = false;  // grounded this frame, airborne the frame before
  int wallDirection = 0;  // -1 wall on the left, 0 none, 1 wall on the right
  int jumpCount = 0;
  int facingDirection = 1;
  PlayerState state = PlayerState::Idle;
};

struct AnimationState {
  std::string currentAnimation = "idle";
  std::shared_ptr<const AnimationTable> animations;
  bool flipX = false;
};

struct Projectile {
  float damage = 1.0F;
  EntityId ownerEntity = kInvalidEntity;
  float lifetime = 2.0F;  // seconds remaining
  float speed = 0.0F;     // m/s
  std::optional<Visual::Color> glow;
};

struct Health {
  float current = 1.0F;
  float max = 1.0F;
  float invincibleTimer = 0.0F;  // seconds; no damage while > 0
  float invincibilityOnHit = 0.0F;
  bool isDead = false;
};

enum class EnemyKind : std::uint8_t {
  Walker,
  Flyer,
  Turret,
  Sentry,
  Crawler,
  Shielder,
  Boss,
};

struct Enemy {
  EnemyKind kind = EnemyKind::Walker;
  int patrolDirection = 1;
  float patrolOriginX = 0.0F;  // m
  float patrolDistance = 2.0F;  // m either side of origin
  float speed = 1.5F;          // m/s
  float contactDamage = 10.0F;
  int scrapValue = 5;
};

enum class WeaponAim : std::uint8_t {
  Player,        // turrets: the controlled player
  NearestEnemy,  // the player's auto-fire
};

// Auto-firing gun. Shoots at the aim target once it is within range and the
// cooldown has run out; the cooldown then restarts at 1 / fireRate.
struct Weapon {
  WeaponAim aim = WeaponAim::Player;
  float damage = 8.0F;
  float fireRate = 1.5F;  // shots per second
  float cooldown = 0.0F;  // s until the next shot
  float range = 6.0F;     // m
  float projectileSpeed = 10.0F;
  float projectileLifetime = 2.0F;
};

// Edge-triggered flags (jumpPressed) only hold for the frame the intent arrived.
struct InputState {
  bool left = false;
  bool right = false;
  bool jumpPressed = false;
  bool jumpHeld = false;

  [[nodiscard]] int moveX() const { return (right ? 1 : 0) - (left ? 1 : 0); }
};

// Short-lived entity timer (labels, flashes). Destroyed through the normal flush.
struct Lifetime {
  float remaining = 1.0F;
  float duration = 1.0F;
};

struct FloatText {
  float riseSpeed = 0.8F;  // m/s upward
};

struct Opacity {
  float alpha = 1.0F;
  float lastApplied = std::numeric_limits<float>::quiet_NaN();
};

// Set once per entity on its first component; orders query results.
struct StoreOrder {
  std::uint64_t seq = 0;
};

struct PendingDestroy {};
