#include "entities/Spawners.h"

#include <cmath>
#include <exception>
#include <format>
#include <utility>

#include "core/Errors.h"
#include "core/Log.h"
#include "ecs/World.h"
#include "util/Math.h"

namespace Spawners {

namespace {

constexpr Visual::Color kProjectileColor{0xFF, 0xFF, 0x44};
constexpr float kLabelWidth = 32.0F;
constexpr float kLabelHeight = 8.0F;

// Body + node pair for an entity under construction. Whatever is still owned
// when the guard goes out of scope is handed back to the collaborators.
class Handles {
 public:
  explicit Handles(World& w) : w_(w) {}
  Handles(const Handles&) = delete;
  Handles& operator=(const Handles&) = delete;
  ~Handles() { discard(); }

  void createBody(BodyType type, Vec2 pos) { body = w_.engine().createBody(type, {pos.x, pos.y}); }

  void createNode(const NodeDesc& desc, Vec2 pos) {
    node = w_.scene().create(desc);
    const float ppm = w_.config().pixelsPerMeter;
    w_.scene().setTransform(node, util::metersToPixels(pos.x, ppm),
                            util::metersToPixels(pos.y, ppm));
  }

  // The entity owns the handles from here on.
  EntityId commit(EntityId id) {
    if (id != kInvalidEntity) {
      body = kInvalidBody;
      node = kInvalidRenderNode;
    }
    return id;
  }

  BodyHandle body = kInvalidBody;
  RenderNode node = kInvalidRenderNode;

 private:
  void discard() noexcept {
    try {
      if (body != kInvalidBody)
        w_.engine().removeBody(body);
      if (node != kInvalidRenderNode)
        w_.scene().destroy(node);
    } catch (const std::exception& err) {
      Log::warnf("spawn", "cleanup after failed spawn: {}", err.what());
    }
  }

  World& w_;
};

// Character and enemy configs both carry a [weapon] section of this shape.
template <typename WeaponCfg>
Weapon weaponFrom(const WeaponCfg& cfg, WeaponAim aim) {
  Weapon gun{};
  gun.aim = aim;
  gun.damage = cfg.damage;
  gun.fireRate = cfg.fireRate;
  gun.range = cfg.range;
  gun.projectileSpeed = cfg.projectileSpeed;
  return gun;
}

}  // namespace

EntityId player(World& w, Vec2 pos, std::shared_ptr<const AnimationTable> animations) {
  const CharacterConfig& cfg = w.character();

  Handles h(w);
  h.createBody(BodyType::Dynamic, pos);
  h.createNode(NodeDesc{NodeKind::Rect, cfg.render.width, cfg.render.height, cfg.render.color, {}},
               pos);

  Health health{};
  health.current = cfg.combat.maxHealth;
  health.max = cfg.combat.maxHealth;
  health.invincibilityOnHit = cfg.combat.invincibilitySeconds;

  AnimationState anim{};
  anim.animations = std::move(animations);

  const Weapon gun = weaponFrom(cfg.weapon, WeaponAim::NearestEnemy);

  const EntityId id = h.commit(w.spawn(Transform{pos},
                                       Velocity{},
                                       PhysicsBody{h.body, BodyType::Dynamic},
                                       Sprite{h.node, cfg.render.width, cfg.render.height},
                                       Player{},
                                       InputState{},
                                       health,
                                       std::move(anim),
                                       gun));
  if (id != kInvalidEntity)
    w.player = id;
  return id;
}

EntityId enemy(World& w, const EnemyConfig& cfg, Vec2 pos) {
  const BodyType type = enemyBodyType(cfg.kind);

  Handles h(w);
  h.createBody(type, pos);
  h.createNode(NodeDesc{NodeKind::Rect, cfg.collision.w, cfg.collision.h, cfg.render.color, {}},
               pos);

  Enemy e{};
  e.kind = cfg.kind;
  e.patrolOriginX = pos.x;
  e.patrolDistance = cfg.move.patrolDistance;
  e.speed = cfg.move.speed;
  e.contactDamage = cfg.combat.contactDamage;
  e.scrapValue = cfg.combat.scrapValue;

  Health health{};
  health.current = cfg.combat.health;
  health.max = cfg.combat.health;

  const Sprite sprite{h.node, cfg.collision.w, cfg.collision.h};
  if (cfg.weapon.fireRate <= 0.0F) {
    return h.commit(
        w.spawn(Transform{pos}, Velocity{}, PhysicsBody{h.body, type}, sprite, e, health));
  }

  return h.commit(
      w.spawn(Transform{pos}, Velocity{}, PhysicsBody{h.body, type}, sprite, e, health,
              weaponFrom(cfg.weapon, WeaponAim::Player)));
}

EntityId projectile(World& w, EntityId owner, Vec2 pos, Vec2 dir, const ProjectileParams& params) {
  const float len = std::hypot(dir.x, dir.y);
  if (len <= 0.0F)
    throw ConfigurationError("projectile needs a non-zero direction");
  if (params.lifetime <= 0.0F)
    throw ConfigurationError(std::format("projectile lifetime must be > 0 (got {})", params.lifetime));

  Handles h(w);
  h.createBody(BodyType::Kinematic, pos);
  h.createNode(NodeDesc{NodeKind::Rect, params.size, params.size,
                        params.glow.value_or(kProjectileColor), {}},
               pos);

  Projectile proj{};
  proj.damage = params.damage;
  proj.ownerEntity = owner;
  proj.lifetime = params.lifetime;
  proj.speed = params.speed;
  proj.glow = params.glow;

  return h.commit(w.spawn(Transform{pos},
                          Velocity{dir * (params.speed / len)},
                          PhysicsBody{h.body, BodyType::Kinematic},
                          Sprite{h.node, params.size, params.size},
                          proj));
}

EntityId floatText(World& w, Vec2 pos, std::string text, Visual::Color color, float seconds) {
  Handles h(w);
  h.createNode(NodeDesc{NodeKind::Label, kLabelWidth, kLabelHeight, color, std::move(text)}, pos);

  return h.commit(w.spawn(Transform{pos},
                          Sprite{h.node, kLabelWidth, kLabelHeight},
                          Lifetime{seconds, seconds},
                          FloatText{},
                          Opacity{}));
}

EntityId spawnFrom(World& w,
                   const SpawnDescriptor& desc,
                   const EnemyRoster& roster,
                   std::shared_ptr<const AnimationTable> playerAnimations) {
  const float ppm = w.config().pixelsPerMeter;
  const Vec2 pos{util::pixelsToMeters(desc.x, ppm), util::pixelsToMeters(desc.y, ppm)};

  try {
    if (desc.kind == "player")
      return player(w, pos, std::move(playerAnimations));

    const auto kind = parseEnemyKindTag(desc.kind);
    if (!kind)
      throw ConfigurationError(std::format("unknown spawn kind '{}'", desc.kind));
    return enemy(w, roster.get(*kind), pos);
  } catch (const ConfigurationError& err) {
    Log::warnf("spawn", "{} at ({}, {}): {}", desc.kind, desc.x, desc.y, err.what());
  } catch (const PhysicsError& err) {
    Log::warnf("spawn", "{} at ({}, {}): physics refused body: {}", desc.kind, desc.x, desc.y,
               err.what());
  }
  return kInvalidEntity;
}

int spawnLevel(World& w,
               const LevelData& level,
               const EnemyRoster& roster,
               std::shared_ptr<const AnimationTable> playerAnimations) {
  int spawned = 0;
  for (const auto& desc : level.spawns) {
    if (parseEnemyKindTag(desc.kind) == EnemyKind::Boss) {
      Log::debugf("spawn", "{}: boss spawn left to its trigger", level.name);
      continue;
    }
    if (spawnFrom(w, desc, roster, playerAnimations) != kInvalidEntity)
      ++spawned;
  }
  Log::infof("spawn", "level '{}': {} of {} spawns placed", level.name, spawned,
             level.spawns.size());
  return spawned;
}

}  // namespace Spawners
