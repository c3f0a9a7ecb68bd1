#include "ecs/Systems.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <optional>
#include <string>
#include <unordered_map>

#include "character/CharacterController.h"
#include "core/Errors.h"
#include "core/Log.h"
#include "core/Time.h"
#include "ecs/World.h"
#include "enemy/EnemyConfig.h"
#include "entities/Spawners.h"
#include "util/Math.h"

namespace Systems {

namespace {

struct Touch {
  bool ground = false;
  int wall = 0;
};

constexpr Visual::Color kScrapTextColor{0xFF, 0xDD, 0x44};
constexpr float kMinAimDistance = 0.02F;  // m; about one pixel

// `n` points from `self` toward `other`.
void resolveSide(World& w,
                 EntityId self,
                 EntityId other,
                 Vec2 n,
                 std::unordered_map<EntityId, Touch>& touches) {
  if (!w.entities.isAlive(self))
    return;
  const bool otherIsTerrain = w.physics().isStatic(w, other);

  if (w.store.has<Projectile>(self)) {
    if (otherIsTerrain) {
      w.events.hits.push_back(ProjectileHit{self, kInvalidEntity});
    } else if (w.store.has<Health>(other)) {
      w.events.hits.push_back(ProjectileHit{self, other});
    }
    return;
  }

  if (!w.store.has<Player>(self))
    return;
  // projectiles never count as floor or wall
  if (other != kInvalidEntity && w.store.has<Projectile>(other))
    return;

  if (const auto* enemy = w.store.get<Enemy>(other)) {
    if (enemy->contactDamage > 0.0F)
      w.events.contacts.push_back(ContactDamage{other, self, enemy->contactDamage});
  }

  const WorldConfig& cfg = w.config();
  Touch& touch = touches[self];
  if (n.y >= cfg.groundNormalMin) {
    touch.ground = true;
  } else if (otherIsTerrain && std::abs(n.x) >= cfg.wallNormalMin) {
    touch.wall = util::signOrZero(n.x);
  }
}

void patrol(World& w, TimeStep ts) {
  (void)ts;
  for (EntityId id : w.store.query<Enemy, Velocity, Transform>()) {
    auto& e = *w.store.get<Enemy>(id);
    auto& vel = w.store.get<Velocity>(id)->v;
    const float x = w.store.get<Transform>(id)->pos.x;

    switch (e.kind) {
      case EnemyKind::Turret:
      case EnemyKind::Boss:
        vel.x = 0.0F;
        continue;
      default:
        break;
    }

    if (e.patrolDirection > 0 && x >= e.patrolOriginX + e.patrolDistance) {
      e.patrolDirection = -1;
    } else if (e.patrolDirection < 0 && x <= e.patrolOriginX - e.patrolDistance) {
      e.patrolDirection = 1;
    }
    vel.x = static_cast<float>(e.patrolDirection) * e.speed;

    // fliers hold their altitude
    if (e.kind == EnemyKind::Flyer || e.kind == EnemyKind::Sentry)
      vel.y = 0.0F;
  }
}

void onKilled(World& w, EntityId id) {
  const auto* enemy = w.store.get<Enemy>(id);
  if (enemy == nullptr)
    return;

  ++w.enemyKills;
  w.requestDestroy(id);
  Log::debugf("combat", "{} {} killed", enemyKindName(enemy->kind), entityIndex(id));
  if (const auto* t = w.store.get<Transform>(id)) {
    try {
      (void)Spawners::floatText(w, t->pos, std::format("+{}", enemy->scrapValue),
                                kScrapTextColor);
    } catch (const std::exception& err) {
      Log::warnf("combat", "scrap label for entity {} not shown: {}", entityIndex(id),
                 err.what());
    }
  }
}

void knockBack(World& w, EntityId target, EntityId source) {
  auto* vel = w.store.get<Velocity>(target);
  const auto* to = w.store.get<Transform>(target);
  const auto* from = w.store.get<Transform>(source);
  if (vel == nullptr || to == nullptr || from == nullptr || !w.store.has<Player>(target))
    return;
  const auto& combat = w.character().combat;
  // away from the source; straight overlap pushes right
  vel->v.x = (from->pos.x > to->pos.x) ? -combat.knockbackX : combat.knockbackX;
  vel->v.y = combat.knockbackY;
}

bool isDead(const World& w, EntityId id) {
  const auto* h = w.store.get<Health>(id);
  return h != nullptr && h->isDead;
}

// Where `gun` should shoot from `from`, if anything is in range.
std::optional<Vec2> aimPoint(World& w, const Weapon& gun, Vec2 from) {
  auto inRange = [&](Vec2 to) {
    const float d = std::hypot(to.x - from.x, to.y - from.y);
    return d >= kMinAimDistance && d <= gun.range;
  };

  if (gun.aim == WeaponAim::Player) {
    if (!w.entities.isAlive(w.player) || isDead(w, w.player))
      return std::nullopt;
    const auto* t = w.store.get<Transform>(w.player);
    if (t == nullptr || !inRange(t->pos))
      return std::nullopt;
    return t->pos;
  }

  std::optional<Vec2> best;
  float bestDist = 0.0F;
  for (EntityId id : w.store.query<Enemy, Transform>()) {
    if (isDead(w, id))
      continue;
    const Vec2 to = w.store.get<Transform>(id)->pos;
    if (!inRange(to))
      continue;
    const float d = std::hypot(to.x - from.x, to.y - from.y);
    if (!best || d < bestDist) {
      best = to;
      bestDist = d;
    }
  }
  return best;
}

}  // namespace

void ingestInput(World& w) {
  for (EntityId id : w.store.query<InputState>()) {
    w.store.get<InputState>(id)->jumpPressed = false;
  }
  for (const auto& [id, in] : w.takeInput()) {
    if (!w.entities.isAlive(id))
      continue;
    if (auto* state = w.store.get<InputState>(id))
      *state = in;
  }
}

void collisions(World& w) {
  std::unordered_map<EntityId, Touch> touches;
  for (const auto& ev : w.events.collisions) {
    resolveSide(w, ev.a, ev.b, ev.normal, touches);
    resolveSide(w, ev.b, ev.a, ev.normal * -1.0F, touches);
  }

  // No engine step, no fresh contacts: keep last frame's grounding.
  const bool stepped = w.events.physicsSteps > 0;
  for (EntityId id : w.store.query<Player>()) {
    auto& p = *w.store.get<Player>(id);
    if (!stepped) {
      p.justLanded = false;
      continue;
    }
    const Touch touch = touches.contains(id) ? touches[id] : Touch{};
    p.justLanded = !p.isGrounded && touch.ground;
    p.isGrounded = touch.ground;
    p.wallDirection = touch.ground ? 0 : touch.wall;
  }
}

void movement(World& w, TimeStep ts) {
  CharacterController::tick(w, ts);
  patrol(w, ts);
}

void weapons(World& w, TimeStep ts) {
  for (EntityId id : w.store.query<Weapon, Transform>()) {
    Weapon gun = *w.store.get<Weapon>(id);
    gun.cooldown = std::max(0.0F, gun.cooldown - ts.dt);
    w.store.get<Weapon>(id)->cooldown = gun.cooldown;
    if (gun.fireRate <= 0.0F || gun.cooldown > 0.0F || isDead(w, id))
      continue;

    const Vec2 from = w.store.get<Transform>(id)->pos;
    const std::optional<Vec2> to = aimPoint(w, gun, from);
    if (!to)
      continue;

    Spawners::ProjectileParams params{};
    params.damage = gun.damage;
    params.speed = gun.projectileSpeed;
    params.lifetime = gun.projectileLifetime;
    try {
      (void)Spawners::projectile(w, id, from, *to - from, params);
    } catch (const std::exception& err) {
      Log::warnf("combat", "entity {} failed to fire: {}", entityIndex(id), err.what());
      continue;
    }
    w.store.get<Weapon>(id)->cooldown = 1.0F / gun.fireRate;
  }
}

bool applyDamage(World& w, EntityId target, float amount, EntityId source) {
  auto* h = w.store.get<Health>(target);
  if (h == nullptr || h->isDead || h->invincibleTimer > 0.0F)
    return false;

  h->current = std::max(0.0F, h->current - amount);
  ++w.damageEvents;
  if (h->current <= 0.0F) {
    h->isDead = true;
    onKilled(w, target);
  } else {
    h->invincibleTimer = h->invincibilityOnHit;
  }
  if (source != kInvalidEntity)
    knockBack(w, target, source);
  return true;
}

void projectiles(World& w, TimeStep ts) {
  for (EntityId id : w.store.query<Health>()) {
    auto& h = *w.store.get<Health>(id);
    h.invincibleTimer = std::max(0.0F, h.invincibleTimer - ts.dt);
  }

  for (EntityId id : w.store.query<Projectile>()) {
    auto& proj = *w.store.get<Projectile>(id);
    proj.lifetime -= ts.dt;
    if (proj.lifetime <= 0.0F)
      w.requestDestroy(id);
  }

  for (const auto& hit : w.events.hits) {
    // expired this frame, or already spent on an earlier hit
    if (!w.entities.isAlive(hit.projectile))
      continue;
    const auto* proj = w.store.get<Projectile>(hit.projectile);
    if (proj == nullptr)
      continue;

    if (hit.target == kInvalidEntity) {
      w.requestDestroy(hit.projectile);
      continue;
    }
    if (hit.target == proj->ownerEntity) {
      Log::debugf("combat", "invariant violation: projectile {} touching its owner {}",
                  entityIndex(hit.projectile), entityIndex(hit.target));
      continue;
    }
    if (!w.entities.isAlive(hit.target))
      continue;

    // spent before the damage runs, so a failure past this point can't revive it
    const float damage = proj->damage;
    w.requestDestroy(hit.projectile);
    (void)applyDamage(w, hit.target, damage);
  }

  for (const auto& c : w.events.contacts) {
    if (!w.entities.isAlive(c.source) || !w.entities.isAlive(c.target))
      continue;
    (void)applyDamage(w, c.target, c.amount, c.source);
  }
}

void ephemerals(World& w, TimeStep ts) {
  for (EntityId id : w.store.query<Lifetime>()) {
    auto& life = *w.store.get<Lifetime>(id);
    life.remaining -= ts.dt;

    if (const auto* ft = w.store.get<FloatText>(id)) {
      if (auto* t = w.store.get<Transform>(id))
        t->pos.y -= ft->riseSpeed * ts.dt;
    }
    if (auto* op = w.store.get<Opacity>(id)) {
      op->alpha = (life.duration > 0.0F) ? std::clamp(life.remaining / life.duration, 0.0F, 1.0F)
                                         : 0.0F;
    }
    if (life.remaining <= 0.0F)
      w.requestDestroy(id);
  }
}

std::string_view selectAnimation(PlayerState state, int facing, bool isGrounded) {
  (void)facing;
  switch (state) {
    case PlayerState::Idle:
      return isGrounded ? "idle" : "fall";
    case PlayerState::Running:
      return isGrounded ? "run" : "fall";
    case PlayerState::Jumping:
      return "jump";
    case PlayerState::Falling:
      return "fall";
    case PlayerState::WallSliding:
      return "wall_slide";
    case PlayerState::Dead:
      return "die";
  }
  return "idle";
}

void animation(World& w) {
  for (EntityId id : w.store.query<Player, AnimationState>()) {
    const auto& p = *w.store.get<Player>(id);
    auto& anim = *w.store.get<AnimationState>(id);
    const auto* sprite = w.store.get<Sprite>(id);
    const RenderNode node = (sprite != nullptr) ? sprite->node : kInvalidRenderNode;

    const std::string_view name = selectAnimation(p.state, p.facingDirection, p.isGrounded);
    if (name != anim.currentAnimation) {
      anim.currentAnimation = std::string(name);
      const AnimationClip* clip =
          anim.animations ? anim.animations->find(anim.currentAnimation) : nullptr;
      if (clip != nullptr && node != kInvalidRenderNode)
        w.scene().playClip(node, anim.currentAnimation, *clip);
    }

    const bool flip = p.facingDirection < 0;
    if (flip != anim.flipX) {
      anim.flipX = flip;
      if (node != kInvalidRenderNode)
        w.scene().setFlipX(node, flip);
    }
  }
}

void renderSync(World& w) {
  const float ppm = w.config().pixelsPerMeter;
  SceneGraph& scene = w.scene();

  for (EntityId id : w.store.query<Sprite, Transform>()) {
    const RenderNode node = w.store.get<Sprite>(id)->node;
    if (node == kInvalidRenderNode)
      continue;
    const Vec2 pos = w.store.get<Transform>(id)->pos;
    scene.setTransform(node, util::metersToPixels(pos.x, ppm), util::metersToPixels(pos.y, ppm));
  }

  for (EntityId id : w.store.query<Sprite, Opacity>()) {
    const RenderNode node = w.store.get<Sprite>(id)->node;
    auto& op = *w.store.get<Opacity>(id);
    if (node == kInvalidRenderNode || op.alpha == op.lastApplied)
      continue;
    scene.setAlpha(node, op.alpha);
    op.lastApplied = op.alpha;
  }
}

}  // namespace Systems
