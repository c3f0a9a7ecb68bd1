#pragma once

#include <memory>
#include <optional>
#include <string>

#include "animation/Animation.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"
#include "enemy/EnemyConfig.h"
#include "stage/LevelData.h"
#include "visual/Palette.h"

class World;

// Entity factories. Each one creates the external body and render node, then
// attaches the entity's whole component set in a single World::spawn, so a
// system never sees a half-built entity. Positions are metres.
namespace Spawners {

struct ProjectileParams {
  float damage = 10.0F;
  float speed = 10.0F;    // m/s
  float lifetime = 2.0F;  // s
  float size = 6.0F;      // px
  std::optional<Visual::Color> glow;
};

EntityId player(World& w, Vec2 pos, std::shared_ptr<const AnimationTable> animations = nullptr);
EntityId enemy(World& w, const EnemyConfig& cfg, Vec2 pos);
// `dir` is normalised here; a zero direction is a ConfigurationError.
EntityId projectile(World& w, EntityId owner, Vec2 pos, Vec2 dir, const ProjectileParams& params);
EntityId floatText(World& w, Vec2 pos, std::string text, Visual::Color color, float seconds = 1.0F);

// One level descriptor (pixels) -> one entity. Bad descriptors and physics
// refusals are logged and yield kInvalidEntity.
EntityId spawnFrom(World& w,
                   const SpawnDescriptor& desc,
                   const EnemyRoster& roster,
                   std::shared_ptr<const AnimationTable> playerAnimations = nullptr);

// Spawns every descriptor except the boss, which an external trigger places
// later through spawnFrom. Returns the number of entities created.
int spawnLevel(World& w,
               const LevelData& level,
               const EnemyRoster& roster,
               std::shared_ptr<const AnimationTable> playerAnimations = nullptr);

}  // namespace Spawners
