#pragma once

#include <string_view>

#include "ecs/Components.h"
#include "ecs/Entity.h"

class World;
struct TimeStep;

namespace Systems {
void ingestInput(World& w);
void collisions(World& w);
void movement(World& w, TimeStep ts);
void weapons(World& w, TimeStep ts);
void projectiles(World& w, TimeStep ts);
void ephemerals(World& w, TimeStep ts);
void animation(World& w);
void renderSync(World& w);

// Same inputs, same name. `facing` only drives flipX, never the clip.
std::string_view selectAnimation(PlayerState state, int facing, bool isGrounded);

// Returns false when the target can't take damage right now (no Health, dead,
// invincible). A kill is handled here: enemies are destroyed and counted.
// `source` is set for body contact; a player hit that way is knocked back.
bool applyDamage(World& w, EntityId target, float amount, EntityId source = kInvalidEntity);
}  // namespace Systems
