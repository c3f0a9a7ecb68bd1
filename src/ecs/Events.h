#pragma once

#include <vector>

#include "ecs/Components.h"
#include "ecs/Entity.h"

// Contact between two bodies, translated to entities. Either side is
// kInvalidEntity for terrain the core never spawned. `normal` points from a to b.
struct CollisionEvent {
  EntityId a = kInvalidEntity;
  EntityId b = kInvalidEntity;
  Vec2 normal{};
};

// target == kInvalidEntity: the projectile struck terrain.
struct ProjectileHit {
  EntityId projectile = kInvalidEntity;
  EntityId target = kInvalidEntity;
};

// Body contact between an enemy and something it hurts.
struct ContactDamage {
  EntityId source = kInvalidEntity;
  EntityId target = kInvalidEntity;
  float amount = 0.0F;
};

// Per-frame event lists, cleared at the start of every frame.
struct FrameEvents {
  std::vector<CollisionEvent> collisions;
  std::vector<ProjectileHit> hits;
  std::vector<ContactDamage> contacts;
  // Engine steps run this frame. With a fixed timestep a short frame may run
  // none, and then the contact list says nothing about what is touching.
  int physicsSteps = 1;

  void clear() {
    collisions.clear();
    hits.clear();
    contacts.clear();
  }
};
