#pragma once

#include <unordered_map>

#include "core/WorldConfig.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"
#include "physics/PhysicsEngine.h"

class World;

// Mirrors PhysicsBody handles against the physics collaborator. Velocity goes
// out before the step, position/velocity/contacts come back after it.
class PhysicsBridge {
 public:
  PhysicsBridge(PhysicsEngine& engine, const WorldConfig& cfg) : engine_(engine), cfg_(cfg) {}

  void bind(BodyHandle handle, EntityId id);
  void unbind(BodyHandle handle);
  // kInvalidEntity for bodies the core did not spawn (terrain).
  [[nodiscard]] EntityId entityFor(BodyHandle handle) const;
  [[nodiscard]] bool isStatic(const World& w, EntityId id) const;

  void preStep(World& w);
  // Advances the engine in fixed increments; returns the number of engine steps.
  // Any engine failure surfaces as PhysicsStepFailure.
  int step(float dt);
  void postStep(World& w);

  // Removes the external body of an entity being flushed. A handle the engine
  // has since reissued to another entity is left alone.
  void releaseBody(EntityId id, const PhysicsBody& body);

  [[nodiscard]] float accumulator() const { return accumulator_; }

 private:
  void markStale(World& w, EntityId id, BodyHandle handle);

  PhysicsEngine& engine_;
  const WorldConfig& cfg_;
  std::unordered_map<BodyHandle, EntityId> owners_;
  float accumulator_ = 0.0F;
};
