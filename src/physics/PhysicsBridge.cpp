#include "physics/PhysicsBridge.h"

#include <algorithm>
#include <exception>
#include <format>
#include <optional>
#include <vector>

#include "core/Errors.h"
#include "core/Log.h"
#include "ecs/World.h"

void PhysicsBridge::bind(BodyHandle handle, EntityId id) {
  if (handle == kInvalidBody)
    return;
  owners_[handle] = id;
}

void PhysicsBridge::unbind(BodyHandle handle) {
  owners_.erase(handle);
}

EntityId PhysicsBridge::entityFor(BodyHandle handle) const {
  auto it = owners_.find(handle);
  return (it != owners_.end()) ? it->second : kInvalidEntity;
}

bool PhysicsBridge::isStatic(const World& w, EntityId id) const {
  if (id == kInvalidEntity)
    return true;
  const auto* body = w.store.get<PhysicsBody>(id);
  return body != nullptr && body->type == BodyType::Static;
}

void PhysicsBridge::markStale(World& w, EntityId id, BodyHandle handle) {
  Log::warnf("physics", "entity {} references stale body {}; destroying",
             entityIndex(id), handle);
  w.requestDestroy(id);
}

void PhysicsBridge::preStep(World& w) {
  for (EntityId id : w.store.query<PhysicsBody, Velocity>()) {
    const auto& body = *w.store.get<PhysicsBody>(id);
    if (body.type == BodyType::Static)
      continue;

    const auto& vel = w.store.get<Velocity>(id)->v;
    try {
      if (!engine_.readBody(body.handle)) {
        throw StaleHandleError(std::format("body {} no longer exists", body.handle));
      }
      engine_.setLinearVelocity(body.handle, BodyVec{vel.x, vel.y});
    } catch (const StaleHandleError&) {
      markStale(w, id, body.handle);
    } catch (const PhysicsError& err) {
      Log::warnf("physics", "setLinearVelocity on body {} failed: {}", body.handle, err.what());
    }
  }
}

int PhysicsBridge::step(float dt) {
  int steps = 0;
  try {
    if (cfg_.fixedTimestep <= 0.0F) {
      engine_.step(dt);
      return 1;
    }

    const float maxBacklog = cfg_.fixedTimestep * static_cast<float>(cfg_.maxSubsteps);
    accumulator_ = std::min(accumulator_ + std::max(0.0F, dt), maxBacklog);
    while (accumulator_ >= cfg_.fixedTimestep) {
      engine_.step(cfg_.fixedTimestep);
      accumulator_ -= cfg_.fixedTimestep;
      ++steps;
    }
  } catch (const std::exception& err) {
    throw PhysicsStepFailure(std::format("physics step failed: {}", err.what()));
  }
  return steps;
}

void PhysicsBridge::postStep(World& w) {
  for (EntityId id : w.store.query<PhysicsBody>()) {
    const BodyHandle handle = w.store.get<PhysicsBody>(id)->handle;

    std::optional<BodyState> state;
    try {
      state = engine_.readBody(handle);
    } catch (const PhysicsError& err) {
      Log::warnf("physics", "readBody {} failed: {}", handle, err.what());
      continue;
    }
    if (!state) {
      markStale(w, id, handle);
      continue;
    }

    if (auto* t = w.store.get<Transform>(id))
      t->pos = Vec2{state->position.x, state->position.y};
    if (auto* v = w.store.get<Velocity>(id))
      v->v = Vec2{state->velocity.x, state->velocity.y};
  }

  std::vector<ContactEvent> contacts;
  try {
    contacts = engine_.drainContactEvents();
  } catch (const PhysicsError& err) {
    Log::warnf("physics", "contact drain failed: {}", err.what());
    return;
  }

  w.events.collisions.reserve(w.events.collisions.size() + contacts.size());
  for (const auto& c : contacts) {
    const EntityId a = entityFor(c.bodyA);
    const EntityId b = entityFor(c.bodyB);
    if (a == kInvalidEntity && b == kInvalidEntity)
      continue;
    w.events.collisions.push_back(CollisionEvent{a, b, Vec2{c.normal.x, c.normal.y}});
  }
}

void PhysicsBridge::releaseBody(EntityId id, const PhysicsBody& body) {
  if (body.handle == kInvalidBody)
    return;
  const EntityId owner = entityFor(body.handle);
  if (owner != id && owner != kInvalidEntity) {
    // The engine reissued the handle after this entity's body went stale.
    Log::debugf("physics", "body {} now belongs to entity {}; not removed for entity {}",
                body.handle, entityIndex(owner), entityIndex(id));
    return;
  }
  unbind(body.handle);
  try {
    engine_.removeBody(body.handle);
  } catch (const PhysicsError& err) {
    // Already gone on the engine side (stale); nothing left to release.
    Log::debugf("physics", "removeBody {} for entity {}: {}", body.handle, entityIndex(id),
                err.what());
  }
}
