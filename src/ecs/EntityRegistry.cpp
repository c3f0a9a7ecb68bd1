#include "ecs/EntityRegistry.h"

#include <utility>

#include "ecs/Components.h"

EntityId EntityRegistry::create() {
  ++live_;
  return registry_.create();
}

void EntityRegistry::destroy(EntityId id) {
  if (!isAlive(id))
    return;
  registry_.emplace<PendingDestroy>(id);
  pending_.push_back(id);
}

bool EntityRegistry::isAlive(EntityId id) const {
  return exists(id) && !registry_.all_of<PendingDestroy>(id);
}

bool EntityRegistry::exists(EntityId id) const {
  return id != kInvalidEntity && registry_.valid(id);
}

bool EntityRegistry::isPending(EntityId id) const {
  return exists(id) && registry_.all_of<PendingDestroy>(id);
}

std::vector<EntityId> EntityRegistry::takePending() {
  std::vector<EntityId> out;
  out.swap(pending_);
  return out;
}

void EntityRegistry::release(EntityId id) {
  if (!exists(id))
    return;
  registry_.destroy(id);
  --live_;
}
