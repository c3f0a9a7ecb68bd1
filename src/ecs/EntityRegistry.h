#pragma once

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "ecs/Entity.h"

// Issues ids and tracks liveness. destroy() only marks an entity; the id stays
// reserved until release() at the end-of-frame flush, so nothing that still
// refers to it (a physics body, a render node) can observe a recycled id.
class EntityRegistry {
 public:
  EntityId create();
  void destroy(EntityId id);

  // True from create() until destroy() is requested.
  [[nodiscard]] bool isAlive(EntityId id) const;
  // True from create() until release(); includes pending entities.
  [[nodiscard]] bool exists(EntityId id) const;
  [[nodiscard]] bool isPending(EntityId id) const;

  [[nodiscard]] std::size_t aliveCount() const { return live_ - pending_.size(); }
  [[nodiscard]] std::size_t pendingCount() const { return pending_.size(); }

  // Hands the flush the pending ids in request order and clears the queue.
  std::vector<EntityId> takePending();
  void release(EntityId id);

  entt::registry& registry() { return registry_; }
  const entt::registry& registry() const { return registry_; }

 private:
  entt::registry registry_;
  std::vector<EntityId> pending_;
  std::size_t live_ = 0;
};
