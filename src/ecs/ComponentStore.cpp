#include "ecs/ComponentStore.h"

#include <entt/entt.hpp>

namespace {

bool isBookkeeping(entt::id_type pool) {
  return pool == entt::type_hash<StoreOrder>::value() ||
         pool == entt::type_hash<PendingDestroy>::value();
}

}  // namespace

void ComponentStore::removeAll(EntityId id) {
  if (id == kInvalidEntity || !registry_.valid(id))
    return;
  for (auto [pool, storage] : registry_.storage()) {
    if (isBookkeeping(pool))
      continue;
    (void)storage.remove(id);
  }
}

std::size_t ComponentStore::componentCount(EntityId id) const {
  if (id == kInvalidEntity || !registry_.valid(id))
    return 0;
  std::size_t count = 0;
  for (auto [pool, storage] : registry_.storage()) {
    if (!isBookkeeping(pool) && storage.contains(id))
      ++count;
  }
  return count;
}
