#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "core/Errors.h"
#include "core/Log.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"

// Per-type component pools on top of the registry's EnTT storage. At most one
// instance of a type per entity; query() results come back in the order the
// entities first received a component.
class ComponentStore {
 public:
  explicit ComponentStore(entt::registry& registry) : registry_(registry) {}

  // Throws InvariantViolation if `id` is gone or already has a T.
  template <typename T>
  void attach(EntityId id, T component) {
    if (id == kInvalidEntity || !registry_.valid(id)) {
      throw InvariantViolation(
          std::format("attach {} to unknown entity {}", typeName<T>(), entityIndex(id)));
    }
    if (registry_.all_of<T>(id)) {
      throw InvariantViolation(
          std::format("entity {} already has a {}", entityIndex(id), typeName<T>()));
    }
    if (!registry_.all_of<StoreOrder>(id)) {
      registry_.emplace<StoreOrder>(id, StoreOrder{nextSeq_++});
    }
    registry_.emplace<T>(id, std::move(component));
  }

  // Non-throwing attach: a rejected add is logged and leaves the entity untouched.
  template <typename T>
  bool add(EntityId id, T component) {
    try {
      attach<T>(id, std::move(component));
    } catch (const InvariantViolation& err) {
      Log::warnf("ecs", "invariant violation: {}", err.what());
      return false;
    }
    return true;
  }

  template <typename T>
  [[nodiscard]] T* get(EntityId id) {
    if (id == kInvalidEntity || !registry_.valid(id))
      return nullptr;
    return registry_.try_get<T>(id);
  }

  template <typename T>
  [[nodiscard]] const T* get(EntityId id) const {
    if (id == kInvalidEntity || !registry_.valid(id))
      return nullptr;
    return registry_.try_get<T>(id);
  }

  template <typename T>
  [[nodiscard]] bool has(EntityId id) const {
    return id != kInvalidEntity && registry_.valid(id) && registry_.all_of<T>(id);
  }

  template <typename T>
  bool remove(EntityId id) {
    if (id == kInvalidEntity || !registry_.valid(id))
      return false;
    return registry_.remove<T>(id) > 0;
  }

  void removeAll(EntityId id);

  // Gameplay components on `id`, bookkeeping excluded. 0 for released ids.
  [[nodiscard]] std::size_t componentCount(EntityId id) const;

  // Live (not pending-destroy) entities having every T, in first-insertion order.
  template <typename... Ts>
  [[nodiscard]] std::vector<EntityId> query() const {
    std::vector<std::pair<std::uint64_t, EntityId>> rows;
    auto view = registry_.view<StoreOrder, Ts...>(entt::exclude<PendingDestroy>);
    for (auto entity : view) {
      rows.emplace_back(view.template get<StoreOrder>(entity).seq, entity);
    }
    std::ranges::sort(rows, {}, &std::pair<std::uint64_t, EntityId>::first);

    std::vector<EntityId> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
      out.push_back(row.second);
    }
    return out;
  }

 private:
  template <typename T>
  static std::string typeName() {
    return std::string(entt::type_id<T>().name());
  }

  entt::registry& registry_;
  std::uint64_t nextSeq_ = 0;
};
