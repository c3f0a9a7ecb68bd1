#pragma once

#include <cstdint>

#include <entt/entt.hpp>

using EntityId = entt::entity;
inline constexpr EntityId kInvalidEntity = entt::null;

inline std::uint32_t entityIndex(EntityId e) {
  return static_cast<std::uint32_t>(entt::to_integral(e));
}
