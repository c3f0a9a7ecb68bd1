#pragma once

#include <cstdint>
#include <optional>
#include <vector>

// Opaque body id issued by the physics collaborator.
using BodyHandle = std::uint32_t;
inline constexpr BodyHandle kInvalidBody = 0xFFFFFFFFU;

enum class BodyType : std::uint8_t {
  Dynamic,
  Kinematic,
  Static,
};

struct BodyVec {
  float x = 0.0F;
  float y = 0.0F;
};

struct BodyState {
  BodyVec position{};  // metres
  BodyVec velocity{};  // m/s
};

// `normal` is a unit vector pointing from bodyA toward bodyB.
struct ContactEvent {
  BodyHandle bodyA = kInvalidBody;
  BodyHandle bodyB = kInvalidBody;
  BodyVec normal{};
};

// Rigid-body engine seen from the simulation core. Every call may throw
// PhysicsError; the core owns none of the engine's objects.
class PhysicsEngine {
 public:
  virtual ~PhysicsEngine() = default;

  virtual BodyHandle createBody(BodyType type, BodyVec position) = 0;
  virtual void removeBody(BodyHandle handle) = 0;
  virtual void setLinearVelocity(BodyHandle handle, BodyVec velocity) = 0;
  // nullopt when the handle no longer resolves to a live body.
  virtual std::optional<BodyState> readBody(BodyHandle handle) const = 0;
  virtual void step(float dt) = 0;
  virtual std::vector<ContactEvent> drainContactEvents() = 0;
};
