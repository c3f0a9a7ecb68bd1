#pragma once

#include <utility>
#include <vector>

#include "character/CharacterConfig.h"
#include "core/Errors.h"
#include "core/Log.h"
#include "core/Time.h"
#include "core/WorldConfig.h"
#include "ecs/ComponentStore.h"
#include "ecs/Components.h"  // IWYU pragma: keep
#include "ecs/Entity.h"
#include "ecs/EntityRegistry.h"
#include "ecs/Events.h"
#include "physics/PhysicsBridge.h"
#include "physics/PhysicsEngine.h"
#include "render/SceneGraph.h"

// Facade over the registry and component store. Owns the per-frame pipeline:
//   input -> physics pre/step/post -> collisions -> movement -> weapons
//   -> projectiles -> ephemerals -> animation -> render sync -> flush
// Every stage runs to completion before the next one starts, and destruction
// is deferred to the flush, so systems may call requestDestroy() mid-iteration.
class World {
 public:
  World(PhysicsEngine& physics,
        SceneGraph& scene,
        WorldConfig cfg = {},
        CharacterConfig character = {});
  World(const World&) = delete;
  World& operator=(const World&) = delete;

  // Creates an entity carrying exactly `components`, or nothing at all. A
  // duplicate component type rejects the whole spawn (kInvalidEntity).
  template <typename... Cs>
  EntityId spawn(Cs... components) {
    const EntityId id = entities.create();
    try {
      (store.attach(id, std::move(components)), ...);
    } catch (const InvariantViolation& err) {
      discard(id);
      Log::warnf("world", "invariant violation: spawn rejected: {}", err.what());
      return kInvalidEntity;
    }
    adopt(id);
    return id;
  }

  void requestDestroy(EntityId id) { entities.destroy(id); }

  // Queues intent for the next frame's input stage.
  void submitInput(EntityId id, InputState input);
  std::vector<std::pair<EntityId, InputState>> takeInput();

  // Throws PhysicsStepFailure if the engine step fails; the world then halts
  // and later calls are refused.
  void runFrame(float dt);
  // Applies queued destructions: body -> components -> render node -> id.
  void flush();

  [[nodiscard]] bool halted() const { return halted_; }
  [[nodiscard]] const TimeStep& lastStep() const { return step_; }

  PhysicsBridge& physics() { return physics_; }
  PhysicsEngine& engine() { return engine_; }
  SceneGraph& scene() { return scene_; }
  [[nodiscard]] const WorldConfig& config() const { return cfg_; }
  [[nodiscard]] const CharacterConfig& character() const { return character_; }

  EntityRegistry entities;
  ComponentStore store{entities.registry()};
  FrameEvents events;

  // debug/test-friendly counters
  int damageEvents = 0;
  int enemyKills = 0;

  // external handle: "currently controlled player"
  EntityId player = kInvalidEntity;

 private:
  void adopt(EntityId id);
  void discard(EntityId id);

  PhysicsEngine& engine_;
  SceneGraph& scene_;
  WorldConfig cfg_;
  CharacterConfig character_;
  PhysicsBridge physics_;
  std::vector<std::pair<EntityId, InputState>> input_;
  TimeStep step_{};
  bool halted_ = false;
};
