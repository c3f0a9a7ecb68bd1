#include "ecs/World.h"

#include <exception>

#include "ecs/Systems.h"

namespace {

template <typename Fn>
void runStage(const char* name, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& err) {
    Log::errorf("world", "stage '{}' failed: {}", name, err.what());
  }
}

}  // namespace

World::World(PhysicsEngine& physics, SceneGraph& scene, WorldConfig cfg, CharacterConfig character)
    : engine_(physics),
      scene_(scene),
      cfg_(std::move(cfg)),
      character_(std::move(character)),
      physics_(physics, cfg_) {}

void World::adopt(EntityId id) {
  if (const auto* body = store.get<PhysicsBody>(id))
    physics_.bind(body->handle, id);
  if (const auto* sprite = store.get<Sprite>(id)) {
    if (sprite->node != kInvalidRenderNode)
      scene_.attach(sprite->node, scene_.worldLayer());
  }
}

void World::discard(EntityId id) {
  store.removeAll(id);
  entities.release(id);
}

void World::submitInput(EntityId id, InputState input) {
  input_.emplace_back(id, input);
}

std::vector<std::pair<EntityId, InputState>> World::takeInput() {
  std::vector<std::pair<EntityId, InputState>> out;
  out.swap(input_);
  return out;
}

void World::runFrame(float dt) {
  if (halted_) {
    Log::errorf("world", "frame {} refused: simulation halted", step_.frame + 1);
    return;
  }

  step_ = step_.next(dt);
  events.clear();

  runStage("input", [&] { Systems::ingestInput(*this); });
  runStage("physics.preStep", [&] { physics_.preStep(*this); });
  try {
    events.physicsSteps = physics_.step(dt);
  } catch (const PhysicsStepFailure& err) {
    halted_ = true;
    Log::errorf("physics", "{}; halting simulation", err.what());
    throw;
  }
  runStage("physics.postStep", [&] { physics_.postStep(*this); });
  runStage("collisions", [&] { Systems::collisions(*this); });
  runStage("movement", [&] { Systems::movement(*this, step_); });
  runStage("weapons", [&] { Systems::weapons(*this, step_); });
  runStage("projectiles", [&] { Systems::projectiles(*this, step_); });
  runStage("ephemerals", [&] { Systems::ephemerals(*this, step_); });
  runStage("animation", [&] { Systems::animation(*this); });
  runStage("renderSync", [&] { Systems::renderSync(*this); });

  flush();
}

void World::flush() {
  for (EntityId id : entities.takePending()) {
    if (const auto* body = store.get<PhysicsBody>(id)) {
      try {
        physics_.releaseBody(id, *body);
      } catch (const std::exception& err) {
        Log::warnf("physics", "body {} of entity {} not released: {}", body->handle,
                   entityIndex(id), err.what());
      }
    }

    RenderNode node = kInvalidRenderNode;
    if (const auto* sprite = store.get<Sprite>(id))
      node = sprite->node;

    store.removeAll(id);

    if (node != kInvalidRenderNode) {
      try {
        scene_.detach(node);
        scene_.destroy(node);
      } catch (const std::exception& err) {
        Log::warnf("render", "node {} of entity {} not released: {}", node, entityIndex(id),
                   err.what());
      }
    }

    if (id == player)
      player = kInvalidEntity;
    entities.release(id);
  }
}
