#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "ecs/Components.h"
#include "visual/Palette.h"

// One enemy archetype. Sizes in pixels, speeds and distances in metres.
struct EnemyConfig {
  int version = 0;
  std::string id;
  std::string displayName;
  EnemyKind kind = EnemyKind::Walker;

  struct Collision {
    float w = 24.0F;
    float h = 32.0F;
  } collision;

  struct Move {
    float speed = 1.5F;           // m/s
    float patrolDistance = 2.0F;  // m either side of the spawn x
  } move;

  struct Combat {
    float health = 30.0F;
    float contactDamage = 15.0F;
    int scrapValue = 5;
  } combat;

  // fireRate 0: the kind carries no gun.
  struct Weapon {
    float damage = 0.0F;
    float fireRate = 0.0F;         // shots per second
    float range = 0.0F;            // m
    float projectileSpeed = 0.0F;  // m/s
  } weapon;

  struct Render {
    Visual::Color color{0xFF, 0x33, 0x44};
  } render;

  // Built-in archetype for `kind`, used until a file overrides it.
  static EnemyConfig defaults(EnemyKind kind);

  bool loadFromToml(const char* path);
  bool parse(std::string_view text, const char* sourceName = nullptr);

 private:
  bool load(std::string_view source, const char* name, bool fromFile);
};

// "walker" -> Walker. nullopt for anything else.
std::optional<EnemyKind> parseEnemyKind(std::string_view name);
// Level spawn tags: "enemy-walker" ... "enemy-boss-warden".
std::optional<EnemyKind> parseEnemyKindTag(std::string_view tag);
const char* enemyKindName(EnemyKind kind);

// How a kind is simulated by the physics collaborator.
BodyType enemyBodyType(EnemyKind kind);

// Per-kind archetypes, seeded with the built-in defaults.
class EnemyRoster {
 public:
  EnemyRoster();

  // Loads one archetype file and replaces the entry for its kind.
  bool loadFromToml(const char* path);
  bool parse(std::string_view text, const char* sourceName = nullptr);

  void set(EnemyConfig cfg);
  [[nodiscard]] const EnemyConfig& get(EnemyKind kind) const;

 private:
  static constexpr std::size_t kKindCount = 7;
  std::array<EnemyConfig, kKindCount> configs_;
};
