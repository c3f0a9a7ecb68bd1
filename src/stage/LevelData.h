#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One spawn point from level data. Position is in pixels, as authored.
struct SpawnDescriptor {
  std::string kind;  // "player", "enemy-walker", ... "enemy-boss-warden"
  float x = 0.0F;
  float y = 0.0F;
};

// Spawn list of a level. Descriptors keep their authored order.
struct LevelData {
  int version = 0;
  std::string name;
  std::vector<SpawnDescriptor> spawns;

  // First "player" descriptor, if the level has one.
  [[nodiscard]] std::optional<SpawnDescriptor> playerSpawn() const;

  bool loadFromToml(const char* path);
  bool parse(std::string_view text, const char* sourceName = nullptr);

 private:
  bool load(std::string_view source, const char* name, bool fromFile);
};
