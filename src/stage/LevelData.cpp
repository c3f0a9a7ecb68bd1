#include "stage/LevelData.h"

#include <cstddef>
#include <format>
#include <utility>

#include <toml++/toml.h>

#include "core/Errors.h"
#include "util/TomlUtil.h"

namespace {

SpawnDescriptor readSpawn(const toml::table& t, const std::string& scope) {
  SpawnDescriptor sp{};
  if (auto k = t["kind"].value<std::string>()) {
    sp.kind = *k;
  } else {
    throw ConfigurationError(std::format("{} is missing required field 'kind'", scope));
  }
  sp.x = TomlUtil::require<float>(t, "x", scope);
  sp.y = TomlUtil::require<float>(t, "y", scope);
  return sp;
}

}  // namespace

std::optional<SpawnDescriptor> LevelData::playerSpawn() const {
  for (const auto& sp : spawns) {
    if (sp.kind == "player")
      return sp;
  }
  return std::nullopt;
}

bool LevelData::loadFromToml(const char* path) {
  return load(path != nullptr ? std::string_view{path} : std::string_view{}, path, true);
}

bool LevelData::parse(std::string_view text, const char* sourceName) {
  return load(text, sourceName, false);
}

bool LevelData::load(std::string_view source, const char* name, bool fromFile) {
  std::optional<toml::table> parsed = TomlUtil::parse(source, name, fromFile);
  if (!parsed)
    return false;
  const toml::table& tbl = *parsed;

  TomlUtil::warnUnknownKeys(tbl, name, "root", {"version", "level", "spawns"});

  LevelData next{};
  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (auto l = tbl["level"].as_table()) {
    TomlUtil::warnUnknownKeys(*l, name, "level", {"name"});
    if (auto v = l->get("name"))
      next.name = v->value_or(next.name);
  }

  if (auto spawns = tbl["spawns"].as_array()) {
    std::size_t idx = 0;
    for (const auto& node : *spawns) {
      const std::string scope = "spawns[" + std::to_string(idx++) + "]";
      auto t = node.as_table();
      if (!t) {
        TomlUtil::warnf(name, "{} is not a table; skipped", scope);
        continue;
      }
      TomlUtil::warnUnknownKeys(*t, name, scope, {"kind", "x", "y"});
      try {
        next.spawns.push_back(readSpawn(*t, scope));
      } catch (const ConfigurationError& err) {
        TomlUtil::warnf(name, "{}; skipped", err.what());
      }
    }
  }

  *this = std::move(next);
  return true;
}
