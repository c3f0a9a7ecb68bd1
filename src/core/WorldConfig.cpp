#include "core/WorldConfig.h"

#include <algorithm>
#include <optional>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

bool WorldConfig::loadFromToml(const char* path) {
  return load(path != nullptr ? std::string_view{path} : std::string_view{}, path, true);
}

bool WorldConfig::parse(std::string_view text, const char* sourceName) {
  return load(text, sourceName, false);
}

bool WorldConfig::load(std::string_view source, const char* name, bool fromFile) {
  std::optional<toml::table> parsed = TomlUtil::parse(source, name, fromFile);
  if (!parsed)
    return false;
  const toml::table& tbl = *parsed;

  TomlUtil::warnUnknownKeys(tbl, name, "root", {"version", "world"});

  WorldConfig next{};
  if (auto w = tbl["world"].as_table()) {
    TomlUtil::warnUnknownKeys(*w, name, "world",
                              {"pixels_per_meter", "fixed_timestep", "max_substeps",
                               "ground_normal_min", "wall_normal_min"});
    if (auto v = w->get("pixels_per_meter"))
      next.pixelsPerMeter = v->value_or(next.pixelsPerMeter);
    if (auto v = w->get("fixed_timestep"))
      next.fixedTimestep = v->value_or(next.fixedTimestep);
    if (auto v = w->get("max_substeps"))
      next.maxSubsteps = v->value_or(next.maxSubsteps);
    if (auto v = w->get("ground_normal_min"))
      next.groundNormalMin = v->value_or(next.groundNormalMin);
    if (auto v = w->get("wall_normal_min"))
      next.wallNormalMin = v->value_or(next.wallNormalMin);
  }

  if (next.pixelsPerMeter <= 0.0F) {
    TomlUtil::warnf(name, "world.pixels_per_meter must be > 0 (got {}); using default",
                    next.pixelsPerMeter);
    next.pixelsPerMeter = kDefaultPixelsPerMeter;
  }
  next.fixedTimestep = std::max(0.0F, next.fixedTimestep);
  next.maxSubsteps = std::max(1, next.maxSubsteps);
  next.groundNormalMin = std::clamp(next.groundNormalMin, 0.0F, 1.0F);
  next.wallNormalMin = std::clamp(next.wallNormalMin, 0.0F, 1.0F);

  *this = std::move(next);
  return true;
}
