#include "animation/Animation.h"

#include <format>
#include <optional>
#include <utility>

#include <toml++/toml.h>

#include "core/Errors.h"
#include "util/TomlUtil.h"

void AnimationTable::add(std::string name, AnimationClip clip) {
  if (name.empty()) {
    throw ConfigurationError("animation clip has an empty name");
  }
  if (clip.frames.empty()) {
    throw ConfigurationError(std::format("animation '{}' has no frames", name));
  }
  if (!(clip.fps > 0.0F)) {
    throw ConfigurationError(std::format("animation '{}' has fps {} (must be > 0)", name, clip.fps));
  }
  clips_.insert_or_assign(std::move(name), std::move(clip));
}

const AnimationClip* AnimationTable::find(const std::string& name) const {
  auto it = clips_.find(name);
  return (it != clips_.end()) ? &it->second : nullptr;
}

bool AnimationTable::loadFromToml(const char* path) {
  return load(path != nullptr ? std::string_view{path} : std::string_view{}, path, true);
}

bool AnimationTable::parse(std::string_view text, const char* sourceName) {
  return load(text, sourceName, false);
}

bool AnimationTable::load(std::string_view source, const char* name, bool fromFile) {
  std::optional<toml::table> parsed = TomlUtil::parse(source, name, fromFile);
  if (!parsed)
    return false;
  const toml::table& tbl = *parsed;

  TomlUtil::warnUnknownKeys(tbl, name, "root", {"version", "anims"});

  const toml::table* anims = tbl["anims"].as_table();
  if (anims == nullptr) {
    TomlUtil::warnf(name, "missing [anims] table");
    return false;
  }

  AnimationTable next;
  for (const auto& [key, node] : *anims) {
    const std::string clipName(key.str());
    const std::string scope = "anims." + clipName;
    const toml::table* t = node.as_table();
    if (t == nullptr) {
      TomlUtil::warnf(name, "{} must be a table; skipping", scope);
      continue;
    }
    TomlUtil::warnUnknownKeys(*t, name, scope, {"frames", "fps", "loop"});

    AnimationClip clip{};
    if (auto frames = t->get_as<toml::array>("frames")) {
      for (const auto& f : *frames) {
        if (auto s = f.value<std::string>())
          clip.frames.push_back(*s);
      }
    }
    if (auto v = t->get("fps"))
      clip.fps = v->value_or(clip.fps);
    if (auto v = t->get("loop"))
      clip.loop = v->value_or(clip.loop);

    try {
      next.add(clipName, std::move(clip));
    } catch (const ConfigurationError& err) {
      TomlUtil::warnf(name, "{}; skipping", err.what());
    }
  }

  *this = std::move(next);
  return true;
}
