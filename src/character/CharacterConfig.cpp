#include "character/CharacterConfig.h"

#include <algorithm>
#include <optional>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

float clampNonNegative(float v) {
  return std::max(0.0F, v);
}

}  // namespace

bool CharacterConfig::loadFromToml(const char* path) {
  return load(path != nullptr ? std::string_view{path} : std::string_view{}, path, true);
}

bool CharacterConfig::parse(std::string_view text, const char* sourceName) {
  return load(text, sourceName, false);
}

bool CharacterConfig::load(std::string_view source, const char* name, bool fromFile) {
  std::optional<toml::table> parsed = TomlUtil::parse(source, name, fromFile);
  if (!parsed)
    return false;
  const toml::table& tbl = *parsed;

  TomlUtil::warnUnknownKeys(tbl, name, "root",
                            {"version", "character", "move", "jump", "wall", "combat", "weapon",
                             "render"});

  CharacterConfig next{};

  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (auto c = tbl["character"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, name, "character", {"id", "display"});
    if (auto v = c->get("id"))
      next.id = v->value_or(next.id);
    if (auto v = c->get("display"))
      next.displayName = v->value_or(next.displayName);
  }
  if (next.displayName.empty())
    next.displayName = next.id;

  if (auto m = tbl["move"].as_table()) {
    TomlUtil::warnUnknownKeys(*m, name, "move", {"run_speed", "air_control"});
    if (auto v = m->get("run_speed"))
      next.move.runSpeed = v->value_or(next.move.runSpeed);
    if (auto v = m->get("air_control"))
      next.move.airControl = v->value_or(next.move.airControl);
  }

  if (auto j = tbl["jump"].as_table()) {
    TomlUtil::warnUnknownKeys(*j, name, "jump", {"impulse", "max_jumps"});
    if (auto v = j->get("impulse"))
      next.jump.impulse = v->value_or(next.jump.impulse);
    if (auto v = j->get("max_jumps"))
      next.jump.maxJumps = v->value_or(next.jump.maxJumps);
  }

  if (auto w = tbl["wall"].as_table()) {
    TomlUtil::warnUnknownKeys(*w, name, "wall", {"slide_speed", "jump_impulse_x", "jump_impulse_y"});
    if (auto v = w->get("slide_speed"))
      next.wall.slideSpeed = v->value_or(next.wall.slideSpeed);
    if (auto v = w->get("jump_impulse_x"))
      next.wall.jumpImpulseX = v->value_or(next.wall.jumpImpulseX);
    if (auto v = w->get("jump_impulse_y"))
      next.wall.jumpImpulseY = v->value_or(next.wall.jumpImpulseY);
  }

  if (auto c = tbl["combat"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, name, "combat",
                              {"max_health", "invincibility_seconds", "dead_alpha", "knockback_x",
                               "knockback_y"});
    if (auto v = c->get("max_health"))
      next.combat.maxHealth = v->value_or(next.combat.maxHealth);
    if (auto v = c->get("invincibility_seconds"))
      next.combat.invincibilitySeconds = v->value_or(next.combat.invincibilitySeconds);
    if (auto v = c->get("dead_alpha"))
      next.combat.deadAlpha = v->value_or(next.combat.deadAlpha);
    if (auto v = c->get("knockback_x"))
      next.combat.knockbackX = v->value_or(next.combat.knockbackX);
    if (auto v = c->get("knockback_y"))
      next.combat.knockbackY = v->value_or(next.combat.knockbackY);
  }

  if (auto wp = tbl["weapon"].as_table()) {
    TomlUtil::warnUnknownKeys(*wp, name, "weapon",
                              {"damage", "fire_rate", "range", "projectile_speed"});
    if (auto v = wp->get("damage"))
      next.weapon.damage = v->value_or(next.weapon.damage);
    if (auto v = wp->get("fire_rate"))
      next.weapon.fireRate = v->value_or(next.weapon.fireRate);
    if (auto v = wp->get("range"))
      next.weapon.range = v->value_or(next.weapon.range);
    if (auto v = wp->get("projectile_speed"))
      next.weapon.projectileSpeed = v->value_or(next.weapon.projectileSpeed);
  }

  if (auto r = tbl["render"].as_table()) {
    TomlUtil::warnUnknownKeys(*r, name, "render", {"w", "h", "color"});
    if (auto v = r->get("w"))
      next.render.width = v->value_or(next.render.width);
    if (auto v = r->get("h"))
      next.render.height = v->value_or(next.render.height);
    if (auto v = r->get("color")) {
      if (auto s = v->value<std::string_view>())
        next.render.color = Visual::Color::fromHex(*s);
    }
  }

  if (next.jump.maxJumps < 1) {
    TomlUtil::warnf(name, "jump.max_jumps must be >= 1 (got {}); clamping", next.jump.maxJumps);
    next.jump.maxJumps = 1;
  }
  if (next.jump.impulse > 0.0F) {
    TomlUtil::warnf(name, "jump.impulse is Y-down; a positive value pushes the player down");
  }
  next.move.runSpeed = clampNonNegative(next.move.runSpeed);
  next.move.airControl = std::clamp(next.move.airControl, 0.0F, 1.0F);
  next.wall.slideSpeed = clampNonNegative(next.wall.slideSpeed);
  next.wall.jumpImpulseX = clampNonNegative(next.wall.jumpImpulseX);
  next.combat.maxHealth = std::max(1.0F, next.combat.maxHealth);
  next.combat.invincibilitySeconds = clampNonNegative(next.combat.invincibilitySeconds);
  next.combat.deadAlpha = std::clamp(next.combat.deadAlpha, 0.0F, 1.0F);
  next.combat.knockbackX = clampNonNegative(next.combat.knockbackX);
  next.weapon.damage = clampNonNegative(next.weapon.damage);
  next.weapon.fireRate = clampNonNegative(next.weapon.fireRate);
  next.weapon.range = clampNonNegative(next.weapon.range);
  next.weapon.projectileSpeed = clampNonNegative(next.weapon.projectileSpeed);
  next.render.width = clampNonNegative(next.render.width);
  next.render.height = clampNonNegative(next.render.height);

  *this = std::move(next);
  return true;
}
