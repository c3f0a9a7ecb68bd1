#include "enemy/EnemyConfig.h"

#include <algorithm>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

float clampNonNegative(float v) {
  return std::max(0.0F, v);
}

int clampNonNegative(int v) {
  return std::max(0, v);
}

std::size_t slot(EnemyKind kind) {
  return static_cast<std::size_t>(kind);
}

}  // namespace

std::optional<EnemyKind> parseEnemyKind(std::string_view name) {
  if (name == "walker")
    return EnemyKind::Walker;
  if (name == "flyer")
    return EnemyKind::Flyer;
  if (name == "turret")
    return EnemyKind::Turret;
  if (name == "sentry")
    return EnemyKind::Sentry;
  if (name == "crawler")
    return EnemyKind::Crawler;
  if (name == "shielder")
    return EnemyKind::Shielder;
  if (name == "boss")
    return EnemyKind::Boss;
  return std::nullopt;
}

std::optional<EnemyKind> parseEnemyKindTag(std::string_view tag) {
  constexpr std::string_view kPrefix = "enemy-";
  if (!tag.starts_with(kPrefix))
    return std::nullopt;
  tag.remove_prefix(kPrefix.size());
  if (tag == "boss-warden")
    return EnemyKind::Boss;
  return parseEnemyKind(tag);
}

const char* enemyKindName(EnemyKind kind) {
  switch (kind) {
    case EnemyKind::Walker:
      return "walker";
    case EnemyKind::Flyer:
      return "flyer";
    case EnemyKind::Turret:
      return "turret";
    case EnemyKind::Sentry:
      return "sentry";
    case EnemyKind::Crawler:
      return "crawler";
    case EnemyKind::Shielder:
      return "shielder";
    case EnemyKind::Boss:
      return "boss";
  }
  return "enemy";
}

BodyType enemyBodyType(EnemyKind kind) {
  switch (kind) {
    case EnemyKind::Flyer:
    case EnemyKind::Sentry:
      return BodyType::Kinematic;
    case EnemyKind::Turret:
      return BodyType::Static;
    default:
      return BodyType::Dynamic;
  }
}

EnemyConfig EnemyConfig::defaults(EnemyKind kind) {
  EnemyConfig cfg{};
  cfg.kind = kind;
  cfg.id = enemyKindName(kind);
  cfg.displayName = cfg.id;
  switch (kind) {
    case EnemyKind::Walker:
      break;
    case EnemyKind::Flyer:
      cfg.collision = {16.0F, 16.0F};
      cfg.move = {2.0F, 3.0F};
      cfg.combat = {20.0F, 10.0F, 4};
      cfg.render.color = Visual::Color::fromHex("#FF8800");
      break;
    case EnemyKind::Turret:
      cfg.collision = {28.0F, 28.0F};
      cfg.move = {0.0F, 0.0F};
      cfg.combat = {50.0F, 0.0F, 8};
      cfg.weapon = {8.0F, 1.5F, 6.0F, 10.0F};
      cfg.render.color = Visual::Color::fromHex("#882222");
      break;
    case EnemyKind::Sentry:
      cfg.collision = {20.0F, 20.0F};
      cfg.move = {1.0F, 1.5F};
      cfg.combat = {35.0F, 10.0F, 6};
      cfg.render.color = Visual::Color::fromHex("#AA66FF");
      break;
    case EnemyKind::Crawler:
      cfg.collision = {24.0F, 14.0F};
      cfg.move = {1.0F, 2.0F};
      cfg.combat = {25.0F, 20.0F, 5};
      cfg.render.color = Visual::Color::fromHex("#66CC44");
      break;
    case EnemyKind::Shielder:
      cfg.collision = {26.0F, 34.0F};
      cfg.move = {1.2F, 2.4F};
      cfg.combat = {40.0F, 10.0F, 7};
      cfg.render.color = Visual::Color::fromHex("#4488AA");
      break;
    case EnemyKind::Boss:
      cfg.id = "boss-warden";
      cfg.displayName = "Warden";
      cfg.collision = {64.0F, 64.0F};
      cfg.move = {0.0F, 0.0F};
      cfg.combat = {400.0F, 25.0F, 100};
      cfg.render.color = Visual::Color::fromHex("#CC2266");
      break;
  }
  return cfg;
}

bool EnemyConfig::loadFromToml(const char* path) {
  return load(path != nullptr ? std::string_view{path} : std::string_view{}, path, true);
}

bool EnemyConfig::parse(std::string_view text, const char* sourceName) {
  return load(text, sourceName, false);
}

bool EnemyConfig::load(std::string_view source, const char* name, bool fromFile) {
  std::optional<toml::table> parsed = TomlUtil::parse(source, name, fromFile);
  if (!parsed)
    return false;
  const toml::table& tbl = *parsed;

  TomlUtil::warnUnknownKeys(tbl, name, "root",
                            {"version", "enemy", "collision", "move", "combat", "weapon", "render"});

  // The kind picks the baseline every other section overrides.
  EnemyKind kind = EnemyKind::Walker;
  const toml::table* e = tbl["enemy"].as_table();
  if (e != nullptr) {
    if (auto s = (*e)["type"].value<std::string_view>()) {
      if (auto k = parseEnemyKind(*s)) {
        kind = *k;
      } else {
        TomlUtil::warnf(name,
                        "enemy.type must be one of "
                        "walker|flyer|turret|sentry|crawler|shielder|boss (got '{}')",
                        std::string(*s));
        return false;
      }
    }
  }

  EnemyConfig next = defaults(kind);

  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (e != nullptr) {
    TomlUtil::warnUnknownKeys(*e, name, "enemy", {"id", "display", "type"});
    if (auto v = e->get("id"))
      next.id = v->value_or(next.id);
    if (auto v = e->get("display"))
      next.displayName = v->value_or(next.displayName);
  }
  if (next.displayName.empty())
    next.displayName = next.id;

  if (auto c = tbl["collision"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, name, "collision", {"w", "h"});
    if (auto v = c->get("w"))
      next.collision.w = v->value_or(next.collision.w);
    if (auto v = c->get("h"))
      next.collision.h = v->value_or(next.collision.h);
  }

  if (auto m = tbl["move"].as_table()) {
    TomlUtil::warnUnknownKeys(*m, name, "move", {"speed", "patrol_distance"});
    if (auto v = m->get("speed"))
      next.move.speed = v->value_or(next.move.speed);
    if (auto v = m->get("patrol_distance"))
      next.move.patrolDistance = v->value_or(next.move.patrolDistance);
  }

  if (auto c = tbl["combat"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, name, "combat", {"health", "contact_damage", "scrap"});
    if (auto v = c->get("health"))
      next.combat.health = v->value_or(next.combat.health);
    if (auto v = c->get("contact_damage"))
      next.combat.contactDamage = v->value_or(next.combat.contactDamage);
    if (auto v = c->get("scrap"))
      next.combat.scrapValue = v->value_or(next.combat.scrapValue);
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
    TomlUtil::warnUnknownKeys(*r, name, "render", {"color"});
    if (auto s = (*r)["color"].value<std::string_view>())
      next.render.color = Visual::Color::fromHex(*s);
  }

  next.collision.w = clampNonNegative(next.collision.w);
  next.collision.h = clampNonNegative(next.collision.h);
  next.move.speed = clampNonNegative(next.move.speed);
  next.move.patrolDistance = clampNonNegative(next.move.patrolDistance);
  next.combat.health = std::max(1.0F, next.combat.health);
  next.combat.contactDamage = clampNonNegative(next.combat.contactDamage);
  next.combat.scrapValue = clampNonNegative(next.combat.scrapValue);
  next.weapon.damage = clampNonNegative(next.weapon.damage);
  next.weapon.fireRate = clampNonNegative(next.weapon.fireRate);
  next.weapon.range = clampNonNegative(next.weapon.range);
  next.weapon.projectileSpeed = clampNonNegative(next.weapon.projectileSpeed);

  *this = std::move(next);
  return true;
}

EnemyRoster::EnemyRoster() {
  for (std::size_t i = 0; i < kKindCount; ++i) {
    configs_[i] = EnemyConfig::defaults(static_cast<EnemyKind>(i));
  }
}

bool EnemyRoster::loadFromToml(const char* path) {
  EnemyConfig cfg;
  if (!cfg.loadFromToml(path))
    return false;
  set(std::move(cfg));
  return true;
}

bool EnemyRoster::parse(std::string_view text, const char* sourceName) {
  EnemyConfig cfg;
  if (!cfg.parse(text, sourceName))
    return false;
  set(std::move(cfg));
  return true;
}

void EnemyRoster::set(EnemyConfig cfg) {
  const std::size_t i = slot(cfg.kind);
  configs_[i] = std::move(cfg);
}

const EnemyConfig& EnemyRoster::get(EnemyKind kind) const {
  return configs_[slot(kind)];
}
