#include <gtest/gtest.h>

#include "animation/Animation.h"
#include "character/CharacterConfig.h"
#include "core/WorldConfig.h"
#include "enemy/EnemyConfig.h"
#include "stage/LevelData.h"
#include "util/TomlUtil.h"
#include "visual/Palette.h"

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { TomlUtil::resetWarningCount(); }
};

TEST_F(ConfigTest, WorldConfigDefaults) {
  WorldConfig cfg{};
  EXPECT_FLOAT_EQ(cfg.pixelsPerMeter, 50.0F);
  EXPECT_FLOAT_EQ(cfg.fixedTimestep, 1.0F / 60.0F);
  EXPECT_EQ(cfg.maxSubsteps, 10);
}

TEST_F(ConfigTest, WorldConfigParsesAndClamps) {
  WorldConfig cfg{};
  ASSERT_TRUE(cfg.parse(R"(
[world]
pixels_per_meter = 32.0
fixed_timestep = 0.01
max_substeps = 0
ground_normal_min = 2.0
)",
                        "world.toml"));
  EXPECT_FLOAT_EQ(cfg.pixelsPerMeter, 32.0F);
  EXPECT_FLOAT_EQ(cfg.fixedTimestep, 0.01F);
  EXPECT_EQ(cfg.maxSubsteps, 1);
  EXPECT_FLOAT_EQ(cfg.groundNormalMin, 1.0F);
  EXPECT_EQ(TomlUtil::warningCount(), 0);
}

TEST_F(ConfigTest, SyntaxErrorKeepsPreviousValues) {
  WorldConfig cfg{};
  cfg.pixelsPerMeter = 64.0F;
  EXPECT_FALSE(cfg.parse("[world\npixels_per_meter = 1.0", "broken.toml"));
  EXPECT_FLOAT_EQ(cfg.pixelsPerMeter, 64.0F);
  EXPECT_EQ(TomlUtil::warningCount(), 1);
}

TEST_F(ConfigTest, UnknownKeysWarn) {
  WorldConfig cfg{};
  ASSERT_TRUE(cfg.parse("[world]\ngravity = 9.81\n[camera]\n", "world.toml"));
  EXPECT_EQ(TomlUtil::warningCount(), 2);
}

TEST_F(ConfigTest, CharacterConfigDefaultsMatchTuning) {
  CharacterConfig cfg{};
  EXPECT_FLOAT_EQ(cfg.move.runSpeed, 6.0F);
  EXPECT_FLOAT_EQ(cfg.jump.impulse, -8.0F);
  EXPECT_EQ(cfg.jump.maxJumps, 2);
  EXPECT_FLOAT_EQ(cfg.wall.slideSpeed, 2.0F);
  EXPECT_FLOAT_EQ(cfg.wall.jumpImpulseX, 5.0F);
  EXPECT_FLOAT_EQ(cfg.wall.jumpImpulseY, -7.0F);
}

TEST_F(ConfigTest, CharacterConfigParses) {
  CharacterConfig cfg{};
  ASSERT_TRUE(cfg.parse(R"(
version = 1
[character]
id = "scout"
[move]
run_speed = 7.5
air_control = 1.5
[jump]
impulse = -9.0
max_jumps = 3
[combat]
max_health = 60.0
[render]
w = 20.0
h = 36.0
color = "#00FF00"
)",
                        "scout.toml"));
  EXPECT_EQ(cfg.id, "scout");
  EXPECT_EQ(cfg.displayName, "scout");
  EXPECT_FLOAT_EQ(cfg.move.runSpeed, 7.5F);
  EXPECT_FLOAT_EQ(cfg.move.airControl, 1.0F);
  EXPECT_FLOAT_EQ(cfg.jump.impulse, -9.0F);
  EXPECT_EQ(cfg.jump.maxJumps, 3);
  EXPECT_FLOAT_EQ(cfg.combat.maxHealth, 60.0F);
  EXPECT_EQ(cfg.render.color, Visual::Color(0, 255, 0));
}

TEST_F(ConfigTest, MaxJumpsBelowOneIsClamped) {
  CharacterConfig cfg{};
  ASSERT_TRUE(cfg.parse("[jump]\nmax_jumps = 0\n", "c.toml"));
  EXPECT_EQ(cfg.jump.maxJumps, 1);
  EXPECT_EQ(TomlUtil::warningCount(), 1);
}

TEST_F(ConfigTest, EnemyConfigStartsFromKindDefaults) {
  EnemyConfig cfg{};
  ASSERT_TRUE(cfg.parse(R"(
[enemy]
id = "drone"
type = "flyer"
[combat]
scrap = 12
)",
                        "drone.toml"));
  EXPECT_EQ(cfg.kind, EnemyKind::Flyer);
  EXPECT_EQ(cfg.id, "drone");
  EXPECT_EQ(cfg.combat.scrapValue, 12);
  EXPECT_FLOAT_EQ(cfg.combat.health, EnemyConfig::defaults(EnemyKind::Flyer).combat.health);
}

TEST_F(ConfigTest, WeaponSectionsParse) {
  CharacterConfig hero{};
  ASSERT_TRUE(hero.parse(R"(
[combat]
knockback_x = 4.0
knockback_y = -2.0
[weapon]
damage = 12.0
fire_rate = 0.0
)",
                         "hero.toml"));
  EXPECT_FLOAT_EQ(hero.combat.knockbackX, 4.0F);
  EXPECT_FLOAT_EQ(hero.combat.knockbackY, -2.0F);
  EXPECT_FLOAT_EQ(hero.weapon.damage, 12.0F);
  EXPECT_FLOAT_EQ(hero.weapon.fireRate, 0.0F);
  EXPECT_FLOAT_EQ(hero.weapon.range, 6.0F);

  EnemyConfig gunner{};
  ASSERT_TRUE(gunner.parse(R"(
[enemy]
type = "walker"
[weapon]
fire_rate = 2.0
range = 4.0
projectile_speed = 8.0
)",
                           "gunner.toml"));
  EXPECT_FLOAT_EQ(gunner.weapon.fireRate, 2.0F);
  EXPECT_FLOAT_EQ(gunner.weapon.range, 4.0F);
  EXPECT_FLOAT_EQ(gunner.weapon.projectileSpeed, 8.0F);
  EXPECT_EQ(TomlUtil::warningCount(), 0);

  EXPECT_FLOAT_EQ(EnemyConfig::defaults(EnemyKind::Turret).weapon.fireRate, 1.5F);
  EXPECT_FLOAT_EQ(EnemyConfig::defaults(EnemyKind::Walker).weapon.fireRate, 0.0F);
}

TEST_F(ConfigTest, EnemyConfigRejectsUnknownType) {
  EnemyConfig cfg{};
  EXPECT_FALSE(cfg.parse("[enemy]\ntype = \"dragon\"\n", "dragon.toml"));
  EXPECT_EQ(TomlUtil::warningCount(), 1);
}

TEST_F(ConfigTest, EnemyKindTags) {
  EXPECT_EQ(parseEnemyKindTag("enemy-walker"), EnemyKind::Walker);
  EXPECT_EQ(parseEnemyKindTag("enemy-shielder"), EnemyKind::Shielder);
  EXPECT_EQ(parseEnemyKindTag("enemy-boss-warden"), EnemyKind::Boss);
  EXPECT_FALSE(parseEnemyKindTag("walker").has_value());
  EXPECT_FALSE(parseEnemyKindTag("enemy-dragon").has_value());
  EXPECT_EQ(enemyBodyType(EnemyKind::Turret), BodyType::Static);
  EXPECT_EQ(enemyBodyType(EnemyKind::Flyer), BodyType::Kinematic);
  EXPECT_EQ(enemyBodyType(EnemyKind::Walker), BodyType::Dynamic);
}

TEST_F(ConfigTest, RosterReplacesOneKind) {
  EnemyRoster roster;
  ASSERT_TRUE(roster.parse("[enemy]\ntype = \"turret\"\n[combat]\nhealth = 80.0\n", "t.toml"));
  EXPECT_FLOAT_EQ(roster.get(EnemyKind::Turret).combat.health, 80.0F);
  EXPECT_FLOAT_EQ(roster.get(EnemyKind::Walker).combat.health, 30.0F);
}

TEST_F(ConfigTest, AnimationTableParsesAndSkipsBadClips) {
  AnimationTable table;
  ASSERT_TRUE(table.parse(R"(
[anims.idle]
frames = ["idle_0", "idle_1"]
fps = 6.0
[anims.jump]
frames = ["jump_0"]
fps = 12.0
loop = false
[anims.broken]
fps = 8.0
[anims.frozen]
frames = ["f"]
fps = 0.0
)",
                          "anims.toml"));
  EXPECT_EQ(table.size(), 2U);
  ASSERT_NE(table.find("jump"), nullptr);
  EXPECT_FALSE(table.find("jump")->loop);
  EXPECT_EQ(table.find("idle")->frames.size(), 2U);
  EXPECT_FALSE(table.contains("broken"));
  EXPECT_FALSE(table.contains("frozen"));
  EXPECT_EQ(TomlUtil::warningCount(), 2);
}

TEST_F(ConfigTest, LevelDataKeepsOrderAndSkipsIncompleteSpawns) {
  LevelData level;
  ASSERT_TRUE(level.parse(R"(
[level]
name = "outpost"

[[spawns]]
kind = "player"
x = 100.0
y = 1150.0

[[spawns]]
kind = "enemy-walker"
x = 800.0

[[spawns]]
kind = "enemy-turret"
x = 2000.0
y = 470.0

[[spawns]]
kind = "enemy-boss-warden"
x = 2600
y = 300
)",
                          "outpost.toml"));
  EXPECT_EQ(level.name, "outpost");
  ASSERT_EQ(level.spawns.size(), 3U);
  EXPECT_EQ(level.spawns[1].kind, "enemy-turret");
  EXPECT_FLOAT_EQ(level.spawns[2].x, 2600.0F);
  ASSERT_TRUE(level.playerSpawn().has_value());
  EXPECT_FLOAT_EQ(level.playerSpawn()->y, 1150.0F);
  EXPECT_EQ(TomlUtil::warningCount(), 1);
}

TEST(ConfigTest, HexColorsAcceptOptionalAlpha) {
  EXPECT_EQ(Visual::Color::fromHex("#FFDD44"), Visual::Color(255, 221, 68));
  EXPECT_EQ(Visual::Color::fromHex("FFDD4480"), Visual::Color(255, 221, 68, 128));
  EXPECT_EQ(Visual::Color::fromHex("#FFDD4"), Visual::Color());
  EXPECT_EQ(Visual::Color::fromHex("#GGDD44"), Visual::Color());
}
