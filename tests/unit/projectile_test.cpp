#include <gtest/gtest.h>

#include "ecs/Systems.h"
#include "entities/Spawners.h"
#include "support/WorldFixture.h"

class ProjectileTest : public WorldFixture {
 protected:
  void SetUp() override {
    WorldFixture::SetUp();
    hero = Spawners::player(world, {0.0F, 0.0F});
    heroBody = world.store.get<PhysicsBody>(hero)->handle;
    // only the bolts a test fires itself
    world.store.get<Weapon>(hero)->fireRate = 0.0F;
  }

  EntityId fire(EntityId owner, float lifetime = 2.0F, float damage = 10.0F) {
    Spawners::ProjectileParams params{};
    params.lifetime = lifetime;
    params.damage = damage;
    return Spawners::projectile(world, owner, {0.0F, 0.0F}, {1.0F, 0.0F}, params);
  }

  BodyHandle bodyOf(EntityId id) { return world.store.get<PhysicsBody>(id)->handle; }

  EntityId hero = kInvalidEntity;
  BodyHandle heroBody = kInvalidBody;
};

TEST_F(ProjectileTest, ExpiresAfterTenFramesOfOneTenth) {
  const EntityId bolt = fire(hero, 1.0F);

  float last = world.store.get<Projectile>(bolt)->lifetime;
  for (int i = 0; i < 9; ++i) {
    world.runFrame(0.1F);
    ASSERT_TRUE(world.entities.isAlive(bolt)) << "frame " << (i + 1);
    const float now = world.store.get<Projectile>(bolt)->lifetime;
    EXPECT_LT(now, last);
    last = now;
  }

  world.runFrame(0.1F);
  EXPECT_FALSE(world.entities.exists(bolt));
  EXPECT_EQ(world.damageEvents, 0);
}

TEST_F(ProjectileTest, HitDamagesTargetAndIsSpentOnce) {
  const EntityId walker =
      Spawners::enemy(world, EnemyConfig::defaults(EnemyKind::Walker), {2.0F, 0.0F});
  const EntityId bolt = fire(hero);

  // reported twice in one frame; only the first one counts
  physics.queued.push_back(ContactEvent{bodyOf(bolt), bodyOf(walker), {1.0F, 0.0F}});
  physics.queued.push_back(ContactEvent{bodyOf(walker), bodyOf(bolt), {-1.0F, 0.0F}});
  world.runFrame(0.016F);

  EXPECT_EQ(world.damageEvents, 1);
  EXPECT_FLOAT_EQ(world.store.get<Health>(walker)->current, 20.0F);
  EXPECT_FALSE(world.entities.exists(bolt));
}

TEST_F(ProjectileTest, OwnerIsNeverDamaged) {
  const EntityId bolt = fire(hero);
  const float hp = world.store.get<Health>(hero)->current;

  for (int i = 0; i < 5; ++i) {
    physics.queued.push_back(ContactEvent{bodyOf(bolt), heroBody, {0.0F, 1.0F}});
    world.runFrame(0.016F);
  }

  EXPECT_EQ(world.damageEvents, 0);
  EXPECT_FLOAT_EQ(world.store.get<Health>(hero)->current, hp);
  EXPECT_TRUE(world.entities.isAlive(bolt));
}

TEST_F(ProjectileTest, TerrainImpactDestroysWithoutDamage) {
  const EntityId bolt = fire(hero);
  physics.queued.push_back(ContactEvent{bodyOf(bolt), addGround(), {0.0F, 1.0F}});
  world.runFrame(0.016F);

  EXPECT_FALSE(world.entities.exists(bolt));
  EXPECT_EQ(world.damageEvents, 0);
}

TEST_F(ProjectileTest, InvincibleTargetConsumesProjectileWithoutDamage) {
  auto& hp = *world.store.get<Health>(hero);
  hp.invincibleTimer = 5.0F;
  const EntityId shooter = world.spawn(Transform{});
  const EntityId bolt = fire(shooter);

  physics.queued.push_back(ContactEvent{bodyOf(bolt), heroBody, {0.0F, 1.0F}});
  world.runFrame(0.016F);

  EXPECT_EQ(world.damageEvents, 0);
  EXPECT_FALSE(world.entities.exists(bolt));
}

TEST_F(ProjectileTest, HitGrantsPlayerInvincibility) {
  const EntityId shooter = world.spawn(Transform{});
  const EntityId bolt = fire(shooter, 2.0F, 25.0F);

  physics.queued.push_back(ContactEvent{bodyOf(bolt), heroBody, {0.0F, 1.0F}});
  world.runFrame(0.016F);

  const auto& hp = *world.store.get<Health>(hero);
  EXPECT_FLOAT_EQ(hp.current, 75.0F);
  EXPECT_FLOAT_EQ(hp.invincibleTimer, world.character().combat.invincibilitySeconds);

  // a second bolt inside the window does nothing
  const EntityId second = fire(shooter, 2.0F, 25.0F);
  physics.queued.push_back(ContactEvent{bodyOf(second), heroBody, {0.0F, 1.0F}});
  world.runFrame(0.016F);
  EXPECT_FLOAT_EQ(world.store.get<Health>(hero)->current, 75.0F);
  EXPECT_EQ(world.damageEvents, 1);
}

TEST_F(ProjectileTest, KillingAnEnemyCountsAndSpawnsScrapLabel) {
  const EntityId walker =
      Spawners::enemy(world, EnemyConfig::defaults(EnemyKind::Walker), {2.0F, 0.0F});
  const EntityId bolt = fire(hero, 2.0F, 100.0F);

  physics.queued.push_back(ContactEvent{bodyOf(bolt), bodyOf(walker), {1.0F, 0.0F}});
  world.runFrame(0.016F);

  EXPECT_EQ(world.enemyKills, 1);
  EXPECT_FALSE(world.entities.exists(walker));
  const auto labels = world.store.query<FloatText>();
  ASSERT_EQ(labels.size(), 1U);
  const RenderNode node = world.store.get<Sprite>(labels[0])->node;
  EXPECT_EQ(scene.nodes.at(node).desc.text, "+5");
}

TEST_F(ProjectileTest, DeadPlayerIsNotHitAgain) {
  auto& hp = *world.store.get<Health>(hero);
  hp.current = 10.0F;
  const EntityId shooter = world.spawn(Transform{});

  const EntityId first = fire(shooter, 2.0F, 50.0F);
  physics.queued.push_back(ContactEvent{bodyOf(first), heroBody, {0.0F, 1.0F}});
  world.runFrame(0.016F);
  EXPECT_TRUE(world.store.get<Health>(hero)->isDead);

  const EntityId second = fire(shooter, 2.0F, 50.0F);
  physics.queued.push_back(ContactEvent{bodyOf(second), heroBody, {0.0F, 1.0F}});
  world.runFrame(0.016F);
  EXPECT_EQ(world.damageEvents, 1);
  EXPECT_EQ(world.store.get<Player>(hero)->state, PlayerState::Dead);
}

TEST_F(ProjectileTest, EnemyContactDamagesPlayer) {
  const EntityId walker =
      Spawners::enemy(world, EnemyConfig::defaults(EnemyKind::Walker), {0.5F, 0.0F});
  physics.queued.push_back(ContactEvent{heroBody, bodyOf(walker), {1.0F, 0.0F}});
  world.runFrame(0.016F);

  EXPECT_FLOAT_EQ(world.store.get<Health>(hero)->current, 85.0F);
  EXPECT_TRUE(world.entities.isAlive(walker));
}

TEST_F(ProjectileTest, RenderFailureOnAKillStillSpendsTheProjectile) {
  const EntityId doomed =
      Spawners::enemy(world, EnemyConfig::defaults(EnemyKind::Walker), {2.0F, 0.0F});
  const EntityId other =
      Spawners::enemy(world, EnemyConfig::defaults(EnemyKind::Walker), {4.0F, 0.0F});
  const EntityId killer = fire(hero, 2.0F, 100.0F);
  const EntityId grazer = fire(hero, 2.0F, 10.0F);

  physics.queued.push_back(ContactEvent{bodyOf(killer), bodyOf(doomed), {1.0F, 0.0F}});
  physics.queued.push_back(ContactEvent{bodyOf(grazer), bodyOf(other), {1.0F, 0.0F}});
  scene.failCreate = true;  // the scrap label can't be made
  world.runFrame(0.016F);

  EXPECT_EQ(world.enemyKills, 1);
  EXPECT_FALSE(world.entities.exists(killer));
  EXPECT_FALSE(world.entities.exists(grazer));
  EXPECT_FLOAT_EQ(world.store.get<Health>(other)->current, 20.0F);
  EXPECT_TRUE(world.store.query<FloatText>().empty());
  EXPECT_EQ(Log::count(Log::Level::Error), 0);
  EXPECT_EQ(Log::count(Log::Level::Warn), 1);
}
