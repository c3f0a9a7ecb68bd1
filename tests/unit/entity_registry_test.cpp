#include <gtest/gtest.h>

#include <set>

#include "ecs/EntityRegistry.h"

TEST(EntityRegistryTest, CreatedIdsAreUniqueAndAlive) {
  EntityRegistry reg;
  std::set<EntityId> ids;
  for (int i = 0; i < 16; ++i) {
    const EntityId id = reg.create();
    EXPECT_TRUE(reg.isAlive(id));
    EXPECT_TRUE(ids.insert(id).second);
  }
  EXPECT_EQ(reg.aliveCount(), 16U);
}

TEST(EntityRegistryTest, DestroyOnlyMarksPending) {
  EntityRegistry reg;
  const EntityId id = reg.create();
  reg.destroy(id);

  EXPECT_FALSE(reg.isAlive(id));
  EXPECT_TRUE(reg.isPending(id));
  EXPECT_TRUE(reg.exists(id));
  EXPECT_EQ(reg.pendingCount(), 1U);
  EXPECT_EQ(reg.aliveCount(), 0U);
}

TEST(EntityRegistryTest, DestroyTwiceQueuesOnce) {
  EntityRegistry reg;
  const EntityId id = reg.create();
  reg.destroy(id);
  reg.destroy(id);
  EXPECT_EQ(reg.takePending().size(), 1U);
}

TEST(EntityRegistryTest, PendingIdIsNotReissued) {
  EntityRegistry reg;
  const EntityId doomed = reg.create();
  reg.destroy(doomed);

  for (int i = 0; i < 8; ++i) {
    EXPECT_NE(reg.create(), doomed);
  }
}

TEST(EntityRegistryTest, ReleaseFreesTheId) {
  EntityRegistry reg;
  const EntityId id = reg.create();
  reg.destroy(id);
  for (EntityId pending : reg.takePending()) {
    reg.release(pending);
  }
  EXPECT_FALSE(reg.exists(id));
  EXPECT_FALSE(reg.isAlive(id));
  EXPECT_EQ(reg.pendingCount(), 0U);
}

TEST(EntityRegistryTest, InvalidIdIsNeverAlive) {
  EntityRegistry reg;
  EXPECT_FALSE(reg.isAlive(kInvalidEntity));
  reg.destroy(kInvalidEntity);
  EXPECT_EQ(reg.pendingCount(), 0U);
}
