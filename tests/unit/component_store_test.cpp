#include <gtest/gtest.h>

#include "core/Errors.h"
#include "core/Log.h"
#include "ecs/ComponentStore.h"
#include "ecs/EntityRegistry.h"

class ComponentStoreTest : public ::testing::Test {
 protected:
  void SetUp() override { Log::resetCounts(); }

  EntityRegistry reg;
  ComponentStore store{reg.registry()};
};

TEST_F(ComponentStoreTest, AttachGetRemove) {
  const EntityId id = reg.create();
  store.attach(id, Velocity{{1.0F, 2.0F}});

  ASSERT_NE(store.get<Velocity>(id), nullptr);
  EXPECT_FLOAT_EQ(store.get<Velocity>(id)->v.y, 2.0F);
  EXPECT_TRUE(store.has<Velocity>(id));
  EXPECT_EQ(store.get<Player>(id), nullptr);

  EXPECT_TRUE(store.remove<Velocity>(id));
  EXPECT_FALSE(store.has<Velocity>(id));
  EXPECT_FALSE(store.remove<Velocity>(id));
}

TEST_F(ComponentStoreTest, DuplicateTypeIsRejected) {
  const EntityId id = reg.create();
  store.attach(id, Velocity{{1.0F, 0.0F}});

  EXPECT_THROW(store.attach(id, Velocity{{5.0F, 0.0F}}), InvariantViolation);
  EXPECT_FALSE(store.add(id, Velocity{{5.0F, 0.0F}}));
  EXPECT_FLOAT_EQ(store.get<Velocity>(id)->v.x, 1.0F);
  EXPECT_EQ(Log::count(Log::Level::Warn), 1);
}

TEST_F(ComponentStoreTest, AttachToUnknownEntityThrows) {
  EXPECT_THROW(store.attach(kInvalidEntity, Velocity{}), InvariantViolation);
}

TEST_F(ComponentStoreTest, QueryReturnsEntitiesInInsertionOrder) {
  const EntityId a = reg.create();
  const EntityId b = reg.create();
  const EntityId c = reg.create();

  // c enters the store first, then a, then b
  store.attach(c, Velocity{});
  store.attach(a, Velocity{});
  store.attach(b, Velocity{});
  store.attach(b, Transform{});
  store.attach(c, Transform{});

  const auto both = store.query<Velocity, Transform>();
  ASSERT_EQ(both.size(), 2U);
  EXPECT_EQ(both[0], c);
  EXPECT_EQ(both[1], b);

  const auto any = store.query<Velocity>();
  ASSERT_EQ(any.size(), 3U);
  EXPECT_EQ(any[0], c);
  EXPECT_EQ(any[1], a);
  EXPECT_EQ(any[2], b);
}

TEST_F(ComponentStoreTest, QuerySkipsPendingEntities) {
  const EntityId a = reg.create();
  const EntityId b = reg.create();
  store.attach(a, Velocity{});
  store.attach(b, Velocity{});
  reg.destroy(a);

  const auto ids = store.query<Velocity>();
  ASSERT_EQ(ids.size(), 1U);
  EXPECT_EQ(ids[0], b);
}

TEST_F(ComponentStoreTest, RemoveAllLeavesNoComponents) {
  const EntityId id = reg.create();
  store.attach(id, Velocity{});
  store.attach(id, Transform{});
  store.attach(id, Player{});
  EXPECT_EQ(store.componentCount(id), 3U);

  store.removeAll(id);
  EXPECT_EQ(store.componentCount(id), 0U);
  EXPECT_FALSE(store.has<Player>(id));
}
