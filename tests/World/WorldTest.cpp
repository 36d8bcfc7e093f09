#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "Strata/Strata.hpp"
#include "../TestComponents.hpp"

using namespace Strata;
using namespace Strata::Test;

class WorldTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Tracked::s_alive = 0;
        SparseTracked::s_alive = 0;
    }

    void TearDown() override {}

    World m_world;
};

TEST_F(WorldTest, SpawnAndGet)
{
    auto entity = m_world.Spawn(Position(1, 2, 3), Name("hero"));
    ASSERT_TRUE(entity);
    EXPECT_TRUE(m_world.IsAlive(*entity));
    EXPECT_EQ(m_world.EntityCount(), 1u);

    const Position* position = m_world.Get<Position>(*entity);
    ASSERT_NE(position, nullptr);
    EXPECT_FLOAT_EQ(position->z, 3.0f);
    EXPECT_EQ(m_world.Get<Name>(*entity)->value, "hero");
    EXPECT_EQ(m_world.Get<Velocity>(*entity), nullptr);
    EXPECT_FALSE(m_world.Has<Health>(*entity));
}

TEST_F(WorldTest, SpawnWithoutComponents)
{
    Entity entity = *m_world.Spawn();
    EXPECT_TRUE(m_world.IsAlive(entity));
    EXPECT_EQ(m_world.GetLocation(entity)->archetype, EMPTY_ARCHETYPE);
    EXPECT_EQ(m_world.GetLocation(entity)->table, EMPTY_TABLE);
}

// Component order in a bundle does not matter
TEST_F(WorldTest, BundleOrderIsIrrelevant)
{
    Entity a = *m_world.Spawn(Position(0, 0), Velocity(0, 0));
    Entity b = *m_world.Spawn(Velocity(1, 1), Position(1, 1));
    EXPECT_EQ(m_world.GetLocation(a)->archetype, m_world.GetLocation(b)->archetype);
    EXPECT_FLOAT_EQ(m_world.Get<Velocity>(b)->dx, 1.0f);
}

TEST_F(WorldTest, DuplicateComponentInBundleViolatesContract)
{
    ThrowOnContractViolation guard;
    EXPECT_THROW((void)m_world.Spawn(Position(0, 0), Position(1, 1)), ContractViolation);
    EXPECT_EQ(m_world.EntityCount(), 0u);
}

TEST_F(WorldTest, DespawnInvalidatesHandle)
{
    Entity entity = *m_world.Spawn(Position(0, 0));
    EXPECT_TRUE(m_world.Despawn(entity));
    EXPECT_FALSE(m_world.IsAlive(entity));
    EXPECT_EQ(m_world.Get<Position>(entity), nullptr);
    EXPECT_FALSE(m_world.GetLocation(entity).has_value());
    EXPECT_FALSE(m_world.Despawn(entity));

    // The index is reused under a new generation
    Entity next = *m_world.Spawn(Position(5, 5));
    EXPECT_EQ(next.GetIndex(), entity.GetIndex());
    EXPECT_NE(next.GetGeneration(), entity.GetGeneration());
    EXPECT_EQ(m_world.Get<Position>(entity), nullptr);
    EXPECT_FLOAT_EQ(m_world.Get<Position>(next)->x, 5.0f);
}

// Removing a row moves the last entity into the hole; its location must follow
TEST_F(WorldTest, SwapRemoveKeepsLocationsConsistent)
{
    std::vector<Entity> entities;
    for (int i = 0; i < 5; ++i)
        entities.push_back(*m_world.Spawn(Position(static_cast<float>(i), 0), Health(i, 10)));

    ASSERT_TRUE(m_world.Despawn(entities[1]));
    ASSERT_TRUE(m_world.Despawn(entities[0]));

    for (int i = 2; i < 5; ++i)
    {
        Entity entity = entities[static_cast<std::size_t>(i)];
        auto location = m_world.GetLocation(entity);
        ASSERT_TRUE(location.has_value());
        const Table& table = m_world.GetData().tables.Get(location->table);
        EXPECT_EQ(table.GetEntity(location->tableRow), entity);
        EXPECT_EQ(m_world.GetData().archetypes.Get(location->archetype).GetEntity(location->archetypeRow), entity);
        EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->x, static_cast<float>(i));
        EXPECT_EQ(m_world.Get<Health>(entity)->current, i);
    }
}

TEST_F(WorldTest, InsertMigratesAndKeepsValues)
{
    Entity entity = *m_world.Spawn(Position(1, 2), Name("mover"));
    Entity other = *m_world.Spawn(Position(9, 9), Name("other"));

    ASSERT_TRUE(m_world.Insert(entity, Velocity(3, 4)));
    EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->y, 2.0f);
    EXPECT_EQ(m_world.Get<Name>(entity)->value, "mover");
    EXPECT_FLOAT_EQ(m_world.Get<Velocity>(entity)->dy, 4.0f);

    // The entity left behind in the old table is unaffected
    EXPECT_EQ(m_world.Get<Name>(other)->value, "other");
    EXPECT_FALSE(m_world.Has<Velocity>(other));

    auto removed = m_world.Remove<Position>(entity);
    ASSERT_TRUE(removed.has_value());
    EXPECT_FLOAT_EQ(removed->x, 1.0f);
    EXPECT_FALSE(m_world.Has<Position>(entity));
    EXPECT_EQ(m_world.Get<Name>(entity)->value, "mover");
    EXPECT_FLOAT_EQ(m_world.Get<Velocity>(entity)->dx, 3.0f);

    EXPECT_FALSE(m_world.Remove<Position>(entity).has_value());
    EXPECT_FALSE(m_world.Remove<Health>(entity).has_value());
}

TEST_F(WorldTest, InsertExistingComponentReplaces)
{
    Entity entity = *m_world.Spawn(Position(1, 1));
    const std::size_t archetypes = m_world.ArchetypeCount();
    auto location = m_world.GetLocation(entity);

    ASSERT_TRUE(m_world.Insert(entity, Position(7, 7)));
    EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->x, 7.0f);
    EXPECT_EQ(m_world.GetLocation(entity), location);
    EXPECT_EQ(m_world.ArchetypeCount(), archetypes);
}

TEST_F(WorldTest, InsertOnDeadEntityFails)
{
    Entity entity = *m_world.Spawn(Position(0, 0));
    ASSERT_TRUE(m_world.Despawn(entity));

    auto result = m_world.Insert(entity, Velocity(1, 1));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.Error().code, ErrorCode::EntityNotFound);

    auto bundle = m_world.InsertBundle(entity, Velocity(1, 1), Health(1, 1));
    ASSERT_FALSE(bundle);
    EXPECT_EQ(bundle.Error().code, ErrorCode::EntityNotFound);
}

TEST_F(WorldTest, InsertBundleMovesOnce)
{
    Entity entity = *m_world.Spawn(Position(1, 1));
    ASSERT_TRUE(m_world.InsertBundle(entity, Velocity(2, 2), Position(3, 3), Burning(4)));

    EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->x, 3.0f);
    EXPECT_FLOAT_EQ(m_world.Get<Velocity>(entity)->dx, 2.0f);
    EXPECT_EQ(m_world.Get<Burning>(entity)->damagePerTick, 4);

    // Only the final archetype was created, no intermediate step
    EXPECT_EQ(m_world.ArchetypeCount(), 3u);
}

TEST_F(WorldTest, SparseComponentsDoNotChangeTheTable)
{
    Entity entity = *m_world.Spawn(Position(1, 1));
    const TableID table = m_world.GetLocation(entity)->table;
    const ArchetypeID archetype = m_world.GetLocation(entity)->archetype;

    ASSERT_TRUE(m_world.Insert(entity, Burning(3)));
    EXPECT_EQ(m_world.GetLocation(entity)->table, table);
    EXPECT_NE(m_world.GetLocation(entity)->archetype, archetype);
    EXPECT_EQ(m_world.Get<Burning>(entity)->damagePerTick, 3);

    auto removed = m_world.Remove<Burning>(entity);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->damagePerTick, 3);
    EXPECT_EQ(m_world.GetLocation(entity)->archetype, archetype);
    EXPECT_FALSE(m_world.Has<Burning>(entity));

    // Re-inserting does not resurrect the old value
    ASSERT_TRUE(m_world.Insert(entity, Burning(8)));
    EXPECT_EQ(m_world.Get<Burning>(entity)->damagePerTick, 8);
}

// Dense and sparse changes in one bundle: the dense migration happens first, then the sparse attach
TEST_F(WorldTest, MixedDenseAndSparseMigration)
{
    Entity entity = *m_world.Spawn(Position(0, 0), Label("keep"));
    ASSERT_TRUE(m_world.InsertBundle(entity, Velocity(1, 0), Burning(2)));

    EXPECT_EQ(m_world.Get<Label>(entity)->text, "keep");
    EXPECT_EQ(m_world.Get<Burning>(entity)->damagePerTick, 2);
    EXPECT_FLOAT_EQ(m_world.Get<Velocity>(entity)->dx, 1.0f);

    auto removedVelocity = m_world.Remove<Velocity>(entity);
    ASSERT_TRUE(removedVelocity.has_value());
    EXPECT_EQ(m_world.Get<Label>(entity)->text, "keep");
    EXPECT_EQ(m_world.Get<Burning>(entity)->damagePerTick, 2);
}

TEST_F(WorldTest, DespawnDropsSparseValues)
{
    Entity a = *m_world.Spawn(Position(0, 0), SparseTracked(1));
    Entity b = *m_world.Spawn(SparseTracked(2));
    EXPECT_EQ(SparseTracked::s_alive, 2);

    ASSERT_TRUE(m_world.Despawn(a));
    EXPECT_EQ(SparseTracked::s_alive, 1);
    EXPECT_EQ(m_world.Get<SparseTracked>(b)->value, 2);
}

// Every component value is dropped exactly once, whatever path it takes
TEST_F(WorldTest, NoLeaksOrDoubleDrops)
{
    {
        World world;
        std::vector<Entity> entities;
        for (int i = 0; i < 20; ++i)
            entities.push_back(*world.Spawn(Tracked(i), Position(0, 0)));
        EXPECT_EQ(Tracked::s_alive, 20);

        for (int i = 0; i < 20; i += 2)
            ASSERT_TRUE(world.Insert(entities[static_cast<std::size_t>(i)], Velocity(0, 0)));
        EXPECT_EQ(Tracked::s_alive, 20);

        for (int i = 0; i < 20; i += 3)
            ASSERT_TRUE(world.Despawn(entities[static_cast<std::size_t>(i)]));
        EXPECT_EQ(Tracked::s_alive, 13);

        auto removed = world.Remove<Tracked>(entities[1]);
        ASSERT_TRUE(removed.has_value());
        EXPECT_EQ(Tracked::s_alive, 13);
        removed.reset();
        EXPECT_EQ(Tracked::s_alive, 12);

        ASSERT_TRUE(world.Insert(entities[2], Tracked(99)));
        EXPECT_EQ(Tracked::s_alive, 12);
        EXPECT_EQ(world.Get<Tracked>(entities[2])->value, 99);

        world.InsertResource(Tracked(7));
        EXPECT_EQ(Tracked::s_alive, 13);

        (void)world.Spawn(SparseTracked(1));
        EXPECT_EQ(SparseTracked::s_alive, 1);
    }
    EXPECT_EQ(Tracked::s_alive, 0);
    EXPECT_EQ(SparseTracked::s_alive, 0);
}

TEST_F(WorldTest, Resources)
{
    EXPECT_FALSE(m_world.HasResource<GameTime>());
    EXPECT_EQ(m_world.GetResource<GameTime>(), nullptr);

    GameTime& time = m_world.InsertResource(GameTime{1.0, 1});
    EXPECT_EQ(time.frame, 1u);
    EXPECT_TRUE(m_world.HasResource<GameTime>());

    m_world.GetResourceMut<GameTime>()->frame = 2;
    EXPECT_EQ(m_world.GetResource<GameTime>()->frame, 2u);

    // Inserting again replaces the value
    m_world.InsertResource(GameTime{5.0, 9});
    EXPECT_EQ(m_world.GetResource<GameTime>()->frame, 9u);

    auto removed = m_world.RemoveResource<GameTime>();
    ASSERT_TRUE(removed.has_value());
    EXPECT_DOUBLE_EQ(removed->elapsed, 5.0);
    EXPECT_FALSE(m_world.HasResource<GameTime>());
    EXPECT_FALSE(m_world.RemoveResource<GameTime>().has_value());
    EXPECT_FALSE(m_world.RemoveResource<Gravity>().has_value());
}

TEST_F(WorldTest, MutableAccessStampsChangeTick)
{
    Entity entity = *m_world.Spawn(Position(0, 0));
    const Tick spawned = m_world.GetChangeTick();

    m_world.IncrementChangeTick();
    m_world.IncrementChangeTick();
    (void)m_world.GetMut<Position>(entity);

    auto location = m_world.GetLocation(entity);
    const Column* column = m_world.GetData().tables.Get(location->table).GetColumn(*m_world.GetComponents().Find<Position>());
    EXPECT_EQ(column->GetAddedTick(location->tableRow), spawned);
    EXPECT_EQ(column->GetChangedTick(location->tableRow), m_world.GetChangeTick());
}

TEST_F(WorldTest, CheckChangeTicksClampsOldTicks)
{
    Entity entity = *m_world.Spawn(Position(0, 0));
    const ComponentID position = *m_world.GetComponents().Find<Position>();

    // Nothing to do before a full check cycle has passed
    m_world.CheckChangeTicks();
    EXPECT_EQ(m_world.GetData().lastCheckTick, Tick(1));

    m_world.GetData().changeTick.store(Tick::MAX_AGE + 100);
    m_world.CheckChangeTicks();
    const Tick now = m_world.GetChangeTick();
    EXPECT_EQ(m_world.GetData().lastCheckTick, now);

    auto location = m_world.GetLocation(entity);
    const Column* column = m_world.GetData().tables.Get(location->table).GetColumn(position);
    EXPECT_EQ(now.RelativeTo(column->GetAddedTick(location->tableRow)).Get(), Tick::MAX_AGE);
}

TEST_F(WorldTest, CapacityExceeded)
{
    World small(World::Config{1});
    ASSERT_TRUE(small.Spawn(Position(0, 0)));
    ASSERT_TRUE(small.Spawn(Position(0, 0)));

    auto overflow = small.Spawn(Position(0, 0));
    ASSERT_FALSE(overflow);
    EXPECT_EQ(overflow.Error().code, ErrorCode::CapacityExceeded);
    EXPECT_EQ(small.EntityCount(), 2u);
}

TEST_F(WorldTest, FlushCommitsRemoteReservations)
{
    RemoteAllocator remote = m_world.GetRemoteAllocator();
    Entity reserved = *remote.Reserve();
    EXPECT_FALSE(m_world.IsAlive(reserved));

    m_world.Flush();
    EXPECT_TRUE(m_world.IsAlive(reserved));
    EXPECT_EQ(m_world.GetLocation(reserved)->archetype, EMPTY_ARCHETYPE);

    ASSERT_TRUE(m_world.Insert(reserved, Position(1, 1)));
    EXPECT_TRUE(m_world.Has<Position>(reserved));
}

TEST_F(WorldTest, MoveOnlyAndOverAlignedComponents)
{
    Entity entity = *m_world.Spawn(Buffer(5), RenderData{});
    EXPECT_EQ(*m_world.Get<Buffer>(entity)->data, 5);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(m_world.Get<RenderData>(entity)) % 32, 0u);

    ASSERT_TRUE(m_world.Insert(entity, Position(0, 0)));
    EXPECT_EQ(*m_world.Get<Buffer>(entity)->data, 5);

    auto removed = m_world.Remove<Buffer>(entity);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed->data, 5);
}

TEST_F(WorldTest, MovedWorldKeepsEntities)
{
    Entity entity = *m_world.Spawn(Inventory{1, 2, 3});
    World moved(std::move(m_world));
    ASSERT_TRUE(moved.IsAlive(entity));
    EXPECT_EQ(moved.Get<Inventory>(entity)->items.size(), 3u);
    m_world = std::move(moved);
}

TEST_F(WorldTest, ComponentsWithMoveOnlyMembers)
{
    Loot loot;
    loot.items.push_back(std::make_unique<int>(9));
    Entity entity = *m_world.Spawn(std::move(loot), Position(1, 1));

    ASSERT_TRUE(m_world.Insert(entity, Velocity(0, 0)));
    ASSERT_NE(m_world.Get<Loot>(entity), nullptr);
    ASSERT_EQ(m_world.Get<Loot>(entity)->items.size(), 1u);
    EXPECT_EQ(*m_world.Get<Loot>(entity)->items[0], 9);

    auto removed = m_world.Remove<Loot>(entity);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed->items[0], 9);
}

TEST_F(WorldTest, SpawnAddsRequiredComponents)
{
    Entity entity = *m_world.Spawn(Rigidbody{3.0f});

    ASSERT_TRUE(m_world.Has<Position>(entity));
    ASSERT_TRUE(m_world.Has<Velocity>(entity));
    EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->x, 0.0f);
    EXPECT_FLOAT_EQ(m_world.Get<Rigidbody>(entity)->mass, 3.0f);
    EXPECT_EQ(m_world.ArchetypeCount(), 2u);
}

TEST_F(WorldTest, ExplicitValueWinsOverRequiredDefault)
{
    Entity entity = *m_world.Spawn(Position(4, 5), Rigidbody{});
    EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->x, 4.0f);
    EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->y, 5.0f);
    EXPECT_TRUE(m_world.Has<Velocity>(entity));
}

TEST_F(WorldTest, RequiredComponentsAreTransitive)
{
    Entity entity = *m_world.Spawn(Vehicle{});

    EXPECT_TRUE(m_world.Has<Vehicle>(entity));
    EXPECT_TRUE(m_world.Has<Rigidbody>(entity));
    EXPECT_TRUE(m_world.Has<Health>(entity));
    EXPECT_TRUE(m_world.Has<Position>(entity));
    EXPECT_TRUE(m_world.Has<Velocity>(entity));
    EXPECT_EQ(m_world.GetData().archetypes.Get(m_world.GetLocation(entity)->archetype).GetComponents().size(), 5u);
}

TEST_F(WorldTest, CyclicRequirementsTerminate)
{
    Entity entity = *m_world.Spawn(Plug{3});
    EXPECT_EQ(m_world.Get<Plug>(entity)->pins, 3);
    ASSERT_TRUE(m_world.Has<Socket>(entity));
    EXPECT_EQ(m_world.Get<Socket>(entity)->slots, 1);
}

TEST_F(WorldTest, InsertKeepsExistingRequiredValues)
{
    Entity entity = *m_world.Spawn(Position(7, 8));

    ASSERT_TRUE(m_world.Insert(entity, Rigidbody{2.0f}));
    EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->x, 7.0f);
    ASSERT_TRUE(m_world.Has<Velocity>(entity));
    EXPECT_FLOAT_EQ(m_world.Get<Rigidbody>(entity)->mass, 2.0f);

    // Replacing the component itself leaves its requirements alone
    m_world.GetMut<Velocity>(entity)->dx = 6.0f;
    ASSERT_TRUE(m_world.Insert(entity, Rigidbody{4.0f}));
    EXPECT_FLOAT_EQ(m_world.Get<Rigidbody>(entity)->mass, 4.0f);
    EXPECT_FLOAT_EQ(m_world.Get<Velocity>(entity)->dx, 6.0f);
    EXPECT_FLOAT_EQ(m_world.Get<Position>(entity)->y, 8.0f);
}

TEST_F(WorldTest, DefaultAndConfiguredConstruction)
{
    World defaulted;
    World configured(World::Config{16});
    EXPECT_EQ(defaulted.EntityCount(), 0u);
    EXPECT_TRUE(configured.Spawn(Position(0, 0)));
}
