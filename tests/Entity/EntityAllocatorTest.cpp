#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include <vector>
#include "Strata/Entity/EntityAllocator.hpp"

class EntityAllocatorTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}

    Strata::Entity Spawn(Strata::EntityAllocator& allocator)
    {
        auto entity = allocator.Allocate();
        EXPECT_TRUE(entity);
        allocator.Commit(*entity, Strata::EntityLocation{});
        return *entity;
    }
};

TEST_F(EntityAllocatorTest, FreshIndicesAreSequential)
{
    Strata::EntityAllocator allocator;

    for (Strata::Entity::IndexType i = 0; i < 10; ++i)
    {
        Strata::Entity entity = Spawn(allocator);
        EXPECT_EQ(entity.GetIndex(), i);
        EXPECT_EQ(entity.GetGeneration(), 0u);
    }
    EXPECT_EQ(allocator.AliveCount(), 10u);
}

// Allocated entities stay unresolvable until committed
TEST_F(EntityAllocatorTest, AllocateThenCommit)
{
    Strata::EntityAllocator allocator;

    auto entity = allocator.Allocate();
    ASSERT_TRUE(entity);
    EXPECT_FALSE(allocator.IsAlive(*entity));
    EXPECT_FALSE(allocator.Resolve(*entity).has_value());

    Strata::EntityLocation location{3, 1, 2, 0};
    allocator.Commit(*entity, location);
    EXPECT_TRUE(allocator.IsAlive(*entity));
    EXPECT_EQ(allocator.Resolve(*entity), location);
}

TEST_F(EntityAllocatorTest, FreedHandlesGoStale)
{
    Strata::EntityAllocator allocator;

    Strata::Entity first = Spawn(allocator);
    EXPECT_TRUE(allocator.Free(first));
    EXPECT_FALSE(allocator.IsAlive(first));
    EXPECT_FALSE(allocator.Resolve(first).has_value());

    // Freeing twice is rejected
    EXPECT_FALSE(allocator.Free(first));

    Strata::Entity second = Spawn(allocator);
    EXPECT_EQ(second.GetIndex(), first.GetIndex());
    EXPECT_EQ(second.GetGeneration(), first.GetGeneration() + 1);
    EXPECT_NE(second, first);
    EXPECT_FALSE(allocator.IsAlive(first));
    EXPECT_TRUE(allocator.IsAlive(second));
}

TEST_F(EntityAllocatorTest, FreeListIsLifo)
{
    Strata::EntityAllocator allocator;

    Strata::Entity a = Spawn(allocator);
    Strata::Entity b = Spawn(allocator);
    Strata::Entity c = Spawn(allocator);
    (void)b;

    EXPECT_TRUE(allocator.Free(a));
    EXPECT_TRUE(allocator.Free(c));
    EXPECT_EQ(allocator.FreeCount(), 2u);

    EXPECT_EQ(Spawn(allocator).GetIndex(), c.GetIndex());
    EXPECT_EQ(Spawn(allocator).GetIndex(), a.GetIndex());
    EXPECT_EQ(Spawn(allocator).GetIndex(), 3u);
}

TEST_F(EntityAllocatorTest, RepeatedReuseBumpsGeneration)
{
    Strata::EntityAllocator allocator;

    Strata::Entity entity = Spawn(allocator);
    for (std::uint32_t round = 1; round <= 100; ++round)
    {
        EXPECT_TRUE(allocator.Free(entity));
        entity = Spawn(allocator);
        EXPECT_EQ(entity.GetIndex(), 0u);
        EXPECT_EQ(entity.GetGeneration(), round);
    }
}

TEST_F(EntityAllocatorTest, CapacityExceeded)
{
    Strata::EntityAllocator allocator(2);

    Spawn(allocator);
    Spawn(allocator);
    Strata::Entity last = Spawn(allocator);
    EXPECT_EQ(last.GetIndex(), 2u);

    auto overflow = allocator.Allocate();
    ASSERT_FALSE(overflow);
    EXPECT_EQ(overflow.Error().code, Strata::ErrorCode::CapacityExceeded);

    // Freed indices remain usable once the fresh range is exhausted
    EXPECT_TRUE(allocator.Free(last));
    auto reused = allocator.Allocate();
    ASSERT_TRUE(reused);
    EXPECT_EQ(reused->GetIndex(), 2u);
}

TEST_F(EntityAllocatorTest, RemoteReservationsAreInvisibleUntilFlushed)
{
    Strata::EntityAllocator allocator;
    Strata::RemoteAllocator remote = allocator.GetRemote();
    ASSERT_TRUE(remote.IsBound());

    Strata::Entity local = Spawn(allocator);
    auto reserved = remote.Reserve();
    ASSERT_TRUE(reserved);
    EXPECT_NE(reserved->GetIndex(), local.GetIndex());
    EXPECT_FALSE(allocator.IsAlive(*reserved));

    std::vector<Strata::Entity> flushed;
    allocator.FlushReserved([&](Strata::Entity entity) {
        flushed.push_back(entity);
        allocator.Commit(entity, Strata::EntityLocation{});
    });

    ASSERT_EQ(flushed.size(), 1u);
    EXPECT_EQ(flushed[0], *reserved);
    EXPECT_TRUE(allocator.IsAlive(*reserved));

    // A second flush has nothing new to commit
    flushed.clear();
    allocator.FlushReserved([&](Strata::Entity entity) { flushed.push_back(entity); });
    EXPECT_TRUE(flushed.empty());
}

TEST_F(EntityAllocatorTest, ConcurrentReservationsAreUnique)
{
    Strata::EntityAllocator allocator;
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 1000;

    std::vector<std::vector<Strata::Entity>> results(THREADS);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t)
    {
        threads.emplace_back([remote = allocator.GetRemote(), &out = results[t]]() {
            for (int i = 0; i < PER_THREAD; ++i)
            {
                auto entity = remote.Reserve();
                if (entity)
                    out.push_back(*entity);
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    std::vector<Strata::Entity::IndexType> indices;
    for (const auto& list : results)
    {
        EXPECT_EQ(list.size(), static_cast<std::size_t>(PER_THREAD));
        for (Strata::Entity entity : list)
            indices.push_back(entity.GetIndex());
    }
    std::sort(indices.begin(), indices.end());
    EXPECT_EQ(std::adjacent_find(indices.begin(), indices.end()), indices.end());
    EXPECT_EQ(indices.size(), static_cast<std::size_t>(THREADS * PER_THREAD));

    std::size_t committed = 0;
    allocator.FlushReserved([&](Strata::Entity entity) {
        allocator.Commit(entity, Strata::EntityLocation{});
        ++committed;
    });
    EXPECT_EQ(committed, indices.size());
    EXPECT_EQ(allocator.AliveCount(), indices.size());
}

// The owner and remote handles share one fresh-index range
TEST_F(EntityAllocatorTest, OwnerAndRemoteDoNotCollide)
{
    Strata::EntityAllocator allocator;
    Strata::RemoteAllocator remote = allocator.GetRemote();

    auto reserved = remote.Reserve();
    ASSERT_TRUE(reserved);
    Strata::Entity local = Spawn(allocator);
    EXPECT_NE(local.GetIndex(), reserved->GetIndex());

    // Flushing skips the index the owner already committed
    std::vector<Strata::Entity> flushed;
    allocator.FlushReserved([&](Strata::Entity entity) {
        flushed.push_back(entity);
        allocator.Commit(entity, Strata::EntityLocation{});
    });
    ASSERT_EQ(flushed.size(), 1u);
    EXPECT_EQ(flushed[0], *reserved);
}
