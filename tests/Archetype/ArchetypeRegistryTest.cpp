#include <gtest/gtest.h>
#include <array>
#include <vector>
#include "Strata/Archetype/ArchetypeRegistry.hpp"
#include "../TestComponents.hpp"

using namespace Strata::Test;

class ArchetypeRegistryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_position = m_components.Register<Position>();
        m_velocity = m_components.Register<Velocity>();
        m_health = m_components.Register<Health>();
        m_burning = m_components.Register<Burning>();
    }

    void TearDown() override {}

    Strata::ComponentRegistry m_components;
    Strata::Tables m_tables{m_components};
    Strata::ArchetypeRegistry m_archetypes{m_components, m_tables};

    Strata::ComponentID m_position = 0;
    Strata::ComponentID m_velocity = 0;
    Strata::ComponentID m_health = 0;
    Strata::ComponentID m_burning = 0;
};

TEST_F(ArchetypeRegistryTest, EmptyArchetypeExists)
{
    EXPECT_EQ(m_archetypes.Size(), 1u);
    const Strata::Archetype& empty = m_archetypes.Get(Strata::EMPTY_ARCHETYPE);
    EXPECT_TRUE(empty.GetComponents().empty());
    EXPECT_EQ(empty.GetTableID(), Strata::EMPTY_TABLE);
}

// Order and duplicates do not change which archetype a set maps to
TEST_F(ArchetypeRegistryTest, CanonicalSets)
{
    std::array<Strata::ComponentID, 2> pv{m_position, m_velocity};
    std::array<Strata::ComponentID, 3> vpv{m_velocity, m_position, m_velocity};

    Strata::ArchetypeID first = m_archetypes.GetOrCreate(pv);
    Strata::ArchetypeID second = m_archetypes.GetOrCreate(vpv);
    EXPECT_EQ(first, second);
    EXPECT_EQ(m_archetypes.Size(), 2u);

    const Strata::Archetype& archetype = m_archetypes.Get(first);
    EXPECT_EQ(archetype.GetComponents().size(), 2u);
    EXPECT_TRUE(archetype.HasComponent(m_position));
    EXPECT_TRUE(archetype.HasComponent(m_velocity));
    EXPECT_FALSE(archetype.HasComponent(m_health));
}

TEST_F(ArchetypeRegistryTest, SparseComponentsShareTheDenseTable)
{
    std::array<Strata::ComponentID, 1> p{m_position};
    std::array<Strata::ComponentID, 2> pb{m_position, m_burning};

    const Strata::Archetype& dense = m_archetypes.Get(m_archetypes.GetOrCreate(p));
    const Strata::Archetype& mixed = m_archetypes.Get(m_archetypes.GetOrCreate(pb));

    EXPECT_EQ(dense.GetTableID(), mixed.GetTableID());
    EXPECT_FALSE(dense.HasSparseComponents());
    EXPECT_TRUE(mixed.HasSparseComponents());
    ASSERT_EQ(mixed.GetDenseComponents().size(), 1u);
    ASSERT_EQ(mixed.GetSparseComponents().size(), 1u);
    EXPECT_EQ(mixed.GetSparseComponents()[0], m_burning);
    EXPECT_TRUE(mixed.GetSparseMask().Test(m_burning));

    // A purely sparse archetype uses the empty table
    std::array<Strata::ComponentID, 1> b{m_burning};
    EXPECT_EQ(m_archetypes.Get(m_archetypes.GetOrCreate(b)).GetTableID(), Strata::EMPTY_TABLE);
}

TEST_F(ArchetypeRegistryTest, TransitionsAreCachedBothWays)
{
    Strata::ArchetypeID p = m_archetypes.Transition(Strata::EMPTY_ARCHETYPE, m_position, std::nullopt);
    Strata::ArchetypeID pv = m_archetypes.Transition(p, m_velocity, std::nullopt);

    EXPECT_EQ(m_archetypes.Get(p).GetEdges().GetAdd(m_velocity), pv);
    EXPECT_EQ(m_archetypes.Get(pv).GetEdges().GetRemove(m_velocity), p);
    EXPECT_EQ(m_archetypes.Get(Strata::EMPTY_ARCHETYPE).GetEdges().GetAdd(m_position), p);

    EXPECT_EQ(m_archetypes.Transition(pv, std::nullopt, m_velocity), p);
    EXPECT_EQ(m_archetypes.Transition(p, std::nullopt, m_position), Strata::EMPTY_ARCHETYPE);

    // No-op transitions stay put
    EXPECT_EQ(m_archetypes.Transition(pv, m_position, std::nullopt), pv);
    EXPECT_EQ(m_archetypes.Transition(p, std::nullopt, m_health), p);
}

// Replacing one component in a single step
TEST_F(ArchetypeRegistryTest, RemoveThenAdd)
{
    std::array<Strata::ComponentID, 2> pv{m_position, m_velocity};
    std::array<Strata::ComponentID, 2> ph{m_position, m_health};

    Strata::ArchetypeID from = m_archetypes.GetOrCreate(pv);
    Strata::ArchetypeID to = m_archetypes.Transition(from, m_health, m_velocity);
    EXPECT_EQ(to, m_archetypes.GetOrCreate(ph));
}

// Archetypes created directly are linked to neighbours that already exist
TEST_F(ArchetypeRegistryTest, NewArchetypesLinkToExistingNeighbours)
{
    std::array<Strata::ComponentID, 2> pv{m_position, m_velocity};
    std::array<Strata::ComponentID, 1> p{m_position};

    Strata::ArchetypeID larger = m_archetypes.GetOrCreate(pv);
    Strata::ArchetypeID smaller = m_archetypes.GetOrCreate(p);

    EXPECT_EQ(m_archetypes.Get(smaller).GetEdges().GetAdd(m_velocity), larger);
    EXPECT_EQ(m_archetypes.Get(larger).GetEdges().GetRemove(m_velocity), smaller);
    EXPECT_EQ(m_archetypes.Get(Strata::EMPTY_ARCHETYPE).GetEdges().GetAdd(m_position), smaller);
}

TEST_F(ArchetypeRegistryTest, ArchetypesWithComponentInCreationOrder)
{
    std::array<Strata::ComponentID, 1> p{m_position};
    std::array<Strata::ComponentID, 1> v{m_velocity};
    std::array<Strata::ComponentID, 2> pv{m_position, m_velocity};
    std::array<Strata::ComponentID, 2> ph{m_position, m_health};

    Strata::ArchetypeID a = m_archetypes.GetOrCreate(pv);
    m_archetypes.GetOrCreate(v);
    Strata::ArchetypeID b = m_archetypes.GetOrCreate(p);
    Strata::ArchetypeID c = m_archetypes.GetOrCreate(ph);

    auto withPosition = m_archetypes.GetArchetypesWith(m_position);
    EXPECT_EQ(std::vector<Strata::ArchetypeID>(withPosition.begin(), withPosition.end()),
        (std::vector<Strata::ArchetypeID>{a, b, c}));
    EXPECT_TRUE(m_archetypes.GetArchetypesWith(m_burning).empty());
}

TEST_F(ArchetypeRegistryTest, EdgeStorageSlowPath)
{
    Strata::ArchetypeEdgeStorage edges;
    edges.SetAdd(3, 10);
    edges.SetAdd(500, 11);
    edges.SetRemove(500, 12);

    EXPECT_EQ(edges.GetAdd(3), 10u);
    EXPECT_EQ(edges.GetAdd(500), 11u);
    EXPECT_EQ(edges.GetRemove(500), 12u);
    EXPECT_FALSE(edges.GetRemove(3).has_value());
    EXPECT_FALSE(edges.GetAdd(501).has_value());
    EXPECT_EQ(edges.Size(), 3u);
}

TEST_F(ArchetypeRegistryTest, SwapRemoveEntities)
{
    Strata::Archetype& archetype = m_archetypes.Get(Strata::EMPTY_ARCHETYPE);
    archetype.PushEntity(Strata::Entity(0, 0));
    archetype.PushEntity(Strata::Entity(1, 0));
    archetype.PushEntity(Strata::Entity(2, 0));

    auto swapped = archetype.SwapRemove(0);
    ASSERT_TRUE(swapped.has_value());
    EXPECT_EQ(*swapped, Strata::Entity(2, 0));
    EXPECT_EQ(archetype.GetEntity(0), Strata::Entity(2, 0));
    EXPECT_FALSE(archetype.SwapRemove(1).has_value());
    EXPECT_EQ(archetype.Size(), 1u);
}
