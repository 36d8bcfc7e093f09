#include <gtest/gtest.h>
#include <array>
#include <vector>
#include "Strata/Storage/Table.hpp"
#include "../TestComponents.hpp"

using namespace Strata::Test;

class TableTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_position = m_registry.Register<Position>();
        m_velocity = m_registry.Register<Velocity>();
        m_name = m_registry.Register<Name>();
    }

    void TearDown() override {}

    Strata::ComponentRegistry m_registry;
    Strata::ComponentID m_position = 0;
    Strata::ComponentID m_velocity = 0;
    Strata::ComponentID m_name = 0;
};

TEST_F(TableTest, PushRowsInColumnOrder)
{
    std::array<Strata::ComponentID, 2> ids{m_position, m_velocity};
    Strata::Table table(1, ids, m_registry);
    EXPECT_EQ(table.ColumnCount(), 2u);
    EXPECT_TRUE(table.HasComponent(m_position));
    EXPECT_FALSE(table.HasComponent(m_name));

    Position position(1.0f, 2.0f);
    Velocity velocity(3.0f, 4.0f);
    std::array<void*, 2> values{&position, &velocity};
    Strata::TableRow row = table.PushRow(Strata::Entity(7, 0), values, Strata::Tick(1));

    EXPECT_EQ(row, 0u);
    EXPECT_EQ(table.Size(), 1u);
    EXPECT_EQ(table.GetEntity(0), Strata::Entity(7, 0));
    EXPECT_FLOAT_EQ(static_cast<const Position*>(table.GetColumn(m_position)->Get(0))->y, 2.0f);
    EXPECT_FLOAT_EQ(static_cast<const Velocity*>(table.GetColumn(m_velocity)->Get(0))->dx, 3.0f);
    EXPECT_EQ(table.GetColumn(m_name), nullptr);
}

// Removing row 0 of three moves the last row into it
TEST_F(TableTest, SwapRemoveReportsMovedEntity)
{
    std::array<Strata::ComponentID, 1> ids{m_position};
    Strata::Table table(1, ids, m_registry);

    for (std::uint32_t i = 0; i < 3; ++i)
    {
        Position position(static_cast<float>(i), 0.0f);
        std::array<void*, 1> values{&position};
        table.PushRow(Strata::Entity(i, 0), values, Strata::Tick(1));
    }

    auto swapped = table.SwapRemoveRow(0);
    ASSERT_TRUE(swapped.has_value());
    EXPECT_EQ(*swapped, Strata::Entity(2, 0));
    EXPECT_EQ(table.GetEntity(0), Strata::Entity(2, 0));
    EXPECT_FLOAT_EQ(table.GetColumn(m_position)->Data<Position>()[0].x, 2.0f);

    // Removing the last row moves nothing
    EXPECT_FALSE(table.SwapRemoveRow(1).has_value());
    EXPECT_EQ(table.Size(), 1u);
}

TEST_F(TableTest, MoveRowToAddsAndDropsColumns)
{
    std::array<Strata::ComponentID, 2> sourceIds{m_position, m_name};
    std::array<Strata::ComponentID, 2> targetIds{m_position, m_velocity};
    Strata::Table source(1, sourceIds, m_registry);
    Strata::Table target(2, targetIds, m_registry);

    for (std::uint32_t i = 0; i < 2; ++i)
    {
        Position position(static_cast<float>(i), 10.0f);
        Name name("row");
        std::array<void*, 2> values{&position, &name};
        source.PushRow(Strata::Entity(i, 0), values, Strata::Tick(1));
    }

    Velocity velocity(5.0f, 6.0f);
    std::array<void*, 1> missing{&velocity};
    Strata::TableMove move = source.MoveRowTo(0, target, missing, Strata::Tick(2));

    EXPECT_EQ(move.newRow, 0u);
    ASSERT_TRUE(move.swapped.has_value());
    EXPECT_EQ(*move.swapped, Strata::Entity(1, 0));

    EXPECT_EQ(target.Size(), 1u);
    EXPECT_EQ(target.GetEntity(0), Strata::Entity(0, 0));
    EXPECT_FLOAT_EQ(target.GetColumn(m_position)->Data<Position>()[0].x, 0.0f);
    EXPECT_FLOAT_EQ(target.GetColumn(m_velocity)->Data<Velocity>()[0].dy, 6.0f);
    // The relocated value keeps its added tick, the new one gets the move tick
    EXPECT_EQ(target.GetColumn(m_position)->GetAddedTick(0), Strata::Tick(1));
    EXPECT_EQ(target.GetColumn(m_velocity)->GetAddedTick(0), Strata::Tick(2));

    EXPECT_EQ(source.Size(), 1u);
    EXPECT_EQ(source.GetEntity(0), Strata::Entity(1, 0));
    EXPECT_EQ(source.GetColumn(m_name)->Size(), 1u);
}

TEST_F(TableTest, PushRowWithWrongValueCountViolatesContract)
{
    ThrowOnContractViolation guard;
    std::array<Strata::ComponentID, 2> ids{m_position, m_velocity};
    Strata::Table table(1, ids, m_registry);

    Position position;
    std::array<void*, 1> values{&position};
    EXPECT_THROW(table.PushRow(Strata::Entity(0, 0), values, Strata::Tick(1)), ContractViolation);
    EXPECT_EQ(table.Size(), 0u);
}

TEST_F(TableTest, TablesAreSharedPerComponentSet)
{
    Strata::Tables tables(m_registry);
    EXPECT_EQ(tables.Size(), 1u);
    EXPECT_EQ(tables.Get(Strata::EMPTY_TABLE).ColumnCount(), 0u);

    std::array<Strata::ComponentID, 2> ids{m_position, m_velocity};
    Strata::TableID first = tables.GetOrCreate(ids);
    Strata::TableID second = tables.GetOrCreate(ids);
    EXPECT_EQ(first, second);
    EXPECT_EQ(tables.Size(), 2u);
    EXPECT_EQ(tables.GetOrCreate(std::span<const Strata::ComponentID>{}), Strata::EMPTY_TABLE);
}
