#pragma once

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../Component/ComponentRegistry.hpp"
#include "../Core/Contract.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/EntityTable.hpp"
#include "Column.hpp"

namespace Strata
{
    // Result of moving one row to another table
    struct TableMove
    {
        TableRow newRow = INVALID_ROW;
        std::optional<Entity> swapped;  // entity now occupying the vacated source row
    };

    /**
     * @brief Dense columnar storage for one set of dense components
     *
     * Columns are sorted by component id. All columns and the entity list always
     * have the same length and row i of every column belongs to entities[i].
     */
    class Table
    {
    public:
        Table(TableID id, std::span<const ComponentID> components, const ComponentRegistry& registry)
            : m_id(id)
        {
            m_columns.reserve(components.size());
            for (ComponentID component : components)
            {
                m_columns.emplace_back(registry.GetDescriptor(component));
                m_mask.Set(component);
            }
        }

        Table(const Table&) = delete;
        Table& operator=(const Table&) = delete;

        STRATA_NODISCARD TableID GetID() const noexcept { return m_id; }
        STRATA_NODISCARD std::size_t Size() const noexcept { return m_entities.size(); }
        STRATA_NODISCARD bool Empty() const noexcept { return m_entities.empty(); }
        STRATA_NODISCARD std::size_t ColumnCount() const noexcept { return m_columns.size(); }
        STRATA_NODISCARD const ComponentMask& GetMask() const noexcept { return m_mask; }
        STRATA_NODISCARD bool HasComponent(ComponentID id) const noexcept { return m_mask.Test(id); }

        STRATA_NODISCARD Entity GetEntity(TableRow row) const noexcept { return m_entities[row]; }
        STRATA_NODISCARD std::span<const Entity> GetEntities() const noexcept { return m_entities; }

        STRATA_NODISCARD Column* GetColumn(ComponentID id) noexcept
        {
            if (!m_mask.Test(id))
                return nullptr;
            return &m_columns[ColumnIndex(id)];
        }

        STRATA_NODISCARD const Column* GetColumn(ComponentID id) const noexcept
        {
            if (!m_mask.Test(id))
                return nullptr;
            return &m_columns[ColumnIndex(id)];
        }

        STRATA_NODISCARD std::span<Column> GetColumns() noexcept { return m_columns; }

        void Reserve(std::size_t rows)
        {
            m_entities.reserve(rows);
            for (Column& column : m_columns)
                column.Reserve(rows);
        }

        /**
         * @brief Append a row
         * @param values One pointer per column, in column (component id) order. Each
         *        value is move-constructed into the table; the caller keeps ownership of the source.
         */
        TableRow PushRow(Entity entity, std::span<void* const> values, Tick tick)
        {
            STRATA_VERIFY(values.size() == m_columns.size(), "Every table column must receive a value");
            for (std::size_t i = 0; i < m_columns.size(); ++i)
                m_columns[i].PushMoved(values[i], tick);
            m_entities.push_back(entity);
            VerifyLengths();
            return static_cast<TableRow>(m_entities.size() - 1);
        }

        /**
         * @brief Drop row values and fill the hole with the last row
         * @return The entity moved into `row`, or std::nullopt if `row` was the last row
         */
        std::optional<Entity> SwapRemoveRow(TableRow row)
        {
            STRATA_VERIFY(row < m_entities.size(), "Table row out of range");
            for (Column& column : m_columns)
                column.SwapRemoveAndDrop(row);
            return RemoveEntity(row);
        }

        /**
         * @brief Move a row to another table
         *
         * Shared columns are relocated. Columns only present here are dropped.
         * Columns only present in dst are initialized from `missing`, which holds one
         * pointer per such column in component id order; the caller keeps ownership
         * of those sources.
         */
        TableMove MoveRowTo(TableRow row, Table& dst, std::span<void* const> missing, Tick tick)
        {
            STRATA_PROFILE_ZONE_NAMED("Table::MoveRowTo");
            STRATA_VERIFY(row < m_entities.size(), "Table row out of range");
            STRATA_VERIFY(&dst != this, "Moving a row into its own table");

            std::size_t missingIndex = 0;
            std::size_t srcIndex = 0;
            for (Column& dstColumn : dst.m_columns)
            {
                const ComponentID id = dstColumn.GetComponentID();
                while (srcIndex < m_columns.size() && m_columns[srcIndex].GetComponentID() < id)
                {
                    m_columns[srcIndex].SwapRemoveAndDrop(row);
                    ++srcIndex;
                }

                if (srcIndex < m_columns.size() && m_columns[srcIndex].GetComponentID() == id)
                {
                    m_columns[srcIndex].MoveRowTo(row, dstColumn);
                    ++srcIndex;
                }
                else
                {
                    STRATA_VERIFY(missingIndex < missing.size(), "Missing value for a destination-only column");
                    dstColumn.PushMoved(missing[missingIndex++], tick);
                }
            }
            for (; srcIndex < m_columns.size(); ++srcIndex)
                m_columns[srcIndex].SwapRemoveAndDrop(row);

            STRATA_VERIFY(missingIndex == missing.size(), "Unused values passed to a table move");

            const Entity entity = m_entities[row];
            dst.m_entities.push_back(entity);
            dst.VerifyLengths();

            TableMove result;
            result.newRow = static_cast<TableRow>(dst.m_entities.size() - 1);
            result.swapped = RemoveEntity(row);
            return result;
        }

        void CheckTicks(Tick now) noexcept
        {
            for (Column& column : m_columns)
                column.CheckTicks(now);
        }

    private:
        std::size_t ColumnIndex(ComponentID id) const noexcept
        {
            auto it = std::lower_bound(m_columns.begin(), m_columns.end(), id,
                [](const Column& column, ComponentID value) { return column.GetComponentID() < value; });
            return static_cast<std::size_t>(it - m_columns.begin());
        }

        std::optional<Entity> RemoveEntity(TableRow row)
        {
            const std::size_t last = m_entities.size() - 1;
            std::optional<Entity> swapped;
            if (row != last)
            {
                m_entities[row] = m_entities[last];
                swapped = m_entities[row];
            }
            m_entities.pop_back();
            VerifyLengths();
            return swapped;
        }

        void VerifyLengths() const
        {
            for (const Column& column : m_columns)
                STRATA_VERIFY(column.Size() == m_entities.size(), "Table column length differs from entity count");
        }

        TableID m_id;
        std::vector<Column> m_columns;
        std::vector<Entity> m_entities;
        ComponentMask m_mask;
    };

    /**
     * @brief Owner of every table, keyed by the sorted dense component set
     *
     * Table 0 is the empty table used by archetypes without dense components.
     */
    class Tables
    {
    public:
        explicit Tables(const ComponentRegistry& registry)
            : m_registry(registry)
        {
            m_tables.push_back(std::make_unique<Table>(EMPTY_TABLE, std::span<const ComponentID>{}, registry));
            m_bySet.emplace(std::vector<ComponentID>{}, EMPTY_TABLE);
        }

        // `components` must be sorted and free of duplicates
        TableID GetOrCreate(std::span<const ComponentID> components)
        {
            std::vector<ComponentID> key(components.begin(), components.end());
            if (auto it = m_bySet.find(key); it != m_bySet.end())
                return it->second;

            const auto id = static_cast<TableID>(m_tables.size());
            m_tables.push_back(std::make_unique<Table>(id, components, m_registry));
            m_bySet.emplace(std::move(key), id);

            if (Log::IsEnabled(LogLevel::Debug))
                Log::Debug("Storage", "Created table " + std::to_string(id) + " with " + std::to_string(components.size()) + " columns");
            return id;
        }

        STRATA_NODISCARD Table& Get(TableID id)
        {
            STRATA_VERIFY(id < m_tables.size(), "Unknown table id");
            return *m_tables[id];
        }

        STRATA_NODISCARD const Table& Get(TableID id) const
        {
            STRATA_VERIFY(id < m_tables.size(), "Unknown table id");
            return *m_tables[id];
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_tables.size(); }

        void CheckTicks(Tick now) noexcept
        {
            for (auto& table : m_tables)
                table->CheckTicks(now);
        }

    private:
        const ComponentRegistry& m_registry;
        std::vector<std::unique_ptr<Table>> m_tables;
        std::map<std::vector<ComponentID>, TableID> m_bySet;
    };
}
