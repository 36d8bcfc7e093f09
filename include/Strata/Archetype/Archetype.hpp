#pragma once

#include <optional>
#include <span>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Contract.hpp"
#include "../Entity/EntityTable.hpp"
#include "ArchetypeEdgeStorage.hpp"

namespace Strata
{
    /**
     * @brief The storage shape shared by every entity with the same component set
     *
     * Components are kept sorted with the dense ones first, followed by the
     * sparse ones. Dense data lives in the bound table; the archetype itself only
     * keeps the list of its entities (archetype rows) and its transition edges.
     */
    class Archetype
    {
    public:
        Archetype(ArchetypeID id, TableID table, std::vector<ComponentID> dense, std::vector<ComponentID> sparse)
            : m_id(id)
            , m_table(table)
            , m_denseCount(dense.size())
        {
            m_components = std::move(dense);
            m_components.insert(m_components.end(), sparse.begin(), sparse.end());
            for (std::size_t i = 0; i < m_components.size(); ++i)
            {
                m_mask.Set(m_components[i]);
                if (i >= m_denseCount)
                    m_sparseMask.Set(m_components[i]);
            }
        }

        STRATA_NODISCARD ArchetypeID GetID() const noexcept { return m_id; }
        STRATA_NODISCARD TableID GetTableID() const noexcept { return m_table; }

        STRATA_NODISCARD std::span<const ComponentID> GetComponents() const noexcept { return m_components; }
        STRATA_NODISCARD std::span<const ComponentID> GetDenseComponents() const noexcept
        {
            return std::span<const ComponentID>(m_components).first(m_denseCount);
        }
        STRATA_NODISCARD std::span<const ComponentID> GetSparseComponents() const noexcept
        {
            return std::span<const ComponentID>(m_components).subspan(m_denseCount);
        }

        STRATA_NODISCARD const ComponentMask& GetMask() const noexcept { return m_mask; }
        STRATA_NODISCARD const ComponentMask& GetSparseMask() const noexcept { return m_sparseMask; }
        STRATA_NODISCARD bool HasComponent(ComponentID id) const noexcept { return m_mask.Test(id); }
        STRATA_NODISCARD bool HasSparseComponents() const noexcept { return m_denseCount != m_components.size(); }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_entities.size(); }
        STRATA_NODISCARD bool Empty() const noexcept { return m_entities.empty(); }
        STRATA_NODISCARD Entity GetEntity(ArchetypeRow row) const noexcept { return m_entities[row]; }
        STRATA_NODISCARD std::span<const Entity> GetEntities() const noexcept { return m_entities; }

        ArchetypeRow PushEntity(Entity entity)
        {
            m_entities.push_back(entity);
            return static_cast<ArchetypeRow>(m_entities.size() - 1);
        }

        // Returns the entity moved into `row`, or std::nullopt if `row` was the last one
        std::optional<Entity> SwapRemove(ArchetypeRow row)
        {
            STRATA_VERIFY(row < m_entities.size(), "Archetype row out of range");
            const std::size_t last = m_entities.size() - 1;
            std::optional<Entity> swapped;
            if (row != last)
            {
                m_entities[row] = m_entities[last];
                swapped = m_entities[row];
            }
            m_entities.pop_back();
            return swapped;
        }

        STRATA_NODISCARD ArchetypeEdgeStorage& GetEdges() noexcept { return m_edges; }
        STRATA_NODISCARD const ArchetypeEdgeStorage& GetEdges() const noexcept { return m_edges; }

    private:
        ArchetypeID m_id;
        TableID m_table;
        std::size_t m_denseCount;
        std::vector<ComponentID> m_components;
        ComponentMask m_mask;
        ComponentMask m_sparseMask;
        std::vector<Entity> m_entities;
        ArchetypeEdgeStorage m_edges;
    };
}
