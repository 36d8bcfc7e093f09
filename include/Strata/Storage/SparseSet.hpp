#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "../Component/ComponentRegistry.hpp"
#include "../Core/Contract.hpp"
#include "../Entity/Entity.hpp"
#include "Column.hpp"

namespace Strata
{
    /**
     * @brief Sparse-set storage for one sparse component
     *
     * values and entities are parallel dense arrays. The sparse index maps an
     * entity index to its dense slot. A slot only belongs to a handle if the
     * entity stored at that slot is the same handle, so a stale generation reads
     * as absent.
     */
    class SparseSet
    {
    public:
        static constexpr std::uint32_t ABSENT = 0xFFFFFFFFu;

        explicit SparseSet(const ComponentDescriptor& descriptor) noexcept
            : m_values(descriptor)
        {}

        STRATA_NODISCARD ComponentID GetComponentID() const noexcept { return m_values.GetComponentID(); }
        STRATA_NODISCARD std::size_t Size() const noexcept { return m_entities.size(); }
        STRATA_NODISCARD bool Empty() const noexcept { return m_entities.empty(); }
        STRATA_NODISCARD std::span<const Entity> GetEntities() const noexcept { return m_entities; }

        STRATA_NODISCARD bool Contains(Entity entity) const noexcept
        {
            return Slot(entity) != ABSENT;
        }

        STRATA_NODISCARD void* Get(Entity entity) noexcept
        {
            std::uint32_t slot = Slot(entity);
            return slot != ABSENT ? m_values.Get(slot) : nullptr;
        }

        STRATA_NODISCARD const void* Get(Entity entity) const noexcept
        {
            std::uint32_t slot = Slot(entity);
            return slot != ABSENT ? m_values.Get(slot) : nullptr;
        }

        STRATA_NODISCARD std::optional<Tick> GetAddedTick(Entity entity) const noexcept
        {
            std::uint32_t slot = Slot(entity);
            return slot != ABSENT ? std::optional<Tick>(m_values.GetAddedTick(slot)) : std::nullopt;
        }

        STRATA_NODISCARD std::optional<Tick> GetChangedTick(Entity entity) const noexcept
        {
            std::uint32_t slot = Slot(entity);
            return slot != ABSENT ? std::optional<Tick>(m_values.GetChangedTick(slot)) : std::nullopt;
        }

        void SetChangedTick(Entity entity, Tick tick) noexcept
        {
            std::uint32_t slot = Slot(entity);
            if (slot != ABSENT)
                m_values.SetChangedTick(slot, tick);
        }

        /**
         * @brief Insert or replace the value for `entity`
         *
         * The value is move-constructed from src; the caller keeps ownership of src.
         */
        void Insert(Entity entity, void* src, Tick tick)
        {
            std::uint32_t slot = Slot(entity);
            if (slot != ABSENT)
            {
                m_values.Replace(slot, src, tick);
                return;
            }

            const std::size_t index = entity.GetIndex();
            if (m_sparse.size() <= index)
                m_sparse.resize(index + 1, ABSENT);

            m_sparse[index] = static_cast<std::uint32_t>(m_entities.size());
            m_entities.push_back(entity);
            m_values.PushMoved(src, tick);
            STRATA_VERIFY(m_values.Size() == m_entities.size(), "Sparse set value count differs from entity count");
        }

        /**
         * @brief Move the value out into uninitialized storage at `dst` and remove the entry
         * @return false if the entity had no value
         */
        bool Remove(Entity entity, void* dst)
        {
            std::uint32_t slot = Slot(entity);
            if (slot == ABSENT)
                return false;

            m_values.GetDescriptor().Relocate(dst, m_values.Get(slot));
            m_values.SwapRemoveForget(slot);
            RemoveSlot(entity, slot);
            return true;
        }

        // Drops the value of `entity`. Returns false if it had none.
        bool Erase(Entity entity)
        {
            std::uint32_t slot = Slot(entity);
            if (slot == ABSENT)
                return false;

            m_values.SwapRemoveAndDrop(slot);
            RemoveSlot(entity, slot);
            return true;
        }

        void Clear() noexcept
        {
            m_values.Clear();
            m_entities.clear();
            m_sparse.clear();
        }

        void CheckTicks(Tick now) noexcept
        {
            m_values.CheckTicks(now);
        }

    private:
        std::uint32_t Slot(Entity entity) const noexcept
        {
            const std::size_t index = entity.GetIndex();
            if (!entity.IsValid() || index >= m_sparse.size())
                return ABSENT;
            std::uint32_t slot = m_sparse[index];
            if (slot == ABSENT || m_entities[slot] != entity)
                return ABSENT;
            return slot;
        }

        void RemoveSlot(Entity entity, std::uint32_t slot) noexcept
        {
            const std::size_t last = m_entities.size() - 1;
            if (slot != last)
            {
                m_entities[slot] = m_entities[last];
                m_sparse[m_entities[slot].GetIndex()] = slot;
            }
            m_entities.pop_back();
            m_sparse[entity.GetIndex()] = ABSENT;
        }

        Column m_values;
        std::vector<Entity> m_entities;
        std::vector<std::uint32_t> m_sparse;
    };

    // One sparse set per sparse component, created on first use
    class SparseSets
    {
    public:
        explicit SparseSets(const ComponentRegistry& registry) noexcept
            : m_registry(registry)
        {}

        SparseSet& GetOrCreate(ComponentID id)
        {
            if (m_sets.size() <= id)
                m_sets.resize(static_cast<std::size_t>(id) + 1);
            if (!m_sets[id])
            {
                const ComponentDescriptor& descriptor = m_registry.GetDescriptor(id);
                STRATA_VERIFY(descriptor.storage == StorageKind::Sparse, "Creating sparse storage for a dense component");
                m_sets[id] = std::make_unique<SparseSet>(descriptor);
            }
            return *m_sets[id];
        }

        STRATA_NODISCARD SparseSet* Get(ComponentID id) noexcept
        {
            return id < m_sets.size() ? m_sets[id].get() : nullptr;
        }

        STRATA_NODISCARD const SparseSet* Get(ComponentID id) const noexcept
        {
            return id < m_sets.size() ? m_sets[id].get() : nullptr;
        }

        void CheckTicks(Tick now) noexcept
        {
            for (auto& set : m_sets)
            {
                if (set)
                    set->CheckTicks(now);
            }
        }

    private:
        const ComponentRegistry& m_registry;
        std::vector<std::unique_ptr<SparseSet>> m_sets;
    };
}
