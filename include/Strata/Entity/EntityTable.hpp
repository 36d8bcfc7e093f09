#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Contract.hpp"
#include "Entity.hpp"

namespace Strata
{
    using ArchetypeID = std::uint32_t;
    using TableID = std::uint32_t;
    using ArchetypeRow = std::uint32_t;
    using TableRow = std::uint32_t;

    inline constexpr ArchetypeID EMPTY_ARCHETYPE = 0;
    inline constexpr TableID EMPTY_TABLE = 0;
    inline constexpr std::uint32_t INVALID_ROW = 0xFFFFFFFFu;

    /**
     * @brief Where a live entity's data lives
     *
     * Every archetype is bound to exactly one table (the shared empty table when
     * it has no dense components), so both halves are always meaningful.
     */
    struct EntityLocation
    {
        ArchetypeID archetype = EMPTY_ARCHETYPE;
        ArchetypeRow archetypeRow = INVALID_ROW;
        TableID table = EMPTY_TABLE;
        TableRow tableRow = INVALID_ROW;

        bool operator==(const EntityLocation&) const noexcept = default;
    };

    // Per-index metadata: current generation, lifecycle state, location
    class EntityTable
    {
    public:
        using IndexType = Entity::IndexType;
        using GenerationType = Entity::GenerationType;

        enum class SlotState : std::uint8_t
        {
            Reserved,   // issued (possibly by a remote allocator) but not committed yet
            Alive,
            Free
        };

        STRATA_NODISCARD std::optional<EntityLocation> Resolve(Entity entity) const noexcept
        {
            const Slot* slot = Find(entity);
            if (!slot || slot->state != SlotState::Alive)
                return std::nullopt;
            return slot->location;
        }

        STRATA_NODISCARD bool IsAlive(Entity entity) const noexcept
        {
            const Slot* slot = Find(entity);
            return slot && slot->state == SlotState::Alive;
        }

        // Makes a reserved entity visible at `location`
        void Commit(Entity entity, const EntityLocation& location)
        {
            EnsureSize(static_cast<std::size_t>(entity.GetIndex()) + 1);
            Slot& slot = m_slots[entity.GetIndex()];
            STRATA_VERIFY(slot.state == SlotState::Reserved, "Committing an entity that is not reserved");
            STRATA_VERIFY(slot.generation == entity.GetGeneration(), "Committing an entity with a stale generation");
            slot.state = SlotState::Alive;
            slot.location = location;
            ++m_alive;
        }

        void SetLocation(IndexType index, const EntityLocation& location)
        {
            STRATA_VERIFY(index < m_slots.size() && m_slots[index].state == SlotState::Alive, "Relocating a dead entity");
            m_slots[index].location = location;
        }

        /**
         * @brief Mark an alive entity as freed and bump its generation
         * @return The new generation, or std::nullopt if the entity was not alive
         */
        std::optional<GenerationType> Release(Entity entity) noexcept
        {
            if (!IsAlive(entity))
                return std::nullopt;

            Slot& slot = m_slots[entity.GetIndex()];
            slot.state = SlotState::Free;
            slot.location = EntityLocation{};
            --m_alive;
            return ++slot.generation;
        }

        // Re-arms a freed slot for reuse under its current generation
        Entity Reissue(IndexType index) noexcept
        {
            Slot& slot = m_slots[index];
            slot.state = SlotState::Reserved;
            return Entity(index, slot.generation);
        }

        STRATA_NODISCARD GenerationType GetGeneration(IndexType index) const noexcept
        {
            return index < m_slots.size() ? m_slots[index].generation : 0;
        }

        STRATA_NODISCARD SlotState GetState(IndexType index) const noexcept
        {
            return index < m_slots.size() ? m_slots[index].state : SlotState::Reserved;
        }

        void EnsureSize(std::size_t size)
        {
            if (m_slots.size() < size)
                m_slots.resize(size);
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_slots.size(); }
        STRATA_NODISCARD std::size_t AliveCount() const noexcept { return m_alive; }

    private:
        struct Slot
        {
            GenerationType generation = 0;
            SlotState state = SlotState::Reserved;
            EntityLocation location{};
        };

        const Slot* Find(Entity entity) const noexcept
        {
            if (!entity.IsValid() || entity.GetIndex() >= m_slots.size())
                return nullptr;
            const Slot& slot = m_slots[entity.GetIndex()];
            return slot.generation == entity.GetGeneration() ? &slot : nullptr;
        }

        std::vector<Slot> m_slots;
        std::size_t m_alive = 0;
    };
}
