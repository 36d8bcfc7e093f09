#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Log.hpp"
#include "../Core/Result.hpp"
#include "EntityTable.hpp"

namespace Strata
{
    namespace Detail
    {
        // Fresh-index tail shared between the owning allocator and its remote handles
        struct EntityTail
        {
            explicit EntityTail(std::uint64_t maxIndex) noexcept : limit(maxIndex) {}

            Result<Entity::IndexType> Take() noexcept
            {
                std::uint64_t current = next.load(std::memory_order_relaxed);
                do
                {
                    if (current > limit) STRATA_UNLIKELY
                        return Err(MakeError(ErrorCode::CapacityExceeded, "Entity index space exhausted"));
                }
                while (!next.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel, std::memory_order_relaxed));

                return static_cast<Entity::IndexType>(current);
            }

            std::atomic<std::uint64_t> next{0};
            const std::uint64_t limit;
        };
    }

    /**
     * @brief Lock-free entity reservation usable from any thread
     *
     * Draws only never-used indices from the shared tail, so it never races with
     * the owner's free list. Reserved entities stay invisible (Resolve returns
     * nothing) until the owning world flushes them.
     */
    class RemoteAllocator
    {
    public:
        RemoteAllocator() = default;
        explicit RemoteAllocator(std::shared_ptr<Detail::EntityTail> tail) noexcept : m_tail(std::move(tail)) {}

        STRATA_NODISCARD Result<Entity> Reserve() const noexcept
        {
            STRATA_ASSERT(m_tail, "RemoteAllocator is not bound to an allocator");
            auto index = m_tail->Take();
            if (!index)
                return Err(index.Error());
            return Entity(*index, 0);
        }

        STRATA_NODISCARD bool IsBound() const noexcept { return m_tail != nullptr; }

    private:
        std::shared_ptr<Detail::EntityTail> m_tail;
    };

    /**
     * @brief Single-owner entity allocator
     *
     * Prefers the most recently freed index (LIFO) over a fresh one. An index whose
     * generation would wrap is retired instead of being reused.
     */
    class EntityAllocator
    {
    public:
        using IndexType = Entity::IndexType;

        explicit EntityAllocator(std::uint64_t maxIndex = config::MAX_ENTITY_INDEX)
            : m_tail(std::make_shared<Detail::EntityTail>(maxIndex < config::MAX_ENTITY_INDEX ? maxIndex : config::MAX_ENTITY_INDEX))
        {}

        EntityAllocator(const EntityAllocator&) = delete;
        EntityAllocator& operator=(const EntityAllocator&) = delete;

        /**
         * @brief Issue an entity in the reserved state
         *
         * The caller commits it with Commit() once its storage row exists.
         * Fails with ErrorCode::CapacityExceeded once every index is in use.
         */
        STRATA_NODISCARD Result<Entity> Allocate()
        {
            if (!m_freeList.empty())
            {
                IndexType index = m_freeList.back();
                m_freeList.pop_back();
                return m_table.Reissue(index);
            }

            auto index = m_tail->Take();
            if (!index) STRATA_UNLIKELY
            {
                Log::Warn("Entity", "Entity allocation failed: index space exhausted");
                return Err(index.Error());
            }

            m_table.EnsureSize(static_cast<std::size_t>(*index) + 1);
            return Entity(*index, 0);
        }

        // Returns false if the entity is already dead
        bool Free(Entity entity)
        {
            auto generation = m_table.Release(entity);
            if (!generation)
                return false;

            if (*generation != ~Entity::GenerationType{0}) STRATA_LIKELY
                m_freeList.push_back(entity.GetIndex());
            else
                Log::Debug("Entity", "Retiring entity index " + std::to_string(entity.GetIndex()) + " after generation overflow");
            return true;
        }

        STRATA_NODISCARD std::optional<EntityLocation> Resolve(Entity entity) const noexcept
        {
            return m_table.Resolve(entity);
        }

        STRATA_NODISCARD bool IsAlive(Entity entity) const noexcept
        {
            return m_table.IsAlive(entity);
        }

        void Commit(Entity entity, const EntityLocation& location)
        {
            m_table.Commit(entity, location);
        }

        void SetLocation(Entity entity, const EntityLocation& location)
        {
            m_table.SetLocation(entity.GetIndex(), location);
        }

        STRATA_NODISCARD RemoteAllocator GetRemote() const noexcept
        {
            return RemoteAllocator(m_tail);
        }

        /**
         * @brief Calls func(Entity) for every index reserved remotely since the last flush
         *
         * func is expected to Commit the entity.
         */
        template<typename Func>
        void FlushReserved(Func&& func)
        {
            std::uint64_t end = m_tail->next.load(std::memory_order_acquire);
            if (end > m_tail->limit + 1)
                end = m_tail->limit + 1;

            m_table.EnsureSize(static_cast<std::size_t>(end));
            for (std::uint64_t i = m_flushed; i < end; ++i)
            {
                IndexType index = static_cast<IndexType>(i);
                if (m_table.GetState(index) == EntityTable::SlotState::Reserved)
                    func(Entity(index, m_table.GetGeneration(index)));
            }
            m_flushed = end;
        }

        STRATA_NODISCARD std::size_t AliveCount() const noexcept { return m_table.AliveCount(); }
        STRATA_NODISCARD std::size_t FreeCount() const noexcept { return m_freeList.size(); }
        STRATA_NODISCARD const EntityTable& GetTable() const noexcept { return m_table; }

    private:
        EntityTable m_table;
        std::vector<IndexType> m_freeList;
        std::shared_ptr<Detail::EntityTail> m_tail;
        std::uint64_t m_flushed = 0;
    };
}
