#pragma once

#include <cstddef>
#include <new>
#include <optional>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Contract.hpp"
#include "../Core/Tick.hpp"

namespace Strata
{
    // World-scoped singleton values addressed by ResourceID
    class ResourceStorage
    {
    public:
        ResourceStorage() = default;
        ResourceStorage(const ResourceStorage&) = delete;
        ResourceStorage& operator=(const ResourceStorage&) = delete;

        ~ResourceStorage()
        {
            for (Slot& slot : m_slots)
                Release(slot);
        }

        /**
         * @brief Insert or replace a resource
         *
         * The value is move-constructed from src; the caller keeps ownership of src.
         * @return The stored value
         */
        void* Insert(const ResourceDescriptor& descriptor, void* src, Tick tick)
        {
            if (m_slots.size() <= descriptor.id)
                m_slots.resize(static_cast<std::size_t>(descriptor.id) + 1);

            Slot& slot = m_slots[descriptor.id];
            if (slot.data)
            {
                slot.descriptor.Drop(slot.data);
                slot.descriptor.MoveConstruct(slot.data, src);
                slot.changed = tick;
                return slot.data;
            }

            slot.descriptor = descriptor;
            slot.data = static_cast<std::byte*>(::operator new(descriptor.size, std::align_val_t{descriptor.alignment}));
            descriptor.MoveConstruct(slot.data, src);
            slot.added = tick;
            slot.changed = tick;
            return slot.data;
        }

        // Relocates the value into uninitialized storage at dst. Returns false if absent.
        bool Remove(ResourceID id, void* dst)
        {
            if (!Contains(id))
                return false;

            Slot& slot = m_slots[id];
            slot.descriptor.Relocate(dst, slot.data);
            Deallocate(slot);
            return true;
        }

        STRATA_NODISCARD bool Contains(ResourceID id) const noexcept
        {
            return id < m_slots.size() && m_slots[id].data != nullptr;
        }

        STRATA_NODISCARD void* Get(ResourceID id) noexcept
        {
            return id < m_slots.size() ? m_slots[id].data : nullptr;
        }

        STRATA_NODISCARD const void* Get(ResourceID id) const noexcept
        {
            return id < m_slots.size() ? m_slots[id].data : nullptr;
        }

        STRATA_NODISCARD std::optional<Tick> GetChangedTick(ResourceID id) const noexcept
        {
            return Contains(id) ? std::optional<Tick>(m_slots[id].changed) : std::nullopt;
        }

        STRATA_NODISCARD std::optional<Tick> GetAddedTick(ResourceID id) const noexcept
        {
            return Contains(id) ? std::optional<Tick>(m_slots[id].added) : std::nullopt;
        }

        void SetChangedTick(ResourceID id, Tick tick) noexcept
        {
            if (Contains(id))
                m_slots[id].changed = tick;
        }

        void CheckTicks(Tick now) noexcept
        {
            for (Slot& slot : m_slots)
            {
                slot.added.CheckAge(now);
                slot.changed.CheckAge(now);
            }
        }

    private:
        struct Slot
        {
            std::byte* data = nullptr;
            ResourceDescriptor descriptor;
            Tick added;
            Tick changed;
        };

        static void Release(Slot& slot) noexcept
        {
            if (!slot.data)
                return;
            slot.descriptor.Drop(slot.data);
            Deallocate(slot);
        }

        static void Deallocate(Slot& slot) noexcept
        {
            ::operator delete(slot.data, std::align_val_t{slot.descriptor.alignment});
            slot.data = nullptr;
        }

        std::vector<Slot> m_slots;
    };
}
