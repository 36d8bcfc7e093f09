#pragma once

#include <atomic>
#include <cstdint>

#include "../Access/AccessMode.hpp"
#include "../Archetype/ArchetypeRegistry.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Contract.hpp"
#include "../Core/Tick.hpp"
#include "../Entity/EntityAllocator.hpp"
#include "../Storage/ResourceStorage.hpp"
#include "../Storage/SparseSet.hpp"
#include "../Storage/Table.hpp"

namespace Strata
{
    /**
     * @brief Everything a world owns, shared with queries and access windows
     *
     * Member order is construction order: tables, sparse sets and archetypes keep
     * a reference to the component registry.
     */
    struct WorldData
    {
        explicit WorldData(std::uint64_t maxEntityIndex)
            : entities(maxEntityIndex)
        {}

        WorldData(const WorldData&) = delete;
        WorldData& operator=(const WorldData&) = delete;

        ComponentRegistry registry;
        Tables tables{registry};
        SparseSets sparse{registry};
        ArchetypeRegistry archetypes{registry, tables};
        ResourceStorage resources;
        EntityAllocator entities;

        std::atomic<std::uint32_t> changeTick{1};
        Tick lastCheckTick{1};

        // Live access windows, one WINDOW_BITS counter per mode packed into one word
        std::atomic<std::uint64_t> windows{0};

        static constexpr unsigned WINDOW_BITS = 21;
        static constexpr std::uint64_t WINDOW_LIMIT = (std::uint64_t{1} << WINDOW_BITS) - 1;

        STRATA_NODISCARD Tick GetChangeTick() const noexcept
        {
            return Tick(changeTick.load(std::memory_order_acquire));
        }

        // Returns the tick before the increment
        Tick IncrementChangeTick() noexcept
        {
            return Tick(changeTick.fetch_add(1, std::memory_order_acq_rel));
        }

        STRATA_NODISCARD std::uint32_t GetWindowCount(AccessMode mode) const noexcept
        {
            return WindowCount(windows.load(std::memory_order_acquire), mode);
        }

        // Structural changes and new type registrations need every other window closed
        void VerifyStructuralAccess() const
        {
            const std::uint64_t state = windows.load(std::memory_order_acquire);
            STRATA_VERIFY(WindowCount(state, AccessMode::ReadOnly) == 0 && WindowCount(state, AccessMode::DataMut) == 0,
                "Structural change while a ReadOnly or DataMut access window is live");
        }

        template<Component T>
        ComponentID RegisterComponent()
        {
            if (auto id = registry.Find<T>())
                return *id;
            VerifyStructuralAccess();
            return registry.Register<T>();
        }

        template<Resource T>
        ResourceID RegisterResource()
        {
            if (auto id = registry.FindResource<T>())
                return *id;
            VerifyStructuralAccess();
            return registry.RegisterResource<T>();
        }

        // Checks and counts the window in one step, so two FullMut windows never both open
        void OpenWindow(AccessMode mode)
        {
            std::uint64_t state = windows.load(std::memory_order_acquire);
            for (;;)
            {
                STRATA_VERIFY(WindowCount(state, AccessMode::FullMut) == 0, "Access window opened while a FullMut window is live");
                if (mode == AccessMode::FullMut)
                {
                    STRATA_VERIFY(WindowCount(state, AccessMode::ReadOnly) == 0 && WindowCount(state, AccessMode::DataMut) == 0,
                        "FullMut window opened while a ReadOnly or DataMut access window is live");
                }
                STRATA_VERIFY(WindowCount(state, mode) < WINDOW_LIMIT, "Too many live access windows");

                if (windows.compare_exchange_weak(state, state + WindowUnit(mode), std::memory_order_acq_rel, std::memory_order_acquire))
                    return;
            }
        }

        void CloseWindow(AccessMode mode) noexcept
        {
            windows.fetch_sub(WindowUnit(mode), std::memory_order_acq_rel);
        }

    private:
        static constexpr std::uint64_t WindowUnit(AccessMode mode) noexcept
        {
            return std::uint64_t{1} << (static_cast<unsigned>(mode) * WINDOW_BITS);
        }

        static constexpr std::uint32_t WindowCount(std::uint64_t state, AccessMode mode) noexcept
        {
            return static_cast<std::uint32_t>((state >> (static_cast<unsigned>(mode) * WINDOW_BITS)) & WINDOW_LIMIT);
        }
    };
}
