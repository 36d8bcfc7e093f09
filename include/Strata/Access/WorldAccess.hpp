#pragma once

#include <utility>

#include "../Core/Base.hpp"
#include "../World/World.hpp"
#include "AccessMode.hpp"

namespace Strata
{
    /**
     * @brief Capability to use a world at a given access mode
     *
     * The mode is checked once, when the window opens: a FullMut window requires
     * every other window to be closed, and no window opens while a FullMut one is
     * live. Accessors above the granted mode do not compile. Closing happens on
     * destruction.
     *
     * @code
     * {
     *     auto access = world.Access<AccessMode::DataMut>();
     *     access.DataMut().Query<Position>().ForEach(...);
     * }
     * @endcode
     */
    template<AccessMode Mode>
    class WorldAccess
    {
    public:
        explicit WorldAccess(World& world)
            : m_world(&world)
        {
            world.GetData().OpenWindow(Mode);
        }

        ~WorldAccess()
        {
            if (m_world)
                m_world->GetData().CloseWindow(Mode);
        }

        WorldAccess(const WorldAccess&) = delete;
        WorldAccess& operator=(const WorldAccess&) = delete;

        WorldAccess(WorldAccess&& other) noexcept
            : m_world(std::exchange(other.m_world, nullptr))
        {}

        WorldAccess& operator=(WorldAccess&&) = delete;

        STRATA_NODISCARD const World& ReadOnly() const noexcept { return *m_world; }

        STRATA_NODISCARD World& DataMut() const noexcept
            requires (Mode >= AccessMode::DataMut)
        {
            return *m_world;
        }

        STRATA_NODISCARD World& FullMut() const noexcept
            requires (Mode == AccessMode::FullMut)
        {
            return *m_world;
        }

        STRATA_NODISCARD static constexpr AccessMode GetMode() noexcept { return Mode; }

    private:
        World* m_world;
    };
}
