#pragma once

#include <concepts>
#include <type_traits>

#include "../Access/AccessMode.hpp"
#include "../Access/ClaimSet.hpp"
#include "../Commands/CommandBuffer.hpp"
#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Contract.hpp"
#include "../Query/Query.hpp"
#include "../Query/QueryState.hpp"
#include "../World/World.hpp"

namespace Strata
{
    // Shared access to resource T. The resource must exist when the parameter is fetched.
    template<Resource T>
    class Res
    {
    public:
        explicit Res(const T& value) noexcept : m_value(&value) {}

        STRATA_NODISCARD const T& Get() const noexcept { return *m_value; }
        const T& operator*() const noexcept { return *m_value; }
        const T* operator->() const noexcept { return m_value; }

    private:
        const T* m_value;
    };

    // Exclusive access to resource T. Fetching marks it as changed.
    template<Resource T>
    class ResMut
    {
    public:
        explicit ResMut(T& value) noexcept : m_value(&value) {}

        STRATA_NODISCARD T& Get() const noexcept { return *m_value; }
        T& operator*() const noexcept { return *m_value; }
        T* operator->() const noexcept { return m_value; }

    private:
        T* m_value;
    };

    // Pins the system to the thread that owns the world
    struct MainThread {};

    /**
     * @brief Access declaration of one system parameter type
     *
     * MODE is the lowest access mode the parameter needs, MAIN_THREAD whether it
     * must run on the owning thread. MarkAccess() adds the parameter's claims,
     * registering the types it touches, and Fetch() builds the parameter value.
     */
    template<typename Param>
    struct SystemParamTraits;

    template<Resource T>
    struct SystemParamTraits<Res<T>>
    {
        static constexpr AccessMode MODE = AccessMode::ReadOnly;
        static constexpr bool MAIN_THREAD = false;

        static void MarkAccess(ClaimSet& claims, World& world) { claims.ReadResource(world.RegisterResource<T>()); }

        static Res<T> Fetch(World& world)
        {
            const T* value = world.GetResource<T>();
            STRATA_VERIFY(value != nullptr, "System parameter Res<T> needs a resource that is not present");
            return Res<T>(*value);
        }
    };

    template<Resource T>
    struct SystemParamTraits<ResMut<T>>
    {
        static constexpr AccessMode MODE = AccessMode::DataMut;
        static constexpr bool MAIN_THREAD = false;

        static void MarkAccess(ClaimSet& claims, World& world) { claims.WriteResource(world.RegisterResource<T>()); }

        static ResMut<T> Fetch(World& world)
        {
            T* value = world.GetResourceMut<T>();
            STRATA_VERIFY(value != nullptr, "System parameter ResMut<T> needs a resource that is not present");
            return ResMut<T>(*value);
        }
    };

    template<typename... Terms>
    struct SystemParamTraits<Query<Terms...>>
    {
        static constexpr AccessMode MODE = (Detail::TermTraits<Terms>::WRITE || ...) ? AccessMode::DataMut : AccessMode::ReadOnly;
        static constexpr bool MAIN_THREAD = false;

        static void MarkAccess(ClaimSet& claims, World& world)
        {
            claims.Merge(QueryState<Terms...>(world.GetData()).GetClaims());
        }

        static Query<Terms...> Fetch(World& world) { return world.Query<Terms...>(); }
    };

    // Recording commands touches no world data; applying them happens at the sync point
    template<>
    struct SystemParamTraits<CommandBuffer>
    {
        static constexpr AccessMode MODE = AccessMode::ReadOnly;
        static constexpr bool MAIN_THREAD = false;

        static void MarkAccess(ClaimSet&, World&) noexcept {}

        static CommandBuffer Fetch(World& world) { return CommandBuffer(world); }
    };

    template<>
    struct SystemParamTraits<MainThread>
    {
        static constexpr AccessMode MODE = AccessMode::ReadOnly;
        static constexpr bool MAIN_THREAD = true;

        static void MarkAccess(ClaimSet& claims, World&) noexcept { claims.SetMainThread(); }

        static MainThread Fetch(World&) noexcept { return {}; }
    };

    // Read access to everything in the world
    template<>
    struct SystemParamTraits<const World&>
    {
        static constexpr AccessMode MODE = AccessMode::ReadOnly;
        static constexpr bool MAIN_THREAD = false;

        static void MarkAccess(ClaimSet& claims, World&) noexcept { claims.ReadAll(); }

        static const World& Fetch(World& world) noexcept { return world; }
    };

    // Exclusive access: the system may change structure and runs alone on the owning thread
    template<>
    struct SystemParamTraits<World&>
    {
        static constexpr AccessMode MODE = AccessMode::FullMut;
        static constexpr bool MAIN_THREAD = true;

        static void MarkAccess(ClaimSet& claims, World&) noexcept
        {
            claims.SetExclusive();
            claims.SetMainThread();
        }

        static World& Fetch(World& world) noexcept { return world; }
    };

    template<typename Param>
    concept SystemParam = requires(ClaimSet& claims, World& world) {
        { SystemParamTraits<Param>::MODE } -> std::convertible_to<AccessMode>;
        SystemParamTraits<Param>::MarkAccess(claims, world);
        SystemParamTraits<Param>::Fetch(world);
    };

    /**
     * @brief Combined access of a system taking Params...
     *
     * The system's mode is the maximum over its parameters. Build() is meant to
     * run once, when the system is registered with an executor.
     *
     * @code
     * ClaimSet physics = SystemAccess<Query<Position, const Velocity>, Res<Gravity>>::Build(world);
     * ClaimSet render = SystemAccess<Query<const Position>, MainThread>::Build(world);
     * bool serial = Conflicts(physics, render);    // true: Position is written by one and read by the other
     * @endcode
     */
    template<SystemParam... Params>
    struct SystemAccess
    {
        static constexpr AccessMode MODE = [] {
            AccessMode mode = AccessMode::ReadOnly;
            ((mode = Merge(mode, SystemParamTraits<Params>::MODE)), ...);
            return mode;
        }();

        static constexpr bool MAIN_THREAD = (SystemParamTraits<Params>::MAIN_THREAD || ...);

        static ClaimSet Build(World& world)
        {
            ClaimSet claims;
            (SystemParamTraits<Params>::MarkAccess(claims, world), ...);
            claims.RaiseMode(MODE);
            if constexpr (MAIN_THREAD)
                claims.SetMainThread();
            return claims;
        }
    };
}
