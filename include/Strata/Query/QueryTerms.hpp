#pragma once

#include <cstddef>
#include <cstdint>
#include <tuple>
#include <type_traits>
#include <utility>

#include "../Component/Component.hpp"
#include "../Core/Tick.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityTable.hpp"
#include "../Storage/SparseSet.hpp"
#include "../Storage/Table.hpp"

namespace Strata
{
    // Query terms. A bare `T` fetches T&, `const T` fetches const T&.

    // Fetches T* (or const T*), nullptr when the entity has no T
    template<typename T> struct Optional {};

    // Requires T without fetching it
    template<typename T> struct With {};

    // Excludes entities that have T
    template<typename T> struct Not {};

    // Requires T and keeps only rows whose T was written since the query last ran
    template<typename T> struct Changed {};

    // Requires T and keeps only rows whose T was inserted since the query last ran
    template<typename T> struct Added {};

    // Keeps rows passing at least one of the filters (With, Not, Changed or Added)
    template<typename... Filters> struct Or {};

    // Change ticks of one query run
    struct QueryRun
    {
        Tick lastRun;
        Tick thisRun;
    };

    namespace Detail
    {
        enum class TermKind : std::uint8_t
        {
            Data,
            Optional,
            With,
            Without,
            Changed,
            Added,
            Or
        };

        template<typename Term>
        struct TermTraits
        {
            using ComponentType = std::remove_const_t<Term>;
            static constexpr TermKind KIND = TermKind::Data;
            static constexpr bool WRITE = !std::is_const_v<Term>;
            static constexpr bool DENSE = StorageKindOf<ComponentType>() == StorageKind::Dense;
            static constexpr std::size_t ID_COUNT = 1;
            using Item = std::conditional_t<WRITE, ComponentType&, const ComponentType&>;
        };

        template<typename T>
        struct TermTraits<Optional<T>>
        {
            using ComponentType = std::remove_const_t<T>;
            static constexpr TermKind KIND = TermKind::Optional;
            static constexpr bool WRITE = !std::is_const_v<T>;
            static constexpr bool DENSE = StorageKindOf<ComponentType>() == StorageKind::Dense;
            static constexpr std::size_t ID_COUNT = 1;
            using Item = std::conditional_t<WRITE, ComponentType*, const ComponentType*>;
        };

        template<typename T, TermKind Kind>
        struct FilterTermTraits
        {
            using ComponentType = std::remove_const_t<T>;
            static constexpr TermKind KIND = Kind;
            static constexpr bool WRITE = false;
            static constexpr bool DENSE = StorageKindOf<ComponentType>() == StorageKind::Dense;
            static constexpr std::size_t ID_COUNT = 1;
        };

        template<typename T> struct TermTraits<With<T>> : FilterTermTraits<T, TermKind::With> {};
        template<typename T> struct TermTraits<Not<T>> : FilterTermTraits<T, TermKind::Without> {};
        template<typename T> struct TermTraits<Changed<T>> : FilterTermTraits<T, TermKind::Changed> {};
        template<typename T> struct TermTraits<Added<T>> : FilterTermTraits<T, TermKind::Added> {};

        template<typename Term>
        inline constexpr bool IS_FILTER = TermTraits<Term>::KIND == TermKind::With || TermTraits<Term>::KIND == TermKind::Without ||
                                          TermTraits<Term>::KIND == TermKind::Changed || TermTraits<Term>::KIND == TermKind::Added;

        // One component id per alternative
        template<typename... Filters>
        struct TermTraits<Or<Filters...>>
        {
            static_assert(sizeof...(Filters) > 0, "Or needs at least one filter");
            static_assert((IS_FILTER<Filters> && ...), "Or only combines With, Not, Changed and Added");

            static constexpr TermKind KIND = TermKind::Or;
            static constexpr bool WRITE = false;
            static constexpr bool DENSE = (TermTraits<Filters>::DENSE && ...);
            static constexpr std::size_t ID_COUNT = sizeof...(Filters);

            template<typename Func>
            static void ForEachFilter(Func&& func)
            {
                (func.template operator()<Filters>(), ...);
            }
        };

        template<typename Term>
        inline constexpr bool IS_ITEM = TermTraits<Term>::KIND == TermKind::Data || TermTraits<Term>::KIND == TermKind::Optional;

        // Items a term contributes to a query row; filters contribute none
        template<typename Term, bool = IS_ITEM<Term>>
        struct TermItem
        {
            using Type = std::tuple<>;
        };

        template<typename Term>
        struct TermItem<Term, true>
        {
            using Type = std::tuple<typename TermTraits<Term>::Item>;
        };

        // Must the archetype contain the component?
        template<typename Term>
        inline constexpr bool IS_REQUIRED = TermTraits<Term>::KIND == TermKind::Data || TermTraits<Term>::KIND == TermKind::With ||
                                            TermTraits<Term>::KIND == TermKind::Changed || TermTraits<Term>::KIND == TermKind::Added;

        // Does the term read component data (values or ticks)?
        template<typename Term>
        inline constexpr bool ACCESSES_DATA = TermTraits<Term>::KIND != TermKind::With && TermTraits<Term>::KIND != TermKind::Without;

        template<typename Term>
        inline constexpr bool IS_DENSE = TermTraits<Term>::DENSE;

        template<typename Term>
        concept ValidTerm = TermTraits<Term>::KIND == TermKind::Or || Component<typename TermTraits<Term>::ComponentType>;

        /**
         * @brief Per-term cursor into the storage of one table or sparse set
         *
         * Dense components are read from the bound table's column, sparse ones
         * from the component's sparse set. Absent data reads as nullptr.
         */
        template<typename Term>
        struct TermFetch
        {
            using Traits = TermTraits<Term>;
            using C = typename Traits::ComponentType;

            Column* column = nullptr;
            SparseSet* sparse = nullptr;

            void Bind(Table& table, SparseSets& sets, const ComponentID* ids) noexcept
            {
                if constexpr (IS_DENSE<Term>)
                    column = table.GetColumn(ids[0]);
                else
                    sparse = sets.Get(ids[0]);
            }

            STRATA_FORCEINLINE C* Lookup(Entity entity, TableRow row) const noexcept
            {
                if constexpr (IS_DENSE<Term>)
                    return column ? static_cast<C*>(column->Get(row)) : nullptr;
                else
                    return sparse ? static_cast<C*>(sparse->Get(entity)) : nullptr;
            }

            // Row-level filter
            STRATA_FORCEINLINE bool Test(Entity entity, TableRow row, const QueryRun& run) const noexcept
            {
                if constexpr (Traits::KIND == TermKind::Data || Traits::KIND == TermKind::With)
                {
                    return Lookup(entity, row) != nullptr;
                }
                else if constexpr (Traits::KIND == TermKind::Without)
                {
                    return Lookup(entity, row) == nullptr;
                }
                else if constexpr (Traits::KIND == TermKind::Changed || Traits::KIND == TermKind::Added)
                {
                    constexpr bool added = Traits::KIND == TermKind::Added;
                    if constexpr (IS_DENSE<Term>)
                    {
                        if (!column)
                            return false;
                        Tick tick = added ? column->GetAddedTick(row) : column->GetChangedTick(row);
                        return tick.IsNewerThan(run.lastRun, run.thisRun);
                    }
                    else
                    {
                        if (!sparse)
                            return false;
                        auto tick = added ? sparse->GetAddedTick(entity) : sparse->GetChangedTick(entity);
                        return tick && tick->IsNewerThan(run.lastRun, run.thisRun);
                    }
                }
                else
                {
                    return true;
                }
            }

            template<typename T = Term>
            STRATA_FORCEINLINE typename TermTraits<T>::Item Fetch(Entity entity, TableRow row, const QueryRun& run) const noexcept
                requires (Traits::KIND == TermKind::Data || Traits::KIND == TermKind::Optional)
            {
                C* value = Lookup(entity, row);
                if constexpr (Traits::WRITE)
                {
                    if (value)
                        MarkChanged(entity, row, run.thisRun);
                }

                if constexpr (Traits::KIND == TermKind::Data)
                    return *value;
                else
                    return value;
            }

        private:
            void MarkChanged(Entity entity, TableRow row, Tick tick) const noexcept
            {
                if constexpr (IS_DENSE<Term>)
                    column->SetChangedTick(row, tick);
                else
                    sparse->SetChangedTick(entity, tick);
            }
        };

        // Binds every alternative and passes a row when any of them does
        template<typename... Filters>
        struct TermFetch<Or<Filters...>>
        {
            std::tuple<TermFetch<Filters>...> filters;

            void Bind(Table& table, SparseSets& sets, const ComponentID* ids) noexcept
            {
                BindAll(table, sets, ids, std::index_sequence_for<Filters...>{});
            }

            STRATA_FORCEINLINE bool Test(Entity entity, TableRow row, const QueryRun& run) const noexcept
            {
                return std::apply([&](const auto&... filter) { return (filter.Test(entity, row, run) || ...); }, filters);
            }

        private:
            template<std::size_t... Is>
            void BindAll(Table& table, SparseSets& sets, const ComponentID* ids, std::index_sequence<Is...>) noexcept
            {
                (std::get<Is>(filters).Bind(table, sets, ids + Is), ...);
            }
        };
    }
}
