#pragma once

#include <cstddef>
#include <iterator>
#include <tuple>
#include <utility>

#include "../Core/Contract.hpp"
#include "../Core/Profile.hpp"
#include "../World/WorldData.hpp"
#include "QueryState.hpp"
#include "QueryTerms.hpp"

namespace Strata
{
    /**
     * @brief Typed query bound to one world
     *
     * Items are `std::tuple<Entity, Items...>` where every data term contributes
     * one item (T& for `T`, const T& for `const T`, pointers for `Optional<T>`).
     * Filter terms contribute none.
     *
     * Iteration order is archetype creation order (table creation order when every
     * term is dense), then row order within each storage. Structural changes made
     * while iterating are not supported; apply them through a CommandBuffer instead.
     *
     * @code
     * auto query = world.Query<Position, const Velocity, Not<Frozen>>();
     * query.ForEach([](Entity entity, Position& position, const Velocity& velocity) { ... });
     * for (auto [entity, position, velocity] : query.Iter()) { ... }
     * @endcode
     */
    template<typename... Terms>
    class Query
    {
        using State = QueryState<Terms...>;
        using Fetches = std::tuple<Detail::TermFetch<Terms>...>;
        static constexpr auto TERM_INDICES = std::index_sequence_for<Terms...>{};

        template<std::size_t I>
        using TermAt = std::tuple_element_t<I, std::tuple<Terms...>>;

        // Iteration position inside one matched storage
        struct Cursor
        {
            Fetches fetches{};
            const Table* table = nullptr;
            const Archetype* archetype = nullptr;
            std::size_t size = 0;
        };

    public:
        static constexpr bool IS_DENSE = State::IS_DENSE;

        using ItemTuple = decltype(std::tuple_cat(
            std::declval<std::tuple<Entity>>(),
            std::declval<typename Detail::TermItem<Terms>::Type>()...));

        explicit Query(WorldData& data)
            : m_data(&data)
            , m_state(data)
        {}

        /**
         * @brief Call func(Entity, Items...) for every matching row
         *
         * Mutable items are stamped as changed at this run's tick.
         */
        template<typename Func>
        void ForEach(Func&& func)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("Query::ForEach", Profile::ColorQuery);

            const QueryRun run = BeginRun();
            for (StorageRef ref : m_state.GetStorages())
            {
                Cursor cursor;
                if (!Bind(cursor, ref))
                    continue;

                for (std::size_t i = 0; i < cursor.size; ++i)
                {
                    Entity entity;
                    TableRow row;
                    Resolve(cursor, i, entity, row);
                    if (!Passes(cursor.fetches, entity, row, run, TERM_INDICES))
                        continue;
                    std::apply(func, MakeItem(cursor.fetches, entity, row, run, TERM_INDICES));
                }
            }
        }

        class Iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using difference_type = std::ptrdiff_t;
            using value_type = ItemTuple;

            Iterator() = default;

            Iterator(Query* query, QueryRun run, std::size_t storage)
                : m_query(query), m_run(run), m_storage(storage)
            {
                if (m_storage < m_query->m_state.GetStorages().size())
                {
                    BindCurrent();
                    AdvanceToValid();
                }
            }

            value_type operator*() const
            {
                return m_query->MakeItem(m_cursor.fetches, m_entity, m_row, m_run, TERM_INDICES);
            }

            Iterator& operator++()
            {
                ++m_index;
                AdvanceToValid();
                return *this;
            }

            Iterator operator++(int)
            {
                Iterator previous = *this;
                ++*this;
                return previous;
            }

            bool operator==(const Iterator& other) const noexcept
            {
                return m_storage == other.m_storage && (IsEnd() || m_index == other.m_index);
            }

        private:
            bool IsEnd() const noexcept
            {
                return !m_query || m_storage >= m_query->m_state.GetStorages().size();
            }

            void BindCurrent()
            {
                m_index = 0;
                m_bound = m_query->Bind(m_cursor, m_query->m_state.GetStorages()[m_storage]);
            }

            void AdvanceToValid()
            {
                const std::size_t storageCount = m_query->m_state.GetStorages().size();
                while (m_storage < storageCount)
                {
                    if (m_bound)
                    {
                        for (; m_index < m_cursor.size; ++m_index)
                        {
                            m_query->Resolve(m_cursor, m_index, m_entity, m_row);
                            if (m_query->Passes(m_cursor.fetches, m_entity, m_row, m_run, TERM_INDICES))
                                return;
                        }
                    }

                    if (++m_storage < storageCount)
                        BindCurrent();
                }
                m_index = 0;
            }

            Query* m_query = nullptr;
            QueryRun m_run{};
            std::size_t m_storage = 0;
            std::size_t m_index = 0;
            Cursor m_cursor{};
            bool m_bound = false;
            Entity m_entity;
            TableRow m_row = INVALID_ROW;
        };

        /**
         * @brief Lazy, restartable sequence of items for one run
         *
         * Every call starts a new run: the storage cache is refreshed and the change
         * ticks used by Changed/Added advance.
         */
        class Range
        {
        public:
            Range(Query* query, QueryRun run) noexcept : m_query(query), m_run(run) {}

            STRATA_NODISCARD Iterator begin() const { return Iterator(m_query, m_run, 0); }
            STRATA_NODISCARD Iterator end() const { return Iterator(m_query, m_run, m_query->m_state.GetStorages().size()); }

        private:
            Query* m_query;
            QueryRun m_run;
        };

        STRATA_NODISCARD Range Iter()
        {
            return Range(this, BeginRun());
        }

        // Number of rows ForEach would visit. Does not advance change ticks.
        STRATA_NODISCARD std::size_t Count()
        {
            m_state.Update(m_data->archetypes);
            const QueryRun run{m_lastRun, m_data->GetChangeTick()};

            std::size_t count = 0;
            for (StorageRef ref : m_state.GetStorages())
            {
                Cursor cursor;
                if (!Bind(cursor, ref))
                    continue;
                for (std::size_t i = 0; i < cursor.size; ++i)
                {
                    Entity entity;
                    TableRow row;
                    Resolve(cursor, i, entity, row);
                    if (Passes(cursor.fetches, entity, row, run, TERM_INDICES))
                        ++count;
                }
            }
            return count;
        }

        STRATA_NODISCARD bool Empty() { return Count() == 0; }

        STRATA_NODISCARD const State& GetState() const noexcept { return m_state; }
        STRATA_NODISCARD const ClaimSet& GetClaims() const noexcept { return m_state.GetClaims(); }
        STRATA_NODISCARD Tick GetLastRun() const noexcept { return m_lastRun; }

    private:
        QueryRun BeginRun()
        {
            m_state.Update(m_data->archetypes);
            QueryRun run{m_lastRun, m_data->IncrementChangeTick()};
            m_lastRun = run.thisRun;
            return run;
        }

        bool Bind(Cursor& cursor, StorageRef ref)
        {
            Table* table = nullptr;
            if (ref.kind == StorageRef::Kind::Table)
            {
                table = &m_data->tables.Get(ref.index);
                cursor.archetype = nullptr;
                cursor.size = table->Size();
            }
            else
            {
                const Archetype& archetype = m_data->archetypes.Get(ref.index);
                table = &m_data->tables.Get(archetype.GetTableID());
                cursor.archetype = &archetype;
                cursor.size = archetype.Size();
            }
            cursor.table = table;
            if (cursor.size == 0)
                return false;

            BindFetches(cursor.fetches, *table, TERM_INDICES);
            return true;
        }

        template<std::size_t... Is>
        void BindFetches(Fetches& fetches, Table& table, std::index_sequence<Is...>)
        {
            const auto& ids = m_state.GetComponentIDs();
            (std::get<Is>(fetches).Bind(table, m_data->sparse, ids.data() + State::ID_OFFSETS[Is]), ...);
        }

        // Maps the i-th position of a cursor to an entity and its table row
        void Resolve(const Cursor& cursor, std::size_t i, Entity& entity, TableRow& row) const
        {
            if (!cursor.archetype)
            {
                entity = cursor.table->GetEntity(static_cast<TableRow>(i));
                row = static_cast<TableRow>(i);
                return;
            }

            entity = cursor.archetype->GetEntity(static_cast<ArchetypeRow>(i));
            auto location = m_data->entities.Resolve(entity);
            STRATA_VERIFY(location && location->archetype == cursor.archetype->GetID(), "Archetype entity list out of sync with the entity table");
            row = location->tableRow;
        }

        template<std::size_t... Is>
        static bool Passes(const Fetches& fetches, Entity entity, TableRow row, const QueryRun& run, std::index_sequence<Is...>) noexcept
        {
            return (std::get<Is>(fetches).Test(entity, row, run) && ...);
        }

        template<std::size_t I>
        static auto FetchItem(const Fetches& fetches, Entity entity, TableRow row, const QueryRun& run)
        {
            if constexpr (Detail::IS_ITEM<TermAt<I>>)
                return std::tuple<typename Detail::TermTraits<TermAt<I>>::Item>(std::get<I>(fetches).Fetch(entity, row, run));
            else
                return std::tuple<>();
        }

        template<std::size_t... Is>
        static ItemTuple MakeItem(const Fetches& fetches, Entity entity, TableRow row, const QueryRun& run, std::index_sequence<Is...>)
        {
            return std::tuple_cat(std::tuple<Entity>(entity), FetchItem<Is>(fetches, entity, row, run)...);
        }

        WorldData* m_data;
        State m_state;
        Tick m_lastRun{0};
    };
}
