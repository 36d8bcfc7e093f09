#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Access/AccessMode.hpp"
#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Component/RequiredComponents.hpp"
#include "../Core/Contract.hpp"
#include "../Core/Error.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Core/Tick.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityAllocator.hpp"
#include "../Query/Query.hpp"
#include "WorldData.hpp"

namespace Strata
{
    class CommandBuffer;

    template<AccessMode Mode>
    class WorldAccess;

    namespace Detail
    {
        // One value of a spawn or insert bundle
        struct BundleValue
        {
            ComponentID id;
            StorageKind storage;
            void* value;
            // Pulled in by a Required list; never overwrites a value the entity has
            bool required;
        };
    }

    /**
     * @brief Owner of every entity, component, resource and storage structure
     *
     * Structural operations (Spawn, Despawn, Insert of a new component, Remove,
     * Flush, Apply) need FullMut access: they verify that no ReadOnly or DataMut
     * window is live. Value access (Get, GetMut, queries) is unchecked per call;
     * callers coordinate through access windows and claim sets.
     *
     * @code
     * World world;
     * Entity entity = *world.Spawn(Position{0, 0}, Velocity{1, 0});
     * world.Query<Position, const Velocity>().ForEach([](Entity, Position& p, const Velocity& v) { p.x += v.dx; });
     * @endcode
     */
    class World
    {
    public:
        struct Config
        {
            // Highest entity index the allocator may hand out
            std::uint64_t maxEntityIndex = config::MAX_ENTITY_INDEX;
        };

        World() : World(Config{}) {}

        explicit World(const Config& config)
            : m_data(std::make_unique<WorldData>(config.maxEntityIndex))
        {
            Log::Debug("World", "Created world with entity index limit " + std::to_string(config.maxEntityIndex));
        }

        ~World() = default;

        World(const World&) = delete;
        World& operator=(const World&) = delete;
        World(World&&) noexcept = default;
        World& operator=(World&&) noexcept = default;

        // ============= Entities =============

        /**
         * @brief Create an entity holding the given components
         *
         * Every component type may appear once. Components required by the given
         * ones and not given explicitly are default-constructed. Fails with
         * ErrorCode::CapacityExceeded when the entity index space is exhausted.
         */
        template<typename... Ts>
            requires (Component<std::decay_t<Ts>> && ...)
        Result<Entity> Spawn(Ts&&... values)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Spawn", Profile::ColorEntity);
            m_data->VerifyStructuralAccess();

            auto bundle = Detail::MakeRequiredBundle(std::forward<Ts>(values)...);
            constexpr std::size_t count = std::tuple_size_v<decltype(bundle)>;
            auto entries = MakeBundle(bundle, std::make_index_sequence<count>{}, sizeof...(Ts));
            SortBundle(entries);

            auto entity = m_data->entities.Allocate();
            if (!entity)
                return Err(entity.Error());

            std::array<ComponentID, count> ids{};
            std::array<void*, count> dense{};
            std::size_t denseCount = 0;
            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                ids[i] = entries[i].id;
                if (entries[i].storage == StorageKind::Dense)
                    dense[denseCount++] = entries[i].value;
            }

            const ArchetypeID archetypeId = m_data->archetypes.GetOrCreate(ids);
            Archetype& archetype = m_data->archetypes.Get(archetypeId);
            Table& table = m_data->tables.Get(archetype.GetTableID());
            const Tick tick = m_data->GetChangeTick();

            EntityLocation location;
            location.archetype = archetypeId;
            location.table = archetype.GetTableID();
            location.tableRow = table.PushRow(*entity, std::span<void* const>(dense.data(), denseCount), tick);
            location.archetypeRow = archetype.PushEntity(*entity);

            for (const Detail::BundleValue& entry : entries)
            {
                if (entry.storage == StorageKind::Sparse)
                    m_data->sparse.GetOrCreate(entry.id).Insert(*entity, entry.value, tick);
            }

            m_data->entities.Commit(*entity, location);
            return *entity;
        }

        /**
         * @brief Destroy an entity and drop all of its components
         * @return false if the entity was already dead
         */
        bool Despawn(Entity entity)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Despawn", Profile::ColorEntity);
            m_data->VerifyStructuralAccess();

            auto location = m_data->entities.Resolve(entity);
            if (!location)
                return false;

            Archetype& archetype = m_data->archetypes.Get(location->archetype);
            for (ComponentID id : archetype.GetSparseComponents())
            {
                SparseSet* set = m_data->sparse.Get(id);
                const bool erased = set && set->Erase(entity);
                STRATA_VERIFY(erased, "Archetype lists a sparse component the entity does not have");
            }

            if (auto swapped = archetype.SwapRemove(location->archetypeRow))
                PatchArchetypeRow(*swapped, location->archetypeRow);

            Table& table = m_data->tables.Get(location->table);
            if (auto swapped = table.SwapRemoveRow(location->tableRow))
                PatchTableRow(*swapped, location->tableRow);

            const bool freed = m_data->entities.Free(entity);
            STRATA_VERIFY(freed, "Resolved entity could not be freed");
            return true;
        }

        STRATA_NODISCARD bool IsAlive(Entity entity) const noexcept
        {
            return m_data->entities.IsAlive(entity);
        }

        STRATA_NODISCARD std::optional<EntityLocation> GetLocation(Entity entity) const noexcept
        {
            return m_data->entities.Resolve(entity);
        }

        // ============= Components =============

        /**
         * @brief Add a component to an entity, or replace the value it already has
         *
         * Adding a new component moves the entity to the next archetype through the
         * transition edge cache. Fails with ErrorCode::EntityNotFound on a dead entity.
         */
        template<typename T>
            requires Component<std::decay_t<T>>
        Result<void> Insert(Entity entity, T&& value)
        {
            using C = std::decay_t<T>;
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Insert", Profile::ColorComponent);

            const ComponentID id = m_data->RegisterComponent<C>();
            auto location = m_data->entities.Resolve(entity);
            if (!location)
                return Err(MakeError(ErrorCode::EntityNotFound, "Insert on a dead entity"));

            if constexpr (Detail::HAS_REQUIRED<C>)
                return InsertBundle(entity, std::forward<T>(value));

            C local(std::forward<T>(value));
            const Tick tick = m_data->GetChangeTick();

            if (m_data->archetypes.Get(location->archetype).HasComponent(id))
            {
                ReplaceValue(entity, *location, id, &local, tick);
                return Ok();
            }

            m_data->VerifyStructuralAccess();
            const ArchetypeID target = m_data->archetypes.Transition(location->archetype, id, std::nullopt);
            if constexpr (StorageKindOf<C>() == StorageKind::Dense)
            {
                void* missing[] = {&local};
                MoveEntity(entity, *location, target, missing, tick);
            }
            else
            {
                MoveEntity(entity, *location, target, {}, tick);
                m_data->sparse.GetOrCreate(id).Insert(entity, &local, tick);
            }
            return Ok();
        }

        /**
         * @brief Add several components with a single archetype move
         *
         * Components the entity already has are replaced in place. Required
         * components are added only where the entity lacks them.
         */
        template<typename... Ts>
            requires (Component<std::decay_t<Ts>> && ...)
        Result<void> InsertBundle(Entity entity, Ts&&... values)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::InsertBundle", Profile::ColorComponent);

            auto bundle = Detail::MakeRequiredBundle(std::forward<Ts>(values)...);
            constexpr std::size_t count = std::tuple_size_v<decltype(bundle)>;
            auto entries = MakeBundle(bundle, std::make_index_sequence<count>{}, sizeof...(Ts));
            SortBundle(entries);

            auto location = m_data->entities.Resolve(entity);
            if (!location)
                return Err(MakeError(ErrorCode::EntityNotFound, "Insert on a dead entity"));

            const Archetype& source = m_data->archetypes.Get(location->archetype);
            const Tick tick = m_data->GetChangeTick();

            std::vector<ComponentID> components(source.GetComponents().begin(), source.GetComponents().end());
            std::array<void*, count> missing{};
            std::size_t missingCount = 0;
            bool grows = false;
            for (const Detail::BundleValue& entry : entries)
            {
                if (source.HasComponent(entry.id))
                    continue;
                grows = true;
                components.push_back(entry.id);
                if (entry.storage == StorageKind::Dense)
                    missing[missingCount++] = entry.value;
            }

            if (grows)
            {
                m_data->VerifyStructuralAccess();
                const ArchetypeID target = m_data->archetypes.GetOrCreate(components);
                MoveEntity(entity, *location, target, std::span<void* const>(missing.data(), missingCount), tick);

                for (const Detail::BundleValue& entry : entries)
                {
                    if (source.HasComponent(entry.id))
                    {
                        if (!entry.required)
                            ReplaceValue(entity, *location, entry.id, entry.value, tick);
                    }
                    else if (entry.storage == StorageKind::Sparse)
                        m_data->sparse.GetOrCreate(entry.id).Insert(entity, entry.value, tick);
                }
            }
            else
            {
                for (const Detail::BundleValue& entry : entries)
                {
                    if (!entry.required)
                        ReplaceValue(entity, *location, entry.id, entry.value, tick);
                }
            }
            return Ok();
        }

        /**
         * @brief Take a component out of an entity
         * @return The removed value, or std::nullopt if the entity is dead or lacks T
         */
        template<Component T>
        std::optional<T> Remove(Entity entity)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Remove", Profile::ColorComponent);

            auto id = m_data->registry.Find<T>();
            if (!id)
                return std::nullopt;

            auto location = m_data->entities.Resolve(entity);
            if (!location || !m_data->archetypes.Get(location->archetype).HasComponent(*id))
                return std::nullopt;

            m_data->VerifyStructuralAccess();
            const ArchetypeID target = m_data->archetypes.Transition(location->archetype, std::nullopt, *id);
            const Tick tick = m_data->GetChangeTick();

            if constexpr (StorageKindOf<T>() == StorageKind::Dense)
            {
                Column* column = m_data->tables.Get(location->table).GetColumn(*id);
                STRATA_VERIFY(column != nullptr, "Archetype lists a dense component its table does not store");

                // The moved-from value is dropped with the rest of the source-only columns
                std::optional<T> result(std::move(*static_cast<T*>(column->Get(location->tableRow))));
                MoveEntity(entity, *location, target, {}, tick);
                return result;
            }
            else
            {
                SparseSet* set = m_data->sparse.Get(*id);
                alignas(T) std::byte storage[sizeof(T)];
                const bool removed = set && set->Remove(entity, storage);
                STRATA_VERIFY(removed, "Archetype lists a sparse component the entity does not have");

                T* value = std::launder(reinterpret_cast<T*>(storage));
                std::optional<T> result(std::move(*value));
                value->~T();
                MoveEntity(entity, *location, target, {}, tick);
                return result;
            }
        }

        // Returns nullptr if the entity is dead or has no T
        template<Component T>
        STRATA_NODISCARD const T* Get(Entity entity) const
        {
            auto id = m_data->registry.Find<T>();
            if (!id)
                return nullptr;
            return static_cast<const T*>(Lookup(entity, *id));
        }

        // Like Get, and marks the component as changed at the current tick
        template<Component T>
        STRATA_NODISCARD T* GetMut(Entity entity)
        {
            auto id = m_data->registry.Find<T>();
            if (!id)
                return nullptr;

            auto location = m_data->entities.Resolve(entity);
            if (!location || !m_data->archetypes.Get(location->archetype).HasComponent(*id))
                return nullptr;

            const Tick tick = m_data->GetChangeTick();
            if constexpr (StorageKindOf<T>() == StorageKind::Dense)
            {
                Column* column = m_data->tables.Get(location->table).GetColumn(*id);
                column->SetChangedTick(location->tableRow, tick);
                return static_cast<T*>(column->Get(location->tableRow));
            }
            else
            {
                SparseSet* set = m_data->sparse.Get(*id);
                set->SetChangedTick(entity, tick);
                return static_cast<T*>(set->Get(entity));
            }
        }

        template<Component T>
        STRATA_NODISCARD bool Has(Entity entity) const
        {
            return Get<T>(entity) != nullptr;
        }

        /**
         * @brief Build a query handle for the given terms
         *
         * The handle keeps its matching state; reuse it across frames so that only
         * archetypes created since its last run are examined.
         */
        template<typename... Terms>
        STRATA_NODISCARD Strata::Query<Terms...> Query()
        {
            return Strata::Query<Terms...>(*m_data);
        }

        /**
         * @brief Read-only query, reachable from a const world such as a ReadOnly window
         *
         * Every term must be read-only. The component types must already be
         * registered when a ReadOnly or DataMut window is live.
         */
        template<typename... Terms>
            requires (!Detail::TermTraits<Terms>::WRITE && ...)
        STRATA_NODISCARD Strata::Query<Terms...> Query() const
        {
            return Strata::Query<Terms...>(*m_data);
        }

        // ============= Resources =============

        // Inserts or replaces the resource and returns the stored value
        template<typename T>
            requires Resource<std::decay_t<T>>
        std::decay_t<T>& InsertResource(T&& value)
        {
            using R = std::decay_t<T>;
            const ResourceID id = m_data->RegisterResource<R>();
            R local(std::forward<T>(value));
            void* stored = m_data->resources.Insert(m_data->registry.GetResourceDescriptor(id), &local, m_data->GetChangeTick());
            return *static_cast<R*>(stored);
        }

        template<Resource T>
        std::optional<T> RemoveResource()
        {
            auto id = m_data->registry.FindResource<T>();
            if (!id)
                return std::nullopt;

            alignas(T) std::byte storage[sizeof(T)];
            if (!m_data->resources.Remove(*id, storage))
                return std::nullopt;

            T* value = std::launder(reinterpret_cast<T*>(storage));
            std::optional<T> result(std::move(*value));
            value->~T();
            return result;
        }

        template<Resource T>
        STRATA_NODISCARD const T* GetResource() const
        {
            auto id = m_data->registry.FindResource<T>();
            return id ? static_cast<const T*>(m_data->resources.Get(*id)) : nullptr;
        }

        template<Resource T>
        STRATA_NODISCARD T* GetResourceMut()
        {
            auto id = m_data->registry.FindResource<T>();
            if (!id)
                return nullptr;
            m_data->resources.SetChangedTick(*id, m_data->GetChangeTick());
            return static_cast<T*>(m_data->resources.Get(*id));
        }

        template<Resource T>
        STRATA_NODISCARD bool HasResource() const
        {
            return GetResource<T>() != nullptr;
        }

        // ============= Registry =============

        template<Component T>
        ComponentID Register()
        {
            return m_data->RegisterComponent<T>();
        }

        template<Resource T>
        ResourceID RegisterResource()
        {
            return m_data->RegisterResource<T>();
        }

        // Descriptor lookup for collaborators that handle components generically
        STRATA_NODISCARD const ComponentRegistry& GetComponents() const noexcept { return m_data->registry; }

        // ============= Deferred work =============

        // Handle for reserving entity ids from other threads
        STRATA_NODISCARD RemoteAllocator GetRemoteAllocator() const noexcept
        {
            return m_data->entities.GetRemote();
        }

        /**
         * @brief Commit every remotely reserved entity
         *
         * Reserved entities become alive with no components.
         */
        void Flush()
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Flush", Profile::ColorCommands);
            m_data->VerifyStructuralAccess();

            Archetype& archetype = m_data->archetypes.Get(EMPTY_ARCHETYPE);
            Table& table = m_data->tables.Get(EMPTY_TABLE);
            const Tick tick = m_data->GetChangeTick();

            m_data->entities.FlushReserved([&](Entity entity) {
                EntityLocation location;
                location.archetype = EMPTY_ARCHETYPE;
                location.table = EMPTY_TABLE;
                location.tableRow = table.PushRow(entity, {}, tick);
                location.archetypeRow = archetype.PushEntity(entity);
                m_data->entities.Commit(entity, location);
            });
        }

        // Flushes reserved entities, then runs the buffer's commands in recording order
        void Apply(CommandBuffer& buffer);

        // ============= Access =============

        template<AccessMode Mode>
        STRATA_NODISCARD WorldAccess<Mode> Access()
        {
            return WorldAccess<Mode>(*this);
        }

        // ============= Change ticks =============

        STRATA_NODISCARD Tick GetChangeTick() const noexcept { return m_data->GetChangeTick(); }

        // Returns the tick before the increment
        Tick IncrementChangeTick() noexcept { return m_data->IncrementChangeTick(); }

        /**
         * @brief Clamp stored ticks that are about to age past Tick::MAX_AGE
         *
         * Cheap when called often: the scan only runs once per Tick::CHECK_CYCLE ticks.
         */
        void CheckChangeTicks()
        {
            const Tick now = m_data->GetChangeTick();
            if (now.RelativeTo(m_data->lastCheckTick).Get() < Tick::CHECK_CYCLE)
                return;

            STRATA_PROFILE_ZONE_NAMED("World::CheckChangeTicks");
            m_data->tables.CheckTicks(now);
            m_data->sparse.CheckTicks(now);
            m_data->resources.CheckTicks(now);
            m_data->lastCheckTick = now;
        }

        // ============= Statistics =============

        STRATA_NODISCARD std::size_t EntityCount() const noexcept { return m_data->entities.AliveCount(); }
        STRATA_NODISCARD std::size_t ArchetypeCount() const noexcept { return m_data->archetypes.Size(); }
        STRATA_NODISCARD std::size_t TableCount() const noexcept { return m_data->tables.Size(); }

        STRATA_NODISCARD WorldData& GetData() noexcept { return *m_data; }
        STRATA_NODISCARD const WorldData& GetData() const noexcept { return *m_data; }

    private:
        template<typename Tuple, std::size_t... Is>
        std::array<Detail::BundleValue, sizeof...(Is)> MakeBundle(Tuple& bundle, std::index_sequence<Is...>, std::size_t explicitCount)
        {
            return {Detail::BundleValue{
                m_data->RegisterComponent<std::tuple_element_t<Is, Tuple>>(),
                StorageKindOf<std::tuple_element_t<Is, Tuple>>(),
                &std::get<Is>(bundle),
                Is >= explicitCount}...};
        }

        template<std::size_t N>
        static void SortBundle(std::array<Detail::BundleValue, N>& entries)
        {
            std::sort(entries.begin(), entries.end(),
                [](const Detail::BundleValue& a, const Detail::BundleValue& b) { return a.id < b.id; });
            for (std::size_t i = 1; i < N; ++i)
                STRATA_VERIFY(entries[i - 1].id != entries[i].id, "A component type appears twice in one bundle");
        }

        const void* Lookup(Entity entity, ComponentID id) const
        {
            auto location = m_data->entities.Resolve(entity);
            if (!location || !m_data->archetypes.Get(location->archetype).HasComponent(id))
                return nullptr;

            if (const Column* column = m_data->tables.Get(location->table).GetColumn(id))
                return column->Get(location->tableRow);

            const SparseSet* set = m_data->sparse.Get(id);
            return set ? set->Get(entity) : nullptr;
        }

        // Overwrites a component the entity already has
        void ReplaceValue(Entity entity, const EntityLocation& location, ComponentID id, void* value, Tick tick)
        {
            if (Column* column = m_data->tables.Get(location.table).GetColumn(id))
            {
                column->Replace(location.tableRow, value, tick);
                return;
            }
            m_data->sparse.GetOrCreate(id).Insert(entity, value, tick);
        }

        /**
         * @brief Move an entity to another archetype, migrating its table row when the
         * dense component set changes
         *
         * Sparse values are untouched; callers attach or detach them separately.
         * `location` is updated to the new location.
         */
        void MoveEntity(Entity entity, EntityLocation& location, ArchetypeID target, std::span<void* const> missing, Tick tick)
        {
            if (target == location.archetype)
            {
                STRATA_VERIFY(missing.empty(), "Values passed for an archetype move that adds nothing");
                return;
            }

            Archetype& source = m_data->archetypes.Get(location.archetype);
            Archetype& destination = m_data->archetypes.Get(target);

            if (auto swapped = source.SwapRemove(location.archetypeRow))
                PatchArchetypeRow(*swapped, location.archetypeRow);

            EntityLocation next;
            next.archetype = target;
            next.archetypeRow = destination.PushEntity(entity);
            next.table = destination.GetTableID();
            next.tableRow = location.tableRow;

            if (next.table != location.table)
            {
                Table& from = m_data->tables.Get(location.table);
                Table& to = m_data->tables.Get(next.table);
                TableMove move = from.MoveRowTo(location.tableRow, to, missing, tick);
                next.tableRow = move.newRow;
                if (move.swapped)
                    PatchTableRow(*move.swapped, location.tableRow);
            }
            else
            {
                STRATA_VERIFY(missing.empty(), "Dense values passed for a move that keeps the table");
            }

            m_data->entities.SetLocation(entity, next);
            location = next;
        }

        void PatchArchetypeRow(Entity entity, ArchetypeRow row)
        {
            auto location = m_data->entities.Resolve(entity);
            STRATA_VERIFY(location.has_value(), "Archetype holds an entity that is not alive");
            location->archetypeRow = row;
            m_data->entities.SetLocation(entity, *location);
        }

        void PatchTableRow(Entity entity, TableRow row)
        {
            auto location = m_data->entities.Resolve(entity);
            STRATA_VERIFY(location.has_value(), "Table holds an entity that is not alive");
            location->tableRow = row;
            m_data->entities.SetLocation(entity, *location);
        }

        std::unique_ptr<WorldData> m_data;
    };
}

#include "../Access/WorldAccess.hpp"
#include "../Commands/CommandBuffer.hpp"
