#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityAllocator.hpp"
#include "../World/World.hpp"

namespace Strata
{
    namespace Commands
    {
        // A recorded structural change, applied later on the owning thread
        class ICommand
        {
        public:
            virtual ~ICommand() = default;
            virtual void Apply(World& world) = 0;
        };

        template<typename Func>
        class Deferred final : public ICommand
        {
        public:
            explicit Deferred(Func func) : m_func(std::move(func)) {}

            void Apply(World& world) override { m_func(world); }

        private:
            Func m_func;
        };

        inline void Report(const char* command, Entity entity, const Error& error)
        {
            Log::Warn("Commands", std::string(command) + " skipped for entity " + std::to_string(entity.GetIndex()) +
                ": " + error.message);
        }
    }

    /**
     * @brief Records structural changes to apply at a synchronization point
     *
     * Spawned entities get their id immediately from the world's remote
     * allocator, so later commands in the same buffer (or other buffers) can
     * refer to them. A buffer is filled by one thread at a time; use one buffer
     * per worker. Commands run in recording order when the world applies the
     * buffer, and commands that target entities which died in the meantime are
     * skipped.
     *
     * @code
     * CommandBuffer commands(world);
     * Entity bullet = *commands.Spawn(Position{0, 0}, Velocity{0, 10});
     * commands.Despawn(target);
     * world.Apply(commands);
     * @endcode
     */
    class CommandBuffer
    {
    public:
        explicit CommandBuffer(const World& world)
            : m_allocator(world.GetRemoteAllocator())
        {}

        explicit CommandBuffer(RemoteAllocator allocator)
            : m_allocator(std::move(allocator))
        {}

        CommandBuffer(const CommandBuffer&) = delete;
        CommandBuffer& operator=(const CommandBuffer&) = delete;
        CommandBuffer(CommandBuffer&&) noexcept = default;
        CommandBuffer& operator=(CommandBuffer&&) noexcept = default;

        /**
         * @brief Reserve an entity now and record its components for later
         *
         * The entity resolves only after the world applied this buffer. Fails with
         * ErrorCode::CapacityExceeded when no index can be reserved.
         */
        template<typename... Ts>
            requires (Component<std::decay_t<Ts>> && ...)
        Result<Entity> Spawn(Ts&&... values)
        {
            auto reserved = m_allocator.Reserve();
            if (!reserved)
                return reserved;

            if constexpr (sizeof...(Ts) > 0)
            {
                Record([entity = *reserved, bundle = std::tuple<std::decay_t<Ts>...>(std::forward<Ts>(values)...)](World& world) mutable {
                    auto result = std::apply([&](auto&... components) { return world.InsertBundle(entity, std::move(components)...); }, bundle);
                    if (!result)
                        Commands::Report("Spawn", entity, result.Error());
                });
            }
            return reserved;
        }

        void Despawn(Entity entity)
        {
            Record([entity](World& world) {
                if (!world.Despawn(entity))
                    Log::Warn("Commands", "Despawn skipped for dead entity " + std::to_string(entity.GetIndex()));
            });
        }

        template<typename T>
            requires Component<std::decay_t<T>>
        void Insert(Entity entity, T&& value)
        {
            Record([entity, component = std::decay_t<T>(std::forward<T>(value))](World& world) mutable {
                auto result = world.Insert(entity, std::move(component));
                if (!result)
                    Commands::Report("Insert", entity, result.Error());
            });
        }

        template<typename... Ts>
            requires (Component<std::decay_t<Ts>> && ...)
        void InsertBundle(Entity entity, Ts&&... values)
        {
            Record([entity, bundle = std::tuple<std::decay_t<Ts>...>(std::forward<Ts>(values)...)](World& world) mutable {
                auto result = std::apply([&](auto&... components) { return world.InsertBundle(entity, std::move(components)...); }, bundle);
                if (!result)
                    Commands::Report("InsertBundle", entity, result.Error());
            });
        }

        // The removed value is dropped
        template<Component T>
        void Remove(Entity entity)
        {
            Record([entity](World& world) {
                if (!world.IsAlive(entity))
                {
                    Log::Warn("Commands", "Remove skipped for dead entity " + std::to_string(entity.GetIndex()));
                    return;
                }
                std::optional<T> removed = world.Remove<T>(entity);
                if (!removed)
                    Log::Debug("Commands", "Remove skipped, entity " + std::to_string(entity.GetIndex()) + " has no such component");
            });
        }

        // Runs every command in recording order, then empties the buffer
        void Execute(World& world)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("CommandBuffer::Execute", Profile::ColorCommands);

            // Commands may record into this buffer again; those run on the next apply
            std::vector<std::unique_ptr<Commands::ICommand>> commands = std::move(m_commands);
            m_commands.clear();
            for (auto& command : commands)
                command->Apply(world);
        }

        void Clear() noexcept { m_commands.clear(); }
        void Reserve(std::size_t count) { m_commands.reserve(count); }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_commands.size(); }
        STRATA_NODISCARD bool Empty() const noexcept { return m_commands.empty(); }

    private:
        template<typename Func>
        void Record(Func&& func)
        {
            m_commands.push_back(std::make_unique<Commands::Deferred<std::decay_t<Func>>>(std::forward<Func>(func)));
        }

        RemoteAllocator m_allocator;
        std::vector<std::unique_ptr<Commands::ICommand>> m_commands;
    };

    inline void World::Apply(CommandBuffer& buffer)
    {
        Flush();
        buffer.Execute(*this);
    }
}
