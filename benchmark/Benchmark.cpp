#include <Strata/Strata.hpp>
#include <benchmark/benchmark.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

struct Position
{
    std::uint64_t x;
    std::uint64_t y;
};

struct Velocity : Position {};

struct Marker
{
    static constexpr Strata::StorageKind STORAGE = Strata::StorageKind::Sparse;
    int value;
};

template<int N>
struct Comp
{
    int x;
};


static void BM_SpawnEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Strata::World world;
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(world.Spawn());
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_SpawnWithComponents(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Strata::World world;
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(world.Spawn(Position{i, i}, Velocity{}));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Component manipulation benchmarks
static void BM_InsertComponents(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Strata::World world;
        std::vector<Strata::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            entities.push_back(*world.Spawn());
        }
        state.ResumeTiming();

        for(auto entity : entities)
        {
            benchmark::DoNotOptimize(world.Insert(entity, Position{}));
            benchmark::DoNotOptimize(world.Insert(entity, Velocity{}));
        }
    }

    state.SetItemsProcessed(state.iterations() * count * 2);
}

static void BM_InsertBundle(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Strata::World world;
        std::vector<Strata::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            entities.push_back(*world.Spawn());
        }
        state.ResumeTiming();

        for(auto entity : entities)
        {
            benchmark::DoNotOptimize(world.InsertBundle(entity, Position{42, 42}, Velocity{}));
        }
    }

    state.SetItemsProcessed(state.iterations() * count * 2);
}

static void BM_RemoveComponents(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Strata::World world;
        std::vector<Strata::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            entities.push_back(*world.Spawn(Position{}, Velocity{}));
        }
        state.ResumeTiming();

        for(auto entity : entities)
        {
            benchmark::DoNotOptimize(world.Remove<Position>(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Sparse components never move the dense row
static void BM_InsertRemoveSparse(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Strata::World world;
        std::vector<Strata::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            entities.push_back(*world.Spawn(Position{}, Velocity{}, Comp<0>{}));
        }
        state.ResumeTiming();

        for(auto entity : entities)
        {
            benchmark::DoNotOptimize(world.Insert(entity, Marker{1}));
        }
        for(auto entity : entities)
        {
            benchmark::DoNotOptimize(world.Remove<Marker>(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count * 2);
}

static void BM_DespawnEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Strata::World world;
        std::vector<Strata::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            entities.push_back(*world.Spawn(Position{}, Velocity{}));
        }
        state.ResumeTiming();

        for(auto entity : entities)
        {
            benchmark::DoNotOptimize(world.Despawn(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Iteration benchmarks
static void BM_IterateSingleComponent(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;

    for(size_t i = 0; i < count; ++i)
    {
        benchmark::DoNotOptimize(world.Spawn(Position{}));
    }

    // Build the query once before benchmarking
    auto query = world.Query<Position>();

    for(auto _ : state)
    {
        query.ForEach([](Strata::Entity, Position& pos) {
            benchmark::DoNotOptimize(pos.x = 0);
        });
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_IterateTwoComponents(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;

    for(size_t i = 0; i < count; ++i)
    {
        benchmark::DoNotOptimize(world.Spawn(Position{}, Velocity{}));
    }

    auto query = world.Query<Position, const Velocity>();

    for(auto _ : state)
    {
        query.ForEach([](Strata::Entity, Position& pos, const Velocity& vel) {
            benchmark::DoNotOptimize(pos.x += vel.x);
        });
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_IterateTwoComponentsHalf(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;

    // Only half of the entities have Position
    for(size_t i = 0; i < count; ++i)
    {
        if(i % 2 == 0)
        {
            benchmark::DoNotOptimize(world.Spawn(Position{}, Velocity{}));
        }
        else
        {
            benchmark::DoNotOptimize(world.Spawn(Velocity{}));
        }
    }

    auto query = world.Query<Position, Velocity>();

    for(auto _ : state)
    {
        query.ForEach([](Strata::Entity, Position& pos, Velocity& vel) {
            benchmark::DoNotOptimize(pos.x = 0);
            benchmark::DoNotOptimize(vel.x = 0);
        });
    }

    state.SetItemsProcessed(state.iterations() * count / 2);
}

static void BM_IterateFiveComponents(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;

    for(size_t i = 0; i < count; ++i)
    {
        benchmark::DoNotOptimize(world.Spawn(Position{}, Velocity{}, Comp<0>{}, Comp<1>{}, Comp<2>{}));
    }

    auto query = world.Query<Position, Velocity, Comp<0>, Comp<1>, Comp<2>>();

    for(auto _ : state)
    {
        query.ForEach([](Strata::Entity, Position& pos, Velocity& vel,
                         Comp<0>& c0, Comp<1>& c1, Comp<2>& c2) {
            benchmark::DoNotOptimize(pos.x = 0);
            benchmark::DoNotOptimize(vel.x = 0);
            benchmark::DoNotOptimize(c0.x = 0);
            benchmark::DoNotOptimize(c1.x = 0);
            benchmark::DoNotOptimize(c2.x = 0);
        });
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Entities spread over many archetypes that share the Position table
static void BM_IterateMixedSparse(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;

    for(size_t i = 0; i < count; ++i)
    {
        if(i % 4 == 0)
        {
            benchmark::DoNotOptimize(world.Spawn(Position{}, Marker{static_cast<int>(i)}));
        }
        else
        {
            benchmark::DoNotOptimize(world.Spawn(Position{}));
        }
    }

    auto query = world.Query<Position, const Marker>();

    for(auto _ : state)
    {
        query.ForEach([](Strata::Entity, Position& pos, const Marker& marker) {
            benchmark::DoNotOptimize(pos.x = static_cast<std::uint64_t>(marker.value));
        });
    }

    state.SetItemsProcessed(state.iterations() * count / 4);
}

static void BM_IterateRangeTwoComponents(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;

    for(size_t i = 0; i < count; ++i)
    {
        benchmark::DoNotOptimize(world.Spawn(Position{}, Velocity{}));
    }

    auto query = world.Query<Position, const Velocity>();

    for(auto _ : state)
    {
        for(auto [entity, pos, vel] : query.Iter())
        {
            benchmark::DoNotOptimize(pos.x += vel.x);
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_ChangedFilter(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;
    std::vector<Strata::Entity> entities;
    entities.reserve(count);

    for(size_t i = 0; i < count; ++i)
    {
        entities.push_back(*world.Spawn(Position{}));
    }

    auto query = world.Query<const Position, Strata::Changed<Position>>();

    for(auto _ : state)
    {
        state.PauseTiming();
        for(size_t i = 0; i < count; i += 10)
        {
            world.GetMut<Position>(entities[i])->x = i;
        }
        state.ResumeTiming();

        query.ForEach([](Strata::Entity, const Position& pos) {
            benchmark::DoNotOptimize(pos.x);
        });
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Random access benchmarks
static void BM_GetComponent(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;
    std::vector<Strata::Entity> entities;
    entities.reserve(count);

    for(size_t i = 0; i < count; ++i)
    {
        entities.push_back(*world.Spawn(Position{i, i}));
    }

    for(auto _ : state)
    {
        for(auto entity : entities)
        {
            benchmark::DoNotOptimize(world.Get<Position>(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_GetSparseComponent(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::World world;
    std::vector<Strata::Entity> entities;
    entities.reserve(count);

    for(size_t i = 0; i < count; ++i)
    {
        entities.push_back(*world.Spawn(Position{}, Marker{static_cast<int>(i)}));
    }

    for(auto _ : state)
    {
        for(auto entity : entities)
        {
            benchmark::DoNotOptimize(world.Get<Marker>(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Deferred commands
static void BM_ThreadInfo(benchmark::State& state)
{
    for(auto _ : state)
    {
        benchmark::DoNotOptimize(std::thread::hardware_concurrency());
    }
    state.SetLabel("Hardware Threads: " + std::to_string(std::thread::hardware_concurrency()));
}

static void BM_CommandBufferSpawn(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Strata::World world;
        Strata::CommandBuffer commands(world);
        commands.Reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(commands.Spawn(Position{i, i}, Velocity{}));
        }
        world.Apply(commands);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_ParallelCommandBuffers(benchmark::State& state)
{
    const size_t count = state.range(0);
    const size_t workers = std::max<size_t>(1, std::thread::hardware_concurrency());

    for(auto _ : state)
    {
        Strata::World world;
        std::vector<Strata::CommandBuffer> buffers;
        buffers.reserve(workers);
        for(size_t w = 0; w < workers; ++w)
        {
            buffers.emplace_back(world.GetRemoteAllocator());
        }

        std::vector<std::thread> threads;
        for(size_t w = 0; w < workers; ++w)
        {
            threads.emplace_back([&buffer = buffers[w], count, workers]() {
                for(size_t i = 0; i < count / workers; ++i)
                {
                    benchmark::DoNotOptimize(buffer.Spawn(Position{i, i}));
                }
            });
        }
        for(auto& thread : threads)
        {
            thread.join();
        }

        for(auto& buffer : buffers)
        {
            world.Apply(buffer);
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Access declarations
static void BM_BuildSystemClaims(benchmark::State& state)
{
    Strata::World world;
    world.InsertResource(Comp<9>{});

    for(auto _ : state)
    {
        auto physics = Strata::SystemAccess<Strata::Query<Position, const Velocity>, Strata::Res<Comp<9>>>::Build(world);
        auto render = Strata::SystemAccess<Strata::Query<const Position>, Strata::MainThread>::Build(world);
        benchmark::DoNotOptimize(Conflicts(physics, render));
    }
}

// Entity benchmarks
BENCHMARK(BM_SpawnEntities)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_SpawnWithComponents)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_DespawnEntities)->Arg(10000)->Arg(100000);

// Component benchmarks
BENCHMARK(BM_InsertComponents)->Arg(10000)->Arg(100000);
BENCHMARK(BM_InsertBundle)->Arg(10000)->Arg(100000);
BENCHMARK(BM_RemoveComponents)->Arg(10000)->Arg(100000);
BENCHMARK(BM_InsertRemoveSparse)->Arg(10000)->Arg(100000);

// Iteration benchmarks
BENCHMARK(BM_IterateSingleComponent)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateTwoComponents)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateTwoComponentsHalf)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateFiveComponents)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateMixedSparse)->Arg(10000)->Arg(100000);
BENCHMARK(BM_IterateRangeTwoComponents)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_ChangedFilter)->Arg(10000)->Arg(100000);

// Random access benchmarks
BENCHMARK(BM_GetComponent)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_GetSparseComponent)->Arg(10000)->Arg(100000);

// Deferred command benchmarks
BENCHMARK(BM_ThreadInfo);
BENCHMARK(BM_CommandBufferSpawn)->Arg(10000)->Arg(100000);
BENCHMARK(BM_ParallelCommandBuffers)->Arg(10000)->Arg(100000);

BENCHMARK(BM_BuildSystemClaims);

BENCHMARK_MAIN();
