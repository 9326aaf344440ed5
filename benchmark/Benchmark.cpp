#include <Strata/Strata.hpp>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <random>
#include <vector>

namespace
{
    // Segment tree plus one channel per segment, the shape commits and reorders are tuned for.
    struct Morphology
    {
        Strata::Database db;
        Strata::ArchetypeID segment;
        Strata::ArchetypeID channel;
        Strata::ComponentID voltage;
        Strata::ComponentID parent;
        Strata::ComponentID location;
        Strata::ComponentID synapses;

        explicit Morphology(std::size_t count, Strata::Nullability parentNullability = Strata::Nullability::Allowed)
        {
            using namespace Strata;

            segment = *db.DefineArchetype("Segment");
            channel = *db.DefineArchetype("Channel");
            voltage = *db.DefineComponent(segment, ComponentDefinition::Attribute("voltage", DataType::Float32()));

            auto parentDef = ComponentDefinition::Attribute("parent", DataType::PointerTo(segment));
            parentDef.nullability = parentNullability;
            parent = *db.DefineComponent(segment, parentDef);

            location = *db.DefineComponent(channel, ComponentDefinition::Attribute("segment", DataType::PointerTo(segment)));

            auto synapseDef = ComponentDefinition::Sparse("synapses", segment, DataType::Float32());
            synapseDef.nullability = Nullability::Allowed;
            synapses = *db.DefineComponent(segment, synapseDef);

            (void)db.CreateEntities(segment, count);
            (void)db.CreateEntities(channel, count);

            std::mt19937 rng(42);
            std::uniform_real_distribution<float> v(-80.0f, 40.0f);
            auto voltages = db.GetColumnData<float>(voltage);
            for (RowIndex row = 0; row < count; ++row)
            {
                voltages[row] = v(rng);
                if (row > 0)
                    db.SetPointer(Pointer(segment, row), parent, Pointer(segment, row - 1));
                db.SetPointer(Pointer(channel, row), location, Pointer(segment, row));
            }

            std::uniform_int_distribution<RowIndex> pick(0, static_cast<RowIndex>(count - 1));
            std::vector<std::vector<SparseEntry<float>>> rows(count);
            for (auto& entries : rows)
            {
                entries.push_back({pick(rng), 0.5f});
                entries.push_back({pick(rng), 0.25f});
            }
            (void)db.RebuildSparse(synapses, rows);
        }
    };
}

static void BM_CreateEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Strata::Database db;
        auto cell = *db.DefineArchetype("Cell");
        (void)db.DefineComponent(cell, Strata::ComponentDefinition::Attribute("v", Strata::DataType::Float32()));
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(db.CreateEntity(cell));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_CreateEntitiesBatch(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Strata::Database db;
        auto cell = *db.DefineArchetype("Cell");
        (void)db.DefineComponent(cell, Strata::ComponentDefinition::Attribute("v", Strata::DataType::Float32()));
        benchmark::DoNotOptimize(db.CreateEntities(cell, count));
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_IterateColumn(benchmark::State& state)
{
    const size_t count = state.range(0);
    Morphology m(count);

    for(auto _ : state)
    {
        float sum = 0.0f;
        for(float v : m.db.GetColumnData<float>(m.voltage))
        {
            sum += v;
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_ForEachLive(benchmark::State& state)
{
    const size_t count = state.range(0);
    Morphology m(count);
    for(size_t i = 0; i < count; i += 2)
    {
        (void)m.db.MarkDestroy(Strata::Pointer(m.segment, static_cast<Strata::RowIndex>(i)));
    }

    for(auto _ : state)
    {
        float sum = 0.0f;
        m.db.ForEachLive(m.segment, [&](Strata::Pointer p)
        {
            sum += m.db.Get<float>(p, m.voltage);
        });
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Removes every tenth segment; nullable parents are nulled, channels cascade.
static void BM_CommitNullable(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Morphology m(count);
        for(size_t i = 0; i < count; i += 10)
        {
            (void)m.db.MarkDestroy(Strata::Pointer(m.segment, static_cast<Strata::RowIndex>(i)));
        }
        state.ResumeTiming();

        benchmark::DoNotOptimize(m.db.Commit());
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Removes the root of a non-nullable chain: every segment and channel cascades.
static void BM_CommitFullCascade(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Morphology m(count, Strata::Nullability::Disallowed);
        (void)m.db.MarkDestroy(Strata::Pointer(m.segment, 0));
        state.ResumeTiming();

        benchmark::DoNotOptimize(m.db.Commit());
    }

    state.SetItemsProcessed(state.iterations() * count * 2);
}

static void BM_ReorderByVoltage(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Morphology m(count);
        state.ResumeTiming();

        benchmark::DoNotOptimize(m.db.ReorderBy(m.segment, m.voltage));
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_ResolveHandles(benchmark::State& state)
{
    const size_t count = state.range(0);
    Morphology m(count);

    std::vector<Strata::EntityHandle> handles;
    handles.reserve(count);
    for(size_t i = 0; i < count; ++i)
    {
        handles.push_back(*m.db.MakeHandle(Strata::Pointer(m.segment, static_cast<Strata::RowIndex>(i))));
    }

    for(auto _ : state)
    {
        for(const auto& handle : handles)
        {
            benchmark::DoNotOptimize(handle.Resolve());
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_RunChecks(benchmark::State& state)
{
    const size_t count = state.range(0);

    Strata::Database db;
    auto cell = *db.DefineArchetype("Cell");
    auto def = Strata::ComponentDefinition::Attribute("v", Strata::DataType::Float64());
    def.validation.nanCheck = true;
    def.validation.bounds = Strata::Bounds{-100.0, 100.0};
    (void)db.DefineComponent(cell, def);
    (void)db.CreateEntities(cell, count);

    for(auto _ : state)
    {
        benchmark::DoNotOptimize(db.RunChecks());
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Entity creation
BENCHMARK(BM_CreateEntities)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_CreateEntitiesBatch)->Arg(10000)->Arg(100000)->Arg(1000000);

// Iteration
BENCHMARK(BM_IterateColumn)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_ForEachLive)->Arg(10000)->Arg(100000)->Arg(1000000);

// Commit and reorder
BENCHMARK(BM_CommitNullable)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_CommitFullCascade)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_ReorderByVoltage)->Arg(10000)->Arg(100000)->Arg(1000000);

// Handles and validation
BENCHMARK(BM_ResolveHandles)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_RunChecks)->Arg(10000)->Arg(100000)->Arg(1000000);

BENCHMARK_MAIN();
