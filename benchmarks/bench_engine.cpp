// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ToyDB - Engine Benchmarks                                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "toydb/engine.h"
#include "toydb/sql/parser.h"

#include <string>

using namespace toydb;

namespace {

Engine make_engine(int64_t rows) {
    Engine engine;
    if (!engine.create_table("users", {"id", "name", "age"})) {
        return engine;
    }
    for (int64_t i = 0; i < rows; ++i) {
        auto result = engine.execute("INSERT INTO users (id, name, age) VALUES (" +
            std::to_string(i) + ", 'user" + std::to_string(i) + "', " +
            std::to_string(20 + i % 50) + ")");
        benchmark::DoNotOptimize(result);
    }
    return engine;
}

} // anonymous namespace

static void BM_Insert(benchmark::State& state) {
    const auto stmt = sql::parse("INSERT INTO users (id, name, age) VALUES (1, 'Alice', 30)");

    for (auto _ : state) {
        state.PauseTiming();
        Engine engine;
        if (!engine.create_table("users", {})) {
            state.SkipWithError("create_table failed");
            break;
        }
        state.ResumeTiming();

        for (int64_t i = 0; i < state.range(0); ++i) {
            auto result = engine.execute(stmt);
            benchmark::DoNotOptimize(result);
        }
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Insert)->Range(64, 4096);

static void BM_SelectWhere(benchmark::State& state) {
    Engine engine = make_engine(state.range(0));
    const auto stmt = sql::parse("SELECT id, name FROM users WHERE age >= 50");

    for (auto _ : state) {
        auto result = engine.execute(stmt);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SelectWhere)->Range(64, 8192);

static void BM_SelectOrderBy(benchmark::State& state) {
    Engine engine = make_engine(state.range(0));
    const auto stmt = sql::parse("SELECT * FROM users ORDER BY name");

    for (auto _ : state) {
        auto result = engine.execute(stmt);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SelectOrderBy)->Range(64, 8192);

static void BM_UpdateAll(benchmark::State& state) {
    Engine engine = make_engine(state.range(0));
    const auto stmt = sql::parse("UPDATE users SET age=42");

    for (auto _ : state) {
        auto result = engine.execute(stmt);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_UpdateAll)->Range(64, 8192);

BENCHMARK_MAIN();
