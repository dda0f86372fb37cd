// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ToyDB - Parser Benchmarks                                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "toydb/sql/lexer.h"
#include "toydb/sql/parser.h"
#include "toydb/sql/predicate.h"

#include <string>

using namespace toydb::sql;

static void BM_LexSelect(benchmark::State& state) {
    const std::string query = "SELECT id, name FROM users WHERE age >= 30 ORDER BY name;";

    for (auto _ : state) {
        Lexer lexer(query);
        auto tokens = lexer.tokenize();
        benchmark::DoNotOptimize(tokens);
    }
}
BENCHMARK(BM_LexSelect);

static void BM_ParseSelect(benchmark::State& state) {
    const std::string query = "SELECT id, name FROM users WHERE age >= 30 ORDER BY name;";

    for (auto _ : state) {
        auto stmt = parse(query);
        benchmark::DoNotOptimize(stmt);
    }
}
BENCHMARK(BM_ParseSelect);

static void BM_ParseInsert(benchmark::State& state) {
    std::string columns;
    std::string values;
    for (int64_t i = 0; i < state.range(0); ++i) {
        if (i > 0) {
            columns += ", ";
            values += ", ";
        }
        columns += "c" + std::to_string(i);
        values += "'value " + std::to_string(i) + "'";
    }
    const std::string query = "INSERT INTO t (" + columns + ") VALUES (" + values + ")";

    for (auto _ : state) {
        auto stmt = parse(query);
        benchmark::DoNotOptimize(stmt);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(query.size()));
}
BENCHMARK(BM_ParseInsert)->Range(1, 256);

static void BM_CompilePredicate(benchmark::State& state) {
    for (auto _ : state) {
        auto predicate = compile_predicate("name != 'Charlie'");
        benchmark::DoNotOptimize(predicate);
    }
}
BENCHMARK(BM_CompilePredicate);

BENCHMARK_MAIN();
