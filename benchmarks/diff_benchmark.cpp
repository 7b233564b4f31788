// spatch diff benchmarks: positional and identity-keyed array diffs.

#include <spatch/diff.hpp>
#include <spatch/json.hpp>

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <utility>

using namespace spatch;

static auto make_list(std::int64_t n) -> Value {
    auto list = Value::array();
    for (std::int64_t i = 0; i < n; ++i) {
        list.push_back(Value{{"id", "item-" + std::to_string(i)}, {"value", i}, {"tags", {"a", "b"}}});
    }
    return Value{{"list", std::move(list)}};
}

static auto list_schema() -> SchemaIndex {
    return SchemaIndex::build(Value::parse(R"({
        "properties": {"list": {"type": "array", "indexKey": "id"}}
    })")).value();
}

// Edit every tenth element in place.
static auto edited(Value doc) -> Value {
    auto& list = doc["list"];
    for (std::size_t i = 0; i < list.size(); i += 10) list[i]["value"] = -1;
    return doc;
}

// Shuffle the elements with a fixed seed.
static auto shuffled(Value doc) -> Value {
    auto& list = doc["list"];
    auto rng = std::mt19937{42};
    std::shuffle(list.begin(), list.end(), rng);
    return doc;
}

// =============================================================================
// Identical documents
// =============================================================================

static void bm_diff_identical(benchmark::State& state) {
    auto a = make_list(state.range(0));
    for (auto _ : state) {
        auto ops = compute_diff(a, a);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_identical)->Range(10, 10000);

// =============================================================================
// Field edits
// =============================================================================

static void bm_diff_edit_positional(benchmark::State& state) {
    auto a = make_list(state.range(0));
    auto b = edited(a);
    for (auto _ : state) {
        auto ops = compute_diff(a, b);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_edit_positional)->Range(10, 10000);

static void bm_diff_edit_keyed(benchmark::State& state) {
    auto schema = list_schema();
    auto a = make_list(state.range(0));
    auto b = edited(a);
    for (auto _ : state) {
        auto ops = compute_diff(a, b, &schema);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_edit_keyed)->Range(10, 10000);

// =============================================================================
// Reorders
// =============================================================================

static void bm_diff_shuffle_keyed(benchmark::State& state) {
    auto schema = list_schema();
    auto a = make_list(state.range(0));
    auto b = shuffled(a);
    for (auto _ : state) {
        auto ops = compute_diff(a, b, &schema);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_shuffle_keyed)->Range(10, 1000);

static void bm_diff_patch_rendered(benchmark::State& state) {
    auto schema = list_schema();
    auto a = make_list(state.range(0));
    auto b = edited(shuffled(a));
    for (auto _ : state) {
        auto patch = diff_patch(a, b, &schema);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_patch_rendered)->Range(10, 1000);

// Every element changes place: one move per element, each named by selector.
static void bm_diff_patch_reversed(benchmark::State& state) {
    auto schema = list_schema();
    auto a = make_list(state.range(0));
    auto b = a;
    std::reverse(b["list"].begin(), b["list"].end());
    for (auto _ : state) {
        auto patch = diff_patch(a, b, &schema);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_patch_reversed)->Range(64, 8192);
