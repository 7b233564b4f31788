// spatch apply benchmarks: plain and selector paths, decoding.

#include <spatch/apply.hpp>
#include <spatch/json.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>

using namespace spatch;

static auto make_list(std::int64_t n) -> Value {
    auto list = Value::array();
    for (std::int64_t i = 0; i < n; ++i) {
        list.push_back(Value{{"id", i}, {"value", i}});
    }
    return Value{{"list", std::move(list)}};
}

// Replace the value of the last element, addressed positionally or by id.
static auto last_element_patch(std::int64_t n, bool by_identity) -> Patch {
    auto element = by_identity ? "[id=" + std::to_string(n - 1) + "]" : std::to_string(n - 1);
    auto path = Path::parse("/list/" + element + "/value").value();
    return Patch{PatchReplace{std::move(path), -1}};
}

// =============================================================================
// Single operations
// =============================================================================

static void bm_apply_replace_index(benchmark::State& state) {
    auto doc = make_list(state.range(0));
    auto patch = last_element_patch(state.range(0), false);
    for (auto _ : state) {
        auto out = spatch::apply(doc, patch);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(bm_apply_replace_index)->Range(10, 10000);

static void bm_apply_replace_selector(benchmark::State& state) {
    auto doc = make_list(state.range(0));
    auto patch = last_element_patch(state.range(0), true);
    for (auto _ : state) {
        auto out = spatch::apply(doc, patch);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(bm_apply_replace_selector)->Range(10, 10000);

// =============================================================================
// Many operations
// =============================================================================

static void bm_apply_appends(benchmark::State& state) {
    const auto n = state.range(0);
    auto patch = Patch{PatchAdd{Path::parse("/list").value(), Value::array()}};
    for (std::int64_t i = 0; i < n; ++i) {
        patch.push_back(PatchAdd{Path::parse("/list/-").value(), i});
    }
    for (auto _ : state) {
        auto out = spatch::apply(Value::object(), patch);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_apply_appends)->Range(10, 1000);

static void bm_decode_patch(benchmark::State& state) {
    const auto n = state.range(0);
    auto wire = Value::array();
    for (std::int64_t i = 0; i < n; ++i) {
        wire.push_back(Value{{"op", "replace"},
                             {"path", "/list/[id=" + std::to_string(i) + "]/value"},
                             {"value", i}});
    }
    for (auto _ : state) {
        auto ops = decode(wire);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_decode_patch)->Range(10, 1000);
