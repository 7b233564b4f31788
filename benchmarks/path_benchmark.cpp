// spatch path benchmarks: parsing, printing and resolution.

#include <spatch/path.hpp>
#include <spatch/resolve.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>

using namespace spatch;

static void bm_parse_plain(benchmark::State& state) {
    for (auto _ : state) {
        auto p = Path::parse("/users/12/profile/addresses/0/street");
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(bm_parse_plain);

static void bm_parse_escaped(benchmark::State& state) {
    for (auto _ : state) {
        auto p = Path::parse("/a~1b/c~0d/e~1~0f");
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(bm_parse_escaped);

static void bm_parse_selectors(benchmark::State& state) {
    for (auto _ : state) {
        auto p = Path::parse("/users/[name=\"ann\"]/roles/[role=admin]/grants/[id=42]");
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(bm_parse_selectors);

static void bm_to_string(benchmark::State& state) {
    auto p = Path::parse("/users/[name=ann]/roles/[role=admin]/grants/3").value();
    for (auto _ : state) {
        auto s = p.to_string();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(bm_to_string);

static void bm_resolve_deep(benchmark::State& state) {
    const auto depth = state.range(0);
    auto doc = Value(1);
    auto text = std::string{};
    for (std::int64_t i = 0; i < depth; ++i) {
        doc = Value{{"k", std::move(doc)}};
        text += "/k";
    }
    auto p = Path::parse(text).value();
    for (auto _ : state) {
        auto r = resolve(doc, p);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(bm_resolve_deep)->Range(8, 256);
