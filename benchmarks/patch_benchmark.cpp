// docpatch-cpp benchmarks: measures throughput of the patch pipeline.

#include <docpatch-cpp/docpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace docpatch_cpp;

static auto quiet_engine() -> PatchEngine {
    auto options = EngineOptions{};
    options.log_level = LogLevel::off;
    options.max_operations = 100000;
    return PatchEngine{options};
}

// An object with `n` members, each holding a small record.
static auto make_content(std::size_t n) -> Value {
    auto items = Object{};
    for (std::size_t i = 0; i < n; ++i) {
        items.put("item" + std::to_string(i), Object{
            {"id", i},
            {"name", "component " + std::to_string(i)},
            {"tags", Array{"a", "b", "c"}},
        });
    }
    return Object{{"items", std::move(items)}};
}

// =============================================================================
// Hashing
// =============================================================================

static void bm_hash(benchmark::State& state) {
    const auto content = make_content(static_cast<std::size_t>(state.range(0)));
    const auto hasher = ContentHasher::for_documents(EngineOptions{});
    for (auto _ : state) {
        auto digest = hasher.hash(content);
        benchmark::DoNotOptimize(digest);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_hash)->Range(10, 10000);

static void bm_canonical_json(benchmark::State& state) {
    const auto content = make_content(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto text = canonical_json(content);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_canonical_json)->Range(10, 10000);

// =============================================================================
// Pipeline stages
// =============================================================================

static void bm_validate(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto engine = quiet_engine();
    const auto doc = *engine.create_document(make_content(n));
    auto patch = Patch{};
    for (std::size_t i = 0; i < n; ++i) {
        patch.push_back(ReplaceOp{"/items/item" + std::to_string(i) + "/name", "renamed"});
    }
    for (auto _ : state) {
        auto result = engine.validate(patch, doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_validate)->Range(10, 1000);

static void bm_compute_inverse(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto content = make_content(n);
    auto patch = Patch{};
    for (std::size_t i = 0; i < n; ++i) {
        patch.push_back(AddOp{"/items/item" + std::to_string(i) + "/tags/-", "d"});
    }
    for (auto _ : state) {
        auto inverse = compute_inverse(patch, content);
        benchmark::DoNotOptimize(inverse);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_compute_inverse)->Range(10, 1000);

// =============================================================================
// End to end
// =============================================================================

static void bm_apply_single_replace(benchmark::State& state) {
    const auto engine = quiet_engine();
    auto doc = *engine.create_document(make_content(static_cast<std::size_t>(state.range(0))));
    std::int64_t i = 0;
    for (auto _ : state) {
        auto request = PatchRequest{};
        request.document_version = doc.version;
        request.patch = {ReplaceOp{"/items/item0/id", i++}};
        request.dry_run = true;
        auto outcome = engine.apply(doc, request);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_single_replace)->Range(10, 10000);

static void bm_commit_sequence(benchmark::State& state) {
    const auto engine = quiet_engine();
    for (auto _ : state) {
        state.PauseTiming();
        auto doc = *engine.create_document(make_content(100));
        state.ResumeTiming();
        for (std::int64_t v = 0; v < state.range(0); ++v) {
            auto request = PatchRequest{};
            request.document_version = doc.version;
            request.patch = {ReplaceOp{"/items/item1/id", v}};
            auto result = engine.apply_in_place(doc, request);
            benchmark::DoNotOptimize(result);
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_commit_sequence)->Range(8, 256);
