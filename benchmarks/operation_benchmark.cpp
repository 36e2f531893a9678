// jot-cpp benchmarks: measures throughput of core operations.

#include <jot-cpp/jot.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

using namespace jot_cpp;

static auto make_doc(std::int64_t keys) -> Value {
    auto doc = Value::object();
    for (std::int64_t i = 0; i < keys; ++i) {
        doc["key" + std::to_string(i)] = i;
    }
    return doc;
}

static auto make_multi_put(std::int64_t keys) -> Operation {
    auto ops = std::map<std::string, Operation>{};
    for (std::int64_t i = 0; i < keys; ++i) {
        ops.emplace("key" + std::to_string(i), Set{i * 2});
    }
    return Apply{std::move(ops)};
}

// =============================================================================
// Apply
// =============================================================================

static void bm_put_apply(benchmark::State& state) {
    const auto doc = make_doc(100);
    const auto op = put("key50", "value");
    for (auto _ : state) {
        auto result = op.apply(doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_put_apply);

static void bm_apply_many_keys(benchmark::State& state) {
    const auto n = state.range(0);
    const auto doc = make_doc(n);
    const auto op = make_multi_put(n);
    for (auto _ : state) {
        auto result = op.apply(doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_apply_many_keys)->Range(10, 1000);

static void bm_rename_apply(benchmark::State& state) {
    const auto doc = make_doc(100);
    const auto op = jot_cpp::rename("key10", "moved");
    for (auto _ : state) {
        auto result = op.apply(doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_rename_apply);

// =============================================================================
// Construction (dependency resolution)
// =============================================================================

static void bm_apply_construct(benchmark::State& state) {
    const auto n = state.range(0);
    auto ops = std::map<std::string, Operation>{};
    for (std::int64_t i = 0; i < n; ++i) {
        ops.emplace("key" + std::to_string(i), Set{i});
    }
    for (auto _ : state) {
        auto op = Apply{ops};
        benchmark::DoNotOptimize(op);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_apply_construct)->Range(10, 1000);

static void bm_apply_construct_chained_moves(benchmark::State& state) {
    // key0 -> key1 -> ... each key pastes the value captured at the next.
    const auto n = state.range(0);
    auto copies = std::vector<Copy>(static_cast<std::size_t>(n));
    auto ops = std::map<std::string, Operation>{};
    for (std::int64_t i = 0; i < n; ++i) {
        auto i_sz = static_cast<std::size_t>(i);
        auto here = Operation{copies[i_sz]};
        if (i + 1 < n) here = here.then(Paste{copies[i_sz + 1]});
        ops.emplace("key" + std::to_string(i), here);
    }
    for (auto _ : state) {
        auto op = Apply{ops};
        benchmark::DoNotOptimize(op);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_apply_construct_chained_moves)->Range(10, 500);

// =============================================================================
// Compose / Rebase
// =============================================================================

static void bm_compose_disjoint(benchmark::State& state) {
    const auto a = make_multi_put(50);
    auto ops = std::map<std::string, Operation>{};
    for (int i = 0; i < 50; ++i) {
        ops.emplace("other" + std::to_string(i), Math{MathOperator::add, 1});
    }
    const auto b = Operation{Apply{std::move(ops)}};
    for (auto _ : state) {
        auto composed = a.compose(b);
        benchmark::DoNotOptimize(composed);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_compose_disjoint);

static void bm_rebase_conflictless(benchmark::State& state) {
    const auto doc = make_doc(100);
    const auto a = make_multi_put(100);
    auto ops = std::map<std::string, Operation>{};
    for (int i = 0; i < 100; i += 2) {
        ops.emplace("key" + std::to_string(i), Math{MathOperator::add, 1});
    }
    const auto b = Operation{Apply{std::move(ops)}};
    const auto context = RebaseContext{doc};
    for (auto _ : state) {
        auto rebased = a.rebase(b, context);
        benchmark::DoNotOptimize(rebased);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_rebase_conflictless);

// =============================================================================
// Serialization
// =============================================================================

static void bm_serialize(benchmark::State& state) {
    const auto op = make_multi_put(100).then(jot_cpp::rename("key1", "renamed"));
    const auto& registry = OperationRegistry::standard();
    for (auto _ : state) {
        auto node = serialize(op, registry);
        benchmark::DoNotOptimize(node);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_serialize);

static void bm_deserialize(benchmark::State& state) {
    const auto& registry = OperationRegistry::standard();
    const auto node = serialize(make_multi_put(100).then(jot_cpp::rename("key1", "renamed")), registry);
    for (auto _ : state) {
        auto op = deserialize(node, protocol_version, registry);
        benchmark::DoNotOptimize(op);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_deserialize);

// =============================================================================
// Random generation
// =============================================================================

static void bm_random_object_operation(benchmark::State& state) {
    auto rng = RandomEngine{42};
    const auto doc = make_doc(100);
    for (auto _ : state) {
        auto op = random_object_operation(doc, rng);
        benchmark::DoNotOptimize(op);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_random_object_operation);
