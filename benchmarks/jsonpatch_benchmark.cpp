// jsonpatch-cpp benchmarks - measures throughput of diff, apply and the codecs.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace jsonpatch_cpp;

namespace {

auto numbered_object(int n, int offset) -> std::string {
    auto obj = Object{};
    for (int i = 0; i < n; ++i) {
        obj["key" + std::to_string(i)] = Value{i + offset};
    }
    return dump(Value{std::move(obj)});
}

auto numbered_array(int n, int start) -> std::string {
    auto arr = Array{};
    for (int i = start; i < start + n; ++i) arr.push_back(Value{i});
    return dump(Value{std::move(arr)});
}

auto item_array(int n, int changed) -> std::string {
    auto arr = Array{};
    for (int i = 0; i < n; ++i) {
        auto item = Object{};
        item["id"] = Value{i};
        item["name"] = Value{"item" + std::to_string(i == changed ? -i : i)};
        arr.push_back(Value{std::move(item)});
    }
    return dump(Value{std::move(arr)});
}

}  // namespace

// =============================================================================
// Diff
// =============================================================================

static void bm_create_patch_simple_object(benchmark::State& state) {
    const auto a = std::string{R"({"a":100,"b":200,"c":"hello"})"};
    const auto b = std::string{R"({"a":100,"b":200,"c":"goodbye"})"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(create_patch(a, b));
    }
}
BENCHMARK(bm_create_patch_simple_object);

static void bm_create_patch_nested_object(benchmark::State& state) {
    const auto a = std::string{R"({"a":{"b":{"c":{"d":1,"e":[1,2,3]}}},"f":"x"})"};
    const auto b = std::string{R"({"a":{"b":{"c":{"d":2,"e":[1,2,3,4]}}},"f":"y"})"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(create_patch(a, b));
    }
}
BENCHMARK(bm_create_patch_nested_object);

static void bm_create_patch_large_object(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    const auto a = numbered_object(n, 0);
    const auto b = numbered_object(n, 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(create_patch(a, b));
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_create_patch_large_object)->Range(10, 1000);

static void bm_create_patch_array_insert(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    const auto a = "{\"list\":" + numbered_array(n, 0) + "}";
    const auto b = "{\"list\":" + numbered_array(n + 1, 0) + "}";
    for (auto _ : state) {
        benchmark::DoNotOptimize(create_patch(a, b));
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_create_patch_array_insert)->Range(10, 1000);

static void bm_create_patch_sliding_window(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    const auto a = numbered_array(n, 0);
    const auto b = numbered_array(n, 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(create_patch(a, b));
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_create_patch_sliding_window)->Range(10, 1000);

static void bm_create_patch_array_with_objects(benchmark::State& state) {
    const auto a = item_array(100, -1);
    const auto b = item_array(100, 50);
    for (auto _ : state) {
        benchmark::DoNotOptimize(create_patch(a, b));
    }
}
BENCHMARK(bm_create_patch_array_with_objects);

// =============================================================================
// Apply
// =============================================================================

static void bm_apply_patch_simple(benchmark::State& state) {
    const auto doc = std::string{R"({"a":100,"b":200,"c":"hello"})"};
    const auto patch = decode_patch(R"([{"op":"replace","path":"/c","value":"goodbye"}])");
    for (auto _ : state) {
        benchmark::DoNotOptimize(apply_patch(doc, patch));
    }
}
BENCHMARK(bm_apply_patch_simple);

static void bm_apply_patch_multiple_ops(benchmark::State& state) {
    const auto doc = std::string{R"({"a":1,"b":2,"c":3,"d":[1,2,3]})"};
    const auto patch = decode_patch(R"([
        {"op":"replace","path":"/a","value":10},
        {"op":"remove","path":"/b"},
        {"op":"add","path":"/e","value":{"x":true}},
        {"op":"add","path":"/d/-","value":4},
        {"op":"move","from":"/c","path":"/f"},
        {"op":"copy","from":"/d","path":"/g"},
        {"op":"test","path":"/a","value":10}
    ])");
    for (auto _ : state) {
        benchmark::DoNotOptimize(apply_patch(doc, patch));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(patch.size()));
}
BENCHMARK(bm_apply_patch_multiple_ops);

static void bm_apply_patch_array(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    const auto doc = "{\"list\":" + numbered_array(n, 0) + "}";
    const auto patch = decode_patch(R"([
        {"op":"add","path":"/list/0","value":-1},
        {"op":"remove","path":"/list/-1"}
    ])");
    for (auto _ : state) {
        benchmark::DoNotOptimize(apply_patch(doc, patch));
    }
}
BENCHMARK(bm_apply_patch_array)->Range(10, 1000);

// =============================================================================
// Codecs and helpers
// =============================================================================

static void bm_decode_patch(benchmark::State& state) {
    const auto text = std::string{R"([
        {"op":"add","path":"/a","value":{"b":[1,2,3]}},
        {"op":"remove","path":"/c"},
        {"op":"move","from":"/d","path":"/e"},
        {"op":"test","path":"/f","value":"g"}
    ])"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(decode_patch(text));
    }
}
BENCHMARK(bm_decode_patch);

static void bm_equal(benchmark::State& state) {
    const auto a = numbered_object(100, 0);
    const auto b = numbered_object(100, 0);
    for (auto _ : state) {
        benchmark::DoNotOptimize(equal(a, b));
    }
}
BENCHMARK(bm_equal);

static void bm_equal_different(benchmark::State& state) {
    const auto a = numbered_object(100, 0);
    const auto b = numbered_object(100, 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(equal(a, b));
    }
}
BENCHMARK(bm_equal_different);

static void bm_append_token(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(append_token("/some/prefix", "key~with/escapes"));
    }
}
BENCHMARK(bm_append_token);

static void bm_dump_canonical(benchmark::State& state) {
    const auto value = parse(item_array(100, -1));
    for (auto _ : state) {
        benchmark::DoNotOptimize(dump(value));
    }
}
BENCHMARK(bm_dump_canonical);
