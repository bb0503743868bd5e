/// @file bench_encode.cpp
/// @brief Encode benchmarks for mjson.
///
/// Measured operations:
///   - Compact and indented output
///   - OPT_SORT_KEYS on flat and nested objects
///   - Float formatting, non-finite sanitizing
///   - 128-bit integer formatting

#include <mjson/mjson.hpp>

#include <benchmark/benchmark.h>

#include <limits>
#include <string>

using namespace mjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

static JsonValue make_records(int count) {
    auto arr = JsonValue::array();
    for (int i = 0; i < count; ++i) {
        auto rec = JsonValue::object();
        rec["id"] = i;
        rec["name"] = "user_" + std::to_string(i);
        rec["email"] = "user" + std::to_string(i) + "@test.com";
        rec["active"] = (i % 2 == 0);
        rec["score"] = 50.0 + i * 2.5;
        rec["tags"] = JsonValue(Array{"alpha", "beta\n", nullptr});
        arr.push_back(std::move(rec));
    }
    return arr;
}

static JsonValue make_flat_object(int count) {
    auto obj = JsonValue::object();
    // Reverse order so sorting has work to do.
    for (int i = count - 1; i >= 0; --i) obj.insert("key_" + std::to_string(i), i);
    return obj;
}

static JsonValue make_floats(int count, bool with_nan) {
    auto arr = JsonValue::array();
    for (int i = 0; i < count; ++i) {
        if (with_nan && i % 10 == 0) {
            arr.push_back(std::numeric_limits<double>::quiet_NaN());
        } else {
            arr.push_back(i * 1.123456789);
        }
    }
    return arr;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Layout
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_EncodeCompact(benchmark::State& state) {
    const auto v = make_records(static_cast<int>(state.range(0)));
    size_t bytes = 0;
    for (auto _ : state) {
        auto s = encode(v);
        bytes = s.size();
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_EncodeCompact)->Arg(20)->Arg(1000);

static void BM_EncodeIndent2(benchmark::State& state) {
    const auto v = make_records(static_cast<int>(state.range(0)));
    size_t bytes = 0;
    for (auto _ : state) {
        auto s = encode(v, OPT_INDENT_2);
        bytes = s.size();
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_EncodeIndent2)->Arg(20)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Sorted keys
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_EncodeFlat(benchmark::State& state) {
    const auto v = make_flat_object(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto s = encode(v);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeFlat)->Arg(16)->Arg(1000);

static void BM_EncodeFlat_SortKeys(benchmark::State& state) {
    const auto v = make_flat_object(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto s = encode(v, OPT_SORT_KEYS);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeFlat_SortKeys)->Arg(16)->Arg(1000);

static void BM_EncodeRecords_SortKeys(benchmark::State& state) {
    const auto v = make_records(1000);
    for (auto _ : state) {
        auto s = encode(v, OPT_SORT_KEYS);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeRecords_SortKeys);

// ═══════════════════════════════════════════════════════════════════════════════
// Numbers
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_EncodeFloats(benchmark::State& state) {
    const auto v = make_floats(1000, false);
    for (auto _ : state) {
        auto s = encode(v);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_EncodeFloats);

static void BM_EncodeFloats_Sanitize(benchmark::State& state) {
    const auto v = make_floats(1000, true);
    for (auto _ : state) {
        auto s = encode(v, OPT_SANITIZE_NAN);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_EncodeFloats_Sanitize);

static void BM_FloatSerializerWrite(benchmark::State& state) {
    char buf[FloatSerializer::kBufferSize];
    double d = 0.1;
    for (auto _ : state) {
        size_t n = FloatSerializer::write(buf, d, 0);
        benchmark::DoNotOptimize(n);
        d += 0.37;
    }
}
BENCHMARK(BM_FloatSerializerWrite);

static void BM_EncodeInt128(benchmark::State& state) {
    auto arr = JsonValue::array();
    for (int i = 0; i < 1000; ++i) {
        arr.push_back(static_cast<int128_t>(i) * static_cast<int128_t>(UINT64_MAX));
    }
    for (auto _ : state) {
        auto s = encode(arr);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_EncodeInt128);

// ═══════════════════════════════════════════════════════════════════════════════
// Roundtrip
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Roundtrip(benchmark::State& state) {
    const std::string text = encode(make_records(1000));
    for (auto _ : state) {
        auto s = encode(decode_one(text));
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Roundtrip);

BENCHMARK_MAIN();
