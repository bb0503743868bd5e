/// @file bench_decode.cpp
/// @brief Decode benchmarks for mjson.
///
/// Measured operations:
///   - decode_one on small, medium and large documents
///   - Key cache on / off, repeated schemas, long keys
///   - The 2-byte literal fast path
///   - decode_next / decode_each over NDJSON
///   - Wide integers and floats through the numeric materializer
///   - Concurrent decodes sharing the global key cache

#include <mjson/mjson.hpp>

#include <benchmark/benchmark.h>

#include <cstdio>
#include <string>
#include <vector>

using namespace mjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Small JSON object (~50 bytes).
static std::string generate_small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

/// Medium JSON document (~2KB).
static std::string generate_medium_json() {
    std::string s = R"({"users":[)";
    for (int i = 0; i < 20; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","email":"user)" + std::to_string(i) +
             R"(@test.com","active":)" + (i % 2 == 0 ? "true" : "false") +
             R"(,"score":)" + std::to_string(50.0 + i * 2.5) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

/// Large JSON document (~200KB).
static std::string generate_large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with some longer title text for realism")" +
             R"(,"description":"Description for item )" + std::to_string(i) +
             R"( with enough text to be representative.")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

/// Rows of one schema, newline-delimited.
static std::string generate_ndjson(int rows) {
    std::string s;
    for (int i = 0; i < rows; ++i) {
        s += R"({"ts":)" + std::to_string(1707350400 + i) +
             R"(,"level":"info","service":"api","latency_ms":)" + std::to_string(i % 250) +
             R"(,"ok":true})" "\n";
    }
    return s;
}

/// Object whose keys all exceed the cacheable length.
static std::string generate_long_keys(int count) {
    std::string s = "{";
    const std::string prefix(80, 'k');
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += "\"" + prefix + std::to_string(i) + "\":" + std::to_string(i);
    }
    return s + "}";
}

static std::string generate_wide_ints(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += "1" + std::string(25, static_cast<char>('0' + i % 10));
    }
    return s + "]";
}

static std::string generate_float_array(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ',';
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", i * 1.123456789);
        s += buf;
    }
    return s + "]";
}

// ═══════════════════════════════════════════════════════════════════════════════
// decode_one
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeSmall(benchmark::State& state) {
    const auto json = generate_small_json();
    for (auto _ : state) {
        auto v = decode_one(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(json.size()));
}
BENCHMARK(BM_DecodeSmall);

static void BM_DecodeMedium(benchmark::State& state) {
    const auto json = generate_medium_json();
    for (auto _ : state) {
        auto v = decode_one(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(json.size()));
}
BENCHMARK(BM_DecodeMedium);

static void BM_DecodeLarge(benchmark::State& state) {
    const auto json = generate_large_json();
    for (auto _ : state) {
        auto v = decode_one(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(json.size()));
}
BENCHMARK(BM_DecodeLarge);

static void BM_DecodeLarge_NoUtf8Check(benchmark::State& state) {
    const auto json = generate_large_json();
    DecodeOptions opts;
    opts.validate_utf8 = false;
    for (auto _ : state) {
        auto v = decode_one(json, opts);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(json.size()));
}
BENCHMARK(BM_DecodeLarge_NoUtf8Check);

// ═══════════════════════════════════════════════════════════════════════════════
// Key cache
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeMedium_CacheOn(benchmark::State& state) {
    const auto json = generate_medium_json();
    KeyCache cache;
    DecodeOptions opts;
    opts.key_cache = &cache;
    for (auto _ : state) {
        auto v = decode_one(json, opts);
        benchmark::DoNotOptimize(v);
    }
    const auto s = cache.stats();
    state.counters["hit_rate"] =
        static_cast<double>(s.hits) / static_cast<double>(s.hits + s.misses);
}
BENCHMARK(BM_DecodeMedium_CacheOn);

static void BM_DecodeMedium_CacheOff(benchmark::State& state) {
    const auto json = generate_medium_json();
    DecodeOptions opts;
    opts.use_key_cache = false;
    for (auto _ : state) {
        auto v = decode_one(json, opts);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_DecodeMedium_CacheOff);

static void BM_DecodeLongKeys(benchmark::State& state) {
    const auto json = generate_long_keys(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = decode_one(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(json.size()));
}
BENCHMARK(BM_DecodeLongKeys)->Arg(10)->Arg(100);

static void BM_KeyCacheIntern(benchmark::State& state) {
    // Shared by all benchmark threads.
    KeyCache& cache = KeyCache::global();
    const std::string key = "latency_ms";
    for (auto _ : state) {
        Key k = cache.intern(key);
        benchmark::DoNotOptimize(k);
    }
}
BENCHMARK(BM_KeyCacheIntern)->Threads(1)->Threads(4);

// ═══════════════════════════════════════════════════════════════════════════════
// Literal fast path
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeEmptyArray(benchmark::State& state) {
    for (auto _ : state) {
        auto v = decode_one("[]");
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_DecodeEmptyArray);

static void BM_DecodeEmptyArray_Parser(benchmark::State& state) {
    DecodeOptions opts;
    for (auto _ : state) {
        auto v = detail::Parser::parse_document("[]", opts);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_DecodeEmptyArray_Parser);

static void BM_DecodeEmptyString(benchmark::State& state) {
    for (auto _ : state) {
        auto v = decode_one("\"\"");
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_DecodeEmptyString);

// ═══════════════════════════════════════════════════════════════════════════════
// Chained decode
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeEach_NDJSON(benchmark::State& state) {
    const auto ndjson = generate_ndjson(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        size_t n = decode_each(ndjson, [](JsonValue&& row) {
            benchmark::DoNotOptimize(row);
        });
        benchmark::DoNotOptimize(n);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(ndjson.size()));
}
BENCHMARK(BM_DecodeEach_NDJSON)->Arg(100)->Arg(10000);

static void BM_DecodeNext_Loop(benchmark::State& state) {
    const auto ndjson = generate_ndjson(1000);
    const std::string_view buf = ndjson;
    for (auto _ : state) {
        size_t pos = 0;
        while (pos < buf.size()) {
            auto r = decode_next(buf.substr(pos));
            pos += r.bytes_consumed + 1;  // skip the newline
            benchmark::DoNotOptimize(r.value);
        }
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(ndjson.size()));
}
BENCHMARK(BM_DecodeNext_Loop);

// ═══════════════════════════════════════════════════════════════════════════════
// Numbers
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeWideIntegers(benchmark::State& state) {
    const auto json = generate_wide_ints(1000);
    for (auto _ : state) {
        auto v = decode_one(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_DecodeWideIntegers);

static void BM_DecodeFloats(benchmark::State& state) {
    const auto json = generate_float_array(1000);
    for (auto _ : state) {
        auto v = decode_one(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_DecodeFloats);

static void BM_MaterializeNumber(benchmark::State& state) {
    const std::string lexeme = "170141183460469231731687303715884105727";
    for (auto _ : state) {
        auto r = materialize_number(lexeme);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_MaterializeNumber);

// ═══════════════════════════════════════════════════════════════════════════════
// Concurrent decode
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_MT_DecodeMedium(benchmark::State& state) {
    const auto json = generate_medium_json();
    for (auto _ : state) {
        auto v = decode_one(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(json.size()));
}
BENCHMARK(BM_MT_DecodeMedium)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
