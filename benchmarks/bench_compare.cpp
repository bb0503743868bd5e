/// @file bench_compare.cpp
/// @brief Head-to-head benchmark: mjson vs Boost.JSON vs RapidJSON
///        vs nlohmann/json vs simdjson.
///
/// All libraries decode/encode identical data under identical conditions.
/// Scenarios:
///   1. Decode: small (~50B), medium (~2KB), large (~200KB)
///   2. Decode: wide integer array (mjson keeps them exact)
///   3. Network message batch: 100 messages sharing one schema
///   4. Encode compact: large
///   5. Encode sorted keys: flat object 1000 keys

#include <benchmark/benchmark.h>

// ─── mjson ───────────────────────────────────────────────────────────────────
#include <mjson/mjson.hpp>

// ─── Boost.JSON ──────────────────────────────────────────────────────────────
#include <boost/json.hpp>

// ─── RapidJSON ───────────────────────────────────────────────────────────────
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

// ─── nlohmann/json ───────────────────────────────────────────────────────────
#include <nlohmann/json.hpp>

// ─── simdjson ────────────────────────────────────────────────────────────────
#include <simdjson.h>

#include <cstdio>
#include <string>
#include <vector>

// ═══════════════════════════════════════════════════════════════════════════════
// Shared test data (identical for all libraries)
// ═══════════════════════════════════════════════════════════════════════════════

namespace td {

inline std::string small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

inline std::string medium_json() {
    std::string s = R"({"users":[)";
    for (int i = 0; i < 20; ++i) {
        if (i) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","email":"user)" + std::to_string(i) +
             R"(@test.com","active":)" + (i % 2 == 0 ? "true" : "false") +
             R"(,"score":)" + std::to_string(50.0 + i * 2.5) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

inline std::string large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with some longer title text for realism")" +
             R"(,"description":"This is a detailed description for item )" +
             std::to_string(i) +
             R"( which contains enough text to be representative of real data.")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

/// Unsigned 64-bit values near the top of the range.
inline std::string wide_int_array(int n) {
    std::string s = "[";
    for (int i = 0; i < n; ++i) {
        if (i) s += ',';
        s += std::to_string(18446744073709551615ull - static_cast<unsigned>(i));
    }
    return s + "]";
}

inline std::string flat_object(int n) {
    std::string s = "{";
    for (int i = n - 1; i >= 0; --i) {
        if (i != n - 1) s += ',';
        s += "\"key_" + std::to_string(i) + "\":" + std::to_string(i);
    }
    return s + "}";
}

inline std::vector<std::string> network_batch() {
    std::vector<std::string> msgs;
    msgs.reserve(100);
    for (int i = 0; i < 100; ++i) {
        msgs.push_back(
            R"({"type":"scan","bssid":"AA:BB:CC:)" +
            std::to_string(i / 100) + ":" +
            std::to_string(i / 10 % 10) + ":" +
            std::to_string(i % 10) +
            R"(","rssi":)" + std::to_string(-30 - (i % 50)) +
            R"(,"channel":)" + std::to_string(1 + (i % 13)) +
            R"(,"ssid":"Network_)" + std::to_string(i % 20) + R"("})");
    }
    return msgs;
}

} // namespace td

static size_t total_bytes(const std::vector<std::string>& v) {
    size_t n = 0;
    for (auto& s : v) n += s.size();
    return n;
}

// ─── Per-document decode, one function per library ─────────────────────────

template <std::string (*Gen)()>
static void BM_Decode_Mjson(benchmark::State& st) {
    auto in = Gen();
    for (auto _ : st) { auto v = mjson::decode_one(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}

template <std::string (*Gen)()>
static void BM_Decode_Boost(benchmark::State& st) {
    auto in = Gen();
    for (auto _ : st) { auto v = boost::json::parse(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}

template <std::string (*Gen)()>
static void BM_Decode_Rapid(benchmark::State& st) {
    auto in = Gen();
    rapidjson::Document doc;
    for (auto _ : st) { doc.Parse(in.c_str(), in.size()); benchmark::DoNotOptimize(doc); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}

template <std::string (*Gen)()>
static void BM_Decode_Nlohmann(benchmark::State& st) {
    auto in = Gen();
    for (auto _ : st) { auto v = nlohmann::json::parse(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}

template <std::string (*Gen)()>
static void BM_Decode_Simdjson(benchmark::State& st) {
    auto in = Gen();
    simdjson::dom::parser parser;
    simdjson::padded_string padded(in);
    for (auto _ : st) { auto doc = parser.parse(padded); benchmark::DoNotOptimize(doc); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}

static std::string wide_ints_1k() { return td::wide_int_array(1000); }

// ═══════════════════════════════════════════════════════════════════════════════
// 1. DECODE SMALL / MEDIUM / LARGE
// ═══════════════════════════════════════════════════════════════════════════════

BENCHMARK_TEMPLATE(BM_Decode_Mjson, td::small_json);
BENCHMARK_TEMPLATE(BM_Decode_Boost, td::small_json);
BENCHMARK_TEMPLATE(BM_Decode_Rapid, td::small_json);
BENCHMARK_TEMPLATE(BM_Decode_Nlohmann, td::small_json);
BENCHMARK_TEMPLATE(BM_Decode_Simdjson, td::small_json);

BENCHMARK_TEMPLATE(BM_Decode_Mjson, td::medium_json);
BENCHMARK_TEMPLATE(BM_Decode_Boost, td::medium_json);
BENCHMARK_TEMPLATE(BM_Decode_Rapid, td::medium_json);
BENCHMARK_TEMPLATE(BM_Decode_Nlohmann, td::medium_json);
BENCHMARK_TEMPLATE(BM_Decode_Simdjson, td::medium_json);

BENCHMARK_TEMPLATE(BM_Decode_Mjson, td::large_json);
BENCHMARK_TEMPLATE(BM_Decode_Boost, td::large_json);
BENCHMARK_TEMPLATE(BM_Decode_Rapid, td::large_json);
BENCHMARK_TEMPLATE(BM_Decode_Nlohmann, td::large_json);
BENCHMARK_TEMPLATE(BM_Decode_Simdjson, td::large_json);

// ═══════════════════════════════════════════════════════════════════════════════
// 2. DECODE WIDE INTEGERS
// ═══════════════════════════════════════════════════════════════════════════════

BENCHMARK_TEMPLATE(BM_Decode_Mjson, wide_ints_1k);
BENCHMARK_TEMPLATE(BM_Decode_Boost, wide_ints_1k);
BENCHMARK_TEMPLATE(BM_Decode_Rapid, wide_ints_1k);
BENCHMARK_TEMPLATE(BM_Decode_Nlohmann, wide_ints_1k);
BENCHMARK_TEMPLATE(BM_Decode_Simdjson, wide_ints_1k);

// ═══════════════════════════════════════════════════════════════════════════════
// 3. NETWORK MESSAGE BATCH
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_NetBatch_Mjson(benchmark::State& st) {
    auto msgs = td::network_batch();
    auto tb = total_bytes(msgs);
    int64_t mc = 0;
    for (auto _ : st) {
        for (auto& m : msgs) { auto v = mjson::decode_one(m); benchmark::DoNotOptimize(v); }
        mc += int64_t(msgs.size());
    }
    st.SetBytesProcessed(st.iterations() * int64_t(tb));
    st.counters["msg/s"] = benchmark::Counter(double(mc), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_NetBatch_Mjson);

static void BM_NetBatch_Mjson_NoKeyCache(benchmark::State& st) {
    auto msgs = td::network_batch();
    auto tb = total_bytes(msgs);
    mjson::DecodeOptions opts;
    opts.use_key_cache = false;
    int64_t mc = 0;
    for (auto _ : st) {
        for (auto& m : msgs) { auto v = mjson::decode_one(m, opts); benchmark::DoNotOptimize(v); }
        mc += int64_t(msgs.size());
    }
    st.SetBytesProcessed(st.iterations() * int64_t(tb));
    st.counters["msg/s"] = benchmark::Counter(double(mc), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_NetBatch_Mjson_NoKeyCache);

static void BM_NetBatch_Boost(benchmark::State& st) {
    auto msgs = td::network_batch();
    auto tb = total_bytes(msgs);
    int64_t mc = 0;
    for (auto _ : st) {
        for (auto& m : msgs) { auto v = boost::json::parse(m); benchmark::DoNotOptimize(v); }
        mc += int64_t(msgs.size());
    }
    st.SetBytesProcessed(st.iterations() * int64_t(tb));
    st.counters["msg/s"] = benchmark::Counter(double(mc), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_NetBatch_Boost);

static void BM_NetBatch_Rapid(benchmark::State& st) {
    auto msgs = td::network_batch();
    auto tb = total_bytes(msgs);
    rapidjson::Document doc;
    int64_t mc = 0;
    for (auto _ : st) {
        for (auto& m : msgs) { doc.Parse(m.c_str(), m.size()); benchmark::DoNotOptimize(doc); }
        mc += int64_t(msgs.size());
    }
    st.SetBytesProcessed(st.iterations() * int64_t(tb));
    st.counters["msg/s"] = benchmark::Counter(double(mc), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_NetBatch_Rapid);

static void BM_NetBatch_Nlohmann(benchmark::State& st) {
    auto msgs = td::network_batch();
    auto tb = total_bytes(msgs);
    int64_t mc = 0;
    for (auto _ : st) {
        for (auto& m : msgs) { auto v = nlohmann::json::parse(m); benchmark::DoNotOptimize(v); }
        mc += int64_t(msgs.size());
    }
    st.SetBytesProcessed(st.iterations() * int64_t(tb));
    st.counters["msg/s"] = benchmark::Counter(double(mc), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_NetBatch_Nlohmann);

static void BM_NetBatch_Simdjson(benchmark::State& st) {
    auto msgs = td::network_batch();
    auto tb = total_bytes(msgs);
    std::vector<simdjson::padded_string> padded;
    padded.reserve(msgs.size());
    for (auto& m : msgs) padded.emplace_back(m);
    simdjson::dom::parser parser;
    int64_t mc = 0;
    for (auto _ : st) {
        for (auto& p : padded) { auto doc = parser.parse(p); benchmark::DoNotOptimize(doc); }
        mc += int64_t(msgs.size());
    }
    st.SetBytesProcessed(st.iterations() * int64_t(tb));
    st.counters["msg/s"] = benchmark::Counter(double(mc), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_NetBatch_Simdjson);

// ═══════════════════════════════════════════════════════════════════════════════
// 4. ENCODE COMPACT: LARGE
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Encode_Large_Mjson(benchmark::State& st) {
    auto v = mjson::decode_one(td::large_json());
    for (auto _ : st) { auto s = mjson::encode(v); benchmark::DoNotOptimize(s); }
}
BENCHMARK(BM_Encode_Large_Mjson);

static void BM_Encode_Large_Boost(benchmark::State& st) {
    auto v = boost::json::parse(td::large_json());
    for (auto _ : st) { auto s = boost::json::serialize(v); benchmark::DoNotOptimize(s); }
}
BENCHMARK(BM_Encode_Large_Boost);

static void BM_Encode_Large_Rapid(benchmark::State& st) {
    auto in = td::large_json();
    rapidjson::Document doc;
    doc.Parse(in.c_str(), in.size());
    for (auto _ : st) {
        rapidjson::StringBuffer buf;
        rapidjson::Writer<rapidjson::StringBuffer> w(buf);
        doc.Accept(w);
        benchmark::DoNotOptimize(buf.GetString());
    }
}
BENCHMARK(BM_Encode_Large_Rapid);

static void BM_Encode_Large_Nlohmann(benchmark::State& st) {
    auto v = nlohmann::json::parse(td::large_json());
    for (auto _ : st) { auto s = v.dump(); benchmark::DoNotOptimize(s); }
}
BENCHMARK(BM_Encode_Large_Nlohmann);

// ═══════════════════════════════════════════════════════════════════════════════
// 5. ENCODE SORTED KEYS: FLAT OBJECT 1K
// ═══════════════════════════════════════════════════════════════════════════════

// nlohmann::json keeps objects in a std::map, so plain dump() is already sorted.

static void BM_EncodeSorted_FlatObj1K_Mjson(benchmark::State& st) {
    auto v = mjson::decode_one(td::flat_object(1000));
    for (auto _ : st) {
        auto s = mjson::encode(v, mjson::OPT_SORT_KEYS);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeSorted_FlatObj1K_Mjson);

static void BM_EncodeSorted_FlatObj1K_Nlohmann(benchmark::State& st) {
    auto v = nlohmann::json::parse(td::flat_object(1000));
    for (auto _ : st) { auto s = v.dump(); benchmark::DoNotOptimize(s); }
}
BENCHMARK(BM_EncodeSorted_FlatObj1K_Nlohmann);

BENCHMARK_MAIN();
