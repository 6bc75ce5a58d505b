/// @file bench_dictionary.cpp
/// @brief Benchmarks for seqdict containers.
///
/// Measures:
///   - Indexed lookup vs linear scan of the record sequence
///   - Mutation cost (append, in-place set, remove)
///   - Index rebuild after load
///   - Save / load throughput (MB/s) of the persisted form

#include <seqdict/seqdict.hpp>

#include <benchmark/benchmark.h>

#include <random>
#include <string>
#include <vector>

using namespace seqdict;

// ═══════════════════════════════════════════════════════════════════════════════
// Data generators
// ═══════════════════════════════════════════════════════════════════════════════

static SerializableDictionary<int, int> gen_int_dict(int n) {
    SerializableDictionary<int, int> d;
    for (int i = 0; i < n; ++i) d.add(i, i * 10);
    return d;
}

static SerializableDictionary<std::string, std::string> gen_string_dict(int n) {
    SerializableDictionary<std::string, std::string> d;
    for (int i = 0; i < n; ++i) {
        d.add("item_" + std::to_string(i), std::string(24, static_cast<char>('a' + i % 26)));
    }
    return d;
}

static std::vector<int> gen_lookup_keys(int n, int count) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> dist(0, n - 1);
    std::vector<int> keys(static_cast<size_t>(count));
    for (auto& k : keys) k = dist(rng);
    return keys;
}

// ═══════════════════════════════════════════════════════════════════════════════
// LOOKUP — index vs scan
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Lookup_Index(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto d = gen_int_dict(n);
    auto lookups = gen_lookup_keys(n, 1024);
    for (auto _ : state) {
        int64_t sum = 0;
        for (int k : lookups) sum += d.get(k);
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(lookups.size()));
}
BENCHMARK(BM_Lookup_Index)->Arg(16)->Arg(256)->Arg(4096)->Arg(65536);

static void BM_Lookup_Scan(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto d = gen_int_dict(n);
    const auto& records = d.records();
    auto lookups = gen_lookup_keys(n, 1024);
    for (auto _ : state) {
        int64_t sum = 0;
        for (int k : lookups) {
            for (const auto& rec : records) {
                if (rec.key() == k) { sum += rec.value(); break; }
            }
        }
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(lookups.size()));
}
BENCHMARK(BM_Lookup_Scan)->Arg(16)->Arg(256)->Arg(4096);

static void BM_Lookup_StringKeys(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto d = gen_string_dict(n);
    auto lookups = gen_lookup_keys(n, 1024);
    std::vector<std::string> keys;
    keys.reserve(lookups.size());
    for (int k : lookups) keys.push_back("item_" + std::to_string(k));
    for (auto _ : state) {
        size_t total = 0;
        for (const auto& k : keys) total += d.get(k).size();
        benchmark::DoNotOptimize(total);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(keys.size()));
}
BENCHMARK(BM_Lookup_StringKeys)->Arg(256)->Arg(4096);

// ═══════════════════════════════════════════════════════════════════════════════
// MUTATION
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Mutate_Append(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto d = gen_int_dict(n);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Mutate_Append)->Arg(256)->Arg(4096);

static void BM_Mutate_SetInPlace(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto d = gen_int_dict(n);
    auto lookups = gen_lookup_keys(n, 256);
    int v = 0;
    for (auto _ : state) {
        for (int k : lookups) d.set(k, ++v);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(lookups.size()));
}
BENCHMARK(BM_Mutate_SetInPlace)->Arg(16)->Arg(256)->Arg(4096);

static void BM_Mutate_RemoveReadd(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto d = gen_int_dict(n);
    auto lookups = gen_lookup_keys(n, 256);
    for (auto _ : state) {
        for (int k : lookups) {
            d.remove(k);
            d.add(k, k);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(lookups.size()));
}
BENCHMARK(BM_Mutate_RemoveReadd)->Arg(256)->Arg(4096);

// ═══════════════════════════════════════════════════════════════════════════════
// LOAD HOOK — rebuild after the record sequence is replaced
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_AfterLoad_Rebuild(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    const auto records = gen_int_dict(n).records();
    for (auto _ : state) {
        SerializableDictionary<int, int> d;
        d.load(records);
        benchmark::DoNotOptimize(d.get(0));
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_AfterLoad_Rebuild)->Arg(256)->Arg(4096)->Arg(65536);

static void BM_AfterLoad_CollapseDuplicates(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    PairList<int, int> records;
    for (int i = 0; i < n; ++i) records.add(i % (n / 2), i);
    set_log_level(spdlog::level::off);
    for (auto _ : state) {
        SerializableDictionary<int, int> d;
        d.load(records);
        benchmark::DoNotOptimize(d.size());
    }
    set_log_level(spdlog::level::warn);
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_AfterLoad_CollapseDuplicates)->Arg(256)->Arg(4096);

// ═══════════════════════════════════════════════════════════════════════════════
// PERSISTENCE THROUGHPUT — MB/s of the persisted form
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Save_IntDict(benchmark::State& state) {
    auto d = gen_int_dict(static_cast<int>(state.range(0)));
    size_t bytes = 0;
    for (auto _ : state) {
        auto text = save_string(d);
        bytes = text.size();
        benchmark::DoNotOptimize(text);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_Save_IntDict)->Arg(256)->Arg(4096);

static void BM_Load_IntDict(benchmark::State& state) {
    const auto text = save_string(gen_int_dict(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto d = load_string<SerializableDictionary<int, int>>(text);
        benchmark::DoNotOptimize(d);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Load_IntDict)->Arg(256)->Arg(4096);

static void BM_Load_StringDict(benchmark::State& state) {
    const auto text = save_string(gen_string_dict(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto d = load_string<SerializableDictionary<std::string, std::string>>(text);
        benchmark::DoNotOptimize(d);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Load_StringDict)->Arg(256)->Arg(4096);

static void BM_Load_Lenient(benchmark::State& state) {
    auto text = save_string(gen_int_dict(static_cast<int>(state.range(0))));
    text.insert(1, "// save file\n");
    for (auto _ : state) {
        auto d = load_string<SerializableDictionary<int, int>>(text, ReadOptions::lenient());
        benchmark::DoNotOptimize(d);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Load_Lenient)->Arg(4096);
