// SPDX-License-Identifier: Apache-2.0 OR MIT
// Benchmark for HNSW index performance

#include <algorithm>
#include <filesystem>
#include <memory>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <benchmark/benchmark.h>
#include <vecindex-cpp/distances/l2.hpp>
#include <vecindex-cpp/index/hnsw.hpp>
#include <vecindex-cpp/index/hnsw_persistence.hpp>

using namespace vecindex_cpp;
using namespace vecindex_cpp::index;
using namespace vecindex_cpp::distances;

// ============================================================================
// Helpers
// ============================================================================

namespace {

struct DatasetKey {
    size_t corpus = 0;
    size_t dim = 0;

    bool operator==(const DatasetKey& other) const {
        return corpus == other.corpus && dim == other.dim;
    }
};

struct DatasetKeyHash {
    size_t operator()(const DatasetKey& key) const {
        return (key.corpus * 1315423911u) ^ (key.dim + 0x9e3779b97f4a7c15ULL);
    }
};

constexpr size_t kMaxCorpusDefault = 50000;

std::vector<float> generate_vector(size_t dim, std::mt19937& rng) {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> vec(dim);
    for (auto& v : vec) {
        v = dist(rng);
    }
    return vec;
}

/// Cached corpus of documents with ids "doc-<i>"
const std::vector<VectorDocument>& get_documents(size_t corpus_size, size_t dim) {
    static std::unordered_map<DatasetKey, std::shared_ptr<std::vector<VectorDocument>>,
                              DatasetKeyHash>
        cache;

    DatasetKey key{corpus_size, dim};
    auto it = cache.find(key);
    if (it != cache.end()) {
        return *it->second;
    }

    std::mt19937 rng(42);
    auto docs = std::make_shared<std::vector<VectorDocument>>();
    docs->reserve(corpus_size);
    for (size_t i = 0; i < corpus_size; ++i) {
        docs->push_back(VectorDocument{"doc-" + std::to_string(i), "owner",
                                       generate_vector(dim, rng), {}, {}});
    }

    cache.emplace(key, docs);
    return *docs;
}

std::vector<std::vector<float>> make_queries(size_t count, size_t dim, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<std::vector<float>> queries;
    queries.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        queries.push_back(generate_vector(dim, rng));
    }
    return queries;
}

/// Index built once per (corpus, dim) and shared between search benchmarks
const HNSWIndex<>& get_index(size_t corpus_size, size_t dim) {
    static std::unordered_map<DatasetKey, std::unique_ptr<HNSWIndex<>>, DatasetKeyHash> cache;

    DatasetKey key{corpus_size, dim};
    auto it = cache.find(key);
    if (it != cache.end()) {
        return *it->second;
    }

    auto index = std::make_unique<HNSWIndex<>>();
    if (auto added = index->add(get_documents(corpus_size, dim)); !added) {
        throw std::runtime_error(added.error().message);
    }
    const auto& ref = *index;
    cache.emplace(key, std::move(index));
    return ref;
}

} // namespace

// ============================================================================
// Benchmark: HNSW Index Build
// ============================================================================

static void BM_HNSW_Build(benchmark::State& state) {
    size_t num_vectors = std::min<size_t>(state.range(0), kMaxCorpusDefault);
    size_t dim = state.range(1);

    const auto& docs = get_documents(num_vectors, dim);

    for (auto _ : state) {
        HNSWIndex<> index;
        auto added = index.add(docs);
        benchmark::DoNotOptimize(added);
    }

    state.counters["vectors"] = num_vectors;
    state.counters["vectors/sec"] =
        benchmark::Counter(num_vectors, benchmark::Counter::kIsIterationInvariantRate);
}

BENCHMARK(BM_HNSW_Build)->Args({1000, 384})->Unit(benchmark::kMillisecond);
BENCHMARK(BM_HNSW_Build)->Args({10000, 384})->Unit(benchmark::kMillisecond);

// ============================================================================
// Benchmark: HNSW Search Latency
// ============================================================================

static void BM_HNSW_Search(benchmark::State& state) {
    size_t corpus_size = std::min<size_t>(state.range(0), kMaxCorpusDefault);
    size_t dim = state.range(1);
    size_t k = state.range(2);
    size_t ef_search = state.range(3);

    const auto& index = get_index(corpus_size, dim);
    const auto queries = make_queries(1, dim, 43);
    const auto& query = queries[0];

    for (auto _ : state) {
        auto results = index.search(std::span<const float>{query}, k, ef_search);
        benchmark::DoNotOptimize(results);
    }

    state.counters["corpus"] = corpus_size;
    state.counters["k"] = k;
    state.counters["ef"] = ef_search;
    state.counters["QPS"] = benchmark::Counter(1, benchmark::Counter::kIsRate);
}

// Corpus size scaling (384d, k=10, ef=50)
BENCHMARK(BM_HNSW_Search)->Args({1000, 384, 10, 50});
BENCHMARK(BM_HNSW_Search)->Args({10000, 384, 10, 50});

// ef_search scaling (10K corpus, 384d, k=10)
BENCHMARK(BM_HNSW_Search)->Args({10000, 384, 10, 10});
BENCHMARK(BM_HNSW_Search)->Args({10000, 384, 10, 100});
BENCHMARK(BM_HNSW_Search)->Args({10000, 384, 10, 200});

// ============================================================================
// Benchmark: HNSW vs Brute-Force Comparison
// ============================================================================

static void BM_Brute_Force_Search(benchmark::State& state) {
    size_t corpus_size = std::min<size_t>(state.range(0), kMaxCorpusDefault);
    size_t dim = state.range(1);
    size_t k = state.range(2);

    const auto& docs = get_documents(corpus_size, dim);
    const auto queries = make_queries(1, dim, 43);
    const auto& query = queries[0];
    SquaredL2Metric<float> metric;

    for (auto _ : state) {
        std::vector<std::pair<size_t, float>> results;
        results.reserve(corpus_size);
        for (size_t i = 0; i < corpus_size; ++i) {
            float dist =
                metric(std::span<const float>{query}, std::span<const float>{docs[i].vector});
            results.emplace_back(i, dist);
        }
        std::partial_sort(results.begin(), results.begin() + k, results.end(),
                          [](const auto& a, const auto& b) { return a.second < b.second; });
        results.resize(k);
        benchmark::DoNotOptimize(results);
    }

    state.counters["corpus"] = corpus_size;
    state.counters["k"] = k;
    state.counters["QPS"] = benchmark::Counter(1, benchmark::Counter::kIsRate);
}

BENCHMARK(BM_Brute_Force_Search)->Args({1000, 384, 10});
BENCHMARK(BM_Brute_Force_Search)->Args({10000, 384, 10});

// ============================================================================
// Benchmark: Recall Quality vs ef_search
// ============================================================================

static void BM_HNSW_Recall_Quality(benchmark::State& state) {
    const size_t corpus_size = 10000;
    const size_t dim = 128;
    const size_t k = 10;
    const size_t ef_search = state.range(0);
    const size_t num_queries = 50;

    const auto& docs = get_documents(corpus_size, dim);
    const auto& index = get_index(corpus_size, dim);
    const auto queries = make_queries(num_queries, dim, 44);

    SquaredL2Metric<float> metric;
    std::vector<std::unordered_set<std::string>> gt_sets(num_queries);
    for (size_t q = 0; q < num_queries; ++q) {
        std::vector<std::pair<float, size_t>> ground_truth;
        ground_truth.reserve(corpus_size);
        for (size_t i = 0; i < corpus_size; ++i) {
            ground_truth.emplace_back(metric(std::span<const float>{queries[q]},
                                             std::span<const float>{docs[i].vector}),
                                      i);
        }
        std::partial_sort(ground_truth.begin(), ground_truth.begin() + k, ground_truth.end());
        for (size_t i = 0; i < k; ++i) {
            gt_sets[q].insert(docs[ground_truth[i].second].id);
        }
    }

    double recall = 0.0;
    for (auto _ : state) {
        size_t total_hits = 0;
        for (size_t q = 0; q < num_queries; ++q) {
            auto results = index.search(std::span<const float>{queries[q]}, k, ef_search);
            if (!results) {
                state.SkipWithError(results.error().message.c_str());
                return;
            }
            for (const auto& r : *results) {
                total_hits += gt_sets[q].count(r.document_id);
            }
        }
        recall = static_cast<double>(total_hits) / static_cast<double>(num_queries * k);
        benchmark::DoNotOptimize(recall);
    }

    state.counters["recall"] = recall * 100.0;
    state.counters["ef"] = static_cast<double>(ef_search);
}

BENCHMARK(BM_HNSW_Recall_Quality)->Arg(10);
BENCHMARK(BM_HNSW_Recall_Quality)->Arg(50);
BENCHMARK(BM_HNSW_Recall_Quality)->Arg(100);
BENCHMARK(BM_HNSW_Recall_Quality)->Arg(200);

// ============================================================================
// Benchmark: Removal
// ============================================================================

static void BM_HNSW_Remove(benchmark::State& state) {
    const size_t corpus_size = state.range(0);
    const size_t dim = 128;
    const auto& docs = get_documents(corpus_size, dim);

    for (auto _ : state) {
        state.PauseTiming();
        HNSWIndex<> index;
        auto added = index.add(docs);
        benchmark::DoNotOptimize(added);
        state.ResumeTiming();

        for (size_t i = 0; i < corpus_size; i += 10) {
            auto removed = index.remove(docs[i].id);
            benchmark::DoNotOptimize(removed);
        }
    }
    state.counters["removed"] = static_cast<double>(corpus_size / 10);
}

BENCHMARK(BM_HNSW_Remove)->Arg(2000)->Unit(benchmark::kMillisecond);

// ============================================================================
// Benchmark: Snapshot save/load
// ============================================================================

static void BM_HNSW_Save_Load(benchmark::State& state) {
    const size_t corpus_size = state.range(0);
    const size_t dim = 384;
    const auto& index = get_index(corpus_size, dim);
    const auto path = std::filesystem::temp_directory_path() / "vecindex-benchmark.db";

    for (auto _ : state) {
        if (auto saved = save_hnsw_index(index, path); !saved) {
            state.SkipWithError(saved.error().message.c_str());
            break;
        }
        HNSWIndex<> loaded;
        if (auto restored = load_hnsw_index(loaded, path); !restored) {
            state.SkipWithError(restored.error().message.c_str());
            break;
        }
        benchmark::DoNotOptimize(loaded);
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    state.counters["nodes"] = static_cast<double>(corpus_size);
}

BENCHMARK(BM_HNSW_Save_Load)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);
