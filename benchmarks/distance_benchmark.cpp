// SPDX-License-Identifier: Apache-2.0 OR MIT
// Distance metric microbenchmarks

#include <algorithm>
#include <cstdint>
#include <random>
#include <span>
#include <vector>
#include <benchmark/benchmark.h>
#include <vecindex-cpp/distances/cosine.hpp>
#include <vecindex-cpp/distances/l2.hpp>

using namespace vecindex_cpp::distances;

namespace {

std::vector<float> generate_random_vector(std::size_t dim, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> vec(dim);
    std::generate(vec.begin(), vec.end(), [&]() { return dist(gen); });
    return vec;
}

} // namespace

// ============================================================================
// Squared L2
// ============================================================================

static void BM_SquaredL2(benchmark::State& state) {
    const auto dim = static_cast<std::size_t>(state.range(0));
    auto a = generate_random_vector(dim, 42);
    auto b = generate_random_vector(dim, 43);

    for (auto _ : state) {
        float result = squared_l2_distance(std::span<const float>(a), std::span<const float>(b));
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(dim));
}
BENCHMARK(BM_SquaredL2)->Arg(128)->Arg(384)->Arg(768)->Arg(1536);

static void BM_SquaredL2_Scalar(benchmark::State& state) {
    const auto dim = static_cast<std::size_t>(state.range(0));
    auto a = generate_random_vector(dim, 42);
    auto b = generate_random_vector(dim, 43);

    for (auto _ : state) {
        float result =
            squared_l2_distance_fallback(std::span<const float>(a), std::span<const float>(b));
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(dim));
}
BENCHMARK(BM_SquaredL2_Scalar)->Arg(128)->Arg(384)->Arg(768)->Arg(1536);

// ============================================================================
// Cosine
// ============================================================================

static void BM_CosineDistance(benchmark::State& state) {
    const auto dim = static_cast<std::size_t>(state.range(0));
    auto a = generate_random_vector(dim, 42);
    auto b = generate_random_vector(dim, 43);

    for (auto _ : state) {
        float result = cosine_distance(std::span<const float>(a), std::span<const float>(b));
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(dim));
}
BENCHMARK(BM_CosineDistance)->Arg(128)->Arg(384)->Arg(768)->Arg(1536);
