#pragma once

#include <algorithm>
#include <span>
#include <type_traits>
#include "../concepts/distance_metric.hpp"
#include "../concepts/vector_element.hpp"

#ifdef VECINDEX_ENABLE_AVX
#include "../simd/avx.hpp"
#endif

namespace vecindex_cpp::distances {

/// Squared Euclidean distance: sum of (a_i - b_i)^2
/// Only the first min(|a|, |b|) components are compared. The square root is
/// skipped because nearest-neighbor ordering is unchanged by it.
template <concepts::VectorElement T>
float squared_l2_distance_fallback(std::span<const T> a, std::span<const T> b) {
    const std::size_t n = std::min(a.size(), b.size());

    float sum = 0.0f;
    for (std::size_t i = 0; i < n; ++i) {
        const float diff = static_cast<float>(a[i]) - static_cast<float>(b[i]);
        sum += diff * diff;
    }
    return sum;
}

/// Main squared L2 entry point with SIMD dispatch
template <concepts::VectorElement T>
float squared_l2_distance(std::span<const T> a, std::span<const T> b) {
    if constexpr (std::is_same_v<T, float>) {
#ifdef VECINDEX_ENABLE_AVX
        const std::size_t n = std::min(a.size(), b.size());
        if (n >= 16) {
            return simd::squared_l2_float_avx(a, b, n);
        }
#endif
    }
    return squared_l2_distance_fallback(a, b);
}

/// SquaredL2Metric functor (the index's default ranking function)
template <concepts::VectorElement T> struct SquaredL2Metric {
    using element_type = T;

    [[nodiscard]] float operator()(std::span<const T> a, std::span<const T> b) const {
        return squared_l2_distance(a, b);
    }
};

} // namespace vecindex_cpp::distances

namespace vecindex_cpp::concepts::traits {
template <typename T>
struct is_symmetric<vecindex_cpp::distances::SquaredL2Metric<T>> : std::true_type {};
} // namespace vecindex_cpp::concepts::traits

namespace vecindex_cpp::distances {

static_assert(concepts::DistanceMetric<SquaredL2Metric<float>, float>);
static_assert(concepts::traits::is_symmetric_v<SquaredL2Metric<float>>);

} // namespace vecindex_cpp::distances
