#pragma once

#include <algorithm>
#include <cmath>
#include <span>
#include <type_traits>
#include "../concepts/distance_metric.hpp"
#include "../concepts/vector_element.hpp"

namespace vecindex_cpp::distances {

/// Cosine similarity = dot(a,b) / (||a|| * ||b||), in [-1, 1]
/// Returns 0 when either vector has zero magnitude.
template <concepts::VectorElement T>
float cosine_similarity(std::span<const T> a, std::span<const T> b) {
    const std::size_t n = std::min(a.size(), b.size());

    float dot = 0.0f;
    float a_mag = 0.0f;
    float b_mag = 0.0f;

    for (std::size_t i = 0; i < n; ++i) {
        const float a_val = static_cast<float>(a[i]);
        const float b_val = static_cast<float>(b[i]);
        dot += a_val * b_val;
        a_mag += a_val * a_val;
        b_mag += b_val * b_val;
    }

    const float denominator = std::sqrt(a_mag) * std::sqrt(b_mag);
    return denominator == 0.0f ? 0.0f : dot / denominator;
}

/// Cosine distance = 1 - cosine_similarity, in [0, 2]
template <concepts::VectorElement T>
float cosine_distance(std::span<const T> a, std::span<const T> b) {
    return 1.0f - cosine_similarity(a, b);
}

/// CosineMetric functor
/// Not used by the default index; pass it as the HNSWIndex metric to rank by angle.
template <concepts::VectorElement T> struct CosineMetric {
    using element_type = T;

    [[nodiscard]] float operator()(std::span<const T> a, std::span<const T> b) const {
        // Clamp rounding noise so distances stay non-negative
        return std::max(0.0f, cosine_distance(a, b));
    }
};

} // namespace vecindex_cpp::distances

namespace vecindex_cpp::concepts::traits {
template <typename T>
struct is_symmetric<vecindex_cpp::distances::CosineMetric<T>> : std::true_type {};

template <typename T>
struct is_similarity<vecindex_cpp::distances::CosineMetric<T>> : std::true_type {};
} // namespace vecindex_cpp::concepts::traits

namespace vecindex_cpp::distances {

static_assert(concepts::DistanceMetric<CosineMetric<float>, float>);
static_assert(concepts::traits::is_similarity_v<CosineMetric<float>>);

} // namespace vecindex_cpp::distances
