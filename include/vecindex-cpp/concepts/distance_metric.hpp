#pragma once

#include <concepts>
#include <span>
#include <type_traits>
#include <utility> // for std::as_const
#include "vector_element.hpp"

namespace vecindex_cpp::concepts {

/// Concept for distance metric functors
/// A distance metric takes two spans and returns a non-negative dissimilarity
/// where smaller means closer
template <typename M, typename T>
concept DistanceMetric =
    VectorElement<T> && std::default_initializable<M> &&
    requires(const M& metric, std::span<const T> a, std::span<const T> b) {
        { metric(a, b) } -> std::convertible_to<float>;
        { std::as_const(metric)(a, b) } -> std::convertible_to<float>;
    };

namespace traits {

/// Check if a metric is symmetric
template <typename M> struct is_symmetric : std::false_type {};

/// Check if a metric is derived from a similarity score (vs a true distance)
template <typename M> struct is_similarity : std::false_type {};

template <typename M> inline constexpr bool is_symmetric_v = is_symmetric<M>::value;

template <typename M> inline constexpr bool is_similarity_v = is_similarity<M>::value;

} // namespace traits

} // namespace vecindex_cpp::concepts
