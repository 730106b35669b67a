#pragma once

#include <cstddef>
#include <type_traits>

namespace vecindex_cpp::concepts {

/// Concept for types that can be used as vector elements
template <typename T>
concept VectorElement = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

/// Concept for floating-point vector elements
template <typename T>
concept FloatingPointElement = VectorElement<T> && std::is_floating_point_v<T>;

/// Concept for integer vector elements
template <typename T>
concept IntegerElement = VectorElement<T> && std::is_integral_v<T>;

namespace traits {

/// Storage size in bytes for a vector element type
template <VectorElement T> constexpr std::size_t element_size_v = sizeof(T);

/// Embeddings handed to the index are always single-precision
template <typename T> constexpr bool is_embedding_element_v = std::is_same_v<T, float>;

} // namespace traits

static_assert(VectorElement<float>, "float must satisfy VectorElement");
static_assert(VectorElement<double>, "double must satisfy VectorElement");
static_assert(!VectorElement<bool>, "bool must NOT satisfy VectorElement");
static_assert(FloatingPointElement<float>, "float must satisfy FloatingPointElement");
static_assert(!FloatingPointElement<int>, "int must NOT satisfy FloatingPointElement");

} // namespace vecindex_cpp::concepts
