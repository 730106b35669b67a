#pragma once

#ifdef VECINDEX_ENABLE_AVX

#include <cstdint>
#include <immintrin.h>
#include <span>

namespace vecindex_cpp::distances::simd {

/// AVX squared L2 distance for float vectors over the first `size` elements
/// Requires: AVX support, size >= 16
inline float squared_l2_float_avx(std::span<const float> a, std::span<const float> b,
                                  std::size_t size) {
    alignas(32) float tmp_result[8];
    const std::size_t end_idx = (size >> 4) << 4; // (size / 16) * 16

    __m256 sum = _mm256_set1_ps(0.0f);
    std::size_t i = 0;

    while (i < end_idx) {
        __m256 v1 = _mm256_loadu_ps(&a[i]);
        __m256 v2 = _mm256_loadu_ps(&b[i]);
        __m256 diff = _mm256_sub_ps(v1, v2);
        sum = _mm256_add_ps(sum, _mm256_mul_ps(diff, diff));
        i += 8;

        v1 = _mm256_loadu_ps(&a[i]);
        v2 = _mm256_loadu_ps(&b[i]);
        diff = _mm256_sub_ps(v1, v2);
        sum = _mm256_add_ps(sum, _mm256_mul_ps(diff, diff));
        i += 8;
    }

    _mm256_store_ps(tmp_result, sum);
    float scalar_sum = tmp_result[0] + tmp_result[1] + tmp_result[2] + tmp_result[3] +
                       tmp_result[4] + tmp_result[5] + tmp_result[6] + tmp_result[7];

    // Tail
    while (i < size) {
        const float diff = a[i] - b[i];
        scalar_sum += diff * diff;
        ++i;
    }

    return scalar_sum;
}

} // namespace vecindex_cpp::distances::simd

#endif // VECINDEX_ENABLE_AVX
