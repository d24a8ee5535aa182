#pragma once

#include <cmath>
#include <cstddef>

#include <immintrin.h>

namespace rfpindex {
namespace distance {

// --- Scalar kernels ---
static inline float
L2SqrScalar(const float *pVect1, const float *pVect2, size_t qty) {
    float res = 0;
    for (size_t i = 0; i < qty; i++) {
        float t = pVect1[i] - pVect2[i];
        res += t * t;
    }
    return res;
}

static inline float
InnerProductScalar(const float *pVect1, const float *pVect2, size_t qty) {
    float res = 0;
    for (size_t i = 0; i < qty; i++) {
        res += pVect1[i] * pVect2[i];
    }
    return res;
}

#if defined(__AVX__)
static inline float
horizontalSum256(__m256 v) {
    __m128 vlow = _mm256_castps256_ps128(v);
    __m128 vhigh = _mm256_extractf128_ps(v, 1);
    vlow = _mm_add_ps(vlow, vhigh);
    __m128 shuf = _mm_movehdup_ps(vlow);
    __m128 sums = _mm_add_ps(vlow, shuf);
    shuf = _mm_movehl_ps(shuf, sums);
    sums = _mm_add_ss(sums, shuf);
    return _mm_cvtss_f32(sums);
}

// --- AVX kernels (16 floats per iteration as two 8-wide lanes) ---
static inline float
L2Sqr_AVX_16(const float *pVect1, const float *pVect2, size_t qty) {
    const float *pEnd1 = pVect1 + ((qty >> 4) << 4);
    __m256 sum0 = _mm256_setzero_ps();
    __m256 sum1 = _mm256_setzero_ps();

    while (pVect1 < pEnd1) {
        __m256 d0 = _mm256_sub_ps(_mm256_loadu_ps(pVect1), _mm256_loadu_ps(pVect2));
        __m256 d1 = _mm256_sub_ps(_mm256_loadu_ps(pVect1 + 8), _mm256_loadu_ps(pVect2 + 8));
        sum0 = _mm256_add_ps(sum0, _mm256_mul_ps(d0, d0));
        sum1 = _mm256_add_ps(sum1, _mm256_mul_ps(d1, d1));
        pVect1 += 16;
        pVect2 += 16;
    }
    return horizontalSum256(_mm256_add_ps(sum0, sum1));
}

static inline float
InnerProduct_AVX_16(const float *pVect1, const float *pVect2, size_t qty) {
    const float *pEnd1 = pVect1 + ((qty >> 4) << 4);
    __m256 sum0 = _mm256_setzero_ps();
    __m256 sum1 = _mm256_setzero_ps();

    while (pVect1 < pEnd1) {
        sum0 = _mm256_add_ps(sum0, _mm256_mul_ps(_mm256_loadu_ps(pVect1), _mm256_loadu_ps(pVect2)));
        sum1 = _mm256_add_ps(sum1, _mm256_mul_ps(_mm256_loadu_ps(pVect1 + 8), _mm256_loadu_ps(pVect2 + 8)));
        pVect1 += 16;
        pVect2 += 16;
    }
    return horizontalSum256(_mm256_add_ps(sum0, sum1));
}
#endif

#if defined(__SSE__)
// --- SSE kernels (4 floats per iteration) ---
static inline float
L2Sqr_SSE_4(const float *pVect1, const float *pVect2, size_t qty) {
    alignas(16) float TmpRes[4];
    const float *pEnd1 = pVect1 + ((qty >> 2) << 2);
    __m128 sum = _mm_setzero_ps();

    while (pVect1 < pEnd1) {
        __m128 diff = _mm_sub_ps(_mm_loadu_ps(pVect1), _mm_loadu_ps(pVect2));
        sum = _mm_add_ps(sum, _mm_mul_ps(diff, diff));
        pVect1 += 4;
        pVect2 += 4;
    }
    _mm_store_ps(TmpRes, sum);
    return TmpRes[0] + TmpRes[1] + TmpRes[2] + TmpRes[3];
}

static inline float
InnerProduct_SSE_4(const float *pVect1, const float *pVect2, size_t qty) {
    alignas(16) float TmpRes[4];
    const float *pEnd1 = pVect1 + ((qty >> 2) << 2);
    __m128 sum = _mm_setzero_ps();

    while (pVect1 < pEnd1) {
        sum = _mm_add_ps(sum, _mm_mul_ps(_mm_loadu_ps(pVect1), _mm_loadu_ps(pVect2)));
        pVect1 += 4;
        pVect2 += 4;
    }
    _mm_store_ps(TmpRes, sum);
    return TmpRes[0] + TmpRes[1] + TmpRes[2] + TmpRes[3];
}
#endif

// Widest available kernel on the aligned prefix, scalar on the tail.
static inline float
L2Sqr(const float *v1, const float *v2, size_t dim) {
#if defined(__AVX__)
    size_t head = (dim >> 4) << 4;
    float res = head ? L2Sqr_AVX_16(v1, v2, head) : 0.0f;
#elif defined(__SSE__)
    size_t head = (dim >> 2) << 2;
    float res = head ? L2Sqr_SSE_4(v1, v2, head) : 0.0f;
#else
    size_t head = 0;
    float res = 0.0f;
#endif
    if (head < dim) {
        res += L2SqrScalar(v1 + head, v2 + head, dim - head);
    }
    return res;
}

static inline float
InnerProduct(const float *v1, const float *v2, size_t dim) {
#if defined(__AVX__)
    size_t head = (dim >> 4) << 4;
    float res = head ? InnerProduct_AVX_16(v1, v2, head) : 0.0f;
#elif defined(__SSE__)
    size_t head = (dim >> 2) << 2;
    float res = head ? InnerProduct_SSE_4(v1, v2, head) : 0.0f;
#else
    size_t head = 0;
    float res = 0.0f;
#endif
    if (head < dim) {
        res += InnerProductScalar(v1 + head, v2 + head, dim - head);
    }
    return res;
}

/**
 * Distance policies used as template parameters by the index
 * implementations. compare() is a distance: smaller means closer.
 */
struct SquaredL2 {
    static float compare(const float* v1, const float* v2, size_t dim) {
        return L2Sqr(v1, v2, dim);
    }
    // Similarity reported to callers, in (0, 1].
    static float to_similarity(float dist) {
        return 1.0f / (1.0f + dist);
    }
};

// 1 - <v1, v2>, the hnswlib convention; equals the cosine distance when
// both vectors are unit length.
struct InnerProductDistance {
    static float compare(const float* v1, const float* v2, size_t dim) {
        return 1.0f - InnerProduct(v1, v2, dim);
    }
    static float to_similarity(float dist) {
        return 1.0f - dist;
    }
};

/**
 * Scale v to unit length in place. Zero vectors are left untouched.
 */
inline void normalize(float* v, size_t dim) {
    float norm = std::sqrt(InnerProduct(v, v, dim));
    if (norm > 0.0f) {
        float inv = 1.0f / norm;
        for (size_t i = 0; i < dim; ++i) {
            v[i] *= inv;
        }
    }
}

} // namespace distance
} // namespace rfpindex
