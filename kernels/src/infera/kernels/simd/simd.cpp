#include "infera/kernels/simd/simd.hpp"

#if defined(INFERA_SIMD) && defined(__AVX2__)
#define INFERA_AVX2 1
#include <immintrin.h>
#else
#define INFERA_AVX2 0
#endif

namespace infera::kernels::simd {

namespace {

template <BinaryFn F> inline float apply(float a, float b) {
  if constexpr (F == BinaryFn::Add) {
    return a + b;
  } else if constexpr (F == BinaryFn::Sub) {
    return a - b;
  } else if constexpr (F == BinaryFn::Mul) {
    return a * b;
  } else if constexpr (F == BinaryFn::Div) {
    return a / b;
  } else if constexpr (F == BinaryFn::Max) {
    // same NaN behaviour as _mm256_max_ps
    return a > b ? a : b;
  } else {
    return a < b ? a : b;
  }
}

#if INFERA_AVX2
template <BinaryFn F> inline __m256 apply(__m256 a, __m256 b) {
  if constexpr (F == BinaryFn::Add) {
    return _mm256_add_ps(a, b);
  } else if constexpr (F == BinaryFn::Sub) {
    return _mm256_sub_ps(a, b);
  } else if constexpr (F == BinaryFn::Mul) {
    return _mm256_mul_ps(a, b);
  } else if constexpr (F == BinaryFn::Div) {
    return _mm256_div_ps(a, b);
  } else if constexpr (F == BinaryFn::Max) {
    return _mm256_max_ps(a, b);
  } else {
    return _mm256_min_ps(a, b);
  }
}
#endif

template <BinaryFn F>
void binaryImpl(const float *a, std::size_t aStep, const float *b,
                std::size_t bStep, float *out, std::size_t n) {
  std::size_t i = 0;
#if INFERA_AVX2
  if (aStep == 1 && bStep == 1) {
    for (; i + 8 <= n; i += 8) {
      _mm256_storeu_ps(out + i, apply<F>(_mm256_loadu_ps(a + i),
                                         _mm256_loadu_ps(b + i)));
    }
  } else if (aStep == 1) {
    __m256 vb = _mm256_set1_ps(*b);
    for (; i + 8 <= n; i += 8) {
      _mm256_storeu_ps(out + i, apply<F>(_mm256_loadu_ps(a + i), vb));
    }
  } else if (bStep == 1) {
    __m256 va = _mm256_set1_ps(*a);
    for (; i + 8 <= n; i += 8) {
      _mm256_storeu_ps(out + i, apply<F>(va, _mm256_loadu_ps(b + i)));
    }
  }
#endif
  for (; i < n; ++i) {
    out[i] = apply<F>(a[i * aStep], b[i * bStep]);
  }
}

} // namespace

bool enabled() { return INFERA_AVX2 != 0; }

void binary(BinaryFn fn, const float *a, std::size_t aStep, const float *b,
            std::size_t bStep, float *out, std::size_t n) {
  switch (fn) {
  case BinaryFn::Add:
    return binaryImpl<BinaryFn::Add>(a, aStep, b, bStep, out, n);
  case BinaryFn::Sub:
    return binaryImpl<BinaryFn::Sub>(a, aStep, b, bStep, out, n);
  case BinaryFn::Mul:
    return binaryImpl<BinaryFn::Mul>(a, aStep, b, bStep, out, n);
  case BinaryFn::Div:
    return binaryImpl<BinaryFn::Div>(a, aStep, b, bStep, out, n);
  case BinaryFn::Max:
    return binaryImpl<BinaryFn::Max>(a, aStep, b, bStep, out, n);
  case BinaryFn::Min:
    return binaryImpl<BinaryFn::Min>(a, aStep, b, bStep, out, n);
  }
}

void clamp(const float *in, float *out, std::size_t n, float lo, float hi) {
  std::size_t i = 0;
#if INFERA_AVX2
  __m256 vlo = _mm256_set1_ps(lo);
  __m256 vhi = _mm256_set1_ps(hi);
  for (; i + 8 <= n; i += 8) {
    __m256 v = _mm256_max_ps(_mm256_loadu_ps(in + i), vlo);
    _mm256_storeu_ps(out + i, _mm256_min_ps(v, vhi));
  }
#endif
  for (; i < n; ++i) {
    float v = in[i] > lo ? in[i] : lo;
    out[i] = v < hi ? v : hi;
  }
}

void relu(const float *in, float *out, std::size_t n) {
  std::size_t i = 0;
#if INFERA_AVX2
  __m256 zero = _mm256_setzero_ps();
  for (; i + 8 <= n; i += 8) {
    _mm256_storeu_ps(out + i, _mm256_max_ps(_mm256_loadu_ps(in + i), zero));
  }
#endif
  for (; i < n; ++i) {
    out[i] = in[i] > 0.0f ? in[i] : 0.0f;
  }
}

void fill(float *out, std::size_t n, float value) {
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = value;
  }
}

float dot(const float *a, const float *b, std::size_t n) {
  std::size_t i = 0;
  float sum = 0.0f;
#if INFERA_AVX2
  __m256 acc = _mm256_setzero_ps();
  for (; i + 8 <= n; i += 8) {
    acc = _mm256_fmadd_ps(_mm256_loadu_ps(a + i), _mm256_loadu_ps(b + i), acc);
  }
  __m128 lo = _mm256_castps256_ps128(acc);
  __m128 hi = _mm256_extractf128_ps(acc, 1);
  lo = _mm_add_ps(lo, hi);
  lo = _mm_hadd_ps(lo, lo);
  lo = _mm_hadd_ps(lo, lo);
  sum = _mm_cvtss_f32(lo);
#endif
  for (; i < n; ++i) {
    sum += a[i] * b[i];
  }
  return sum;
}

void axpy(float alpha, const float *x, float *y, std::size_t n) {
  std::size_t i = 0;
#if INFERA_AVX2
  __m256 va = _mm256_set1_ps(alpha);
  for (; i + 8 <= n; i += 8) {
    _mm256_storeu_ps(y + i, _mm256_fmadd_ps(va, _mm256_loadu_ps(x + i),
                                            _mm256_loadu_ps(y + i)));
  }
#endif
  for (; i < n; ++i) {
    y[i] += alpha * x[i];
  }
}

} // namespace infera::kernels::simd
