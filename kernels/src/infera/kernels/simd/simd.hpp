#pragma once

#include <cstddef>

// Float loops shared by the kernels. With INFERA_SIMD on an AVX2 target they
// use 256-bit vectors; otherwise plain scalar loops. Elementwise results are
// identical in both builds. dot() and the accumulation in axpy() may round
// differently because of reassociation and fused multiply-add.
namespace infera::kernels::simd {

enum class BinaryFn {
  Add,
  Sub,
  Mul,
  Div,
  Max,
  Min,
};

bool enabled();

// out[i] = a[i * aStep] op b[i * bStep] with steps 0 or 1.
void binary(BinaryFn fn, const float *a, std::size_t aStep, const float *b,
            std::size_t bStep, float *out, std::size_t n);

// out[i] = min(max(in[i], lo), hi)
void clamp(const float *in, float *out, std::size_t n, float lo, float hi);

void relu(const float *in, float *out, std::size_t n);

void fill(float *out, std::size_t n, float value);

float dot(const float *a, const float *b, std::size_t n);

// y[i] += alpha * x[i]
void axpy(float alpha, const float *x, float *y, std::size_t n);

} // namespace infera::kernels::simd
