#include "infera/kernels/details/gemm.hpp"
#include "infera/kernels/simd/simd.hpp"

#include <algorithm>

namespace infera::kernels::details {

void gemm_accumulate(std::size_t M, std::size_t N, std::size_t K,
                     const float *A, std::size_t lda, const float *B,
                     std::size_t ldb, float *C, std::size_t ldc,
                     WorkerPool &pool) {
  if (M == 0 || N == 0 || K == 0) {
    return;
  }
  // Rows per chunk, so that one chunk covers roughly 64k multiply-adds.
  const std::size_t grain = std::max<std::size_t>(1, (1 << 16) / (N * K + 1));
  pool.parallelFor(M, grain, [&](std::size_t begin, std::size_t end) {
    constexpr std::size_t KBlock = 256;
    for (std::size_t k0 = 0; k0 < K; k0 += KBlock) {
      const std::size_t k1 = std::min(K, k0 + KBlock);
      for (std::size_t i = begin; i < end; ++i) {
        float *c = C + i * ldc;
        const float *a = A + i * lda;
        for (std::size_t k = k0; k < k1; ++k) {
          simd::axpy(a[k], B + k * ldb, c, N);
        }
      }
    }
  });
}

void transpose_2d(const float *in, float *out, std::size_t rows,
                  std::size_t cols) {
  for (std::size_t r = 0; r < rows; ++r) {
    for (std::size_t c = 0; c < cols; ++c) {
      out[c * rows + r] = in[r * cols + c];
    }
  }
}

} // namespace infera::kernels::details
