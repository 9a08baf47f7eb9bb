#pragma once

#include "infera/kernels/WorkerPool.hpp"

#include <cstddef>

namespace infera::kernels::details {

// C[m, n] += sum_k A[m, k] * B[k, n], all row-major with leading dimensions.
// Rows of C are distributed over the pool.
void gemm_accumulate(std::size_t M, std::size_t N, std::size_t K,
                     const float *A, std::size_t lda, const float *B,
                     std::size_t ldb, float *C, std::size_t ldc,
                     WorkerPool &pool);

// Row-major [rows, cols] -> [cols, rows].
void transpose_2d(const float *in, float *out, std::size_t rows,
                  std::size_t cols);

} // namespace infera::kernels::details
