#include "infera/kernels/details/gemm.hpp"
#include "infera/kernels/ops.hpp"
#include "infera/tensor/broadcast.hpp"

#include <cstring>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

struct MatMulShape {
  Shape batchA;
  Shape batchB;
  Shape batch;
  std::int64_t M, K, N;
  Shape out;
};

MatMulShape matmul_shape(const Operator &op, const Shape &a, const Shape &b) {
  if (a.empty() || b.empty()) {
    throw ShapeError(op.kind(), "operands must have rank >= 1");
  }
  MatMulShape s;
  const bool vecA = a.size() == 1;
  const bool vecB = b.size() == 1;
  s.M = vecA ? 1 : a[a.size() - 2];
  s.K = a.back();
  const std::int64_t kb = vecB ? b[0] : b[b.size() - 2];
  s.N = vecB ? 1 : b.back();
  if (s.K != kb) {
    throw ShapeError(op.kind(),
                     fmt::format("inner dimensions differ: {} vs {}", a, b));
  }
  s.batchA.assign(a.begin(), a.end() - (vecA ? 1 : 2));
  s.batchB.assign(b.begin(), b.end() - (vecB ? 1 : 2));
  BroadcastMismatch mismatch{};
  auto batch = broadcast_shapes(s.batchA, s.batchB, &mismatch);
  if (!batch) {
    throw ShapeError(op.kind(),
                     fmt::format("cannot broadcast batch dimensions of {} and "
                                 "{}",
                                 a, b),
                     mismatch.dimension);
  }
  s.batch = *batch;
  s.out = s.batch;
  if (!vecA) {
    s.out.push_back(s.M);
  }
  if (!vecB) {
    s.out.push_back(s.N);
  }
  return s;
}

} // namespace

InferResult matmul_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &a = details::required(op, in, 0);
  const TensorInfo &b = details::required(op, in, 1);
  details::require_dtype(op, a, TensorDataType::Float32, "A");
  details::require_dtype(op, b, TensorDataType::Float32, "B");
  return details::single(TensorDataType::Float32,
                         matmul_shape(op, a.shape, b.shape).out);
}

// Dot products are accumulated with axpy and may be reassociated in SIMD
// builds.
void matmul_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &a = ctx.input(0);
  const Tensor &b = ctx.input(1);
  Tensor &out = ctx.output(0);
  MatMulShape s = matmul_shape(op, a.shape(), b.shape());
  const auto M = static_cast<std::size_t>(s.M);
  const auto K = static_cast<std::size_t>(s.K);
  const auto N = static_cast<std::size_t>(s.N);
  float *po = out.data<float>();
  std::memset(po, 0, out.byteSize());
  if (numel(s.batch) == 0) {
    return;
  }

  // Batch offsets in units of whole matrices.
  std::array<memory::vector<std::int64_t>, 2> strides{
      broadcast_strides(s.batchA, s.batch),
      broadcast_strides(s.batchB, s.batch)};
  const float *pa = a.data<float>();
  const float *pb = b.data<float>();
  for_each_broadcast_run<2>(
      s.batch, strides,
      [&](std::int64_t base, const std::array<std::int64_t, 2> &off,
          std::int64_t count, const std::array<std::int64_t, 2> &step) {
        for (std::int64_t i = 0; i < count; ++i) {
          const float *ma = pa + (off[0] + i * step[0]) * s.M * s.K;
          const float *mb = pb + (off[1] + i * step[1]) * s.K * s.N;
          float *mo = po + (base + i) * s.M * s.N;
          details::gemm_accumulate(M, N, K, ma, K, mb, N, mo, N, ctx.pool);
        }
      });
}

InferResult gemm_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &a = details::required(op, in, 0);
  const TensorInfo &b = details::required(op, in, 1);
  details::require_dtype(op, a, TensorDataType::Float32, "A");
  details::require_dtype(op, b, TensorDataType::Float32, "B");
  details::require_rank(op, a, 2, "A");
  details::require_rank(op, b, 2, "B");
  const GemmAttrs &attrs = op.gemm();
  std::int64_t M = attrs.transposeA ? a.shape[1] : a.shape[0];
  std::int64_t K = attrs.transposeA ? a.shape[0] : a.shape[1];
  std::int64_t Kb = attrs.transposeB ? b.shape[1] : b.shape[0];
  std::int64_t N = attrs.transposeB ? b.shape[0] : b.shape[1];
  if (K != Kb) {
    throw ShapeError(op.kind(), fmt::format("inner dimensions differ: {} vs {}",
                                            a.shape, b.shape));
  }
  Shape out{M, N};
  if (details::present(in, 2)) {
    const TensorInfo &c = in[2].info;
    details::require_dtype(op, c, TensorDataType::Float32, "C");
    BroadcastMismatch mismatch{};
    auto bc = broadcast_shapes(out, c.shape, &mismatch);
    if (!bc || *bc != out) {
      throw ShapeError(op.kind(),
                       fmt::format("C of shape {} does not broadcast to {}",
                                   c.shape, out));
    }
  }
  return details::single(TensorDataType::Float32, std::move(out));
}

void gemm_execute(const Operator &op, KernelContext &ctx) {
  const GemmAttrs &attrs = op.gemm();
  const Tensor &a = ctx.input(0);
  const Tensor &b = ctx.input(1);
  Tensor &out = ctx.output(0);
  const auto M = static_cast<std::size_t>(out.dim(0));
  const auto N = static_cast<std::size_t>(out.dim(1));
  const auto K = static_cast<std::size_t>(attrs.transposeA ? a.dim(0)
                                                           : a.dim(1));

  memory::vector<float> packedA;
  memory::vector<float> packedB;
  const float *pa = a.data<float>();
  const float *pb = b.data<float>();
  if (attrs.transposeA) {
    packedA.resize(M * K);
    details::transpose_2d(pa, packedA.data(), K, M);
    pa = packedA.data();
  }
  if (attrs.transposeB) {
    packedB.resize(K * N);
    details::transpose_2d(pb, packedB.data(), N, K);
    pb = packedB.data();
  }

  float *po = out.data<float>();
  std::memset(po, 0, out.byteSize());
  details::gemm_accumulate(M, N, K, pa, K, pb, N, po, N, ctx.pool);
  if (attrs.alpha != 1.0f) {
    for (std::size_t i = 0; i < M * N; ++i) {
      po[i] *= attrs.alpha;
    }
  }
  if (ctx.has(2) && attrs.beta != 0.0f) {
    const Tensor &c = ctx.input(2);
    std::array<memory::vector<std::int64_t>, 1> strides{
        broadcast_strides(c.shape(), out.shape())};
    const float *pc = c.data<float>();
    const float beta = attrs.beta;
    for_each_broadcast_run<1>(
        out.shape(), strides,
        [&](std::int64_t base, const std::array<std::int64_t, 1> &off,
            std::int64_t count, const std::array<std::int64_t, 1> &step) {
          for (std::int64_t i = 0; i < count; ++i) {
            po[base + i] += beta * pc[off[0] + i * step[0]];
          }
        });
  }
}

} // namespace infera::kernels::ops
