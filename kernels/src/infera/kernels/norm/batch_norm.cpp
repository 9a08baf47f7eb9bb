#include "infera/kernels/ops.hpp"

#include <cmath>

namespace infera::kernels::ops {

using details::InferResult;

// Inputs: X [N, C, ...], scale, bias, mean, variance, each [C].
InferResult batch_norm_infer(const Operator &op,
                             memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  if (x.shape.size() < 2) {
    throw ShapeError(op.kind(),
                     fmt::format("expected at least N and C, got {}", x.shape));
  }
  static constexpr const char *Names[] = {"scale", "bias", "mean", "variance"};
  for (std::size_t i = 1; i < 5; ++i) {
    const TensorInfo &p = details::required(op, in, i);
    details::require_dtype(op, p, TensorDataType::Float32, Names[i - 1]);
    if (p.shape != Shape{x.shape[1]}) {
      throw ShapeError(op.kind(), fmt::format("{} must have shape [{}], got {}",
                                              Names[i - 1], x.shape[1],
                                              p.shape));
    }
  }
  return details::single(x.dtype, x.shape);
}

void batch_norm_execute(const Operator &op, KernelContext &ctx) {
  const float epsilon = op.batchNorm().epsilon;
  const Tensor &x = ctx.input(0);
  const float *scale = ctx.input(1).data<float>();
  const float *bias = ctx.input(2).data<float>();
  const float *mean = ctx.input(3).data<float>();
  const float *var = ctx.input(4).data<float>();
  const std::int64_t N = x.dim(0);
  const std::int64_t C = x.dim(1);
  const std::int64_t inner = N * C == 0 ? 0 : x.numel() / (N * C);
  const float *px = x.data<float>();
  float *po = ctx.output(0).data<float>();
  ctx.pool.parallelFor(
      static_cast<std::size_t>(N * C), 1,
      [&](std::size_t begin, std::size_t end) {
        for (std::size_t p = begin; p < end; ++p) {
          const auto c = static_cast<std::int64_t>(p) % C;
          const float mul = scale[c] / std::sqrt(var[c] + epsilon);
          const float add = bias[c] - mean[c] * mul;
          const float *src = px + static_cast<std::int64_t>(p) * inner;
          float *dst = po + static_cast<std::int64_t>(p) * inner;
          for (std::int64_t i = 0; i < inner; ++i) {
            dst[i] = src[i] * mul + add;
          }
        }
      });
}

} // namespace infera::kernels::ops
