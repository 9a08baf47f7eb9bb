#include "infera/kernels/ops.hpp"

#include <cmath>
#include <limits>

namespace infera::kernels::ops {

using details::InferResult;

InferResult softmax_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  if (x.shape.empty()) {
    throw ShapeError(op.kind(), "input must have rank >= 1");
  }
  details::axis_of(op, op.axis().axis, x.shape.size());
  return details::single(x.dtype, x.shape);
}

// Softmax and LogSoftmax along one axis, max-subtracted for stability.
void softmax_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  const std::size_t axis = details::axis_of(op, op.axis().axis, x.rank());
  std::int64_t outer = 1;
  std::int64_t inner = 1;
  for (std::size_t d = 0; d < axis; ++d) {
    outer *= x.dim(d);
  }
  for (std::size_t d = axis + 1; d < x.rank(); ++d) {
    inner *= x.dim(d);
  }
  const std::int64_t len = x.dim(axis);
  const bool logOutput = op.kind() == OpKind::LogSoftmax;
  const float *px = x.data<float>();
  float *po = ctx.output(0).data<float>();

  ctx.pool.parallelFor(
      static_cast<std::size_t>(outer * inner), 64,
      [&](std::size_t begin, std::size_t end) {
        for (std::size_t lane = begin; lane < end; ++lane) {
          const std::int64_t o = static_cast<std::int64_t>(lane) / inner;
          const std::int64_t i = static_cast<std::int64_t>(lane) % inner;
          const float *src = px + o * len * inner + i;
          float *dst = po + o * len * inner + i;
          float max = -std::numeric_limits<float>::infinity();
          for (std::int64_t k = 0; k < len; ++k) {
            max = std::max(max, src[k * inner]);
          }
          float sum = 0.0f;
          for (std::int64_t k = 0; k < len; ++k) {
            const float e = std::exp(src[k * inner] - max);
            dst[k * inner] = e;
            sum += e;
          }
          if (logOutput) {
            const float logSum = std::log(sum);
            for (std::int64_t k = 0; k < len; ++k) {
              dst[k * inner] = src[k * inner] - max - logSum;
            }
          } else {
            for (std::int64_t k = 0; k < len; ++k) {
              dst[k * inner] /= sum;
            }
          }
        }
      });
}

} // namespace infera::kernels::ops
