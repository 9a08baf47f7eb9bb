#include "infera/kernels/ops.hpp"

#include <cstring>

namespace infera::kernels::ops {

using details::InferResult;

InferResult gather_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &data = details::required(op, in, 0);
  const TensorInfo &indices = details::required(op, in, 1);
  details::require_dtype(op, indices, TensorDataType::Int32, "indices");
  if (data.shape.empty()) {
    throw ShapeError(op.kind(), "cannot gather from a scalar");
  }
  const std::size_t axis =
      details::axis_of(op, op.axis().axis, data.shape.size());
  Shape out(data.shape.begin(), data.shape.begin() + axis);
  out.insert(out.end(), indices.shape.begin(), indices.shape.end());
  out.insert(out.end(), data.shape.begin() + axis + 1, data.shape.end());
  return details::single(data.dtype, std::move(out));
}

// Negative indices count from the end; anything else out of range fails.
void gather_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &data = ctx.input(0);
  const Tensor &indices = ctx.input(1);
  Tensor &out = ctx.output(0);
  const std::size_t axis = details::axis_of(op, op.axis().axis, data.rank());
  std::int64_t outer = 1;
  std::int64_t inner = 1;
  for (std::size_t d = 0; d < axis; ++d) {
    outer *= data.dim(d);
  }
  for (std::size_t d = axis + 1; d < data.rank(); ++d) {
    inner *= data.dim(d);
  }
  const std::int64_t dim = data.dim(axis);
  const std::size_t elem = size_of(data.dtype());
  const std::size_t chunk = static_cast<std::size_t>(inner) * elem;
  const std::int32_t *idx = indices.data<std::int32_t>();
  const std::int64_t count = indices.numel();
  std::byte *dst = out.mutableBytes();
  for (std::int64_t o = 0; o < outer; ++o) {
    for (std::int64_t k = 0; k < count; ++k) {
      std::int64_t i = idx[k];
      if (i < 0) {
        i += dim;
      }
      if (i < 0 || i >= dim) {
        throw KernelError(op.kind(),
                          fmt::format("index {} is out of range for dimension "
                                      "of size {}",
                                      idx[k], dim));
      }
      if (chunk != 0) {
        std::memcpy(dst + (o * count + k) * chunk,
                    data.bytes() + (o * dim + i) * chunk, chunk);
      }
    }
  }
}

} // namespace infera::kernels::ops
