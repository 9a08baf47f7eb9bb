#include "infera/kernels/ops.hpp"

#include <algorithm>
#include <cstring>

namespace infera::kernels::ops {

using details::InferResult;

InferResult concat_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &first = details::required(op, in, 0);
  if (first.shape.empty()) {
    throw ShapeError(op.kind(), "cannot concatenate scalars");
  }
  const std::size_t axis =
      details::axis_of(op, op.axis().axis, first.shape.size());
  Shape out = first.shape;
  out[axis] = 0;
  for (std::size_t i = 0; i < in.size(); ++i) {
    const TensorInfo &t = details::required(op, in, i);
    details::require_dtype(op, t, first.dtype, "input");
    details::require_rank(op, t, first.shape.size(), "input");
    for (std::size_t d = 0; d < out.size(); ++d) {
      if (d != axis && t.shape[d] != first.shape[d]) {
        throw ShapeError(op.kind(),
                         fmt::format("input {} has shape {}, expected {} in "
                                     "dimension {}",
                                     i, t.shape, first.shape[d], d),
                         d);
      }
    }
    out[axis] += t.shape[axis];
  }
  return details::single(first.dtype, std::move(out));
}

void concat_execute(const Operator &op, KernelContext &ctx) {
  Tensor &out = ctx.output(0);
  const std::size_t axis = details::axis_of(op, op.axis().axis, out.rank());
  std::int64_t outer = 1;
  for (std::size_t d = 0; d < axis; ++d) {
    outer *= out.dim(d);
  }
  const std::size_t elem = size_of(out.dtype());
  const auto outRow = static_cast<std::size_t>(out.numel() / std::max<std::int64_t>(outer, 1)) * elem;
  std::byte *dst = out.mutableBytes();
  std::size_t column = 0;
  for (std::size_t i = 0; i < ctx.inputs.size(); ++i) {
    const Tensor &t = ctx.input(i);
    const auto row = static_cast<std::size_t>(t.numel() / std::max<std::int64_t>(outer, 1)) * elem;
    if (row != 0) {
      for (std::int64_t o = 0; o < outer; ++o) {
        std::memcpy(dst + o * outRow + column, t.bytes() + o * row, row);
      }
    }
    column += row;
  }
}

} // namespace infera::kernels::ops
