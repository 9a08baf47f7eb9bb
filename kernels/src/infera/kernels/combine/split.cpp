#include "infera/kernels/ops.hpp"

#include <algorithm>
#include <cstring>
#include <numeric>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

// Sizes from the optional second input, else from the attributes, else an
// even split over the outputs.
memory::optional<memory::vector<std::int64_t>>
split_sizes(const Operator &op, memory::span<const ValueInfo> in,
            std::int64_t dim) {
  const SplitAttrs &attrs = op.split();
  memory::vector<std::int64_t> sizes;
  if (details::present(in, 1)) {
    auto known = details::known_ints(op, in, 1, "split");
    if (!known) {
      return memory::nullopt;
    }
    sizes = std::move(*known);
  } else if (!attrs.split.empty()) {
    sizes.assign(attrs.split.begin(), attrs.split.end());
  } else {
    const std::int64_t parts = attrs.numOutputs;
    if (parts <= 0 || dim % parts != 0) {
      throw ShapeError(op.kind(),
                       fmt::format("dimension of size {} cannot be split "
                                   "evenly into {} parts",
                                   dim, parts));
    }
    sizes.assign(static_cast<std::size_t>(parts), dim / parts);
  }
  if (sizes.size() != attrs.numOutputs) {
    throw ShapeError(op.kind(), fmt::format("{} split sizes for {} outputs",
                                            sizes.size(), attrs.numOutputs));
  }
  std::int64_t total = 0;
  for (std::int64_t s : sizes) {
    if (s < 0) {
      throw ShapeError(op.kind(), "negative split size");
    }
    total += s;
  }
  if (total != dim) {
    throw ShapeError(op.kind(),
                     fmt::format("split sizes {} do not add up to {}", sizes,
                                 dim));
  }
  return sizes;
}

} // namespace

InferResult split_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  if (x.shape.empty()) {
    throw ShapeError(op.kind(), "cannot split a scalar");
  }
  const std::size_t axis =
      details::axis_of(op, op.split().axis, x.shape.size());
  auto sizes = split_sizes(op, in, x.shape[axis]);
  if (!sizes) {
    return memory::nullopt;
  }
  memory::vector<TensorInfo> out;
  for (std::int64_t s : *sizes) {
    Shape shape = x.shape;
    shape[axis] = s;
    out.push_back(TensorInfo{x.dtype, std::move(shape)});
  }
  return out;
}

void split_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  const std::size_t axis = details::axis_of(op, op.split().axis, x.rank());
  std::int64_t outer = 1;
  for (std::size_t d = 0; d < axis; ++d) {
    outer *= x.dim(d);
  }
  const std::size_t elem = size_of(x.dtype());
  const auto inRow = static_cast<std::size_t>(
                         x.numel() / std::max<std::int64_t>(outer, 1)) *
                     elem;
  std::size_t column = 0;
  for (Tensor &out : ctx.outputs) {
    const auto row = static_cast<std::size_t>(
                         out.numel() / std::max<std::int64_t>(outer, 1)) *
                     elem;
    if (row != 0) {
      std::byte *dst = out.mutableBytes();
      for (std::int64_t o = 0; o < outer; ++o) {
        std::memcpy(dst + o * row, x.bytes() + o * inRow + column, row);
      }
    }
    column += row;
  }
}

} // namespace infera::kernels::ops
