#include "infera/kernels/ops.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

Shape resolve_reshape(const Operator &op, const Shape &in,
                      const memory::vector<std::int64_t> &target) {
  Shape out(target.size());
  std::int64_t known = 1;
  memory::optional<std::size_t> inferred;
  for (std::size_t i = 0; i < target.size(); ++i) {
    std::int64_t d = target[i];
    if (d == 0) {
      if (i >= in.size()) {
        throw ShapeError(op.kind(),
                         fmt::format("dimension {} copies a dimension the "
                                     "input {} does not have",
                                     i, in));
      }
      d = in[i];
    } else if (d == -1) {
      if (inferred) {
        throw ShapeError(op.kind(), "more than one dimension is -1");
      }
      inferred = i;
      continue;
    } else if (d < -1) {
      throw ShapeError(op.kind(), fmt::format("invalid dimension {}", d));
    }
    out[i] = d;
    if (d != 0 && known > MaxTensorElements / d) {
      throw ShapeError(op.kind(),
                       fmt::format("cannot reshape {} to {}", in, target));
    }
    known *= d;
  }
  const std::int64_t total = numel(in);
  if (inferred) {
    if (known == 0 || total % known != 0) {
      throw ShapeError(op.kind(), fmt::format("cannot reshape {} to {}", in,
                                              target));
    }
    out[*inferred] = total / known;
  } else if (known != total) {
    throw ShapeError(op.kind(),
                     fmt::format("cannot reshape {} to {}", in, target));
  }
  return out;
}

} // namespace

InferResult reshape_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const TensorInfo &shape = details::required(op, in, 1);
  details::require_dtype(op, shape, TensorDataType::Int32, "shape");
  details::require_rank(op, shape, 1, "shape");
  auto target = details::known_ints(op, in, 1, "shape");
  if (!target) {
    return memory::nullopt;
  }
  return details::single(x.dtype, resolve_reshape(op, x.shape, *target));
}

InferResult flatten_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const auto rank = static_cast<std::int64_t>(x.shape.size());
  std::int64_t axis = op.axis().axis;
  if (axis < 0) {
    axis += rank;
  }
  if (axis < 0 || axis > rank) {
    throw ShapeError(op.kind(), fmt::format("axis {} is out of range for rank "
                                            "{}",
                                            op.axis().axis, rank));
  }
  std::int64_t outer = 1;
  std::int64_t inner = 1;
  for (std::int64_t d = 0; d < rank; ++d) {
    (d < axis ? outer : inner) *= x.shape[static_cast<std::size_t>(d)];
  }
  return details::single(x.dtype, Shape{outer, inner});
}

InferResult squeeze_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const AxesAttrs &attrs = op.axes();
  memory::vector<bool> drop(x.shape.size(), false);
  if (attrs.axes.empty()) {
    for (std::size_t d = 0; d < x.shape.size(); ++d) {
      drop[d] = x.shape[d] == 1;
    }
  }
  for (std::int32_t a : attrs.axes) {
    std::size_t axis = details::axis_of(op, a, x.shape.size());
    if (x.shape[axis] != 1) {
      throw ShapeError(op.kind(),
                       fmt::format("cannot squeeze dimension {} of size {}",
                                   axis, x.shape[axis]),
                       axis);
    }
    drop[axis] = true;
  }
  Shape out;
  for (std::size_t d = 0; d < x.shape.size(); ++d) {
    if (!drop[d]) {
      out.push_back(x.shape[d]);
    }
  }
  return details::single(x.dtype, std::move(out));
}

InferResult unsqueeze_infer(const Operator &op,
                            memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const AxesAttrs &attrs = op.axes();
  const std::size_t rank = x.shape.size() + attrs.axes.size();
  memory::vector<bool> inserted(rank, false);
  for (std::int32_t a : attrs.axes) {
    std::size_t axis = details::axis_of(op, a, rank);
    if (inserted[axis]) {
      throw ShapeError(op.kind(), fmt::format("axis {} repeated", a));
    }
    inserted[axis] = true;
  }
  Shape out;
  std::size_t src = 0;
  for (std::size_t d = 0; d < rank; ++d) {
    out.push_back(inserted[d] ? 1 : x.shape[src++]);
  }
  return details::single(x.dtype, std::move(out));
}

void copy_execute(const Operator &, KernelContext &ctx) {
  const Tensor &in = ctx.input(0);
  if (in.byteSize() != 0) {
    std::memcpy(ctx.output(0).mutableBytes(), in.bytes(), in.byteSize());
  }
}

InferResult shape_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  return details::single(TensorDataType::Int32,
                         Shape{static_cast<std::int64_t>(x.shape.size())});
}

void shape_execute(const Operator &op, KernelContext &ctx) {
  const Shape &shape = ctx.input(0).shape();
  auto *po = ctx.output(0).data<std::int32_t>();
  for (std::size_t d = 0; d < shape.size(); ++d) {
    if (shape[d] > std::numeric_limits<std::int32_t>::max()) {
      throw KernelError(op.kind(),
                        fmt::format("dimension {} does not fit into i32",
                                    shape[d]));
    }
    po[d] = static_cast<std::int32_t>(shape[d]);
  }
}

} // namespace infera::kernels::ops
