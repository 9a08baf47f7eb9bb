#include "infera/kernels/ops.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

// Marks the reduced axes; empty axes reduce everything.
memory::vector<bool> reduced_axes(const Operator &op, std::size_t rank) {
  const AxesAttrs &attrs = op.axes();
  memory::vector<bool> reduced(rank, attrs.axes.empty());
  for (std::int32_t a : attrs.axes) {
    std::size_t axis = details::axis_of(op, a, rank);
    if (reduced[axis]) {
      throw ShapeError(op.kind(), fmt::format("axis {} repeated", a));
    }
    reduced[axis] = true;
  }
  return reduced;
}

template <typename T> T reduce_init(OpKind kind) {
  switch (kind) {
  case OpKind::ReduceMax:
    return std::numeric_limits<T>::lowest();
  case OpKind::ReduceMin:
    return std::numeric_limits<T>::max();
  default:
    return T{0};
  }
}

} // namespace

InferResult reduce_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const bool isFloat = x.dtype == TensorDataType::Float32;
  if (!isFloat && !(x.dtype == TensorDataType::Int32 &&
                    op.kind() != OpKind::ReduceMean)) {
    throw ShapeError(op.kind(),
                     fmt::format("unsupported input type {}", x.dtype));
  }
  auto reduced = reduced_axes(op, x.shape.size());
  Shape out;
  for (std::size_t d = 0; d < x.shape.size(); ++d) {
    if (!reduced[d]) {
      out.push_back(x.shape[d]);
    } else if (op.axes().keepDims) {
      out.push_back(1);
    } else if (x.shape[d] == 0 && (op.kind() == OpKind::ReduceMax ||
                                   op.kind() == OpKind::ReduceMin)) {
      throw ShapeError(op.kind(), "cannot reduce an empty dimension", d);
    }
  }
  return details::single(x.dtype, std::move(out));
}

// Integer ReduceSum wraps. The reduction runs in row-major order of the input.
void reduce_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  Tensor &out = ctx.output(0);
  auto reduced = reduced_axes(op, x.rank());
  // Output strides expanded to the input rank, 0 on reduced axes.
  memory::vector<std::int64_t> kept;
  for (std::size_t d = 0; d < x.rank(); ++d) {
    kept.push_back(reduced[d] ? 1 : x.dim(d));
  }
  memory::vector<std::int64_t> strides = strides_of(kept);
  for (std::size_t d = 0; d < x.rank(); ++d) {
    if (reduced[d]) {
      strides[d] = 0;
    }
  }
  std::int64_t count = 1;
  for (std::size_t d = 0; d < x.rank(); ++d) {
    if (reduced[d]) {
      count *= x.dim(d);
    }
  }
  const OpKind kind = op.kind();

  visit_dtype(x.dtype(), [&](auto tag) {
    using T = decltype(tag);
    if constexpr (std::is_same_v<T, float> || std::is_same_v<T, std::int32_t>) {
      const T *px = x.data<T>();
      T *po = out.data<T>();
      std::fill(po, po + out.numel(), reduce_init<T>(kind));
      memory::vector<std::int64_t> index(x.rank(), 0);
      std::int64_t dst = 0;
      for (std::int64_t i = 0; i < x.numel(); ++i) {
        const T v = px[i];
        switch (kind) {
        case OpKind::ReduceMax:
          po[dst] = std::max(po[dst], v);
          break;
        case OpKind::ReduceMin:
          po[dst] = std::min(po[dst], v);
          break;
        default:
          if constexpr (std::is_same_v<T, float>) {
            po[dst] += v;
          } else {
            po[dst] = static_cast<T>(static_cast<std::uint32_t>(po[dst]) +
                                     static_cast<std::uint32_t>(v));
          }
          break;
        }
        for (std::size_t d = x.rank(); d-- > 0;) {
          dst += strides[d];
          if (++index[d] < x.dim(d)) {
            break;
          }
          dst -= strides[d] * index[d];
          index[d] = 0;
        }
      }
      if constexpr (std::is_same_v<T, float>) {
        if (kind == OpKind::ReduceMean && count > 0) {
          for (std::int64_t i = 0; i < out.numel(); ++i) {
            po[i] /= static_cast<float>(count);
          }
        }
      }
    } else {
      diag::unreachable();
    }
  });
}

} // namespace infera::kernels::ops
