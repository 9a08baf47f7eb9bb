#include "infera/kernels/ops.hpp"

#include <algorithm>
#include <cmath>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

template <typename T>
std::int64_t range_count(const Operator &op, T start, T limit, T delta) {
  if (delta == T{0}) {
    throw ShapeError(op.kind(), "delta must not be 0");
  }
  const double count =
      std::ceil((static_cast<double>(limit) - static_cast<double>(start)) /
                static_cast<double>(delta));
  if (!(count <= static_cast<double>(MaxTensorElements))) {
    throw ShapeError(op.kind(),
                     fmt::format("range of {} elements exceeds the tensor size "
                                 "limit",
                                 count));
  }
  return std::max<std::int64_t>(0, static_cast<std::int64_t>(count));
}

} // namespace

InferResult constant_of_shape_infer(const Operator &op,
                                    memory::span<const ValueInfo> in) {
  const TensorInfo &shape = details::required(op, in, 0);
  details::require_dtype(op, shape, TensorDataType::Int32, "shape");
  details::require_rank(op, shape, 1, "shape");
  auto dims = details::known_ints(op, in, 0, "shape");
  if (!dims) {
    return memory::nullopt;
  }
  try {
    numel(*dims);
  } catch (const std::invalid_argument &e) {
    throw ShapeError(op.kind(), e.what());
  }
  return details::single(op.constantOfShape().dtype, Shape(*dims));
}

void constant_of_shape_execute(const Operator &op, KernelContext &ctx) {
  const ConstantOfShapeAttrs &attrs = op.constantOfShape();
  Tensor &out = ctx.output(0);
  visit_dtype(out.dtype(), [&](auto tag) {
    using T = decltype(tag);
    T value = attrs.dtype == TensorDataType::Float32
                  ? static_cast<T>(attrs.floatValue)
                  : static_cast<T>(attrs.intValue);
    auto values = out.mutableValues<T>();
    std::fill(values.begin(), values.end(), value);
  });
}

// Inputs are scalar start, limit and delta of the same type (f32 or i32).
InferResult range_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &start = details::required(op, in, 0);
  for (std::size_t i = 0; i < 3; ++i) {
    const TensorInfo &t = details::required(op, in, i);
    if (t.dtype != start.dtype) {
      throw ShapeError(op.kind(), "start, limit and delta differ in type");
    }
    if (numel(t.shape) != 1) {
      throw ShapeError(op.kind(), "start, limit and delta must be scalars");
    }
  }
  if (start.dtype != TensorDataType::Float32 &&
      start.dtype != TensorDataType::Int32) {
    throw ShapeError(op.kind(),
                     fmt::format("unsupported input type {}", start.dtype));
  }
  for (std::size_t i = 0; i < 3; ++i) {
    if (in[i].value == nullptr) {
      return memory::nullopt;
    }
  }
  std::int64_t count = 0;
  if (start.dtype == TensorDataType::Float32) {
    count = range_count(op, in[0].value->data<float>()[0],
                        in[1].value->data<float>()[0],
                        in[2].value->data<float>()[0]);
  } else {
    count = range_count(op, in[0].value->data<std::int32_t>()[0],
                        in[1].value->data<std::int32_t>()[0],
                        in[2].value->data<std::int32_t>()[0]);
  }
  return details::single(start.dtype, Shape{count});
}

void range_execute(const Operator &, KernelContext &ctx) {
  Tensor &out = ctx.output(0);
  if (out.dtype() == TensorDataType::Float32) {
    const float start = ctx.input(0).data<float>()[0];
    const float delta = ctx.input(2).data<float>()[0];
    float *po = out.data<float>();
    for (std::int64_t i = 0; i < out.numel(); ++i) {
      po[i] = start + static_cast<float>(i) * delta;
    }
  } else {
    const std::int64_t start = ctx.input(0).data<std::int32_t>()[0];
    const std::int64_t delta = ctx.input(2).data<std::int32_t>()[0];
    auto *po = out.data<std::int32_t>();
    for (std::int64_t i = 0; i < out.numel(); ++i) {
      po[i] = static_cast<std::int32_t>(start + i * delta);
    }
  }
}

} // namespace infera::kernels::ops
