#pragma once

#include "infera/kernels/Kernel.hpp"
#include "infera/kernels/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace infera::kernels::details {

using InferResult = memory::optional<memory::vector<TensorInfo>>;

inline InferResult single(TensorDataType dtype, Shape shape) {
  return memory::vector<TensorInfo>{TensorInfo{dtype, std::move(shape)}};
}

inline bool present(memory::span<const ValueInfo> inputs, std::size_t i) {
  return i < inputs.size() && inputs[i].present;
}

inline const TensorInfo &required(const Operator &op,
                                  memory::span<const ValueInfo> inputs,
                                  std::size_t i) {
  if (!present(inputs, i)) {
    throw ShapeError(op.kind(), fmt::format("input {} is required", i));
  }
  return inputs[i].info;
}

inline void require_dtype(const Operator &op, const TensorInfo &info,
                          TensorDataType dtype, std::string_view what) {
  if (info.dtype != dtype) {
    throw ShapeError(op.kind(), fmt::format("{} must be {}, got {}", what,
                                            dtype, info.dtype));
  }
}

inline void require_rank(const Operator &op, const TensorInfo &info,
                         std::size_t rank, std::string_view what) {
  if (info.shape.size() != rank) {
    throw ShapeError(op.kind(), fmt::format("{} must have rank {}, got {}",
                                            what, rank, info.shape));
  }
}

// Int32 tensor contents widened to int64 (shapes, axes, indices).
inline memory::vector<std::int64_t> read_ints(const Operator &op,
                                              const Tensor &t,
                                              std::string_view what) {
  if (t.dtype() != TensorDataType::Int32) {
    throw ShapeError(op.kind(),
                     fmt::format("{} must be i32, got {}", what, t.dtype()));
  }
  auto v = t.values<std::int32_t>();
  return memory::vector<std::int64_t>(v.begin(), v.end());
}

// Data of a shape-like input if it is known, nullopt otherwise.
inline memory::optional<memory::vector<std::int64_t>>
known_ints(const Operator &op, memory::span<const ValueInfo> inputs,
           std::size_t i, std::string_view what) {
  if (!present(inputs, i) || inputs[i].value == nullptr) {
    return memory::nullopt;
  }
  return read_ints(op, *inputs[i].value, what);
}

inline float read_float_scalar(const Operator &op, const Tensor &t,
                               std::string_view what) {
  if (t.dtype() != TensorDataType::Float32 || t.numel() != 1) {
    throw ShapeError(op.kind(), fmt::format("{} must be a single f32 value",
                                            what));
  }
  return t.data<float>()[0];
}

inline std::size_t axis_of(const Operator &op, std::int64_t axis,
                           std::size_t rank) {
  auto r = static_cast<std::int64_t>(rank);
  std::int64_t a = axis < 0 ? axis + r : axis;
  if (a < 0 || a >= r) {
    throw ShapeError(op.kind(),
                     fmt::format("axis {} is out of range for rank {}", axis,
                                 rank));
  }
  return static_cast<std::size_t>(a);
}

// Elements per parallel chunk for cheap elementwise loops.
inline constexpr std::size_t ElementwiseGrain = 1 << 14;

} // namespace infera::kernels::details
