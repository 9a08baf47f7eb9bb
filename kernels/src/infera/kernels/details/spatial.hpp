#pragma once

#include "infera/common/ops/PaddingMode.hpp"
#include "infera/kernels/errors.hpp"
#include "infera/memory/container/uvec2.hpp"

#include <algorithm>
#include <cstdint>

namespace infera::kernels::details {

struct SpatialLayout {
  std::int64_t outH;
  std::int64_t outW;
  std::int64_t padTop;
  std::int64_t padLeft;
};

namespace spatial {

inline std::int64_t out_dim(OpKind op, std::int64_t in, std::int64_t padBegin,
                            std::int64_t padEnd, std::int64_t kernel,
                            std::int64_t stride, std::int64_t dilation) {
  const std::int64_t effective = dilation * (kernel - 1) + 1;
  const std::int64_t padded = in + padBegin + padEnd;
  if (stride <= 0 || dilation <= 0 || kernel <= 0) {
    throw ShapeError(op, "kernel size, stride and dilation must be positive");
  }
  if (padded < effective) {
    throw ShapeError(op, fmt::format("padded input size {} is smaller than the "
                                     "kernel size {}",
                                     padded, effective));
  }
  return (padded - effective) / stride + 1;
}

// SAME_UPPER: the extra padding pixel goes to the end.
inline void same_padding(std::int64_t in, std::int64_t kernel,
                         std::int64_t stride, std::int64_t dilation,
                         std::int64_t &begin, std::int64_t &end) {
  const std::int64_t out = (in + stride - 1) / stride;
  const std::int64_t effective = dilation * (kernel - 1) + 1;
  const std::int64_t total =
      std::max<std::int64_t>(0, (out - 1) * stride + effective - in);
  begin = total / 2;
  end = total - begin;
}

} // namespace spatial

inline SpatialLayout resolve_spatial(OpKind op, std::int64_t inH,
                                     std::int64_t inW, std::int64_t kH,
                                     std::int64_t kW, memory::uvec2 strides,
                                     memory::uvec2 dilations, PaddingMode mode,
                                     const Padding2d &pads) {
  std::int64_t top = pads[0];
  std::int64_t left = pads[1];
  std::int64_t bottom = pads[2];
  std::int64_t right = pads[3];
  if (mode == PaddingMode::Same) {
    spatial::same_padding(inH, kH, strides.y, dilations.y, top, bottom);
    spatial::same_padding(inW, kW, strides.x, dilations.x, left, right);
  }
  SpatialLayout layout;
  layout.outH =
      spatial::out_dim(op, inH, top, bottom, kH, strides.y, dilations.y);
  layout.outW =
      spatial::out_dim(op, inW, left, right, kW, strides.x, dilations.x);
  layout.padTop = top;
  layout.padLeft = left;
  return layout;
}

} // namespace infera::kernels::details
