#include "infera/kernels/ops.hpp"

#include <algorithm>
#include <cmath>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

// Inputs: X (NCHW), roi (ignored), scales [4] f32, sizes [4] i32. Scales
// take precedence when both are given; only H and W may be resized.
memory::optional<Shape> resize_shape(const Operator &op,
                                     memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  details::require_rank(op, x, 4, "input");
  const bool hasScales =
      details::present(in, 2) && numel(in[2].info.shape) != 0;
  const bool hasSizes = details::present(in, 3) && numel(in[3].info.shape) != 0;
  if (!hasScales && !hasSizes) {
    throw ShapeError(op.kind(), "one of scales and sizes is required");
  }
  Shape out(4);
  if (!hasScales) {
    auto sizes = details::known_ints(op, in, 3, "sizes");
    if (!sizes) {
      return memory::nullopt;
    }
    if (sizes->size() != 4) {
      throw ShapeError(op.kind(), "sizes must have 4 elements");
    }
    out.assign(sizes->begin(), sizes->end());
  } else {
    const ValueInfo &scales = in[2];
    details::require_dtype(op, scales.info, TensorDataType::Float32, "scales");
    if (scales.value == nullptr) {
      return memory::nullopt;
    }
    auto s = scales.value->values<float>();
    if (s.size() != 4) {
      throw ShapeError(op.kind(), "scales must have 4 elements");
    }
    for (std::size_t d = 0; d < 4; ++d) {
      if (!(s[d] > 0.0f) || !std::isfinite(s[d])) {
        throw ShapeError(op.kind(), "scales must be positive and finite", d);
      }
      const double scaled =
          std::floor(static_cast<double>(x.shape[d]) * s[d]);
      if (scaled > static_cast<double>(MaxTensorElements)) {
        throw ShapeError(op.kind(),
                         fmt::format("scale {} overflows dimension {}", s[d],
                                     x.shape[d]),
                         d);
      }
      out[d] = static_cast<std::int64_t>(scaled);
    }
  }
  if (out[0] != x.shape[0] || out[1] != x.shape[1]) {
    throw ShapeError(op.kind(), "only the spatial dimensions can be resized");
  }
  for (std::size_t d = 0; d < 4; ++d) {
    if (out[d] < 0) {
      throw ShapeError(op.kind(), "negative output size", d);
    }
  }
  return out;
}

float source_coord(CoordTransformMode mode, std::int64_t dst, std::int64_t inSize,
                   std::int64_t outSize) {
  const float scale =
      static_cast<float>(outSize) / static_cast<float>(inSize);
  switch (mode) {
  case CoordTransformMode::HalfPixel:
    return (static_cast<float>(dst) + 0.5f) / scale - 0.5f;
  case CoordTransformMode::Asymmetric:
    return static_cast<float>(dst) / scale;
  case CoordTransformMode::AlignCorners:
    return outSize == 1 ? 0.0f
                        : static_cast<float>(dst) *
                              static_cast<float>(inSize - 1) /
                              static_cast<float>(outSize - 1);
  }
  diag::unreachable();
}

std::int64_t nearest_index(NearestMode mode, float x, std::int64_t size) {
  float r = 0.0f;
  switch (mode) {
  case NearestMode::RoundPreferFloor:
    r = std::ceil(x - 0.5f);
    break;
  case NearestMode::RoundPreferCeil:
    r = std::floor(x + 0.5f);
    break;
  case NearestMode::Floor:
    r = std::floor(x);
    break;
  case NearestMode::Ceil:
    r = std::ceil(x);
    break;
  }
  return std::clamp<std::int64_t>(static_cast<std::int64_t>(r), 0, size - 1);
}

struct LinearTap {
  std::int64_t i0;
  std::int64_t i1;
  float w1;
};

LinearTap linear_tap(float x, std::int64_t size) {
  x = std::clamp(x, 0.0f, static_cast<float>(size - 1));
  const auto i0 = static_cast<std::int64_t>(std::floor(x));
  const std::int64_t i1 = std::min(i0 + 1, size - 1);
  return LinearTap{i0, i1, x - static_cast<float>(i0)};
}

} // namespace

InferResult resize_infer(const Operator &op, memory::span<const ValueInfo> in) {
  auto shape = resize_shape(op, in);
  if (!shape) {
    return memory::nullopt;
  }
  return details::single(TensorDataType::Float32, std::move(*shape));
}

void resize_execute(const Operator &op, KernelContext &ctx) {
  const ResizeAttrs &attrs = op.resize();
  const Tensor &x = ctx.input(0);
  Tensor &out = ctx.output(0);
  const std::int64_t H = x.dim(2);
  const std::int64_t W = x.dim(3);
  const std::int64_t OH = out.dim(2);
  const std::int64_t OW = out.dim(3);
  if (out.numel() == 0) {
    return;
  }
  if (H == 0 || W == 0) {
    throw KernelError(op.kind(), "cannot resize an empty image");
  }
  const float *px = x.data<float>();
  float *po = out.data<float>();

  ctx.pool.parallelFor(
      static_cast<std::size_t>(x.dim(0) * x.dim(1)), 1,
      [&](std::size_t begin, std::size_t end) {
        for (std::size_t p = begin; p < end; ++p) {
          const float *src = px + static_cast<std::int64_t>(p) * H * W;
          float *dst = po + static_cast<std::int64_t>(p) * OH * OW;
          for (std::int64_t oy = 0; oy < OH; ++oy) {
            const float sy = source_coord(attrs.coordMode, oy, H, OH);
            for (std::int64_t ox = 0; ox < OW; ++ox) {
              const float sx = source_coord(attrs.coordMode, ox, W, OW);
              if (attrs.mode == ResizeMode::Nearest) {
                dst[oy * OW + ox] =
                    src[nearest_index(attrs.nearestMode, sy, H) * W +
                        nearest_index(attrs.nearestMode, sx, W)];
              } else {
                const LinearTap ty = linear_tap(sy, H);
                const LinearTap tx = linear_tap(sx, W);
                const float top = src[ty.i0 * W + tx.i0] * (1.0f - tx.w1) +
                                  src[ty.i0 * W + tx.i1] * tx.w1;
                const float bottom = src[ty.i1 * W + tx.i0] * (1.0f - tx.w1) +
                                     src[ty.i1 * W + tx.i1] * tx.w1;
                dst[oy * OW + ox] = top * (1.0f - ty.w1) + bottom * ty.w1;
              }
            }
          }
        }
      });
}

} // namespace infera::kernels::ops
