#include "infera/kernels/details/spatial.hpp"
#include "infera/kernels/ops.hpp"

#include <limits>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

details::SpatialLayout pool_layout(const Operator &op, const Shape &x) {
  const PoolAttrs &attrs = op.pool();
  if (x.size() != 4) {
    throw ShapeError(op.kind(),
                     fmt::format("expected NCHW input, got {}", x));
  }
  return details::resolve_spatial(op.kind(), x[2], x[3], attrs.kernelSize.y,
                                  attrs.kernelSize.x, attrs.strides,
                                  memory::uvec2{1, 1}, attrs.padding,
                                  attrs.pads);
}

// Calls reduce(plane, y0, y1, x0, x1, window) for each output pixel, with the
// window clipped to the input. Planes are distributed over the pool.
template <typename Fn>
void for_each_window(const Operator &op, KernelContext &ctx, Fn reduce) {
  const PoolAttrs &attrs = op.pool();
  const Tensor &x = ctx.input(0);
  Tensor &out = ctx.output(0);
  const details::SpatialLayout layout = pool_layout(op, x.shape());
  const std::int64_t H = x.dim(2);
  const std::int64_t W = x.dim(3);
  const std::int64_t kH = attrs.kernelSize.y;
  const std::int64_t kW = attrs.kernelSize.x;
  const std::int64_t OH = layout.outH;
  const std::int64_t OW = layout.outW;
  const float *px = x.data<float>();
  float *po = out.data<float>();
  ctx.pool.parallelFor(
      static_cast<std::size_t>(x.dim(0) * x.dim(1)), 1,
      [&](std::size_t begin, std::size_t end) {
        for (std::size_t p = begin; p < end; ++p) {
          const float *plane = px + static_cast<std::int64_t>(p) * H * W;
          float *dst = po + static_cast<std::int64_t>(p) * OH * OW;
          for (std::int64_t oy = 0; oy < OH; ++oy) {
            const std::int64_t wy = oy * attrs.strides.y - layout.padTop;
            const std::int64_t y0 = std::max<std::int64_t>(wy, 0);
            const std::int64_t y1 = std::min<std::int64_t>(wy + kH, H);
            for (std::int64_t ox = 0; ox < OW; ++ox) {
              const std::int64_t wx = ox * attrs.strides.x - layout.padLeft;
              const std::int64_t x0 = std::max<std::int64_t>(wx, 0);
              const std::int64_t x1 = std::min<std::int64_t>(wx + kW, W);
              dst[oy * OW + ox] = reduce(plane, W, y0, y1, x0, x1, kH * kW);
            }
          }
        }
      });
}

} // namespace

InferResult pool_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  details::SpatialLayout layout = pool_layout(op, x.shape);
  return details::single(TensorDataType::Float32,
                         Shape{x.shape[0], x.shape[1], layout.outH,
                               layout.outW});
}

void max_pool_execute(const Operator &op, KernelContext &ctx) {
  for_each_window(op, ctx,
                  [](const float *plane, std::int64_t W, std::int64_t y0,
                     std::int64_t y1, std::int64_t x0, std::int64_t x1,
                     std::int64_t) {
                    float m = -std::numeric_limits<float>::infinity();
                    for (std::int64_t y = y0; y < y1; ++y) {
                      for (std::int64_t x = x0; x < x1; ++x) {
                        m = std::max(m, plane[y * W + x]);
                      }
                    }
                    return m;
                  });
}

void average_pool_execute(const Operator &op, KernelContext &ctx) {
  const bool includePad = op.pool().countIncludePad;
  for_each_window(op, ctx,
                  [includePad](const float *plane, std::int64_t W,
                               std::int64_t y0, std::int64_t y1,
                               std::int64_t x0, std::int64_t x1,
                               std::int64_t window) {
                    float sum = 0.0f;
                    for (std::int64_t y = y0; y < y1; ++y) {
                      for (std::int64_t x = x0; x < x1; ++x) {
                        sum += plane[y * W + x];
                      }
                    }
                    const std::int64_t count =
                        includePad ? window : (y1 - y0) * (x1 - x0);
                    return count > 0 ? sum / static_cast<float>(count) : 0.0f;
                  });
}

InferResult global_average_pool_infer(const Operator &op,
                                      memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  if (x.shape.size() < 3) {
    throw ShapeError(op.kind(),
                     fmt::format("expected N, C and spatial dimensions, got {}",
                                 x.shape));
  }
  Shape out(x.shape.size(), 1);
  out[0] = x.shape[0];
  out[1] = x.shape[1];
  return details::single(TensorDataType::Float32, std::move(out));
}

void global_average_pool_execute(const Operator &, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  const std::int64_t planes = x.dim(0) * x.dim(1);
  const std::int64_t size = planes == 0 ? 0 : x.numel() / planes;
  const float *px = x.data<float>();
  float *po = ctx.output(0).data<float>();
  for (std::int64_t p = 0; p < planes; ++p) {
    float sum = 0.0f;
    for (std::int64_t i = 0; i < size; ++i) {
      sum += px[p * size + i];
    }
    po[p] = size > 0 ? sum / static_cast<float>(size) : 0.0f;
  }
}

} // namespace infera::kernels::ops
