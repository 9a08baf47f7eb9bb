#include "infera/kernels/details/gemm.hpp"
#include "infera/kernels/details/spatial.hpp"
#include "infera/kernels/ops.hpp"

#include <cstring>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

// Layout is NCHW, weights are [M, C / groups, kH, kW]. strides.x and
// dilations.x apply to the width.
struct ConvGeometry {
  std::int64_t N, C, H, W;
  std::int64_t M, kH, kW;
  std::int64_t groups;
  details::SpatialLayout layout;
};

ConvGeometry conv_geometry(const Operator &op, const Shape &x,
                           const Shape &w) {
  const ConvAttrs &attrs = op.conv();
  if (x.size() != 4 || w.size() != 4) {
    throw ShapeError(op.kind(),
                     fmt::format("expected NCHW input and 4-D weights, got {} "
                                 "and {}",
                                 x, w));
  }
  ConvGeometry g;
  g.N = x[0];
  g.C = x[1];
  g.H = x[2];
  g.W = x[3];
  g.M = w[0];
  g.kH = w[2];
  g.kW = w[3];
  g.groups = attrs.groups;
  if (g.groups <= 0 || g.C % g.groups != 0 || g.M % g.groups != 0) {
    throw ShapeError(op.kind(),
                     fmt::format("{} input and {} output channels are not "
                                 "divisible into {} groups",
                                 g.C, g.M, g.groups));
  }
  if (w[1] != g.C / g.groups) {
    throw ShapeError(op.kind(),
                     fmt::format("weights expect {} input channels per group, "
                                 "input has {}",
                                 w[1], g.C / g.groups),
                     1);
  }
  g.layout = details::resolve_spatial(op.kind(), g.H, g.W, g.kH, g.kW,
                                      attrs.strides, attrs.dilations,
                                      attrs.padding, attrs.pads);
  return g;
}

void check_bias(const Operator &op, memory::span<const ValueInfo> in,
                std::int64_t channels) {
  if (!details::present(in, 2)) {
    return;
  }
  const TensorInfo &bias = in[2].info;
  details::require_dtype(op, bias, TensorDataType::Float32, "bias");
  if (bias.shape != Shape{channels}) {
    throw ShapeError(op.kind(), fmt::format("bias must have shape [{}], got {}",
                                            channels, bias.shape));
  }
}

// Unfolds one group of one image into [Cg * kH * kW, OH * OW].
void im2col(const float *x, const ConvGeometry &g, const ConvAttrs &attrs,
            std::int64_t channels, float *col) {
  const std::int64_t OH = g.layout.outH;
  const std::int64_t OW = g.layout.outW;
  const std::int64_t sy = attrs.strides.y;
  const std::int64_t sx = attrs.strides.x;
  const std::int64_t dy = attrs.dilations.y;
  const std::int64_t dx = attrs.dilations.x;
  for (std::int64_t c = 0; c < channels; ++c) {
    const float *plane = x + c * g.H * g.W;
    for (std::int64_t ky = 0; ky < g.kH; ++ky) {
      for (std::int64_t kx = 0; kx < g.kW; ++kx) {
        float *row = col + ((c * g.kH + ky) * g.kW + kx) * OH * OW;
        for (std::int64_t oy = 0; oy < OH; ++oy) {
          const std::int64_t iy = oy * sy - g.layout.padTop + ky * dy;
          for (std::int64_t ox = 0; ox < OW; ++ox) {
            const std::int64_t ix = ox * sx - g.layout.padLeft + kx * dx;
            row[oy * OW + ox] = (iy >= 0 && iy < g.H && ix >= 0 && ix < g.W)
                                    ? plane[iy * g.W + ix]
                                    : 0.0f;
          }
        }
      }
    }
  }
}

} // namespace

InferResult conv_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const TensorInfo &w = details::required(op, in, 1);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  details::require_dtype(op, w, TensorDataType::Float32, "weights");
  ConvGeometry g = conv_geometry(op, x.shape, w.shape);
  check_bias(op, in, g.M);
  return details::single(TensorDataType::Float32,
                         Shape{g.N, g.M, g.layout.outH, g.layout.outW});
}

// Lowered to im2col + gemm; accumulation order may differ between scalar and
// SIMD builds.
void conv_execute(const Operator &op, KernelContext &ctx) {
  const ConvAttrs &attrs = op.conv();
  const Tensor &x = ctx.input(0);
  const Tensor &w = ctx.input(1);
  Tensor &out = ctx.output(0);
  ConvGeometry g = conv_geometry(op, x.shape(), w.shape());

  const std::int64_t Cg = g.C / g.groups;
  const std::int64_t Mg = g.M / g.groups;
  const std::int64_t spatial = g.layout.outH * g.layout.outW;
  const std::int64_t patch = Cg * g.kH * g.kW;
  const bool direct = g.kH == 1 && g.kW == 1 && attrs.strides == memory::uvec2{1, 1} &&
                      g.layout.padTop == 0 && g.layout.padLeft == 0 &&
                      spatial == g.H * g.W;

  const float *px = x.data<float>();
  const float *pw = w.data<float>();
  float *po = out.data<float>();
  std::memset(po, 0, out.byteSize());

  memory::vector<float> col;
  if (!direct) {
    col.resize(static_cast<std::size_t>(patch * spatial));
  }
  for (std::int64_t n = 0; n < g.N; ++n) {
    for (std::int64_t grp = 0; grp < g.groups; ++grp) {
      const float *xg = px + (n * g.C + grp * Cg) * g.H * g.W;
      const float *src = xg;
      if (!direct) {
        im2col(xg, g, attrs, Cg, col.data());
        src = col.data();
      }
      details::gemm_accumulate(
          static_cast<std::size_t>(Mg), static_cast<std::size_t>(spatial),
          static_cast<std::size_t>(patch), pw + grp * Mg * patch,
          static_cast<std::size_t>(patch), src,
          static_cast<std::size_t>(spatial),
          po + (n * g.M + grp * Mg) * spatial,
          static_cast<std::size_t>(spatial), ctx.pool);
    }
  }

  if (ctx.has(2)) {
    const float *bias = ctx.input(2).data<float>();
    for (std::int64_t n = 0; n < g.N; ++n) {
      for (std::int64_t m = 0; m < g.M; ++m) {
        float *plane = po + (n * g.M + m) * spatial;
        for (std::int64_t i = 0; i < spatial; ++i) {
          plane[i] += bias[m];
        }
      }
    }
  }
}

namespace {

struct ConvTransposeGeometry {
  std::int64_t N, C, H, W;
  std::int64_t M, kH, kW;
  std::int64_t OH, OW;
};

// Weights are [C, M, kH, kW].
ConvTransposeGeometry conv_transpose_geometry(const Operator &op,
                                              const Shape &x, const Shape &w) {
  const ConvTransposeAttrs &attrs = op.convTranspose();
  if (x.size() != 4 || w.size() != 4) {
    throw ShapeError(op.kind(),
                     fmt::format("expected NCHW input and 4-D weights, got {} "
                                 "and {}",
                                 x, w));
  }
  if (w[0] != x[1]) {
    throw ShapeError(op.kind(),
                     fmt::format("weights expect {} input channels, input has "
                                 "{}",
                                 w[0], x[1]),
                     1);
  }
  if (attrs.strides.x == 0 || attrs.strides.y == 0) {
    throw ShapeError(op.kind(), "strides must be positive");
  }
  ConvTransposeGeometry g{x[0], x[1], x[2], x[3], w[1], w[2], w[3], 0, 0};
  g.OH = (g.H - 1) * attrs.strides.y + g.kH - attrs.pads[0] - attrs.pads[2];
  g.OW = (g.W - 1) * attrs.strides.x + g.kW - attrs.pads[1] - attrs.pads[3];
  if (g.H <= 0 || g.W <= 0 || g.OH <= 0 || g.OW <= 0) {
    throw ShapeError(op.kind(),
                     fmt::format("padding leaves an empty output for input {}",
                                 x));
  }
  return g;
}

} // namespace

InferResult conv_transpose_infer(const Operator &op,
                                 memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const TensorInfo &w = details::required(op, in, 1);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  details::require_dtype(op, w, TensorDataType::Float32, "weights");
  ConvTransposeGeometry g = conv_transpose_geometry(op, x.shape, w.shape);
  check_bias(op, in, g.M);
  return details::single(TensorDataType::Float32, Shape{g.N, g.M, g.OH, g.OW});
}

void conv_transpose_execute(const Operator &op, KernelContext &ctx) {
  const ConvTransposeAttrs &attrs = op.convTranspose();
  const Tensor &x = ctx.input(0);
  const Tensor &w = ctx.input(1);
  Tensor &out = ctx.output(0);
  ConvTransposeGeometry g = conv_transpose_geometry(op, x.shape(), w.shape());

  const float *px = x.data<float>();
  const float *pw = w.data<float>();
  float *po = out.data<float>();
  const float *bias = ctx.has(2) ? ctx.input(2).data<float>() : nullptr;
  const std::int64_t sy = attrs.strides.y;
  const std::int64_t sx = attrs.strides.x;
  const std::int64_t top = attrs.pads[0];
  const std::int64_t left = attrs.pads[1];

  // Output channels are independent, so they are distributed over the pool.
  ctx.pool.parallelFor(
      static_cast<std::size_t>(g.N * g.M), 1,
      [&](std::size_t begin, std::size_t end) {
        for (std::size_t nm = begin; nm < end; ++nm) {
          const auto n = static_cast<std::int64_t>(nm) / g.M;
          const auto m = static_cast<std::int64_t>(nm) % g.M;
          float *plane = po + (n * g.M + m) * g.OH * g.OW;
          const float b = bias != nullptr ? bias[m] : 0.0f;
          for (std::int64_t i = 0; i < g.OH * g.OW; ++i) {
            plane[i] = b;
          }
          for (std::int64_t c = 0; c < g.C; ++c) {
            const float *in = px + (n * g.C + c) * g.H * g.W;
            const float *k = pw + (c * g.M + m) * g.kH * g.kW;
            for (std::int64_t y = 0; y < g.H; ++y) {
              for (std::int64_t xx = 0; xx < g.W; ++xx) {
                const float v = in[y * g.W + xx];
                for (std::int64_t ky = 0; ky < g.kH; ++ky) {
                  const std::int64_t oy = y * sy + ky - top;
                  if (oy < 0 || oy >= g.OH) {
                    continue;
                  }
                  for (std::int64_t kx = 0; kx < g.kW; ++kx) {
                    const std::int64_t ox = xx * sx + kx - left;
                    if (ox < 0 || ox >= g.OW) {
                      continue;
                    }
                    plane[oy * g.OW + ox] += v * k[ky * g.kW + kx];
                  }
                }
              }
            }
          }
        }
      });
}

} // namespace infera::kernels::ops
