#include "infera/kernels/ops.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

void check_scalar(const Operator &op, const TensorInfo &t,
                  std::string_view what) {
  if (numel(t.shape) != 1) {
    throw ShapeError(op.kind(),
                     fmt::format("{} must be a single value (per-tensor), got "
                                 "{}",
                                 what, t.shape));
  }
}

// Round half to even, independent of the current rounding mode.
float round_half_even(float v) {
  const float r = std::round(v);
  if (std::fabs(v - std::trunc(v)) == 0.5f) {
    return 2.0f * std::round(v / 2.0f);
  }
  return r;
}

template <typename Q>
void quantize(const Tensor &x, float scale, std::int32_t zero, Tensor &out) {
  constexpr float lo = std::numeric_limits<Q>::min();
  constexpr float hi = std::numeric_limits<Q>::max();
  const float *px = x.data<float>();
  Q *po = out.data<Q>();
  for (std::int64_t i = 0; i < x.numel(); ++i) {
    float q = round_half_even(px[i] / scale) + static_cast<float>(zero);
    if (std::isnan(q)) {
      q = static_cast<float>(zero);
    }
    po[i] = static_cast<Q>(std::clamp(q, lo, hi));
  }
}

std::int32_t zero_point(const KernelContext &ctx, std::size_t i) {
  if (!ctx.has(i)) {
    return 0;
  }
  const Tensor &zp = ctx.input(i);
  return visit_dtype(zp.dtype(), [&](auto tag) -> std::int32_t {
    using T = decltype(tag);
    return static_cast<std::int32_t>(zp.data<T>()[0]);
  });
}

} // namespace

// Inputs: x f32, scale f32, optional zero point (i8 or u8, defaults to u8).
InferResult quantize_infer(const Operator &op,
                           memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const TensorInfo &scale = details::required(op, in, 1);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  details::require_dtype(op, scale, TensorDataType::Float32, "scale");
  check_scalar(op, scale, "scale");
  TensorDataType outType = TensorDataType::Uint8;
  if (details::present(in, 2)) {
    const TensorInfo &zp = in[2].info;
    check_scalar(op, zp, "zero point");
    if (zp.dtype != TensorDataType::Int8 && zp.dtype != TensorDataType::Uint8) {
      throw ShapeError(op.kind(),
                       fmt::format("zero point must be i8 or u8, got {}",
                                   zp.dtype));
    }
    outType = zp.dtype;
  }
  return details::single(outType, x.shape);
}

void quantize_execute(const Operator &op, KernelContext &ctx) {
  const float scale = details::read_float_scalar(op, ctx.input(1), "scale");
  if (!(scale > 0.0f) || !std::isfinite(scale)) {
    throw KernelError(op.kind(), fmt::format("invalid scale {}", scale));
  }
  const std::int32_t zero = zero_point(ctx, 2);
  Tensor &out = ctx.output(0);
  if (out.dtype() == TensorDataType::Int8) {
    quantize<std::int8_t>(ctx.input(0), scale, zero, out);
  } else {
    quantize<std::uint8_t>(ctx.input(0), scale, zero, out);
  }
}

// Inputs: x (i8, u8 or i32), scale f32, optional zero point of x's type.
InferResult dequantize_infer(const Operator &op,
                             memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const TensorInfo &scale = details::required(op, in, 1);
  if (x.dtype == TensorDataType::Float32) {
    throw ShapeError(op.kind(), "input must be an integer tensor");
  }
  details::require_dtype(op, scale, TensorDataType::Float32, "scale");
  check_scalar(op, scale, "scale");
  if (details::present(in, 2)) {
    details::require_dtype(op, in[2].info, x.dtype, "zero point");
    check_scalar(op, in[2].info, "zero point");
  }
  return details::single(TensorDataType::Float32, x.shape);
}

void dequantize_execute(const Operator &op, KernelContext &ctx) {
  const float scale = details::read_float_scalar(op, ctx.input(1), "scale");
  const std::int32_t zero = zero_point(ctx, 2);
  const Tensor &x = ctx.input(0);
  float *po = ctx.output(0).data<float>();
  visit_dtype(x.dtype(), [&](auto tag) {
    using T = decltype(tag);
    const T *px = x.data<T>();
    for (std::int64_t i = 0; i < x.numel(); ++i) {
      po[i] = static_cast<float>(static_cast<std::int64_t>(px[i]) - zero) *
              scale;
    }
  });
}

} // namespace infera::kernels::ops
