#include "infera/kernels/ops.hpp"
#include "infera/kernels/simd/simd.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

template <typename T, typename Fn>
void map(const Tensor &in, Tensor &out, WorkerPool &pool, Fn fn) {
  const T *pi = in.data<T>();
  T *po = out.data<T>();
  pool.parallelFor(static_cast<std::size_t>(in.numel()),
                   details::ElementwiseGrain,
                   [&](std::size_t begin, std::size_t end) {
                     for (std::size_t i = begin; i < end; ++i) {
                       po[i] = fn(pi[i]);
                     }
                   });
}

bool accepts_int(OpKind kind) {
  switch (kind) {
  case OpKind::Abs:
  case OpKind::Neg:
  case OpKind::Not:
  case OpKind::Relu:
    return true;
  default:
    return false;
  }
}

void float_unary(const Operator &op, const Tensor &in, Tensor &out,
                 WorkerPool &pool) {
  const float *pi = in.data<float>();
  float *po = out.data<float>();
  const auto n = static_cast<std::size_t>(in.numel());
  switch (op.kind()) {
  case OpKind::Relu:
    return pool.parallelFor(n, details::ElementwiseGrain,
                            [&](std::size_t begin, std::size_t end) {
                              simd::relu(pi + begin, po + begin, end - begin);
                            });
  case OpKind::LeakyRelu: {
    float alpha = op.leakyRelu().alpha;
    return map<float>(in, out, pool,
                      [alpha](float x) { return x < 0.0f ? alpha * x : x; });
  }
  case OpKind::Sigmoid:
    return map<float>(in, out, pool,
                      [](float x) { return 1.0f / (1.0f + std::exp(-x)); });
  case OpKind::Tanh:
    return map<float>(in, out, pool, [](float x) { return std::tanh(x); });
  case OpKind::Sqrt:
    return map<float>(in, out, pool, [](float x) { return std::sqrt(x); });
  case OpKind::Exp:
    return map<float>(in, out, pool, [](float x) { return std::exp(x); });
  case OpKind::Log:
    return map<float>(in, out, pool, [](float x) { return std::log(x); });
  case OpKind::Erf:
    return map<float>(in, out, pool, [](float x) { return std::erf(x); });
  case OpKind::Sin:
    return map<float>(in, out, pool, [](float x) { return std::sin(x); });
  case OpKind::Cos:
    return map<float>(in, out, pool, [](float x) { return std::cos(x); });
  case OpKind::Abs:
    return map<float>(in, out, pool, [](float x) { return std::fabs(x); });
  case OpKind::Neg:
    return map<float>(in, out, pool, [](float x) { return -x; });
  case OpKind::Reciprocal:
    return map<float>(in, out, pool, [](float x) { return 1.0f / x; });
  case OpKind::Floor:
    return map<float>(in, out, pool, [](float x) { return std::floor(x); });
  case OpKind::Ceil:
    return map<float>(in, out, pool, [](float x) { return std::ceil(x); });
  default:
    diag::unreachable(fmt::format("{} is not a float unary operator",
                                  op.kind()));
  }
}

void int_unary(const Operator &op, const Tensor &in, Tensor &out,
               WorkerPool &pool) {
  using I = std::int32_t;
  constexpr I IntMin = std::numeric_limits<I>::min();
  switch (op.kind()) {
  case OpKind::Relu:
    return map<I>(in, out, pool, [](I x) { return x > 0 ? x : 0; });
  case OpKind::Abs:
    // |INT32_MIN| wraps to itself
    return map<I>(in, out, pool,
                  [](I x) { return x == IntMin ? x : (x < 0 ? -x : x); });
  case OpKind::Neg:
    return map<I>(in, out, pool, [](I x) { return x == IntMin ? x : -x; });
  case OpKind::Not:
    return map<I>(in, out, pool, [](I x) { return static_cast<I>(x == 0); });
  default:
    diag::unreachable(fmt::format("{} is not an integer unary operator",
                                  op.kind()));
  }
}

} // namespace

InferResult unary_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  if (op.kind() == OpKind::Identity) {
    return details::single(x.dtype, x.shape);
  }
  if (op.kind() == OpKind::Not) {
    details::require_dtype(op, x, TensorDataType::Int32, "input");
  } else if (x.dtype != TensorDataType::Float32 &&
             !(x.dtype == TensorDataType::Int32 && accepts_int(op.kind()))) {
    throw ShapeError(op.kind(),
                     fmt::format("unsupported input type {}", x.dtype));
  }
  return details::single(x.dtype, x.shape);
}

void unary_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &in = ctx.input(0);
  Tensor &out = ctx.output(0);
  if (op.kind() == OpKind::Identity) {
    std::memcpy(out.mutableBytes(), in.bytes(), in.byteSize());
  } else if (in.dtype() == TensorDataType::Float32) {
    float_unary(op, in, out, ctx.pool);
  } else {
    int_unary(op, in, out, ctx.pool);
  }
}

// Clip bounds come from the attributes, overridden by the optional min/max
// inputs.
InferResult clip_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  details::require_dtype(op, x, TensorDataType::Float32, "input");
  for (std::size_t i = 1; i < 3; ++i) {
    if (details::present(in, i) && in[i].info.shape.size() > 1) {
      throw ShapeError(op.kind(), fmt::format("bound {} must be a scalar", i));
    }
  }
  return details::single(x.dtype, x.shape);
}

void clip_execute(const Operator &op, KernelContext &ctx) {
  float lo = op.clip().min;
  float hi = op.clip().max;
  if (ctx.has(1)) {
    lo = details::read_float_scalar(op, ctx.input(1), "min");
  }
  if (ctx.has(2)) {
    hi = details::read_float_scalar(op, ctx.input(2), "max");
  }
  const Tensor &in = ctx.input(0);
  const float *pi = in.data<float>();
  float *po = ctx.output(0).data<float>();
  ctx.pool.parallelFor(static_cast<std::size_t>(in.numel()),
                       details::ElementwiseGrain,
                       [&](std::size_t begin, std::size_t end) {
                         simd::clamp(pi + begin, po + begin, end - begin, lo,
                                     hi);
                       });
}

} // namespace infera::kernels::ops
