#include "infera/kernels/ops.hpp"
#include "infera/kernels/simd/simd.hpp"
#include "infera/tensor/broadcast.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

bool is_comparison(OpKind kind) {
  switch (kind) {
  case OpKind::Equal:
  case OpKind::Less:
  case OpKind::LessOrEqual:
  case OpKind::Greater:
  case OpKind::GreaterOrEqual:
    return true;
  default:
    return false;
  }
}

bool is_logical(OpKind kind) {
  return kind == OpKind::And || kind == OpKind::Or || kind == OpKind::Xor;
}

Shape broadcast_or_throw(const Operator &op, const Shape &a, const Shape &b) {
  BroadcastMismatch mismatch{};
  auto out = broadcast_shapes(a, b, &mismatch);
  if (!out) {
    throw ShapeError(op.kind(),
                     fmt::format("cannot broadcast {} with {}: dimension {} "
                                 "({} vs {})",
                                 a, b, mismatch.dimension, mismatch.lhs,
                                 mismatch.rhs),
                     mismatch.dimension);
  }
  return *out;
}

TensorDataType binary_dtype(const Operator &op, const TensorInfo &a,
                            const TensorInfo &b) {
  if (a.dtype != b.dtype) {
    throw ShapeError(op.kind(), fmt::format("operand types differ: {} vs {}",
                                            a.dtype, b.dtype));
  }
  if (is_logical(op.kind())) {
    details::require_dtype(op, a, TensorDataType::Int32, "operand");
    return TensorDataType::Int32;
  }
  if (a.dtype != TensorDataType::Float32 && a.dtype != TensorDataType::Int32) {
    throw ShapeError(op.kind(),
                     fmt::format("unsupported operand type {}", a.dtype));
  }
  return is_comparison(op.kind()) ? TensorDataType::Int32 : a.dtype;
}

// Applies fn(a, b) -> R elementwise with broadcasting.
template <typename T, typename R, typename Fn>
void broadcast_apply(const Tensor &a, const Tensor &b, Tensor &out,
                     WorkerPool &pool, Fn fn) {
  const T *pa = a.data<T>();
  const T *pb = b.data<T>();
  R *po = out.data<R>();
  const auto n = static_cast<std::size_t>(out.numel());
  if (a.shape() == b.shape()) {
    pool.parallelFor(n, details::ElementwiseGrain,
                     [&](std::size_t begin, std::size_t end) {
                       for (std::size_t i = begin; i < end; ++i) {
                         po[i] = fn(pa[i], pb[i]);
                       }
                     });
    return;
  }
  std::array<memory::vector<std::int64_t>, 2> strides{
      broadcast_strides(a.shape(), out.shape()),
      broadcast_strides(b.shape(), out.shape())};
  for_each_broadcast_run<2>(
      out.shape(), strides,
      [&](std::int64_t base, const std::array<std::int64_t, 2> &off,
          std::int64_t count, const std::array<std::int64_t, 2> &step) {
        for (std::int64_t i = 0; i < count; ++i) {
          po[base + i] = fn(pa[off[0] + i * step[0]], pb[off[1] + i * step[1]]);
        }
      });
}

// Float Add/Sub/Mul/Div/Max/Min go through the vectorized loops.
void float_simd_apply(simd::BinaryFn fn, const Tensor &a, const Tensor &b,
                      Tensor &out, WorkerPool &pool) {
  const float *pa = a.data<float>();
  const float *pb = b.data<float>();
  float *po = out.data<float>();
  const auto n = static_cast<std::size_t>(out.numel());
  if (a.shape() == b.shape() || a.numel() == 1 || b.numel() == 1) {
    const std::size_t sa = a.numel() == 1 && n != 1 ? 0 : 1;
    const std::size_t sb = b.numel() == 1 && n != 1 ? 0 : 1;
    pool.parallelFor(n, details::ElementwiseGrain,
                     [&](std::size_t begin, std::size_t end) {
                       simd::binary(fn, pa + begin * sa, sa, pb + begin * sb,
                                    sb, po + begin, end - begin);
                     });
    return;
  }
  std::array<memory::vector<std::int64_t>, 2> strides{
      broadcast_strides(a.shape(), out.shape()),
      broadcast_strides(b.shape(), out.shape())};
  for_each_broadcast_run<2>(
      out.shape(), strides,
      [&](std::int64_t base, const std::array<std::int64_t, 2> &off,
          std::int64_t count, const std::array<std::int64_t, 2> &step) {
        simd::binary(fn, pa + off[0], static_cast<std::size_t>(step[0]),
                     pb + off[1], static_cast<std::size_t>(step[1]),
                     po + base, static_cast<std::size_t>(count));
      });
}

std::int32_t wrap(std::int64_t v) {
  return static_cast<std::int32_t>(static_cast<std::uint32_t>(v));
}

std::int32_t int_div(OpKind op, std::int32_t a, std::int32_t b) {
  if (b == 0) {
    throw KernelError(op, "integer division by zero");
  }
  if (a == std::numeric_limits<std::int32_t>::min() && b == -1) {
    return a;
  }
  return a / b;
}

std::int32_t int_mod(OpKind op, std::int32_t a, std::int32_t b, bool fmod) {
  if (b == 0) {
    throw KernelError(op, "integer modulo by zero");
  }
  if (b == -1) {
    return 0;
  }
  std::int32_t r = a % b;
  if (!fmod && r != 0 && ((r < 0) != (b < 0))) {
    r += b;
  }
  return r;
}

std::int32_t int_pow(std::int32_t base, std::int32_t exp) {
  if (exp < 0) {
    if (base == 1) {
      return 1;
    }
    if (base == -1) {
      return (exp % 2 == 0) ? 1 : -1;
    }
    return 0;
  }
  std::uint32_t result = 1;
  std::uint32_t b = static_cast<std::uint32_t>(base);
  auto e = static_cast<std::uint32_t>(exp);
  while (e != 0) {
    if (e & 1u) {
      result *= b;
    }
    b *= b;
    e >>= 1;
  }
  return static_cast<std::int32_t>(result);
}

float float_mod(float a, float b, bool fmod) {
  float r = std::fmod(a, b);
  if (!fmod && r != 0.0f && ((r < 0.0f) != (b < 0.0f))) {
    r += b;
  }
  return r;
}

template <typename T>
void compare(OpKind kind, const Tensor &a, const Tensor &b, Tensor &out,
             WorkerPool &pool) {
  auto cmp = [&](auto fn) {
    broadcast_apply<T, std::int32_t>(a, b, out, pool,
                                     [fn](T x, T y) -> std::int32_t {
                                       return fn(x, y) ? 1 : 0;
                                     });
  };
  switch (kind) {
  case OpKind::Equal:
    return cmp([](T x, T y) { return x == y; });
  case OpKind::Less:
    return cmp([](T x, T y) { return x < y; });
  case OpKind::LessOrEqual:
    return cmp([](T x, T y) { return x <= y; });
  case OpKind::Greater:
    return cmp([](T x, T y) { return x > y; });
  case OpKind::GreaterOrEqual:
    return cmp([](T x, T y) { return x >= y; });
  default:
    diag::unreachable();
  }
}

void float_binary(const Operator &op, const Tensor &a, const Tensor &b,
                  Tensor &out, WorkerPool &pool) {
  using simd::BinaryFn;
  switch (op.kind()) {
  case OpKind::Add:
    return float_simd_apply(BinaryFn::Add, a, b, out, pool);
  case OpKind::Sub:
    return float_simd_apply(BinaryFn::Sub, a, b, out, pool);
  case OpKind::Mul:
    return float_simd_apply(BinaryFn::Mul, a, b, out, pool);
  case OpKind::Div:
    return float_simd_apply(BinaryFn::Div, a, b, out, pool);
  case OpKind::Max:
    return float_simd_apply(BinaryFn::Max, a, b, out, pool);
  case OpKind::Min:
    return float_simd_apply(BinaryFn::Min, a, b, out, pool);
  case OpKind::Pow:
    return broadcast_apply<float, float>(
        a, b, out, pool, [](float x, float y) { return std::pow(x, y); });
  case OpKind::Mod: {
    bool fmod = op.mod().fmod;
    return broadcast_apply<float, float>(
        a, b, out, pool,
        [fmod](float x, float y) { return float_mod(x, y, fmod); });
  }
  default:
    return compare<float>(op.kind(), a, b, out, pool);
  }
}

void int_binary(const Operator &op, const Tensor &a, const Tensor &b,
                Tensor &out, WorkerPool &pool) {
  using I = std::int32_t;
  const OpKind kind = op.kind();
  switch (kind) {
  case OpKind::Add:
    return broadcast_apply<I, I>(a, b, out, pool, [](I x, I y) {
      return wrap(std::int64_t{x} + y);
    });
  case OpKind::Sub:
    return broadcast_apply<I, I>(a, b, out, pool, [](I x, I y) {
      return wrap(std::int64_t{x} - y);
    });
  case OpKind::Mul:
    return broadcast_apply<I, I>(a, b, out, pool, [](I x, I y) {
      return wrap(std::int64_t{x} * y);
    });
  case OpKind::Div:
    return broadcast_apply<I, I>(
        a, b, out, pool, [kind](I x, I y) { return int_div(kind, x, y); });
  case OpKind::Mod: {
    bool fmod = op.mod().fmod;
    return broadcast_apply<I, I>(a, b, out, pool, [kind, fmod](I x, I y) {
      return int_mod(kind, x, y, fmod);
    });
  }
  case OpKind::Pow:
    return broadcast_apply<I, I>(a, b, out, pool,
                                 [](I x, I y) { return int_pow(x, y); });
  case OpKind::Max:
    return broadcast_apply<I, I>(a, b, out, pool,
                                 [](I x, I y) { return x > y ? x : y; });
  case OpKind::Min:
    return broadcast_apply<I, I>(a, b, out, pool,
                                 [](I x, I y) { return x < y ? x : y; });
  case OpKind::And:
    return broadcast_apply<I, I>(a, b, out, pool, [](I x, I y) {
      return static_cast<I>(x != 0 && y != 0);
    });
  case OpKind::Or:
    return broadcast_apply<I, I>(a, b, out, pool, [](I x, I y) {
      return static_cast<I>(x != 0 || y != 0);
    });
  case OpKind::Xor:
    return broadcast_apply<I, I>(a, b, out, pool, [](I x, I y) {
      return static_cast<I>((x != 0) != (y != 0));
    });
  default:
    return compare<I>(kind, a, b, out, pool);
  }
}

void apply_binary(const Operator &op, const Tensor &a, const Tensor &b,
                  Tensor &out, WorkerPool &pool) {
  if (a.dtype() == TensorDataType::Float32) {
    float_binary(op, a, b, out, pool);
  } else {
    int_binary(op, a, b, out, pool);
  }
}

} // namespace

InferResult binary_infer(const Operator &op,
                         memory::span<const ValueInfo> in) {
  const TensorInfo &a = details::required(op, in, 0);
  const TensorInfo &b = details::required(op, in, 1);
  TensorDataType dtype = binary_dtype(op, a, b);
  return details::single(dtype, broadcast_or_throw(op, a.shape, b.shape));
}

void binary_execute(const Operator &op, KernelContext &ctx) {
  apply_binary(op, ctx.input(0), ctx.input(1), ctx.output(0), ctx.pool);
}

InferResult variadic_infer(const Operator &op,
                           memory::span<const ValueInfo> in) {
  TensorInfo acc = details::required(op, in, 0);
  binary_dtype(op, acc, acc);
  for (std::size_t i = 1; i < in.size(); ++i) {
    const TensorInfo &next = details::required(op, in, i);
    binary_dtype(op, acc, next);
    acc.shape = broadcast_or_throw(op, acc.shape, next.shape);
  }
  return memory::vector<TensorInfo>{acc};
}

// Max and Min fold pairwise from the left.
void variadic_execute(const Operator &op, KernelContext &ctx) {
  Tensor &out = ctx.output(0);
  if (ctx.inputs.size() == 1) {
    const Tensor &in = ctx.input(0);
    std::memcpy(out.mutableBytes(), in.bytes(), in.byteSize());
    return;
  }
  Tensor acc;
  const Tensor *lhs = &ctx.input(0);
  for (std::size_t i = 1; i < ctx.inputs.size(); ++i) {
    const Tensor &rhs = ctx.input(i);
    auto shape = broadcast_or_throw(op, lhs->shape(), rhs.shape());
    if (i + 1 == ctx.inputs.size()) {
      apply_binary(op, *lhs, rhs, out, ctx.pool);
      return;
    }
    Tensor next = Tensor::empty(out.dtype(), std::move(shape));
    apply_binary(op, *lhs, rhs, next, ctx.pool);
    acc = std::move(next);
    lhs = &acc;
  }
}

InferResult where_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &cond = details::required(op, in, 0);
  const TensorInfo &x = details::required(op, in, 1);
  const TensorInfo &y = details::required(op, in, 2);
  details::require_dtype(op, cond, TensorDataType::Int32, "condition");
  if (x.dtype != y.dtype) {
    throw ShapeError(op.kind(), fmt::format("operand types differ: {} vs {}",
                                            x.dtype, y.dtype));
  }
  Shape shape = broadcast_or_throw(op, cond.shape, x.shape);
  shape = broadcast_or_throw(op, shape, y.shape);
  return details::single(x.dtype, std::move(shape));
}

void where_execute(const Operator &, KernelContext &ctx) {
  const Tensor &cond = ctx.input(0);
  const Tensor &x = ctx.input(1);
  const Tensor &y = ctx.input(2);
  Tensor &out = ctx.output(0);
  std::array<memory::vector<std::int64_t>, 3> strides{
      broadcast_strides(cond.shape(), out.shape()),
      broadcast_strides(x.shape(), out.shape()),
      broadcast_strides(y.shape(), out.shape())};
  visit_dtype(out.dtype(), [&](auto tag) {
    using T = decltype(tag);
    const std::int32_t *pc = cond.data<std::int32_t>();
    const T *px = x.data<T>();
    const T *py = y.data<T>();
    T *po = out.data<T>();
    for_each_broadcast_run<3>(
        out.shape(), strides,
        [&](std::int64_t base, const std::array<std::int64_t, 3> &off,
            std::int64_t count, const std::array<std::int64_t, 3> &step) {
          for (std::int64_t i = 0; i < count; ++i) {
            po[base + i] = pc[off[0] + i * step[0]] != 0
                               ? px[off[1] + i * step[1]]
                               : py[off[2] + i * step[2]];
          }
        });
  });
}

} // namespace infera::kernels::ops
