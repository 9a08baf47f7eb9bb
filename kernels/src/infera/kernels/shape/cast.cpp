#include "infera/kernels/ops.hpp"

#include <cmath>
#include <limits>
#include <type_traits>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

// Float to integer truncates toward zero and saturates, NaN becomes 0.
// Integer narrowing saturates as well.
template <typename To, typename From> To convert(From v) {
  if constexpr (std::is_same_v<To, From>) {
    return v;
  } else if constexpr (std::is_floating_point_v<To>) {
    return static_cast<To>(v);
  } else if constexpr (std::is_floating_point_v<From>) {
    if (std::isnan(v)) {
      return To{0};
    }
    constexpr auto lo = static_cast<From>(std::numeric_limits<To>::min());
    // 2^31 is exactly representable, INT32_MAX is not.
    constexpr auto hi = static_cast<From>(std::numeric_limits<To>::max()) + From{1};
    if (v <= lo) {
      return std::numeric_limits<To>::min();
    }
    if (v >= hi) {
      return std::numeric_limits<To>::max();
    }
    return static_cast<To>(v);
  } else {
    const auto w = static_cast<std::int64_t>(v);
    if (w < static_cast<std::int64_t>(std::numeric_limits<To>::min())) {
      return std::numeric_limits<To>::min();
    }
    if (w > static_cast<std::int64_t>(std::numeric_limits<To>::max())) {
      return std::numeric_limits<To>::max();
    }
    return static_cast<To>(w);
  }
}

} // namespace

InferResult cast_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  return details::single(op.cast().to, x.shape);
}

void cast_execute(const Operator &, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  Tensor &out = ctx.output(0);
  visit_dtype(x.dtype(), [&](auto fromTag) {
    using From = decltype(fromTag);
    visit_dtype(out.dtype(), [&](auto toTag) {
      using To = decltype(toTag);
      const From *src = x.data<From>();
      To *dst = out.data<To>();
      for (std::int64_t i = 0; i < x.numel(); ++i) {
        dst[i] = convert<To>(src[i]);
      }
    });
  });
}

} // namespace infera::kernels::ops
