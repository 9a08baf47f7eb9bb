#include "infera/kernels/details/copy.hpp"
#include "infera/kernels/ops.hpp"

#include <algorithm>

namespace infera::kernels::ops {

namespace {

using details::InferResult;

struct SliceRange {
  memory::vector<std::int64_t> start;
  memory::vector<std::int64_t> step;
  Shape out;
};

// starts/ends/axes/steps are i32 tensors; out-of-range values are clamped.
SliceRange slice_range(const Operator &op, const Shape &in,
                       const memory::vector<std::int64_t> &starts,
                       const memory::vector<std::int64_t> &ends,
                       const memory::optional<memory::vector<std::int64_t>> &axes,
                       const memory::optional<memory::vector<std::int64_t>> &steps) {
  if (starts.size() != ends.size() || (axes && axes->size() != starts.size()) ||
      (steps && steps->size() != starts.size())) {
    throw ShapeError(op.kind(), "starts, ends, axes and steps differ in length");
  }
  const std::size_t rank = in.size();
  SliceRange r;
  r.start.assign(rank, 0);
  r.step.assign(rank, 1);
  r.out = in;
  memory::vector<bool> seen(rank, false);
  for (std::size_t i = 0; i < starts.size(); ++i) {
    const std::size_t axis =
        axes ? details::axis_of(op, (*axes)[i], rank) : i;
    if (axis >= rank || seen[axis]) {
      throw ShapeError(op.kind(), fmt::format("invalid slice axis {}", axis));
    }
    seen[axis] = true;
    const std::int64_t dim = in[axis];
    const std::int64_t step = steps ? (*steps)[i] : 1;
    if (step == 0) {
      throw ShapeError(op.kind(), "slice step must not be 0");
    }
    std::int64_t start = starts[i] < 0 ? starts[i] + dim : starts[i];
    std::int64_t end = ends[i] < 0 ? ends[i] + dim : ends[i];
    std::int64_t len = 0;
    if (step > 0) {
      start = std::clamp<std::int64_t>(start, 0, dim);
      end = std::clamp<std::int64_t>(end, 0, dim);
      len = end > start ? (end - start + step - 1) / step : 0;
    } else {
      start = std::clamp<std::int64_t>(start, 0, dim - 1);
      end = std::clamp<std::int64_t>(end, -1, dim - 1);
      len = start > end ? (start - end - step - 1) / -step : 0;
    }
    r.start[axis] = len > 0 ? start : 0;
    r.step[axis] = step;
    r.out[axis] = len;
  }
  return r;
}

memory::optional<memory::vector<std::int64_t>>
optional_ints(const Operator &op, const Tensor *t, std::string_view what) {
  if (t == nullptr) {
    return memory::nullopt;
  }
  return details::read_ints(op, *t, what);
}

} // namespace

InferResult slice_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  for (std::size_t i = 1; i < 5; ++i) {
    if (details::present(in, i)) {
      details::require_dtype(op, in[i].info, TensorDataType::Int32,
                             "slice parameter");
      details::require_rank(op, in[i].info, 1, "slice parameter");
    }
  }
  details::required(op, in, 1);
  details::required(op, in, 2);
  for (std::size_t i = 1; i < 5; ++i) {
    if (details::present(in, i) && in[i].value == nullptr) {
      return memory::nullopt;
    }
  }
  auto starts = details::read_ints(op, *in[1].value, "starts");
  auto ends = details::read_ints(op, *in[2].value, "ends");
  auto axes = optional_ints(op, details::present(in, 3) ? in[3].value : nullptr,
                            "axes");
  auto steps = optional_ints(
      op, details::present(in, 4) ? in[4].value : nullptr, "steps");
  return details::single(x.dtype,
                         slice_range(op, x.shape, starts, ends, axes, steps).out);
}

void slice_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  auto starts = details::read_ints(op, ctx.input(1), "starts");
  auto ends = details::read_ints(op, ctx.input(2), "ends");
  auto axes = optional_ints(op, ctx.has(3) ? &ctx.input(3) : nullptr, "axes");
  auto steps =
      optional_ints(op, ctx.has(4) ? &ctx.input(4) : nullptr, "steps");
  SliceRange r = slice_range(op, x.shape(), starts, ends, axes, steps);
  auto inStrides = x.strides();
  memory::vector<std::int64_t> strides(x.rank());
  std::int64_t offset = 0;
  for (std::size_t d = 0; d < x.rank(); ++d) {
    offset += r.start[d] * inStrides[d];
    strides[d] = inStrides[d] * r.step[d];
  }
  Tensor &out = ctx.output(0);
  details::strided_copy(x.bytes(), strides, offset, out.mutableBytes(),
                        out.shape(), size_of(x.dtype()));
}

// Inputs: data, pads [2 * rank] (all begins, then all ends), optional scalar
// constant value. Only non-negative constant padding is supported.
InferResult pad_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const TensorInfo &pads = details::required(op, in, 1);
  details::require_dtype(op, pads, TensorDataType::Int32, "pads");
  if (details::present(in, 2)) {
    details::require_dtype(op, in[2].info, x.dtype, "constant value");
  }
  auto p = details::known_ints(op, in, 1, "pads");
  if (!p) {
    return memory::nullopt;
  }
  const std::size_t rank = x.shape.size();
  if (p->size() != 2 * rank) {
    throw ShapeError(op.kind(), fmt::format("expected {} pads, got {}",
                                            2 * rank, p->size()));
  }
  Shape out = x.shape;
  for (std::size_t d = 0; d < rank; ++d) {
    if ((*p)[d] < 0 || (*p)[d + rank] < 0) {
      throw ShapeError(op.kind(), "negative pads are not supported", d);
    }
    out[d] += (*p)[d] + (*p)[d + rank];
  }
  return details::single(x.dtype, std::move(out));
}

void pad_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  Tensor &out = ctx.output(0);
  auto pads = details::read_ints(op, ctx.input(1), "pads");
  const std::size_t rank = x.rank();
  const std::size_t elem = size_of(x.dtype());

  visit_dtype(x.dtype(), [&](auto tag) {
    using T = decltype(tag);
    T value{};
    if (ctx.has(2)) {
      const Tensor &v = ctx.input(2);
      if (v.numel() != 1) {
        throw ShapeError(op.kind(), "constant value must be a single element");
      }
      value = v.data<T>()[0];
    }
    auto values = out.mutableValues<T>();
    std::fill(values.begin(), values.end(), value);
  });
  if (x.numel() == 0) {
    return;
  }
  if (rank == 0) {
    std::memcpy(out.mutableBytes(), x.bytes(), elem);
    return;
  }

  auto outStrides = out.strides();
  std::int64_t base = 0;
  for (std::size_t d = 0; d < rank; ++d) {
    base += pads[d] * outStrides[d];
  }
  const std::int64_t inner = x.dim(rank - 1);
  memory::vector<std::int64_t> index(rank - 1, 0);
  std::int64_t dst = base;
  for (std::int64_t src = 0; src < x.numel(); src += inner) {
    std::memcpy(out.mutableBytes() + dst * elem, x.bytes() + src * elem,
                inner * elem);
    for (std::size_t d = rank - 1; d-- > 0;) {
      dst += outStrides[d];
      if (++index[d] < x.dim(d)) {
        break;
      }
      dst -= outStrides[d] * index[d];
      index[d] = 0;
    }
  }
}

} // namespace infera::kernels::ops
