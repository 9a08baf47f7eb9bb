#include "infera/kernels/details/copy.hpp"
#include "infera/kernels/ops.hpp"
#include "infera/tensor/broadcast.hpp"

namespace infera::kernels::ops {

namespace {

using details::InferResult;

memory::vector<std::size_t> permutation(const Operator &op, std::size_t rank) {
  const auto &perm = op.transpose().perm;
  memory::vector<std::size_t> p(rank);
  if (perm.empty()) {
    for (std::size_t d = 0; d < rank; ++d) {
      p[d] = rank - 1 - d;
    }
    return p;
  }
  if (perm.size() != rank) {
    throw ShapeError(op.kind(),
                     fmt::format("permutation {} does not match rank {}", perm,
                                 rank));
  }
  memory::vector<bool> seen(rank, false);
  for (std::size_t d = 0; d < rank; ++d) {
    if (perm[d] >= rank || seen[perm[d]]) {
      throw ShapeError(op.kind(),
                       fmt::format("{} is not a permutation", perm));
    }
    seen[perm[d]] = true;
    p[d] = perm[d];
  }
  return p;
}

} // namespace

InferResult transpose_infer(const Operator &op,
                            memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  auto p = permutation(op, x.shape.size());
  Shape out(p.size());
  for (std::size_t d = 0; d < p.size(); ++d) {
    out[d] = x.shape[p[d]];
  }
  return details::single(x.dtype, std::move(out));
}

void transpose_execute(const Operator &op, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  Tensor &out = ctx.output(0);
  auto p = permutation(op, x.rank());
  auto inStrides = x.strides();
  memory::vector<std::int64_t> strides(p.size());
  for (std::size_t d = 0; d < p.size(); ++d) {
    strides[d] = inStrides[p[d]];
  }
  details::strided_copy(x.bytes(), strides, 0, out.mutableBytes(), out.shape(),
                        size_of(x.dtype()));
}

InferResult expand_infer(const Operator &op, memory::span<const ValueInfo> in) {
  const TensorInfo &x = details::required(op, in, 0);
  const TensorInfo &shape = details::required(op, in, 1);
  details::require_dtype(op, shape, TensorDataType::Int32, "shape");
  details::require_rank(op, shape, 1, "shape");
  auto target = details::known_ints(op, in, 1, "shape");
  if (!target) {
    return memory::nullopt;
  }
  for (std::size_t i = 0; i < target->size(); ++i) {
    if ((*target)[i] < 0) {
      throw ShapeError(op.kind(),
                       fmt::format("invalid dimension {} in target {}",
                                   (*target)[i], *target),
                       i);
    }
  }
  BroadcastMismatch mismatch{};
  auto out = broadcast_shapes(x.shape, *target, &mismatch);
  if (!out) {
    throw ShapeError(op.kind(),
                     fmt::format("cannot expand {} to {}: dimension {} ({} vs "
                                 "{})",
                                 x.shape, *target, mismatch.dimension,
                                 mismatch.lhs, mismatch.rhs),
                     mismatch.dimension);
  }
  return details::single(x.dtype, std::move(*out));
}

void expand_execute(const Operator &, KernelContext &ctx) {
  const Tensor &x = ctx.input(0);
  Tensor &out = ctx.output(0);
  auto strides = broadcast_strides(x.shape(), out.shape());
  details::strided_copy(x.bytes(), strides, 0, out.mutableBytes(), out.shape(),
                        size_of(x.dtype()));
}

} // namespace infera::kernels::ops
