#pragma once

#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/span.hpp"
#include "infera/tensor/Shape.hpp"

#include <array>
#include <cstdint>

namespace infera {

struct BroadcastMismatch {
  // Index into the (right-aligned) output shape.
  std::size_t dimension;
  std::int64_t lhs;
  std::int64_t rhs;
};

// NumPy broadcasting: shapes are right-aligned, each aligned pair must be
// equal or contain a 1. On failure reports the first mismatching output
// dimension from the left.
memory::optional<Shape> broadcast_shapes(memory::span<const std::int64_t> a,
                                         memory::span<const std::int64_t> b,
                                         BroadcastMismatch *mismatch = nullptr);

// Strides of `in` when read as `out`: aligned to out's rank, 0 where the
// input dimension is broadcast.
memory::vector<std::int64_t>
broadcast_strides(memory::span<const std::int64_t> in,
                  memory::span<const std::int64_t> out);

// Visits `out` in row-major order as runs along the innermost dimension.
// fn(outOffset, offsets, count, steps) receives the element offset of each
// operand at the start of the run and its step within the run (0 or 1).
template <std::size_t N, typename Fn>
void for_each_broadcast_run(
    memory::span<const std::int64_t> out,
    const std::array<memory::vector<std::int64_t>, N> &strides, Fn &&fn) {
  const std::size_t rank = out.size();
  const std::int64_t total = numel(out);
  if (total == 0) {
    return;
  }
  const std::int64_t inner = rank == 0 ? 1 : out[rank - 1];
  std::array<std::int64_t, N> steps{};
  for (std::size_t k = 0; k < N; ++k) {
    steps[k] = rank == 0 ? 0 : strides[k][rank - 1];
  }
  memory::vector<std::int64_t> counter(rank == 0 ? 0 : rank - 1, 0);
  std::array<std::int64_t, N> offsets{};
  for (std::int64_t base = 0; base < total; base += inner) {
    fn(base, offsets, inner, steps);
    // advance the outer counter
    for (std::size_t d = counter.size(); d-- > 0;) {
      ++counter[d];
      for (std::size_t k = 0; k < N; ++k) {
        offsets[k] += strides[k][d];
      }
      if (counter[d] < out[d]) {
        break;
      }
      for (std::size_t k = 0; k < N; ++k) {
        offsets[k] -= strides[k][d] * counter[d];
      }
      counter[d] = 0;
    }
  }
}

} // namespace infera
