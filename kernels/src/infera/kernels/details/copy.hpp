#pragma once

#include "infera/memory/container/span.hpp"
#include "infera/memory/container/vector.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace infera::kernels::details {

// Gathers elements of `elemSize` bytes into a dense row-major `shape`, where
// srcStrides (in elements) gives the source offset of each output dimension.
inline void strided_copy(const std::byte *src,
                         memory::span<const std::int64_t> srcStrides,
                         std::int64_t srcOffset, std::byte *dst,
                         memory::span<const std::int64_t> shape,
                         std::size_t elemSize) {
  std::int64_t total = 1;
  for (std::int64_t d : shape) {
    total *= d;
  }
  if (total == 0) {
    return;
  }
  const std::size_t rank = shape.size();
  if (rank == 0) {
    std::memcpy(dst, src + srcOffset * elemSize, elemSize);
    return;
  }
  const std::int64_t inner = shape[rank - 1];
  const std::int64_t innerStride = srcStrides[rank - 1];
  memory::vector<std::int64_t> index(rank - 1, 0);
  std::int64_t offset = srcOffset;
  for (std::int64_t base = 0; base < total; base += inner) {
    std::byte *out = dst + base * elemSize;
    if (innerStride == 1) {
      std::memcpy(out, src + offset * elemSize, inner * elemSize);
    } else {
      for (std::int64_t i = 0; i < inner; ++i) {
        std::memcpy(out + i * elemSize,
                    src + (offset + i * innerStride) * elemSize, elemSize);
      }
    }
    for (std::size_t d = rank - 1; d-- > 0;) {
      offset += srcStrides[d];
      if (++index[d] < shape[d]) {
        break;
      }
      offset -= srcStrides[d] * index[d];
      index[d] = 0;
    }
  }
}

} // namespace infera::kernels::details
