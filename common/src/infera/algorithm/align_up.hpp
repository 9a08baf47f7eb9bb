#pragma once

#include <cstddef>

namespace infera::algorithm {

template <std::size_t A> constexpr std::size_t align_up(std::size_t offset) {
  static_assert(A != 0 && (A & (A - 1)) == 0, "alignment must be a power of two");
  return (offset + A - 1) & ~(A - 1);
}

inline std::size_t align_up(std::size_t offset, std::size_t alignment) {
  return (offset + alignment - 1) & ~(alignment - 1);
}

} // namespace infera::algorithm
