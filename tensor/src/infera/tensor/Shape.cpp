#include "infera/tensor/Shape.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace infera {

std::int64_t numel(memory::span<const std::int64_t> shape) {
  std::int64_t n = 1;
  for (std::int64_t d : shape) {
    if (d < 0) {
      throw std::invalid_argument(
          fmt::format("negative dimension {} in shape {}", d, shape));
    }
    if (d != 0 && n > MaxTensorElements / d) {
      throw std::invalid_argument(
          fmt::format("shape {} exceeds the tensor size limit", shape));
    }
    n *= d;
  }
  return n;
}

memory::vector<std::int64_t>
strides_of(memory::span<const std::int64_t> shape) {
  memory::vector<std::int64_t> strides(shape.size(), 1);
  std::int64_t acc = 1;
  for (std::size_t i = shape.size(); i-- > 0;) {
    strides[i] = acc;
    acc *= shape[i];
  }
  return strides;
}

} // namespace infera
