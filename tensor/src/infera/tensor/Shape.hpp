#pragma once

#include "infera/memory/container/span.hpp"
#include "infera/memory/container/vector.hpp"

#include <cstdint>
#include <fmt/ranges.h>

namespace infera {

// Dimensions are non-negative; rank 0 is a scalar with one element.
using Shape = memory::vector<std::int64_t>;

// Upper bound on the element count of a single tensor.
inline constexpr std::int64_t MaxTensorElements = std::int64_t{1} << 32;

// Throws std::invalid_argument for negative dimensions or when the element
// count exceeds MaxTensorElements.
std::int64_t numel(memory::span<const std::int64_t> shape);

memory::vector<std::int64_t> strides_of(memory::span<const std::int64_t> shape);

} // namespace infera
