#pragma once

#include "infera/common/ops/PaddingMode.hpp"
#include "infera/memory/container/uvec2.hpp"

namespace infera {

struct PoolAttrs {
  memory::uvec2 kernelSize{1, 1};
  PaddingMode padding = PaddingMode::Fixed;
  Padding2d pads{0, 0, 0, 0};
  memory::uvec2 strides{1, 1};
  // AveragePool only.
  bool countIncludePad = false;
};

} // namespace infera
