#pragma once

#include "infera/common/ops/PaddingMode.hpp"
#include "infera/memory/container/uvec2.hpp"
#include <cstdint>

namespace infera {

struct ConvAttrs {
  std::uint32_t groups = 1;
  PaddingMode padding = PaddingMode::Fixed;
  Padding2d pads{0, 0, 0, 0};
  memory::uvec2 strides{1, 1};
  memory::uvec2 dilations{1, 1};
};

struct ConvTransposeAttrs {
  memory::uvec2 strides{1, 1};
  Padding2d pads{0, 0, 0, 0};
};

} // namespace infera
