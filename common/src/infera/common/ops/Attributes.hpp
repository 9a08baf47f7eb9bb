#pragma once

#include "infera/common/TensorDataType.hpp"
#include "infera/memory/container/vector.hpp"

#include <cstdint>
#include <limits>

namespace infera {

struct LeakyReluAttrs {
  float alpha = 0.01f;
};

struct ClipAttrs {
  float min = std::numeric_limits<float>::lowest();
  float max = std::numeric_limits<float>::max();
};

// Concat, Softmax, LogSoftmax, Gather, Flatten
struct AxisAttrs {
  std::int32_t axis = 0;
};

// ReduceMean/Sum/Max/Min, Squeeze, Unsqueeze. An empty axes list reduces
// (or squeezes) every axis.
struct AxesAttrs {
  memory::vector<std::int32_t> axes;
  bool keepDims = true;
};

struct SplitAttrs {
  std::int32_t axis = 0;
  // Empty: split evenly across the outputs.
  memory::vector<std::uint32_t> split;
  std::uint32_t numOutputs = 1;
};

struct TransposeAttrs {
  // Empty: reverse the dimensions.
  memory::vector<std::uint32_t> perm;
};

struct BatchNormAttrs {
  float epsilon = 1e-5f;
};

struct CastAttrs {
  TensorDataType to = TensorDataType::Float32;
};

struct ConstantOfShapeAttrs {
  TensorDataType dtype = TensorDataType::Float32;
  float floatValue = 0.0f;
  std::int32_t intValue = 0;
};

struct GemmAttrs {
  float alpha = 1.0f;
  float beta = 1.0f;
  bool transposeA = false;
  bool transposeB = false;
};

struct ModAttrs {
  // true: sign follows the dividend (C fmod), false: sign follows the divisor.
  bool fmod = false;
};

} // namespace infera
