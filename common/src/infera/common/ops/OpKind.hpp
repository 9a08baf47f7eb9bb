#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <fmt/core.h>
#include <string_view>

namespace infera {

enum class OpKind : std::uint16_t {
  // binary elementwise
  Add,
  Sub,
  Mul,
  Div,
  Pow,
  Mod,
  Max,
  Min,
  Equal,
  Less,
  LessOrEqual,
  Greater,
  GreaterOrEqual,
  And,
  Or,
  Xor,
  Where,
  // unary
  Relu,
  LeakyRelu,
  Sigmoid,
  Tanh,
  Clip,
  Sqrt,
  Exp,
  Log,
  Erf,
  Sin,
  Cos,
  Abs,
  Neg,
  Reciprocal,
  Floor,
  Ceil,
  Not,
  Identity,
  // spatial
  Conv,
  ConvTranspose,
  MaxPool,
  AveragePool,
  GlobalAveragePool,
  // normalization
  BatchNormalization,
  Softmax,
  LogSoftmax,
  // reductions
  ReduceMean,
  ReduceSum,
  ReduceMax,
  ReduceMin,
  // matrix
  MatMul,
  Gemm,
  // shape manipulation
  Reshape,
  Shape,
  Flatten,
  Squeeze,
  Unsqueeze,
  Transpose,
  Expand,
  Slice,
  Pad,
  Cast,
  ConstantOfShape,
  Range,
  Resize,
  // combinators
  Concat,
  Split,
  Gather,
  // quantization
  QuantizeLinear,
  DequantizeLinear,
};

inline constexpr std::size_t OpKindCount =
    static_cast<std::size_t>(OpKind::DequantizeLinear) + 1;

inline constexpr std::array<std::string_view, OpKindCount> OpKindNames = {
    "Add",
    "Sub",
    "Mul",
    "Div",
    "Pow",
    "Mod",
    "Max",
    "Min",
    "Equal",
    "Less",
    "LessOrEqual",
    "Greater",
    "GreaterOrEqual",
    "And",
    "Or",
    "Xor",
    "Where",
    "Relu",
    "LeakyRelu",
    "Sigmoid",
    "Tanh",
    "Clip",
    "Sqrt",
    "Exp",
    "Log",
    "Erf",
    "Sin",
    "Cos",
    "Abs",
    "Neg",
    "Reciprocal",
    "Floor",
    "Ceil",
    "Not",
    "Identity",
    "Conv",
    "ConvTranspose",
    "MaxPool",
    "AveragePool",
    "GlobalAveragePool",
    "BatchNormalization",
    "Softmax",
    "LogSoftmax",
    "ReduceMean",
    "ReduceSum",
    "ReduceMax",
    "ReduceMin",
    "MatMul",
    "Gemm",
    "Reshape",
    "Shape",
    "Flatten",
    "Squeeze",
    "Unsqueeze",
    "Transpose",
    "Expand",
    "Slice",
    "Pad",
    "Cast",
    "ConstantOfShape",
    "Range",
    "Resize",
    "Concat",
    "Split",
    "Gather",
    "QuantizeLinear",
    "DequantizeLinear",
};

inline std::string_view op_name(OpKind kind) {
  auto i = static_cast<std::size_t>(kind);
  if (i >= OpKindCount) {
    return "Unknown";
  }
  return OpKindNames[i];
}

} // namespace infera

template <> struct fmt::formatter<infera::OpKind> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(infera::OpKind kind, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", infera::op_name(kind));
  }
};
