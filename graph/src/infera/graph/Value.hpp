#pragma once

#include "infera/common/TensorDataType.hpp"
#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/string.hpp"
#include "infera/memory/container/vector.hpp"
#include "infera/tensor/Tensor.hpp"

#include <cstdint>
#include <fmt/format.h>

namespace infera::graph {

// A declared dimension: fixed size, or symbolic (size < 0) with an optional
// name shared between inputs that must agree.
struct Dim {
  std::int64_t size = -1;
  memory::string name;

  static Dim fixed(std::int64_t n) { return Dim{n, {}}; }
  static Dim symbolic(memory::string name = {}) {
    return Dim{-1, std::move(name)};
  }

  bool isFixed() const { return size >= 0; }
};

using DimList = memory::vector<Dim>;

// A value of the graph: input, constant, operator output or intermediate.
struct ValueNode {
  memory::string name;
  memory::optional<TensorDataType> dtype;
  memory::optional<DimList> shape;
  // Set for constants.
  memory::optional<Tensor> constant;

  bool isConstant() const { return constant.has_value(); }
};

} // namespace infera::graph

template <> struct fmt::formatter<infera::graph::Dim> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const infera::graph::Dim &dim, FormatContext &ctx) const {
    if (dim.isFixed()) {
      return fmt::format_to(ctx.out(), "{}", dim.size);
    }
    if (dim.name.empty()) {
      return fmt::format_to(ctx.out(), "?");
    }
    return fmt::format_to(ctx.out(), "{}", dim.name);
  }
};
