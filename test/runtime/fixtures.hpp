#pragma once

#include "infera/ifx/ModelWriter.hpp"
#include "infera/runtime/model.hpp"

#include <cstring>
#include <fmt/format.h>
#include <initializer_list>

namespace infera::test {

inline graph::DimList fixed(std::initializer_list<std::int64_t> sizes) {
  graph::DimList out;
  for (std::int64_t s : sizes) {
    out.push_back(graph::Dim::fixed(s));
  }
  return out;
}

inline runtime::ModelHandle load(const memory::vector<std::byte> &bytes,
                                 const runtime::LoadOptions &options = {}) {
  return runtime::load_model(bytes, options);
}

// x[n] -> relu -> neg -> relu -> ... -> y, `length` operators in a line.
inline memory::vector<std::byte> unary_chain(std::size_t length,
                                             std::int64_t n = 16) {
  ifx::ModelWriter w;
  std::uint32_t prev = w.addInput("x", TensorDataType::Float32, fixed({n}));
  for (std::size_t i = 0; i < length; ++i) {
    std::uint32_t next = w.addValue(fmt::format("t{}", i));
    w.addOperator(fmt::format("op{}", i),
                  Operator(i % 2 == 0 ? OpKind::Relu : OpKind::Neg), {prev},
                  {next});
    prev = next;
  }
  w.addOutput(prev);
  return w.finish();
}

// Four independent branches off one input, summed pairwise:
//   a = x*2, b = x+1, c = relu(x), d = -x
//   ab = a+b, cd = c+d, y = ab*cd
inline memory::vector<std::byte> diamond_model(std::int64_t n = 64) {
  ifx::ModelWriter w;
  std::uint32_t x = w.addInput("x", TensorDataType::Float32, fixed({n}));
  std::uint32_t two = w.addConstant("two", Tensor::scalar<float>(2.0f));
  std::uint32_t one = w.addConstant("one", Tensor::scalar<float>(1.0f));
  std::uint32_t a = w.addValue("a");
  std::uint32_t b = w.addValue("b");
  std::uint32_t c = w.addValue("c");
  std::uint32_t d = w.addValue("d");
  std::uint32_t ab = w.addValue("ab");
  std::uint32_t cd = w.addValue("cd");
  std::uint32_t y = w.addValue("y");
  w.addOperator("scale", Operator(OpKind::Mul), {x, two}, {a});
  w.addOperator("shift", Operator(OpKind::Add), {x, one}, {b});
  w.addOperator("relu", Operator(OpKind::Relu), {x}, {c});
  w.addOperator("neg", Operator(OpKind::Neg), {x}, {d});
  w.addOperator("sum_ab", Operator(OpKind::Add), {a, b}, {ab});
  w.addOperator("sum_cd", Operator(OpKind::Add), {c, d}, {cd});
  w.addOperator("product", Operator(OpKind::Mul), {ab, cd}, {y});
  w.addOutput(y);
  return w.finish();
}

inline Tensor ramp(std::int64_t n, float start = -8.0f, float step = 0.25f) {
  memory::vector<float> v(static_cast<std::size_t>(n));
  for (std::size_t i = 0; i < v.size(); ++i) {
    v[i] = start + step * static_cast<float>(i);
  }
  return Tensor::from<float>({n}, v);
}

inline bool same_bytes(const Tensor &a, const Tensor &b) {
  return a.info() == b.info() &&
         std::memcmp(a.bytes(), b.bytes(), a.byteSize()) == 0;
}

} // namespace infera::test
