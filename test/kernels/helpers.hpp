#pragma once

#include "infera/kernels/Kernel.hpp"
#include "infera/kernels/errors.hpp"

#include <gtest/gtest.h>
#include <initializer_list>

namespace infera::test {

inline kernels::WorkerPool &inline_pool() {
  static kernels::WorkerPool pool(1);
  return pool;
}

// nullptr marks an absent optional input.
inline memory::vector<Tensor>
run_op(const Operator &op, std::initializer_list<const Tensor *> inputs,
       kernels::WorkerPool &pool = inline_pool()) {
  memory::vector<const Tensor *> ins(inputs);
  return kernels::run(op, ins, pool);
}

inline Tensor run1(const Operator &op,
                   std::initializer_list<const Tensor *> inputs,
                   kernels::WorkerPool &pool = inline_pool()) {
  auto outs = run_op(op, inputs, pool);
  EXPECT_EQ(outs.size(), 1u);
  return std::move(outs.at(0));
}

inline memory::optional<memory::vector<TensorInfo>>
infer_op(const Operator &op, std::initializer_list<TensorInfo> infos) {
  memory::vector<kernels::ValueInfo> ins;
  for (const TensorInfo &info : infos) {
    ins.push_back(kernels::ValueInfo{true, info, nullptr});
  }
  return kernels::infer(op, ins);
}

template <typename T>
memory::vector<T> to_vector(const Tensor &t) {
  auto v = t.values<T>();
  return memory::vector<T>(v.begin(), v.end());
}

inline void expect_floats(const Tensor &t, const memory::vector<float> &expected,
                          float tolerance = 1e-5f) {
  ASSERT_EQ(t.dtype(), TensorDataType::Float32);
  ASSERT_EQ(static_cast<std::size_t>(t.numel()), expected.size());
  auto v = t.values<float>();
  for (std::size_t i = 0; i < expected.size(); ++i) {
    EXPECT_NEAR(v[i], expected[i], tolerance) << "at index " << i;
  }
}

inline TensorInfo f32(Shape shape) {
  return TensorInfo{TensorDataType::Float32, std::move(shape)};
}

inline TensorInfo i32(Shape shape) {
  return TensorInfo{TensorDataType::Int32, std::move(shape)};
}

} // namespace infera::test
