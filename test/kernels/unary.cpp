#include "helpers.hpp"

#include <cmath>
#include <limits>

using namespace infera;
using namespace infera::test;

TEST(unary, relu_and_leaky_relu) {
  Tensor x = Tensor::from<float>({5}, {-2, -0.5f, 0, 0.5f, 2});
  expect_floats(run1(Operator(OpKind::Relu), {&x}), {0, 0, 0, 0.5f, 2});
  expect_floats(run1(Operator(OpKind::LeakyRelu, LeakyReluAttrs{0.1f}), {&x}),
                {-0.2f, -0.05f, 0, 0.5f, 2});
}

TEST(unary, relu_long_input) {
  // Exercises the vector path and its scalar tail.
  memory::vector<float> values;
  memory::vector<float> expected;
  for (int i = 0; i < 37; ++i) {
    float v = static_cast<float>(i % 2 == 0 ? -i : i);
    values.push_back(v);
    expected.push_back(v < 0 ? 0.0f : v);
  }
  Tensor x = Tensor::from<float>({37}, values);
  expect_floats(run1(Operator(OpKind::Relu), {&x}), expected);
}

TEST(unary, transcendental) {
  Tensor x = Tensor::from<float>({3}, {0, 1, -1});
  expect_floats(run1(Operator(OpKind::Sigmoid), {&x}),
                {0.5f, 1.0f / (1.0f + std::exp(-1.0f)),
                 1.0f / (1.0f + std::exp(1.0f))});
  expect_floats(run1(Operator(OpKind::Tanh), {&x}),
                {0, std::tanh(1.0f), std::tanh(-1.0f)});
  expect_floats(run1(Operator(OpKind::Exp), {&x}),
                {1, std::exp(1.0f), std::exp(-1.0f)});
  expect_floats(run1(Operator(OpKind::Erf), {&x}),
                {0, std::erf(1.0f), std::erf(-1.0f)});
}

TEST(unary, rounding_and_sign) {
  Tensor x = Tensor::from<float>({4}, {-1.5f, -0.5f, 0.5f, 2.25f});
  expect_floats(run1(Operator(OpKind::Floor), {&x}), {-2, -1, 0, 2});
  expect_floats(run1(Operator(OpKind::Ceil), {&x}), {-1, -0.0f, 1, 3});
  expect_floats(run1(Operator(OpKind::Abs), {&x}), {1.5f, 0.5f, 0.5f, 2.25f});
  expect_floats(run1(Operator(OpKind::Neg), {&x}), {1.5f, 0.5f, -0.5f, -2.25f});
}

TEST(unary, log_and_sqrt_of_invalid_inputs) {
  Tensor x = Tensor::from<float>({2}, {0, -1});
  Tensor logs = run1(Operator(OpKind::Log), {&x});
  EXPECT_TRUE(std::isinf(logs.values<float>()[0]));
  EXPECT_TRUE(std::isnan(logs.values<float>()[1]));
  Tensor roots = run1(Operator(OpKind::Sqrt), {&x});
  EXPECT_EQ(roots.values<float>()[0], 0.0f);
  EXPECT_TRUE(std::isnan(roots.values<float>()[1]));
}

TEST(unary, reciprocal) {
  Tensor x = Tensor::from<float>({2}, {4, -0.5f});
  expect_floats(run1(Operator(OpKind::Reciprocal), {&x}), {0.25f, -2});
}

TEST(unary, int_relu_abs_neg) {
  constexpr std::int32_t IntMin = std::numeric_limits<std::int32_t>::min();
  Tensor x = Tensor::from<std::int32_t>({4}, {-3, 0, 7, IntMin});
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Relu), {&x})),
            (memory::vector<std::int32_t>{0, 0, 7, 0}));
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Abs), {&x})),
            (memory::vector<std::int32_t>{3, 0, 7, IntMin}));
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Neg), {&x})),
            (memory::vector<std::int32_t>{3, 0, -7, IntMin}));
}

TEST(unary, int_input_rejected_for_float_ops) {
  EXPECT_THROW(infer_op(Operator(OpKind::Sigmoid), {i32({2})}),
               kernels::ShapeError);
  EXPECT_THROW(infer_op(Operator(OpKind::Relu),
                        {TensorInfo{TensorDataType::Int8, {2}}}),
               kernels::ShapeError);
}

TEST(unary, not_requires_i32) {
  Tensor x = Tensor::from<std::int32_t>({3}, {0, 1, 9});
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Not), {&x})),
            (memory::vector<std::int32_t>{1, 0, 0}));
  EXPECT_THROW(infer_op(Operator(OpKind::Not), {f32({1})}),
               kernels::ShapeError);
}

TEST(unary, identity_copies_any_dtype) {
  Tensor x = Tensor::from<std::uint8_t>({3}, {1, 2, 255});
  Tensor out = run1(Operator(OpKind::Identity), {&x});
  EXPECT_EQ(out.dtype(), TensorDataType::Uint8);
  EXPECT_EQ(to_vector<std::uint8_t>(out),
            (memory::vector<std::uint8_t>{1, 2, 255}));
  EXPECT_NE(out.bytes(), x.bytes());
}

TEST(clip, bounds_from_attributes) {
  Tensor x = Tensor::from<float>({4}, {-5, 0, 3, 10});
  expect_floats(run1(Operator(OpKind::Clip, ClipAttrs{-1, 4}), {&x}),
                {-1, 0, 3, 4});
  expect_floats(run1(Operator(OpKind::Clip), {&x}), {-5, 0, 3, 10});
}

TEST(clip, bound_inputs_override_attributes) {
  Tensor x = Tensor::from<float>({4}, {-5, 0, 3, 10});
  Tensor lo = Tensor::scalar<float>(0.0f);
  Tensor hi = Tensor::scalar<float>(6.0f);
  expect_floats(run1(Operator(OpKind::Clip, ClipAttrs{-1, 1}), {&x, &lo, &hi}),
                {0, 0, 3, 6});
  // absent min keeps the attribute bound
  expect_floats(
      run1(Operator(OpKind::Clip, ClipAttrs{-1, 1}), {&x, nullptr, &hi}),
      {-1, 0, 3, 6});
}

TEST(clip, bounds_must_be_scalars) {
  EXPECT_THROW(
      infer_op(Operator(OpKind::Clip), {f32({4}), f32({2, 2})}),
      kernels::ShapeError);
}

TEST(unary, input_count_is_checked) {
  EXPECT_THROW(infer_op(Operator(OpKind::Relu), {f32({1}), f32({1})}),
               kernels::ShapeError);
}
