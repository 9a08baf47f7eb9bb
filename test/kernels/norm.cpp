#include "helpers.hpp"

#include <cmath>

using namespace infera;
using namespace infera::test;

TEST(batch_norm, per_channel_affine) {
  Tensor x = Tensor::from<float>({1, 2, 1, 2}, {1, 2, 3, 4});
  Tensor scale = Tensor::from<float>({2}, {1, 2});
  Tensor bias = Tensor::from<float>({2}, {0, 1});
  Tensor mean = Tensor::from<float>({2}, {1, 3});
  Tensor var = Tensor::from<float>({2}, {4, 1});
  BatchNormAttrs attrs{0.0f};
  Tensor out = run1(Operator(OpKind::BatchNormalization, attrs),
                    {&x, &scale, &bias, &mean, &var});
  EXPECT_EQ(out.shape(), x.shape());
  // (x - mean) * scale / sqrt(var) + bias
  expect_floats(out, {0, 0.5f, 1, 3});
}

TEST(batch_norm, epsilon_is_added_to_variance) {
  Tensor x = Tensor::from<float>({1, 1}, {2});
  Tensor one = Tensor::from<float>({1}, {1});
  Tensor zero = Tensor::from<float>({1}, {0});
  Tensor out = run1(Operator(OpKind::BatchNormalization, BatchNormAttrs{3.0f}),
                    {&x, &one, &zero, &zero, &one});
  expect_floats(out, {1});
}

TEST(batch_norm, parameter_shapes_are_checked) {
  EXPECT_THROW(infer_op(Operator(OpKind::BatchNormalization),
                        {f32({1, 3, 2, 2}), f32({3}), f32({3}), f32({2}),
                         f32({3})}),
               kernels::ShapeError);
  EXPECT_THROW(infer_op(Operator(OpKind::BatchNormalization),
                        {f32({3}), f32({3}), f32({3}), f32({3}), f32({3})}),
               kernels::ShapeError);
  EXPECT_THROW(infer_op(Operator(OpKind::BatchNormalization),
                        {f32({1, 3}), f32({3}), f32({3}), f32({3})}),
               kernels::ShapeError);
}

TEST(softmax, rows_sum_to_one) {
  Tensor x = Tensor::from<float>({2, 3}, {1, 2, 3, 0, 0, 0});
  Tensor out = run1(Operator(OpKind::Softmax, AxisAttrs{1}), {&x});
  const float e1 = std::exp(1.0f);
  const float e2 = std::exp(2.0f);
  const float e3 = std::exp(3.0f);
  const float s = e1 + e2 + e3;
  expect_floats(out, {e1 / s, e2 / s, e3 / s, 1.0f / 3, 1.0f / 3, 1.0f / 3});
}

TEST(softmax, negative_axis) {
  Tensor x = Tensor::from<float>({2, 2}, {0, 0, 0, 100});
  expect_floats(run1(Operator(OpKind::Softmax, AxisAttrs{-1}), {&x}),
                {0.5f, 0.5f, 0, 1});
}

TEST(softmax, along_leading_axis) {
  Tensor x = Tensor::from<float>({2, 2}, {1, 5, 1, 5});
  expect_floats(run1(Operator(OpKind::Softmax, AxisAttrs{0}), {&x}),
                {0.5f, 0.5f, 0.5f, 0.5f});
}

TEST(softmax, large_inputs_stay_finite) {
  Tensor x = Tensor::from<float>({3}, {1000, 1000, 1000});
  expect_floats(run1(Operator(OpKind::Softmax), {&x}),
                {1.0f / 3, 1.0f / 3, 1.0f / 3});
}

TEST(softmax, log_softmax) {
  Tensor x = Tensor::from<float>({2}, {0, 0});
  expect_floats(run1(Operator(OpKind::LogSoftmax), {&x}),
                {-std::log(2.0f), -std::log(2.0f)});
}

TEST(softmax, axis_out_of_range) {
  EXPECT_THROW(infer_op(Operator(OpKind::Softmax, AxisAttrs{2}), {f32({2, 2})}),
               kernels::ShapeError);
  EXPECT_THROW(infer_op(Operator(OpKind::Softmax), {f32({})}),
               kernels::ShapeError);
}
