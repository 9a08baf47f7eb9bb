#include "helpers.hpp"

using namespace infera;
using namespace infera::test;

namespace {

Tensor grid4x4() {
  memory::vector<float> values;
  for (int i = 1; i <= 16; ++i) {
    values.push_back(static_cast<float>(i));
  }
  return Tensor::from<float>({1, 1, 4, 4}, values);
}

PoolAttrs window(unsigned int k, unsigned int stride) {
  PoolAttrs attrs;
  attrs.kernelSize = {k, k};
  attrs.strides = {stride, stride};
  return attrs;
}

} // namespace

TEST(pool, max_pool_2x2) {
  Tensor x = grid4x4();
  Tensor out = run1(Operator(OpKind::MaxPool, window(2, 2)), {&x});
  EXPECT_EQ(out.shape(), (Shape{1, 1, 2, 2}));
  expect_floats(out, {6, 8, 14, 16});
}

TEST(pool, max_pool_overlapping_windows) {
  Tensor x = grid4x4();
  Tensor out = run1(Operator(OpKind::MaxPool, window(3, 1)), {&x});
  EXPECT_EQ(out.shape(), (Shape{1, 1, 2, 2}));
  expect_floats(out, {11, 12, 15, 16});
}

TEST(pool, max_pool_ignores_padding) {
  Tensor x = Tensor::from<float>({1, 1, 2, 2}, {-1, -2, -3, -4});
  PoolAttrs attrs = window(2, 1);
  attrs.pads = {1, 1, 0, 0};
  Tensor out = run1(Operator(OpKind::MaxPool, attrs), {&x});
  EXPECT_EQ(out.shape(), (Shape{1, 1, 2, 2}));
  expect_floats(out, {-1, -1, -1, -1});
}

TEST(pool, average_pool_2x2) {
  Tensor x = grid4x4();
  Tensor out = run1(Operator(OpKind::AveragePool, window(2, 2)), {&x});
  expect_floats(out, {3.5f, 5.5f, 11.5f, 13.5f});
}

TEST(pool, average_pool_pad_counting) {
  Tensor x = Tensor::from<float>({1, 1, 2, 2}, {1, 2, 3, 4});
  PoolAttrs attrs = window(3, 1);
  attrs.pads = {1, 1, 1, 1};
  expect_floats(run1(Operator(OpKind::AveragePool, attrs), {&x}),
                {2.5f, 2.5f, 2.5f, 2.5f});
  attrs.countIncludePad = true;
  const float tenNinths = 10.0f / 9.0f;
  expect_floats(run1(Operator(OpKind::AveragePool, attrs), {&x}),
                {tenNinths, tenNinths, tenNinths, tenNinths});
}

TEST(pool, same_padding) {
  Tensor x = grid4x4();
  PoolAttrs attrs = window(3, 2);
  attrs.padding = PaddingMode::Same;
  Tensor out = run1(Operator(OpKind::MaxPool, attrs), {&x});
  // SAME_UPPER: ceil(4 / 2) outputs, the extra pad goes to the end.
  EXPECT_EQ(out.shape(), (Shape{1, 1, 2, 2}));
  expect_floats(out, {11, 12, 15, 16});
}

TEST(pool, window_larger_than_input) {
  EXPECT_THROW(infer_op(Operator(OpKind::MaxPool, window(5, 1)),
                        {f32({1, 1, 4, 4})}),
               kernels::ShapeError);
  EXPECT_THROW(infer_op(Operator(OpKind::MaxPool, window(2, 2)),
                        {f32({1, 4, 4})}),
               kernels::ShapeError);
}

TEST(pool, global_average) {
  Tensor x = Tensor::from<float>({1, 2, 2, 2}, {1, 2, 3, 4, 10, 20, 30, 40});
  Tensor out = run1(Operator(OpKind::GlobalAveragePool), {&x});
  EXPECT_EQ(out.shape(), (Shape{1, 2, 1, 1}));
  expect_floats(out, {2.5f, 25});
}

TEST(pool, global_average_keeps_rank) {
  auto infos = infer_op(Operator(OpKind::GlobalAveragePool),
                        {f32({2, 3, 5})});
  ASSERT_TRUE(infos.has_value());
  EXPECT_EQ(infos->at(0).shape, (Shape{2, 3, 1}));
  EXPECT_THROW(
      infer_op(Operator(OpKind::GlobalAveragePool), {f32({2, 3})}),
      kernels::ShapeError);
}
