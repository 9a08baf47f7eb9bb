#include "helpers.hpp"

using namespace infera;
using namespace infera::test;

TEST(matmul, two_by_two) {
  Tensor a = Tensor::from<float>({2, 3}, {1, 2, 3, 4, 5, 6});
  Tensor b = Tensor::from<float>({3, 2}, {7, 8, 9, 10, 11, 12});
  Tensor out = run1(Operator(OpKind::MatMul), {&a, &b});
  EXPECT_EQ(out.shape(), (Shape{2, 2}));
  expect_floats(out, {58, 64, 139, 154});
}

TEST(matmul, vector_operands_drop_their_dimension) {
  Tensor v = Tensor::from<float>({2}, {1, 2});
  Tensor m = Tensor::from<float>({2, 2}, {1, 2, 3, 4});
  Tensor vm = run1(Operator(OpKind::MatMul), {&v, &m});
  EXPECT_EQ(vm.shape(), (Shape{2}));
  expect_floats(vm, {7, 10});
  Tensor mv = run1(Operator(OpKind::MatMul), {&m, &v});
  EXPECT_EQ(mv.shape(), (Shape{2}));
  expect_floats(mv, {5, 11});
  Tensor dot = run1(Operator(OpKind::MatMul), {&v, &v});
  EXPECT_EQ(dot.shape(), Shape{});
  expect_floats(dot, {5});
}

TEST(matmul, batch_broadcast) {
  Tensor a = Tensor::from<float>({2, 1, 2}, {1, 0, 0, 1});
  Tensor b = Tensor::from<float>({2, 2}, {1, 2, 3, 4});
  Tensor out = run1(Operator(OpKind::MatMul), {&a, &b});
  EXPECT_EQ(out.shape(), (Shape{2, 1, 2}));
  expect_floats(out, {1, 2, 3, 4});
}

TEST(matmul, wide_output_uses_vector_tail) {
  const std::int64_t N = 19;
  memory::vector<float> bv;
  for (std::int64_t i = 0; i < 2 * N; ++i) {
    bv.push_back(static_cast<float>(i));
  }
  Tensor a = Tensor::from<float>({1, 2}, {1, 2});
  Tensor b = Tensor::from<float>({2, N}, bv);
  Tensor out = run1(Operator(OpKind::MatMul), {&a, &b});
  memory::vector<float> expected;
  for (std::int64_t j = 0; j < N; ++j) {
    expected.push_back(static_cast<float>(j + 2 * (N + j)));
  }
  expect_floats(out, expected);
}

TEST(matmul, inner_dimension_mismatch) {
  EXPECT_THROW(
      infer_op(Operator(OpKind::MatMul), {f32({2, 3}), f32({2, 3})}),
      kernels::ShapeError);
  EXPECT_THROW(infer_op(Operator(OpKind::MatMul),
                        {f32({2, 1, 2}), f32({3, 2, 2})}),
               kernels::ShapeError);
}

TEST(gemm, alpha_beta_and_bias_broadcast) {
  Tensor a = Tensor::from<float>({2, 2}, {1, 2, 3, 4});
  Tensor b = Tensor::from<float>({2, 2}, {1, 0, 0, 1});
  Tensor c = Tensor::from<float>({2}, {10, 20});
  GemmAttrs attrs;
  attrs.alpha = 2.0f;
  attrs.beta = 0.5f;
  Tensor out = run1(Operator(OpKind::Gemm, attrs), {&a, &b, &c});
  expect_floats(out, {7, 14, 11, 18});
}

TEST(gemm, transposed_operands) {
  Tensor a = Tensor::from<float>({3, 2}, {1, 4, 2, 5, 3, 6});
  Tensor b = Tensor::from<float>({2, 3}, {7, 9, 11, 8, 10, 12});
  GemmAttrs attrs;
  attrs.transposeA = true;
  attrs.transposeB = true;
  Tensor out = run1(Operator(OpKind::Gemm, attrs), {&a, &b});
  EXPECT_EQ(out.shape(), (Shape{2, 2}));
  expect_floats(out, {58, 64, 139, 154});
}

TEST(gemm, bias_must_broadcast_to_output) {
  EXPECT_THROW(infer_op(Operator(OpKind::Gemm),
                        {f32({2, 2}), f32({2, 2}), f32({3})}),
               kernels::ShapeError);
  EXPECT_THROW(infer_op(Operator(OpKind::Gemm), {f32({2, 2, 2}), f32({2, 2})}),
               kernels::ShapeError);
}
