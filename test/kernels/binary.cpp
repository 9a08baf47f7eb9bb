#include "helpers.hpp"

#include <cmath>
#include <limits>

using namespace infera;
using namespace infera::test;

namespace {
constexpr std::int32_t IntMax = std::numeric_limits<std::int32_t>::max();
constexpr std::int32_t IntMin = std::numeric_limits<std::int32_t>::min();
} // namespace

TEST(binary, add_same_shape) {
  Tensor a = Tensor::from<float>({2, 2}, {1, 2, 3, 4});
  Tensor b = Tensor::from<float>({2, 2}, {10, 20, 30, 40});
  Tensor out = run1(Operator(OpKind::Add), {&a, &b});
  EXPECT_EQ(out.shape(), (Shape{2, 2}));
  expect_floats(out, {11, 22, 33, 44});
}

TEST(binary, add_broadcast_row_and_column) {
  Tensor col = Tensor::from<float>({3, 1}, {1, 2, 3});
  Tensor row = Tensor::from<float>({1, 2}, {10, 20});
  Tensor out = run1(Operator(OpKind::Add), {&col, &row});
  EXPECT_EQ(out.shape(), (Shape{3, 2}));
  expect_floats(out, {11, 21, 12, 22, 13, 23});
}

TEST(binary, scalar_operand) {
  Tensor a = Tensor::from<float>({4}, {1, 2, 3, 4});
  Tensor s = Tensor::scalar<float>(2.0f);
  expect_floats(run1(Operator(OpKind::Mul), {&a, &s}), {2, 4, 6, 8});
  expect_floats(run1(Operator(OpKind::Sub), {&s, &a}), {1, 0, -1, -2});
  expect_floats(run1(Operator(OpKind::Div), {&a, &s}), {0.5f, 1, 1.5f, 2});
}

TEST(binary, add_mismatch_names_first_dimension) {
  try {
    kernels::infer(Operator(OpKind::Add),
                   memory::vector<kernels::ValueInfo>{
                       kernels::ValueInfo{true, f32({2, 3}), nullptr},
                       kernels::ValueInfo{true, f32({4, 5}), nullptr}});
    FAIL() << "expected ShapeError";
  } catch (const kernels::ShapeError &e) {
    EXPECT_EQ(e.op(), OpKind::Add);
    ASSERT_TRUE(e.dimension().has_value());
    EXPECT_EQ(*e.dimension(), 0u);
  }
}

TEST(binary, operand_types_must_match) {
  EXPECT_THROW(infer_op(Operator(OpKind::Add), {f32({2}), i32({2})}),
               kernels::ShapeError);
}

TEST(binary, float_pow_and_mod) {
  Tensor a = Tensor::from<float>({3}, {2, -7, 7});
  Tensor b = Tensor::from<float>({3}, {3, 3, -3});
  expect_floats(run1(Operator(OpKind::Pow), {&a, &b}),
                {8, -343, 1.0f / 343.0f});
  // sign follows the divisor
  expect_floats(run1(Operator(OpKind::Mod), {&a, &b}), {2, 2, -2});
  // sign follows the dividend
  expect_floats(run1(Operator(OpKind::Mod, ModAttrs{true}), {&a, &b}),
                {2, -1, 1});
}

TEST(binary, comparisons_yield_i32) {
  Tensor a = Tensor::from<float>({3}, {1, 2, 3});
  Tensor b = Tensor::from<float>({3}, {2, 2, 2});
  Tensor lt = run1(Operator(OpKind::Less), {&a, &b});
  EXPECT_EQ(lt.dtype(), TensorDataType::Int32);
  EXPECT_EQ(to_vector<std::int32_t>(lt), (memory::vector<std::int32_t>{1, 0, 0}));
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Equal), {&a, &b})),
            (memory::vector<std::int32_t>{0, 1, 0}));
  EXPECT_EQ(
      to_vector<std::int32_t>(run1(Operator(OpKind::GreaterOrEqual), {&a, &b})),
      (memory::vector<std::int32_t>{0, 1, 1}));
}

TEST(binary, nan_compares_false) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  Tensor a = Tensor::from<float>({1}, {nan});
  EXPECT_EQ(run1(Operator(OpKind::Equal), {&a, &a}).values<std::int32_t>()[0],
            0);
}

TEST(binary, logical_ops_need_i32) {
  Tensor a = Tensor::from<std::int32_t>({4}, {0, 0, 1, 5});
  Tensor b = Tensor::from<std::int32_t>({4}, {0, 1, 0, 2});
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::And), {&a, &b})),
            (memory::vector<std::int32_t>{0, 0, 0, 1}));
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Or), {&a, &b})),
            (memory::vector<std::int32_t>{0, 1, 1, 1}));
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Xor), {&a, &b})),
            (memory::vector<std::int32_t>{0, 1, 1, 0}));
  EXPECT_THROW(infer_op(Operator(OpKind::And), {f32({1}), f32({1})}),
               kernels::ShapeError);
}

TEST(binary_int, add_sub_mul_wrap) {
  Tensor a = Tensor::from<std::int32_t>({2}, {IntMax, IntMin});
  Tensor one = Tensor::from<std::int32_t>({2}, {1, 1});
  Tensor two = Tensor::from<std::int32_t>({2}, {2, 2});
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Add), {&a, &one})),
            (memory::vector<std::int32_t>{IntMin, IntMin + 1}));
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Sub), {&a, &one})),
            (memory::vector<std::int32_t>{IntMax - 1, IntMax}));
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Mul), {&a, &two})),
            (memory::vector<std::int32_t>{-2, 0}));
}

TEST(binary_int, division_truncates) {
  Tensor a = Tensor::from<std::int32_t>({4}, {7, -7, 7, -7});
  Tensor b = Tensor::from<std::int32_t>({4}, {2, 2, -2, -2});
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Div), {&a, &b})),
            (memory::vector<std::int32_t>{3, -3, -3, 3}));
}

TEST(binary_int, division_by_zero_fails) {
  Tensor a = Tensor::from<std::int32_t>({2}, {1, 2});
  Tensor b = Tensor::from<std::int32_t>({2}, {1, 0});
  EXPECT_THROW(run1(Operator(OpKind::Div), {&a, &b}), kernels::KernelError);
  EXPECT_THROW(run1(Operator(OpKind::Mod), {&a, &b}), kernels::KernelError);
}

TEST(binary_int, int_min_div_minus_one_wraps) {
  Tensor a = Tensor::from<std::int32_t>({1}, {IntMin});
  Tensor b = Tensor::from<std::int32_t>({1}, {-1});
  EXPECT_EQ(run1(Operator(OpKind::Div), {&a, &b}).values<std::int32_t>()[0],
            IntMin);
  EXPECT_EQ(run1(Operator(OpKind::Mod), {&a, &b}).values<std::int32_t>()[0],
            0);
}

TEST(binary_int, mod_sign) {
  Tensor a = Tensor::from<std::int32_t>({3}, {-7, 7, -7});
  Tensor b = Tensor::from<std::int32_t>({3}, {3, -3, -3});
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Mod), {&a, &b})),
            (memory::vector<std::int32_t>{2, -2, -1}));
  EXPECT_EQ(to_vector<std::int32_t>(
                run1(Operator(OpKind::Mod, ModAttrs{true}), {&a, &b})),
            (memory::vector<std::int32_t>{-1, 1, -1}));
}

TEST(binary_int, pow) {
  Tensor a = Tensor::from<std::int32_t>({5}, {2, 3, 1, -1, 2});
  Tensor b = Tensor::from<std::int32_t>({5}, {10, 0, -3, -3, -1});
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Pow), {&a, &b})),
            (memory::vector<std::int32_t>{1024, 1, 1, -1, 0}));
}

TEST(variadic, max_min_fold) {
  Tensor a = Tensor::from<float>({3}, {1, 5, 3});
  Tensor b = Tensor::from<float>({3}, {4, 2, 6});
  Tensor c = Tensor::scalar<float>(3.5f);
  expect_floats(run1(Operator(OpKind::Max), {&a, &b, &c}), {4, 5, 6});
  expect_floats(run1(Operator(OpKind::Min), {&a, &b, &c}), {1, 2, 3});
  expect_floats(run1(Operator(OpKind::Max), {&a}), {1, 5, 3});
}

TEST(variadic, broadcast_across_inputs) {
  Tensor a = Tensor::from<float>({2, 1}, {1, 10});
  Tensor b = Tensor::from<float>({1, 3}, {0, 5, 20});
  Tensor out = run1(Operator(OpKind::Max), {&a, &b});
  EXPECT_EQ(out.shape(), (Shape{2, 3}));
  expect_floats(out, {1, 5, 20, 10, 10, 20});
}

TEST(where, selects_with_broadcast) {
  Tensor cond = Tensor::from<std::int32_t>({2, 1}, {1, 0});
  Tensor x = Tensor::from<float>({1, 3}, {1, 2, 3});
  Tensor y = Tensor::scalar<float>(-1.0f);
  Tensor out = run1(Operator(OpKind::Where), {&cond, &x, &y});
  EXPECT_EQ(out.shape(), (Shape{2, 3}));
  expect_floats(out, {1, 2, 3, -1, -1, -1});
}

TEST(where, condition_must_be_i32) {
  EXPECT_THROW(
      infer_op(Operator(OpKind::Where), {f32({1}), f32({1}), f32({1})}),
      kernels::ShapeError);
}
