#include "helpers.hpp"

#include <limits>

using namespace infera;
using namespace infera::test;

namespace {

Tensor ints(memory::vector<std::int32_t> values) {
  const auto n = static_cast<std::int64_t>(values.size());
  return Tensor::from<std::int32_t>({n}, values);
}

Tensor iota(Shape shape) {
  memory::vector<float> values;
  for (std::int64_t i = 0; i < numel(shape); ++i) {
    values.push_back(static_cast<float>(i));
  }
  return Tensor::from<float>(std::move(shape), values);
}

} // namespace

TEST(reshape, infers_minus_one_and_copies_zero) {
  Tensor x = iota({2, 3, 4});
  Tensor shape = ints({0, -1});
  Tensor out = run1(Operator(OpKind::Reshape), {&x, &shape});
  EXPECT_EQ(out.shape(), (Shape{2, 12}));
  EXPECT_EQ(to_vector<float>(out), to_vector<float>(x));
}

TEST(reshape, unknown_target_defers_inference) {
  auto infos = infer_op(Operator(OpKind::Reshape), {f32({2, 3}), i32({2})});
  EXPECT_FALSE(infos.has_value());
}

TEST(reshape, invalid_targets) {
  Tensor x = iota({2, 3});
  Tensor twoUnknown = ints({-1, -1});
  Tensor wrongCount = ints({4, 2});
  Tensor indivisible = ints({4, -1});
  EXPECT_THROW(run1(Operator(OpKind::Reshape), {&x, &twoUnknown}),
               kernels::ShapeError);
  EXPECT_THROW(run1(Operator(OpKind::Reshape), {&x, &wrongCount}),
               kernels::ShapeError);
  EXPECT_THROW(run1(Operator(OpKind::Reshape), {&x, &indivisible}),
               kernels::ShapeError);
}

TEST(reshape, oversized_target_is_rejected) {
  Tensor x = iota({2, 3});
  const std::int32_t big = std::numeric_limits<std::int32_t>::max();
  Tensor huge = ints({big, big, big});
  EXPECT_THROW(run1(Operator(OpKind::Reshape), {&x, &huge}),
               kernels::ShapeError);
  Tensor hugeInferred = ints({big, big, big, -1});
  EXPECT_THROW(run1(Operator(OpKind::Reshape), {&x, &hugeInferred}),
               kernels::ShapeError);
}

TEST(flatten, splits_at_axis) {
  auto at1 = infer_op(Operator(OpKind::Flatten, AxisAttrs{1}),
                      {f32({2, 3, 4})});
  EXPECT_EQ(at1->at(0).shape, (Shape{2, 12}));
  auto at0 = infer_op(Operator(OpKind::Flatten), {f32({2, 3, 4})});
  EXPECT_EQ(at0->at(0).shape, (Shape{1, 24}));
  auto atEnd = infer_op(Operator(OpKind::Flatten, AxisAttrs{3}),
                        {f32({2, 3, 4})});
  EXPECT_EQ(atEnd->at(0).shape, (Shape{24, 1}));
  auto negative = infer_op(Operator(OpKind::Flatten, AxisAttrs{-1}),
                           {f32({2, 3, 4})});
  EXPECT_EQ(negative->at(0).shape, (Shape{6, 4}));
  EXPECT_THROW(
      infer_op(Operator(OpKind::Flatten, AxisAttrs{4}), {f32({2, 3, 4})}),
      kernels::ShapeError);
}

TEST(squeeze, named_and_implicit_axes) {
  AxesAttrs named;
  named.axes = {0};
  auto one = infer_op(Operator(OpKind::Squeeze, named), {f32({1, 3, 1})});
  EXPECT_EQ(one->at(0).shape, (Shape{3, 1}));
  auto all = infer_op(Operator(OpKind::Squeeze), {f32({1, 3, 1})});
  EXPECT_EQ(all->at(0).shape, (Shape{3}));
  named.axes = {1};
  EXPECT_THROW(infer_op(Operator(OpKind::Squeeze, named), {f32({1, 3, 1})}),
               kernels::ShapeError);
}

TEST(unsqueeze, inserts_axes_in_output_rank) {
  AxesAttrs attrs;
  attrs.axes = {0, -1};
  auto infos = infer_op(Operator(OpKind::Unsqueeze, attrs), {f32({3, 4})});
  EXPECT_EQ(infos->at(0).shape, (Shape{1, 3, 4, 1}));
  Tensor x = iota({3});
  Tensor out = run1(Operator(OpKind::Unsqueeze, attrs), {&x});
  EXPECT_EQ(out.shape(), (Shape{1, 3, 1}));
  expect_floats(out, {0, 1, 2});
}

TEST(shape, reports_dimensions_as_i32) {
  Tensor x = Tensor::empty(TensorDataType::Uint8, {2, 0, 5});
  Tensor out = run1(Operator(OpKind::Shape), {&x});
  EXPECT_EQ(out.dtype(), TensorDataType::Int32);
  EXPECT_EQ(to_vector<std::int32_t>(out),
            (memory::vector<std::int32_t>{2, 0, 5}));
}

TEST(transpose, explicit_and_reversed_permutation) {
  Tensor x = iota({2, 3});
  Tensor reversed = run1(Operator(OpKind::Transpose), {&x});
  EXPECT_EQ(reversed.shape(), (Shape{3, 2}));
  expect_floats(reversed, {0, 3, 1, 4, 2, 5});

  Tensor y = iota({2, 1, 3});
  TransposeAttrs attrs;
  attrs.perm = {2, 0, 1};
  Tensor out = run1(Operator(OpKind::Transpose, attrs), {&y});
  EXPECT_EQ(out.shape(), (Shape{3, 2, 1}));
  expect_floats(out, {0, 3, 1, 4, 2, 5});
}

TEST(transpose, rejects_invalid_permutation) {
  TransposeAttrs attrs;
  attrs.perm = {0, 0};
  EXPECT_THROW(infer_op(Operator(OpKind::Transpose, attrs), {f32({2, 2})}),
               kernels::ShapeError);
  attrs.perm = {1, 0, 2};
  EXPECT_THROW(infer_op(Operator(OpKind::Transpose, attrs), {f32({2, 2})}),
               kernels::ShapeError);
}

TEST(expand, broadcasts_to_target) {
  Tensor x = Tensor::from<float>({3, 1}, {1, 2, 3});
  Tensor shape = ints({2, 3, 2});
  Tensor out = run1(Operator(OpKind::Expand), {&x, &shape});
  EXPECT_EQ(out.shape(), (Shape{2, 3, 2}));
  expect_floats(out, {1, 1, 2, 2, 3, 3, 1, 1, 2, 2, 3, 3});
  Tensor bad = ints({2, 2});
  EXPECT_THROW(run1(Operator(OpKind::Expand), {&x, &bad}), kernels::ShapeError);
}

TEST(expand, negative_target_dimension_is_rejected) {
  Tensor x = Tensor::from<float>({1}, {1});
  Tensor negative = ints({-5});
  try {
    run1(Operator(OpKind::Expand), {&x, &negative});
    FAIL() << "expand succeeded";
  } catch (const kernels::ShapeError &e) {
    EXPECT_EQ(e.op(), OpKind::Expand);
    EXPECT_EQ(e.dimension(), 0u);
  }
  Tensor trailing = ints({2, -1});
  try {
    run1(Operator(OpKind::Expand), {&x, &trailing});
    FAIL() << "expand succeeded";
  } catch (const kernels::ShapeError &e) {
    EXPECT_EQ(e.dimension(), 1u);
  }
}

TEST(slice, basic_range_with_axes) {
  Tensor x = iota({3, 4});
  Tensor starts = ints({1});
  Tensor ends = ints({3});
  Tensor axes = ints({1});
  Tensor out = run1(Operator(OpKind::Slice), {&x, &starts, &ends, &axes});
  EXPECT_EQ(out.shape(), (Shape{3, 2}));
  expect_floats(out, {1, 2, 5, 6, 9, 10});
}

TEST(slice, negative_indices_and_clamping) {
  Tensor x = iota({5});
  Tensor starts = ints({-3});
  Tensor ends = ints({100});
  expect_floats(run1(Operator(OpKind::Slice), {&x, &starts, &ends}),
                {2, 3, 4});
}

TEST(slice, negative_step_reverses) {
  Tensor x = iota({5});
  Tensor starts = ints({-1});
  Tensor ends = ints({std::numeric_limits<std::int32_t>::min()});
  Tensor axes = ints({0});
  Tensor steps = ints({-2});
  expect_floats(
      run1(Operator(OpKind::Slice), {&x, &starts, &ends, &axes, &steps}),
      {4, 2, 0});
}

TEST(slice, empty_result_and_errors) {
  Tensor x = iota({4});
  Tensor starts = ints({3});
  Tensor ends = ints({1});
  Tensor out = run1(Operator(OpKind::Slice), {&x, &starts, &ends});
  EXPECT_EQ(out.shape(), (Shape{0}));
  Tensor zeroStep = ints({0});
  EXPECT_THROW(
      run1(Operator(OpKind::Slice), {&x, &starts, &ends, nullptr, &zeroStep}),
      kernels::ShapeError);
  EXPECT_FALSE(infer_op(Operator(OpKind::Slice), {f32({4}), i32({1}), i32({1})})
                   .has_value());
}

TEST(pad, constant_value) {
  Tensor x = Tensor::from<float>({2, 2}, {1, 2, 3, 4});
  Tensor pads = ints({1, 0, 0, 1});
  Tensor value = Tensor::scalar<float>(9.0f);
  Tensor out = run1(Operator(OpKind::Pad), {&x, &pads, &value});
  EXPECT_EQ(out.shape(), (Shape{3, 3}));
  expect_floats(out, {9, 9, 9, 1, 2, 9, 3, 4, 9});
}

TEST(pad, defaults_to_zero_and_rejects_negative) {
  Tensor x = Tensor::from<std::int32_t>({2}, {5, 6});
  Tensor pads = ints({1, 2});
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Pad), {&x, &pads})),
            (memory::vector<std::int32_t>{0, 5, 6, 0, 0}));
  Tensor negative = ints({-1, 0});
  EXPECT_THROW(run1(Operator(OpKind::Pad), {&x, &negative}),
               kernels::ShapeError);
  Tensor wrongLength = ints({1});
  EXPECT_THROW(run1(Operator(OpKind::Pad), {&x, &wrongLength}),
               kernels::ShapeError);
}

TEST(cast, float_to_integer_truncates_and_saturates) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  Tensor x = Tensor::from<float>({5}, {3.7f, -3.7f, 200.0f, -200.0f, nan});
  Tensor i8 = run1(Operator(OpKind::Cast, CastAttrs{TensorDataType::Int8}),
                   {&x});
  EXPECT_EQ(to_vector<std::int8_t>(i8),
            (memory::vector<std::int8_t>{3, -3, 127, -128, 0}));
  Tensor u8 = run1(Operator(OpKind::Cast, CastAttrs{TensorDataType::Uint8}),
                   {&x});
  EXPECT_EQ(to_vector<std::uint8_t>(u8),
            (memory::vector<std::uint8_t>{3, 0, 200, 0, 0}));
  Tensor big = Tensor::from<float>({2}, {3e9f, -3e9f});
  EXPECT_EQ(to_vector<std::int32_t>(run1(
                Operator(OpKind::Cast, CastAttrs{TensorDataType::Int32}),
                {&big})),
            (memory::vector<std::int32_t>{
                std::numeric_limits<std::int32_t>::max(),
                std::numeric_limits<std::int32_t>::min()}));
}

TEST(cast, integer_narrowing_and_widening) {
  Tensor x = Tensor::from<std::int32_t>({3}, {-1, 300, 7});
  EXPECT_EQ(to_vector<std::uint8_t>(run1(
                Operator(OpKind::Cast, CastAttrs{TensorDataType::Uint8}),
                {&x})),
            (memory::vector<std::uint8_t>{0, 255, 7}));
  expect_floats(run1(Operator(OpKind::Cast, CastAttrs{TensorDataType::Float32}),
                     {&x}),
                {-1, 300, 7});
}

TEST(constant_of_shape, fills_requested_dtype) {
  Tensor shape = ints({2, 2});
  ConstantOfShapeAttrs attrs;
  attrs.dtype = TensorDataType::Int32;
  attrs.intValue = 7;
  Tensor out = run1(Operator(OpKind::ConstantOfShape, attrs), {&shape});
  EXPECT_EQ(out.shape(), (Shape{2, 2}));
  EXPECT_EQ(to_vector<std::int32_t>(out),
            (memory::vector<std::int32_t>{7, 7, 7, 7}));
  Tensor negative = ints({-2});
  EXPECT_THROW(run1(Operator(OpKind::ConstantOfShape), {&negative}),
               kernels::ShapeError);
}

TEST(range, float_and_int) {
  Tensor start = Tensor::scalar<float>(1.0f);
  Tensor limit = Tensor::scalar<float>(2.0f);
  Tensor delta = Tensor::scalar<float>(0.25f);
  expect_floats(run1(Operator(OpKind::Range), {&start, &limit, &delta}),
                {1, 1.25f, 1.5f, 1.75f});

  Tensor a = Tensor::scalar<std::int32_t>(10);
  Tensor b = Tensor::scalar<std::int32_t>(4);
  Tensor d = Tensor::scalar<std::int32_t>(-3);
  EXPECT_EQ(to_vector<std::int32_t>(run1(Operator(OpKind::Range), {&a, &b, &d})),
            (memory::vector<std::int32_t>{10, 7}));

  Tensor empty = run1(Operator(OpKind::Range), {&b, &a, &d});
  EXPECT_EQ(empty.shape(), (Shape{0}));
}

TEST(range, zero_delta) {
  Tensor a = Tensor::scalar<std::int32_t>(0);
  Tensor zero = Tensor::scalar<std::int32_t>(0);
  EXPECT_THROW(run1(Operator(OpKind::Range), {&a, &a, &zero}),
               kernels::ShapeError);
}

TEST(resize, nearest_upsample_by_scales) {
  Tensor x = Tensor::from<float>({1, 1, 2, 2}, {1, 2, 3, 4});
  Tensor scales = Tensor::from<float>({4}, {1, 1, 2, 2});
  Tensor out = run1(Operator(OpKind::Resize), {&x, nullptr, &scales});
  EXPECT_EQ(out.shape(), (Shape{1, 1, 4, 4}));
  expect_floats(out, {1, 1, 2, 2, 1, 1, 2, 2, 3, 3, 4, 4, 3, 3, 4, 4});
}

TEST(resize, linear_align_corners_by_sizes) {
  Tensor x = Tensor::from<float>({1, 1, 1, 2}, {0, 10});
  Tensor sizes = ints({1, 1, 1, 3});
  ResizeAttrs attrs;
  attrs.mode = ResizeMode::Linear;
  attrs.coordMode = CoordTransformMode::AlignCorners;
  Tensor out =
      run1(Operator(OpKind::Resize, attrs), {&x, nullptr, nullptr, &sizes});
  EXPECT_EQ(out.shape(), (Shape{1, 1, 1, 3}));
  expect_floats(out, {0, 5, 10});
}

TEST(resize, scales_take_precedence_over_sizes) {
  Tensor x = Tensor::from<float>({1, 1, 2, 2}, {1, 2, 3, 4});
  Tensor scales = Tensor::from<float>({4}, {1, 1, 2, 2});
  Tensor sizes = ints({1, 1, 3, 3});
  Tensor out =
      run1(Operator(OpKind::Resize), {&x, nullptr, &scales, &sizes});
  EXPECT_EQ(out.shape(), (Shape{1, 1, 4, 4}));
}

TEST(resize, non_finite_or_huge_scales_are_rejected) {
  Tensor x = Tensor::from<float>({1, 1, 2, 2}, {1, 2, 3, 4});
  const float inf = std::numeric_limits<float>::infinity();
  Tensor infinite = Tensor::from<float>({4}, {1, 1, inf, 2});
  try {
    run1(Operator(OpKind::Resize), {&x, nullptr, &infinite});
    FAIL() << "resize succeeded";
  } catch (const kernels::ShapeError &e) {
    EXPECT_EQ(e.dimension(), 2u);
  }
  const float nan = std::numeric_limits<float>::quiet_NaN();
  Tensor notANumber = Tensor::from<float>({4}, {1, 1, 2, nan});
  EXPECT_THROW(run1(Operator(OpKind::Resize), {&x, nullptr, &notANumber}),
               kernels::ShapeError);
  Tensor huge = Tensor::from<float>({4}, {1, 1, 2, 1e30f});
  try {
    run1(Operator(OpKind::Resize), {&x, nullptr, &huge});
    FAIL() << "resize succeeded";
  } catch (const kernels::ShapeError &e) {
    EXPECT_EQ(e.dimension(), 3u);
  }
}

TEST(resize, scales_or_sizes_are_required) {
  Tensor x = Tensor::from<float>({1, 1, 2, 2}, {1, 2, 3, 4});
  EXPECT_THROW(run1(Operator(OpKind::Resize), {&x}), kernels::ShapeError);
  Tensor channels = ints({1, 2, 4, 4});
  EXPECT_THROW(
      run1(Operator(OpKind::Resize), {&x, nullptr, nullptr, &channels}),
      kernels::ShapeError);
}
