#include "builder.hpp"
#include "infera/graph/static_shapes.hpp"

#include <gtest/gtest.h>

using namespace infera;
using namespace infera::graph;
using namespace infera::test;

namespace {

Tensor zeros(Shape shape) {
  return Tensor::empty(TensorDataType::Float32, std::move(shape));
}

} // namespace

TEST(static_shapes, conv_chain_is_fully_known) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({1, 3, 4, 4}));
  ValueId w = b.constant("w", zeros({2, 3, 3, 3}));
  ValueId conv = b.value("conv");
  ValueId pooled = b.value("pooled");
  ValueId flat = b.value("flat");
  b.node("conv", Operator(OpKind::Conv), {x, w}, {conv});
  b.node("gap", Operator(OpKind::GlobalAveragePool), {conv}, {pooled});
  b.node("flatten", Operator(OpKind::Flatten, AxisAttrs{1}), {pooled}, {flat});
  b.output(flat);
  Graph g = b.build();

  auto known = propagate_static_shapes(g);
  ASSERT_TRUE(known[*conv].has_value());
  EXPECT_EQ(known[*conv]->shape, (Shape{1, 2, 2, 2}));
  EXPECT_EQ(known[*pooled]->shape, (Shape{1, 2, 1, 1}));
  EXPECT_EQ(known[*flat]->shape, (Shape{1, 2}));
  EXPECT_EQ(known[*w]->shape, (Shape{2, 3, 3, 3}));
}

TEST(static_shapes, symbolic_dimensions_stay_unknown) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({-1, 4}));
  ValueId y = b.value("y");
  b.node("relu", Operator(OpKind::Relu), {x}, {y});
  b.output(y);
  Graph g = b.build();
  auto known = propagate_static_shapes(g);
  EXPECT_FALSE(known[*x].has_value());
  EXPECT_FALSE(known[*y].has_value());
}

TEST(static_shapes, data_dependent_shapes_stay_unknown) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({2, 3}));
  ValueId s = b.value("s");
  ValueId y = b.value("y");
  ValueId z = b.value("z");
  b.node("shape", Operator(OpKind::Shape), {x}, {s});
  b.node("reshape", Operator(OpKind::Reshape), {x, s}, {y});
  b.node("relu", Operator(OpKind::Relu), {y}, {z});
  b.output(z);
  Graph g = b.build();
  auto known = propagate_static_shapes(g);
  ASSERT_TRUE(known[*s].has_value());
  EXPECT_EQ(known[*s]->dtype, TensorDataType::Int32);
  EXPECT_EQ(known[*s]->shape, (Shape{2}));
  EXPECT_FALSE(known[*y].has_value());
  EXPECT_FALSE(known[*z].has_value());
}

TEST(static_shapes, constant_shape_input_is_used) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({2, 3}));
  ValueId s = b.constant("s", Tensor::from<std::int32_t>({2}, {3, -1}));
  ValueId y = b.value("y");
  b.node("reshape", Operator(OpKind::Reshape), {x, s}, {y});
  b.output(y);
  Graph g = b.build();
  auto known = propagate_static_shapes(g);
  ASSERT_TRUE(known[*y].has_value());
  EXPECT_EQ(known[*y]->shape, (Shape{3, 2}));
}

TEST(static_shapes, broadcast_failure_names_node) {
  GraphBuilder b;
  ValueId a = b.input("a", TensorDataType::Float32, dims({2, 3}));
  ValueId c = b.input("c", TensorDataType::Float32, dims({4, 5}));
  ValueId ok = b.value("ok");
  ValueId y = b.value("y");
  b.node("fine", Operator(OpKind::Relu), {a}, {ok});
  b.node("sum", Operator(OpKind::Add), {ok, c}, {y});
  b.output(y);
  Graph g = b.build();
  try {
    propagate_static_shapes(g);
    FAIL() << "expected GraphError";
  } catch (const GraphError &e) {
    EXPECT_EQ(e.kind(), GraphErrorKind::ShapeMismatch);
    ASSERT_TRUE(e.node().has_value());
    EXPECT_EQ(*e.node(), 1u);
    EXPECT_NE(std::string(e.what()).find("sum"), std::string::npos);
  }
}

TEST(static_shapes, contradicting_declaration) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({2}));
  ValueId y = b.value("y", TensorDataType::Float32, dims({3}));
  b.node("relu", Operator(OpKind::Relu), {x}, {y});
  b.output(y);
  Graph g = b.build();
  EXPECT_THROW(propagate_static_shapes(g), GraphError);

  GraphBuilder typed;
  ValueId tx = typed.input("x", TensorDataType::Float32, dims({2}));
  ValueId ty = typed.value("y", TensorDataType::Int32);
  typed.node("relu", Operator(OpKind::Relu), {tx}, {ty});
  typed.output(ty);
  Graph tg = typed.build();
  EXPECT_THROW(propagate_static_shapes(tg), GraphError);
}

TEST(static_shapes, symbolic_declaration_accepts_any_size) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({2, 5}));
  ValueId y = b.value("y", TensorDataType::Float32, dims({-1, 5}));
  b.node("relu", Operator(OpKind::Relu), {x}, {y});
  b.output(y);
  Graph g = b.build();
  auto known = propagate_static_shapes(g);
  EXPECT_EQ(known[*y]->shape, (Shape{2, 5}));
}

TEST(static_shapes, output_count_must_match_operator) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({4}));
  ValueId p = b.value("p");
  ValueId q = b.value("q");
  ValueId r = b.value("r");
  SplitAttrs attrs;
  attrs.numOutputs = 2;
  b.node("split", Operator(OpKind::Split, attrs), {x}, {p, q, r});
  b.output(p);
  Graph g = b.build();
  EXPECT_THROW(propagate_static_shapes(g), GraphError);
}

TEST(static_shapes, declared_info_requires_fixed_dims) {
  ValueNode v;
  EXPECT_FALSE(declared_info(v).has_value());
  v.dtype = TensorDataType::Int8;
  v.shape = dims({2, 3});
  auto info = declared_info(v);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->dtype, TensorDataType::Int8);
  EXPECT_EQ(info->shape, (Shape{2, 3}));
  v.shape = DimList{Dim::fixed(2), Dim::symbolic("batch")};
  EXPECT_FALSE(declared_info(v).has_value());
}
