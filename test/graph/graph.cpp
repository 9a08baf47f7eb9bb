#include "builder.hpp"

#include <gtest/gtest.h>

using namespace infera;
using namespace infera::graph;
using namespace infera::test;

namespace {

GraphErrorKind build_error(GraphBuilder &b) {
  try {
    b.build();
  } catch (const GraphError &e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected GraphError";
  return GraphErrorKind::InvalidSignature;
}

} // namespace

TEST(graph, diamond_structure) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({2}));
  ValueId l = b.value("l");
  ValueId r = b.value("r");
  ValueId y = b.value("y");
  b.node("right", Operator(OpKind::Neg), {x}, {r});
  b.node("left", Operator(OpKind::Relu), {x}, {l});
  b.node("join", Operator(OpKind::Add), {l, r}, {y});
  b.output(y);
  Graph g = b.build();

  EXPECT_EQ(g.valueCount(), 4u);
  EXPECT_EQ(g.nodeCount(), 3u);
  EXPECT_TRUE(g.isInput(x));
  EXPECT_TRUE(g.isOutput(y));
  EXPECT_FALSE(g.isOutput(l));
  EXPECT_FALSE(g.producer(x));
  EXPECT_EQ(*g.producer(y), 2u);
  EXPECT_EQ(g.consumers(x).size(), 2u);
  EXPECT_EQ(g.findValue("r"), r);
  EXPECT_FALSE(g.findValue("missing").has_value());

  auto order = g.topologicalOrder();
  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(*order[0], 0u);
  EXPECT_EQ(*order[1], 1u);
  EXPECT_EQ(*order[2], 2u);
}

TEST(graph, order_follows_dependencies_not_declaration) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({1}));
  ValueId a = b.value("a");
  ValueId c = b.value("c");
  b.node("second", Operator(OpKind::Relu), {a}, {c});
  b.node("first", Operator(OpKind::Neg), {x}, {a});
  b.output(c);
  Graph g = b.build();
  auto order = g.topologicalOrder();
  EXPECT_EQ(*order[0], 1u);
  EXPECT_EQ(*order[1], 0u);
}

TEST(graph, repeated_input_is_consumed_twice) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({1}));
  ValueId y = b.value("y");
  b.node("square", Operator(OpKind::Mul), {x, x}, {y});
  b.output(y);
  Graph g = b.build();
  EXPECT_EQ(g.consumers(x).size(), 2u);
}

TEST(graph, absent_optional_inputs_are_kept) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({4}));
  ValueId hi = b.constant("hi", Tensor::scalar<float>(1.0f));
  ValueId y = b.value("y");
  b.node("clip", Operator(OpKind::Clip), {x, memory::nullopt, hi}, {y});
  b.output(y);
  Graph g = b.build();
  ASSERT_EQ(g.node(NodeId{0}).inputs.size(), 3u);
  EXPECT_FALSE(g.node(NodeId{0}).inputs[1].has_value());
  EXPECT_EQ(g.consumers(hi).size(), 1u);
}

TEST(graph, constant_can_be_an_output) {
  GraphBuilder b;
  ValueId c = b.constant("c", Tensor::scalar<float>(2.0f));
  b.output(c);
  Graph g = b.build();
  EXPECT_EQ(g.nodeCount(), 0u);
  EXPECT_TRUE(g.isOutput(c));
}

TEST(graph, rejects_out_of_range_value) {
  GraphBuilder b;
  b.input("x", TensorDataType::Float32, dims({1}));
  ValueId y = b.value("y");
  b.node("bad", Operator(OpKind::Relu), {ValueId{42}}, {y});
  b.output(y);
  EXPECT_EQ(build_error(b), GraphErrorKind::ValueOutOfRange);
}

TEST(graph, rejects_second_producer) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({1}));
  ValueId y = b.value("y");
  b.node("a", Operator(OpKind::Relu), {x}, {y});
  b.node("b", Operator(OpKind::Neg), {x}, {y});
  b.output(y);
  EXPECT_EQ(build_error(b), GraphErrorKind::DuplicateProducer);
}

TEST(graph, rejects_overwriting_an_input) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({1}));
  b.node("a", Operator(OpKind::Relu), {x}, {x});
  b.output(x);
  EXPECT_EQ(build_error(b), GraphErrorKind::DuplicateProducer);
}

TEST(graph, rejects_dangling_reads) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({1}));
  ValueId ghost = b.value("ghost");
  ValueId y = b.value("y");
  b.node("a", Operator(OpKind::Add), {x, ghost}, {y});
  b.output(y);
  EXPECT_EQ(build_error(b), GraphErrorKind::DanglingInput);

  GraphBuilder unproduced;
  unproduced.input("x", TensorDataType::Float32, dims({1}));
  unproduced.output(unproduced.value("never"));
  EXPECT_EQ(build_error(unproduced), GraphErrorKind::DanglingInput);
}

TEST(graph, rejects_cycles) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({1}));
  ValueId a = b.value("a");
  ValueId c = b.value("c");
  ValueId y = b.value("y");
  b.node("n0", Operator(OpKind::Add), {x, c}, {a});
  b.node("n1", Operator(OpKind::Relu), {a}, {c});
  b.node("n2", Operator(OpKind::Neg), {x}, {y});
  b.output(y);
  EXPECT_EQ(build_error(b), GraphErrorKind::Cycle);
}

TEST(graph, rejects_constant_input) {
  memory::vector<ValueNode> values;
  ValueNode k;
  k.name = "k";
  k.constant = Tensor::scalar<float>(1.0f);
  values.push_back(std::move(k));
  try {
    Graph g(std::move(values), {}, {ValueId{0}}, {ValueId{0}});
    FAIL() << "expected GraphError";
  } catch (const GraphError &e) {
    EXPECT_EQ(e.kind(), GraphErrorKind::InvalidSignature);
  }
}

TEST(graph, error_names_the_node) {
  GraphBuilder b;
  ValueId x = b.input("x", TensorDataType::Float32, dims({1}));
  ValueId y = b.value("y");
  b.node("ok", Operator(OpKind::Relu), {x}, {y});
  b.node("bad", Operator(OpKind::Relu), {ValueId{99}}, {b.value("z")});
  b.output(y);
  try {
    b.build();
    FAIL() << "expected GraphError";
  } catch (const GraphError &e) {
    ASSERT_TRUE(e.node().has_value());
    EXPECT_EQ(*e.node(), 1u);
  }
}
