#pragma once

#include "infera/graph/GraphError.hpp"
#include "infera/graph/NodeId.hpp"
#include "infera/graph/OperatorNode.hpp"
#include "infera/graph/Value.hpp"
#include "infera/graph/ValueId.hpp"
#include "infera/memory/container/span.hpp"
#include "infera/memory/container/string_view.hpp"

namespace infera::graph {

// Immutable dataflow graph. Operator nodes refer to values by id; every
// value is produced by at most one operator, every operator input is a graph
// input, a constant or the output of an operator, and there are no cycles.
// The constructor enforces this and throws GraphError otherwise.
class Graph {
public:
  Graph(memory::vector<ValueNode> values, memory::vector<OperatorNode> nodes,
        memory::vector<ValueId> inputs, memory::vector<ValueId> outputs);

  Graph(const Graph &) = delete;
  Graph &operator=(const Graph &) = delete;
  Graph(Graph &&) = default;

  std::size_t valueCount() const { return m_values.size(); }
  std::size_t nodeCount() const { return m_nodes.size(); }

  const ValueNode &value(ValueId id) const { return m_values[*id]; }
  const OperatorNode &node(NodeId id) const { return m_nodes[*id]; }
  memory::span<const ValueNode> values() const { return m_values; }
  memory::span<const OperatorNode> nodes() const { return m_nodes; }

  memory::span<const ValueId> inputs() const { return m_inputs; }
  memory::span<const ValueId> outputs() const { return m_outputs; }

  // NullId for graph inputs and constants.
  NodeId producer(ValueId id) const { return m_producers[*id]; }
  // One entry per input slot, so a node reading a value twice is listed
  // twice.
  memory::span<const NodeId> consumers(ValueId id) const {
    return m_consumers[*id];
  }

  bool isInput(ValueId id) const;
  bool isOutput(ValueId id) const;

  memory::optional<ValueId> findValue(memory::string_view name) const;

  // Deterministic topological order: among ready nodes the lowest index
  // comes first.
  memory::span<const NodeId> topologicalOrder() const { return m_order; }
  // Node -> nodes consuming one of its outputs, with multiplicity.
  memory::span<const memory::vector<std::uint32_t>> successors() const {
    return m_successors;
  }

private:
  memory::vector<ValueNode> m_values;
  memory::vector<OperatorNode> m_nodes;
  memory::vector<ValueId> m_inputs;
  memory::vector<ValueId> m_outputs;
  memory::vector<NodeId> m_producers;
  memory::vector<memory::vector<NodeId>> m_consumers;
  memory::vector<memory::vector<std::uint32_t>> m_successors;
  memory::vector<NodeId> m_order;
};

} // namespace infera::graph
