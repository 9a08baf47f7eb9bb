#include "infera/graph/Graph.hpp"
#include "infera/algorithm/topological_sort.hpp"
#include "infera/memory/container/dynamic_bitset.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace infera::graph {

Graph::Graph(memory::vector<ValueNode> values,
             memory::vector<OperatorNode> nodes,
             memory::vector<ValueId> inputs, memory::vector<ValueId> outputs)
    : m_values(std::move(values)), m_nodes(std::move(nodes)),
      m_inputs(std::move(inputs)), m_outputs(std::move(outputs)),
      m_producers(m_values.size(), NodeId{}),
      m_consumers(m_values.size()), m_successors(m_nodes.size()) {
  const std::size_t valueCount = m_values.size();
  auto checkRange = [&](ValueId v, memory::optional<std::size_t> node,
                        std::string_view what) {
    if (!v || *v >= valueCount) {
      throw GraphError(GraphErrorKind::ValueOutOfRange,
                       fmt::format("{} refers to value {} of {}", what, *v,
                                   valueCount),
                       node);
    }
  };

  memory::dynamic_bitset available(valueCount);
  for (ValueId in : m_inputs) {
    checkRange(in, memory::nullopt, "graph input");
    if (m_values[*in].isConstant()) {
      throw GraphError(GraphErrorKind::InvalidSignature,
                       fmt::format("graph input '{}' is a constant",
                                   m_values[*in].name));
    }
    available.set(*in);
  }
  for (std::size_t v = 0; v < valueCount; ++v) {
    if (m_values[v].isConstant()) {
      available.set(v);
    }
  }

  for (std::size_t n = 0; n < m_nodes.size(); ++n) {
    const OperatorNode &node = m_nodes[n];
    for (ValueId out : node.outputs) {
      checkRange(out, n, fmt::format("output of node '{}'", node.name));
      if (available[*out]) {
        throw GraphError(GraphErrorKind::DuplicateProducer,
                         fmt::format("value '{}' produced by node '{}' is "
                                     "already defined",
                                     m_values[*out].name, node.name),
                         n);
      }
      available.set(*out);
      m_producers[*out] = NodeId{static_cast<std::uint32_t>(n)};
    }
  }

  for (std::size_t n = 0; n < m_nodes.size(); ++n) {
    const OperatorNode &node = m_nodes[n];
    for (const auto &in : node.inputs) {
      if (!in) {
        continue;
      }
      checkRange(*in, n, fmt::format("input of node '{}'", node.name));
      if (!available[**in]) {
        throw GraphError(GraphErrorKind::DanglingInput,
                         fmt::format("node '{}' reads value '{}' that is "
                                     "never produced",
                                     node.name, m_values[**in].name),
                         n);
      }
      m_consumers[**in].push_back(NodeId{static_cast<std::uint32_t>(n)});
      NodeId producer = m_producers[**in];
      if (producer) {
        m_successors[*producer].push_back(static_cast<std::uint32_t>(n));
      }
    }
  }

  for (ValueId out : m_outputs) {
    checkRange(out, memory::nullopt, "graph output");
    if (!available[*out]) {
      throw GraphError(GraphErrorKind::DanglingInput,
                       fmt::format("graph output '{}' is never produced",
                                   m_values[*out].name));
    }
  }

  try {
    auto order = algorithm::topologicalSort(
        memory::span<const memory::vector<std::uint32_t>>(m_successors));
    m_order.reserve(order.size());
    for (std::uint32_t n : order) {
      m_order.push_back(NodeId{n});
    }
  } catch (const algorithm::cycle_error &e) {
    throw GraphError(GraphErrorKind::Cycle,
                     fmt::format("graph contains a cycle ({} of {} nodes "
                                 "sortable)",
                                 e.sortedCount(), e.nodeCount()));
  }
}

bool Graph::isInput(ValueId id) const {
  return std::find(m_inputs.begin(), m_inputs.end(), id) != m_inputs.end();
}

bool Graph::isOutput(ValueId id) const {
  return std::find(m_outputs.begin(), m_outputs.end(), id) != m_outputs.end();
}

memory::optional<ValueId> Graph::findValue(memory::string_view name) const {
  for (std::size_t v = 0; v < m_values.size(); ++v) {
    if (m_values[v].name == name) {
      return ValueId{static_cast<std::uint32_t>(v)};
    }
  }
  return memory::nullopt;
}

} // namespace infera::graph
