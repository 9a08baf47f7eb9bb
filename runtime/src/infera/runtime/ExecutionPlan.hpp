#pragma once

#include "infera/graph/Graph.hpp"
#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/span.hpp"
#include "infera/memory/container/vector.hpp"

#include <cstdint>

namespace infera::runtime {

// Static schedule of a graph, computed once and shared by every run.
// Nodes are grouped into levels (longest path from the graph sources); the
// nodes of one level are independent of each other. Intermediates are
// released after the level of their last consumer.
class ExecutionPlan {
public:
  explicit ExecutionPlan(const graph::Graph &graph);

  memory::span<const graph::NodeId> order() const { return m_order; }

  std::size_t levelCount() const { return m_levels.size(); }
  // Ascending node index.
  memory::span<const graph::NodeId> level(std::size_t l) const {
    return m_levels[l];
  }
  std::uint32_t levelOf(graph::NodeId node) const {
    return m_levelOf[*node];
  }

  // Number of operator input slots reading the value.
  std::uint32_t consumerCount(graph::ValueId value) const {
    return m_consumerCounts[*value];
  }
  memory::span<const std::uint32_t> consumerCounts() const {
    return m_consumerCounts;
  }

  // Level of the last operator reading the value, nullopt if none does.
  memory::optional<std::uint32_t> lastUseLevel(graph::ValueId value) const {
    return m_lastUse[*value];
  }

  // True for operator outputs that are released during a run.
  bool isReleasable(graph::ValueId value) const {
    return m_releasable[*value];
  }

  // Largest number of operator-produced tensors held at once when levels
  // run in order and releases happen after each level.
  std::size_t maxLiveSet() const { return m_maxLiveSet; }

private:
  memory::vector<graph::NodeId> m_order;
  memory::vector<memory::vector<graph::NodeId>> m_levels;
  memory::vector<std::uint32_t> m_levelOf;
  memory::vector<std::uint32_t> m_consumerCounts;
  memory::vector<memory::optional<std::uint32_t>> m_lastUse;
  memory::vector<bool> m_releasable;
  std::size_t m_maxLiveSet = 0;
};

} // namespace infera::runtime
