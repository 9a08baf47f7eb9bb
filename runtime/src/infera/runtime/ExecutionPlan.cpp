#include "infera/runtime/ExecutionPlan.hpp"
#include "infera/algorithm/topological_sort.hpp"
#include "infera/diag/logging.hpp"

#include <algorithm>

namespace infera::runtime {

ExecutionPlan::ExecutionPlan(const graph::Graph &graph)
    : m_order(graph.topologicalOrder().begin(),
              graph.topologicalOrder().end()),
      m_consumerCounts(graph.valueCount(), 0),
      m_lastUse(graph.valueCount()),
      m_releasable(graph.valueCount(), false) {
  memory::vector<std::uint32_t> order;
  order.reserve(m_order.size());
  for (graph::NodeId n : m_order) {
    order.push_back(*n);
  }
  m_levelOf = algorithm::dependencyLevels(graph.successors(), order);

  std::uint32_t levelCount = 0;
  for (std::uint32_t l : m_levelOf) {
    levelCount = std::max(levelCount, l + 1);
  }
  m_levels.resize(levelCount);
  for (std::size_t n = 0; n < graph.nodeCount(); ++n) {
    m_levels[m_levelOf[n]].push_back(
        graph::NodeId{static_cast<std::uint32_t>(n)});
  }

  for (std::size_t n = 0; n < graph.nodeCount(); ++n) {
    const graph::OperatorNode &node = graph.nodes()[n];
    for (const auto &in : node.inputs) {
      if (!in) {
        continue;
      }
      ++m_consumerCounts[**in];
      auto &last = m_lastUse[**in];
      if (!last || *last < m_levelOf[n]) {
        last = m_levelOf[n];
      }
    }
    for (graph::ValueId out : node.outputs) {
      m_releasable[*out] = !graph.isOutput(out);
    }
  }

  // Sweep over levels: a tensor produced at level p becomes live at p and
  // stays live through the level it is released after.
  memory::vector<std::int64_t> delta(levelCount + 1, 0);
  for (std::size_t n = 0; n < graph.nodeCount(); ++n) {
    const std::uint32_t produced = m_levelOf[n];
    for (graph::ValueId out : graph.nodes()[n].outputs) {
      std::uint32_t releasedAfter = levelCount;
      if (m_releasable[*out]) {
        releasedAfter = m_lastUse[*out].value_or(produced);
      }
      delta[produced] += 1;
      delta[std::min<std::uint32_t>(releasedAfter + 1, levelCount)] -= 1;
    }
  }
  std::int64_t live = 0;
  for (std::uint32_t l = 0; l < levelCount; ++l) {
    live += delta[l];
    m_maxLiveSet = std::max(m_maxLiveSet, static_cast<std::size_t>(live));
  }

  INFERA_DEBUG("execution plan: {} nodes in {} levels, max live set {}",
               graph.nodeCount(), levelCount, m_maxLiveSet);
}

} // namespace infera::runtime
