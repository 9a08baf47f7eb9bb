#pragma once

#include "infera/memory/container/span.hpp"
#include "infera/memory/container/vector.hpp"

#include <cstdint>
#include <functional>
#include <queue>
#include <stdexcept>

namespace infera::algorithm {

class cycle_error : public std::runtime_error {
public:
  explicit cycle_error(std::size_t sorted, std::size_t total)
      : std::runtime_error("topologicalSort: graph contains a cycle"),
        m_sorted(sorted), m_total(total) {}

  std::size_t sortedCount() const { return m_sorted; }
  std::size_t nodeCount() const { return m_total; }

private:
  std::size_t m_sorted;
  std::size_t m_total;
};

// Kahn's algorithm over an adjacency list (successors[n] lists every node
// that depends on n; duplicates count as separate edges). Among ready nodes
// the smallest index is always taken first, so the order only depends on the
// graph.
inline memory::vector<std::uint32_t> topologicalSort(
    memory::span<const memory::vector<std::uint32_t>> successors) {
  const std::size_t nodeCount = successors.size();
  memory::vector<std::uint32_t> unsatisfied(nodeCount, 0);
  for (const auto &succ : successors) {
    for (std::uint32_t s : succ) {
      ++unsatisfied[s];
    }
  }

  std::priority_queue<std::uint32_t, memory::vector<std::uint32_t>,
                      std::greater<std::uint32_t>>
      ready;
  for (std::size_t n = 0; n < nodeCount; ++n) {
    if (unsatisfied[n] == 0) {
      ready.push(static_cast<std::uint32_t>(n));
    }
  }

  memory::vector<std::uint32_t> order;
  order.reserve(nodeCount);
  while (!ready.empty()) {
    std::uint32_t n = ready.top();
    ready.pop();
    order.push_back(n);
    for (std::uint32_t s : successors[n]) {
      if (--unsatisfied[s] == 0) {
        ready.push(s);
      }
    }
  }

  if (order.size() != nodeCount) {
    throw cycle_error(order.size(), nodeCount);
  }
  return order;
}

// Longest path (in edges) from any source, given a topological order.
inline memory::vector<std::uint32_t>
dependencyLevels(memory::span<const memory::vector<std::uint32_t>> successors,
                 memory::span<const std::uint32_t> order) {
  memory::vector<std::uint32_t> level(successors.size(), 0);
  for (std::uint32_t n : order) {
    for (std::uint32_t s : successors[n]) {
      if (level[s] < level[n] + 1) {
        level[s] = level[n] + 1;
      }
    }
  }
  return level;
}

} // namespace infera::algorithm
