#include "infera/algorithm/topological_sort.hpp"
#include <gtest/gtest.h>

using namespace infera;
using namespace infera::algorithm;

TEST(topological_sort, empty_graph) {
  memory::vector<memory::vector<std::uint32_t>> succ;
  EXPECT_TRUE(topologicalSort(succ).empty());
}

TEST(topological_sort, chain) {
  // 2 -> 0 -> 1
  memory::vector<memory::vector<std::uint32_t>> succ{{1}, {}, {0}};
  auto order = topologicalSort(succ);
  EXPECT_EQ(order, (memory::vector<std::uint32_t>{2, 0, 1}));
}

TEST(topological_sort, ready_nodes_in_index_order) {
  // diamond 0 -> {2, 1} -> 3, plus an isolated node 4
  memory::vector<memory::vector<std::uint32_t>> succ{
      {2, 1}, {3}, {3}, {}, {}};
  auto order = topologicalSort(succ);
  EXPECT_EQ(order, (memory::vector<std::uint32_t>{0, 1, 2, 3, 4}));
}

TEST(topological_sort, duplicate_edges) {
  // node 1 reads node 0 twice
  memory::vector<memory::vector<std::uint32_t>> succ{{1, 1}, {}};
  auto order = topologicalSort(succ);
  EXPECT_EQ(order, (memory::vector<std::uint32_t>{0, 1}));
}

TEST(topological_sort, cycle_throws) {
  memory::vector<memory::vector<std::uint32_t>> succ{{1}, {2}, {1}, {}};
  try {
    topologicalSort(succ);
    FAIL() << "expected cycle_error";
  } catch (const cycle_error &e) {
    EXPECT_EQ(e.sortedCount(), 2u); // 0 and 3
    EXPECT_EQ(e.nodeCount(), 4u);
  }
}

TEST(topological_sort, self_loop_is_a_cycle) {
  memory::vector<memory::vector<std::uint32_t>> succ{{0}};
  EXPECT_THROW(topologicalSort(succ), cycle_error);
}

TEST(topological_sort, levels_are_longest_paths) {
  // 0 -> 1 -> 3, 0 -> 3, 2 -> 3
  memory::vector<memory::vector<std::uint32_t>> succ{{1, 3}, {3}, {3}, {}};
  auto order = topologicalSort(succ);
  auto levels = dependencyLevels(succ, order);
  EXPECT_EQ(levels, (memory::vector<std::uint32_t>{0, 1, 0, 2}));
}
