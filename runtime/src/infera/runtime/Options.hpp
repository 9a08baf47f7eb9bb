#pragma once

#include "infera/common/ops/OpKind.hpp"
#include "infera/kernels/WorkerPool.hpp"
#include "infera/memory/container/string.hpp"
#include "infera/memory/container/vector.hpp"

#include <chrono>
#include <cstddef>

namespace infera::runtime {

struct LoadOptions {
  // Propagate statically known shapes through the graph and reject models
  // whose operators cannot accept them.
  bool checkShapes = true;
};

struct ExecutorOptions {
  // nullptr selects WorkerPool::global().
  kernels::WorkerPool *pool = nullptr;
  // Run independent nodes of a level concurrently.
  bool parallelLevels = true;
};

struct RunOptions {
  // Log per-operator wall time at info level.
  bool timing = false;
  // Log input and output shapes of every node at debug level.
  bool verbose = false;
  // Subset of the declared outputs to return; empty returns all of them.
  memory::vector<memory::string> outputs;
};

struct NodeTiming {
  std::size_t node;
  memory::string name;
  OpKind op;
  std::chrono::nanoseconds duration;
};

struct RunStats {
  // Intermediate tensors alive at once, at worst.
  std::size_t peakLiveTensors = 0;
  std::size_t allocations = 0;
  std::size_t reuses = 0;
  // Only filled when RunOptions::timing is set; sorted slowest first.
  memory::vector<NodeTiming> timings;
};

} // namespace infera::runtime
