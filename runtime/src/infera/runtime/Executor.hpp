#pragma once

#include "infera/runtime/Options.hpp"
#include "infera/runtime/model.hpp"
#include "infera/tensor/Tensor.hpp"

#include <map>

namespace infera::runtime {

// Named tensors: graph inputs going in, graph outputs coming out. Input
// tensors may borrow caller memory; outputs always own theirs.
using Binding = std::map<memory::string, Tensor>;

// Runs a model. One executor can serve concurrent run() calls; each call
// owns its tensors and buffer pool.
class Executor {
public:
  explicit Executor(ModelHandle model, ExecutorOptions options = {});

  // Throws RunError. No outputs are returned if any node fails.
  Binding run(const Binding &inputs, const RunOptions &options = {},
              RunStats *stats = nullptr) const;

  const Model &model() const { return *m_model; }

private:
  // Checks the bindings against the declared inputs and returns them in
  // graph input order.
  memory::vector<const Tensor *> bindInputs(const Binding &inputs) const;

  ModelHandle m_model;
  kernels::WorkerPool *m_pool;
  bool m_parallelLevels;
};

} // namespace infera::runtime
