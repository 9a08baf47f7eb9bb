#pragma once

#include "infera/graph/Graph.hpp"
#include "infera/tensor/Tensor.hpp"

namespace infera::graph {

// Walks the graph in topological order and infers every output whose
// operator inputs are all statically known (declared inputs with fully
// fixed shapes and constants). Operators whose output shapes depend on
// runtime data stay unknown. Throws GraphError(ShapeMismatch) naming the
// first node whose inputs its kernel rejects, or whose inferred outputs
// contradict the declared ones.
memory::vector<memory::optional<TensorInfo>>
propagate_static_shapes(const Graph &graph);

// Declared dtype and fully fixed shape, if both are known.
memory::optional<TensorInfo> declared_info(const ValueNode &value);

} // namespace infera::graph
