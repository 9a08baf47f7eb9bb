#include "infera/graph/static_shapes.hpp"
#include "infera/diag/logging.hpp"
#include "infera/kernels/Kernel.hpp"
#include "infera/kernels/errors.hpp"

#include <fmt/format.h>

namespace infera::graph {

memory::optional<TensorInfo> declared_info(const ValueNode &value) {
  if (!value.dtype || !value.shape) {
    return memory::nullopt;
  }
  TensorInfo info{*value.dtype, {}};
  for (const Dim &d : *value.shape) {
    if (!d.isFixed()) {
      return memory::nullopt;
    }
    info.shape.push_back(d.size);
  }
  return info;
}

namespace {

bool contradicts(const ValueNode &declared, const TensorInfo &inferred) {
  if (declared.dtype && *declared.dtype != inferred.dtype) {
    return true;
  }
  if (!declared.shape) {
    return false;
  }
  if (declared.shape->size() != inferred.shape.size()) {
    return true;
  }
  for (std::size_t d = 0; d < inferred.shape.size(); ++d) {
    const Dim &dim = (*declared.shape)[d];
    if (dim.isFixed() && dim.size != inferred.shape[d]) {
      return true;
    }
  }
  return false;
}

} // namespace

memory::vector<memory::optional<TensorInfo>>
propagate_static_shapes(const Graph &graph) {
  memory::vector<memory::optional<TensorInfo>> known(graph.valueCount());
  for (std::size_t v = 0; v < graph.valueCount(); ++v) {
    const ValueNode &value = graph.values()[v];
    if (value.isConstant()) {
      known[v] = value.constant->info();
    }
  }
  for (ValueId in : graph.inputs()) {
    known[*in] = declared_info(graph.value(in));
  }

  std::size_t inferred = 0;
  for (NodeId id : graph.topologicalOrder()) {
    const OperatorNode &node = graph.node(id);
    memory::vector<kernels::ValueInfo> inputs;
    bool complete = true;
    for (const auto &in : node.inputs) {
      if (!in) {
        inputs.push_back(kernels::ValueInfo::absent());
        continue;
      }
      if (!known[**in]) {
        complete = false;
        break;
      }
      const ValueNode &value = graph.value(*in);
      inputs.push_back(kernels::ValueInfo{
          true, *known[**in],
          value.isConstant() ? &*value.constant : nullptr});
    }
    if (!complete) {
      continue;
    }

    memory::optional<memory::vector<TensorInfo>> outputs;
    try {
      outputs = kernels::infer(node.op, inputs);
    } catch (const kernels::ShapeError &e) {
      throw GraphError(GraphErrorKind::ShapeMismatch,
                       fmt::format("node {} '{}': {}", *id, node.name,
                                   e.what()),
                       *id);
    } catch (const std::invalid_argument &e) {
      throw GraphError(GraphErrorKind::ShapeMismatch,
                       fmt::format("node {} '{}' ({}): {}", *id, node.name,
                                   node.op.kind(), e.what()),
                       *id);
    }
    if (!outputs) {
      INFERA_TRACE("node {} '{}' ({}) depends on runtime data", *id,
                   node.name, node.op.kind());
      continue;
    }
    if (outputs->size() != node.outputs.size()) {
      throw GraphError(GraphErrorKind::ShapeMismatch,
                       fmt::format("node {} '{}' ({}) declares {} outputs, "
                                   "its operator produces {}",
                                   *id, node.name, node.op.kind(),
                                   node.outputs.size(), outputs->size()),
                       *id);
    }
    for (std::size_t i = 0; i < outputs->size(); ++i) {
      const ValueId out = node.outputs[i];
      const TensorInfo &info = (*outputs)[i];
      if (contradicts(graph.value(out), info)) {
        throw GraphError(GraphErrorKind::ShapeMismatch,
                         fmt::format("node {} '{}' ({}) produces {} for "
                                     "'{}', which is declared differently",
                                     *id, node.name, node.op.kind(), info,
                                     graph.value(out).name),
                         *id);
      }
      known[*out] = info;
    }
    ++inferred;
  }
  INFERA_DEBUG("static shapes known for {} of {} nodes", inferred,
               graph.nodeCount());
  return known;
}

} // namespace infera::graph
