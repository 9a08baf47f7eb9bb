#pragma once

#include "infera/graph/Graph.hpp"
#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/span.hpp"
#include "infera/memory/container/string.hpp"
#include "infera/runtime/ExecutionPlan.hpp"
#include "infera/runtime/Options.hpp"
#include "infera/runtime/errors.hpp"

#include <cstddef>
#include <memory>

namespace infera::runtime {

struct ModelMetadata {
  std::uint32_t formatVersion = 0;
  memory::string producer;
  memory::string producerVersion;
  memory::string description;
};

// Declared signature of a graph input or output.
struct ModelIo {
  memory::string name;
  graph::ValueId value;
  memory::optional<TensorDataType> dtype;
  // nullopt if the rank is unknown.
  memory::optional<graph::DimList> shape;
};

// A loaded, validated model. Immutable and safe to share between threads.
class Model {
public:
  Model(graph::Graph graph, ModelMetadata metadata);

  const graph::Graph &graph() const { return m_graph; }
  const ExecutionPlan &plan() const { return m_plan; }
  const ModelMetadata &metadata() const { return m_metadata; }

  memory::span<const ModelIo> inputs() const { return m_inputs; }
  memory::span<const ModelIo> outputs() const { return m_outputs; }

  memory::optional<graph::ValueId> findValue(memory::string_view name) const {
    return m_graph.findValue(name);
  }

private:
  graph::Graph m_graph;
  ExecutionPlan m_plan;
  ModelMetadata m_metadata;
  memory::vector<ModelIo> m_inputs;
  memory::vector<ModelIo> m_outputs;
};

using ModelHandle = std::shared_ptr<const Model>;

// Decodes and validates an IFX container. Throws LoadError.
ModelHandle load_model(memory::span<const std::byte> bytes,
                       const LoadOptions &options = {});

} // namespace infera::runtime
