#include "infera/runtime/model.hpp"
#include "infera/diag/logging.hpp"
#include "infera/graph/static_shapes.hpp"
#include "infera/ifx/FormatError.hpp"
#include "infera/ifx/attributes.hpp"
#include "infera/ifx/container.hpp"

#include <cstring>
#include <fmt/format.h>
#include <ifx.h>

namespace infera::runtime {

static memory::vector<ModelIo> collect_io(const graph::Graph &graph,
                                          memory::span<const graph::ValueId> ids) {
  memory::vector<ModelIo> io;
  io.reserve(ids.size());
  for (graph::ValueId id : ids) {
    const graph::ValueNode &value = graph.value(id);
    io.push_back(ModelIo{
        .name = value.name,
        .value = id,
        .dtype = value.isConstant()
                     ? memory::optional<TensorDataType>(value.constant->dtype())
                     : value.dtype,
        .shape = value.shape,
    });
  }
  return io;
}

Model::Model(graph::Graph graph, ModelMetadata metadata)
    : m_graph(std::move(graph)), m_plan(m_graph),
      m_metadata(std::move(metadata)),
      m_inputs(collect_io(m_graph, m_graph.inputs())),
      m_outputs(collect_io(m_graph, m_graph.outputs())) {}

namespace {

[[noreturn]] void malformed(const std::string &msg) {
  INFERA_ERROR("failed to load model: {}", msg);
  throw LoadError(LoadErrorKind::MalformedContainer, msg);
}

memory::string string_of(const flatbuffers::String *s) {
  return s == nullptr ? memory::string{} : s->str();
}

template <typename T, typename Data>
Tensor decode_constant(Shape shape, const Data *data) {
  if (data == nullptr || data->data() == nullptr) {
    return Tensor::from<T>(std::move(shape), memory::span<const T>{});
  }
  const auto *v = data->data();
  return Tensor::from<T>(std::move(shape),
                         memory::span<const T>(
                             reinterpret_cast<const T *>(v->data()),
                             v->size()));
}

Tensor decode_constant(const memory::string &name,
                       const ifx::ConstantNode &node) {
  Shape shape;
  if (node.shape() != nullptr) {
    shape.assign(node.shape()->begin(), node.shape()->end());
  }
  try {
    switch (node.data_type()) {
    case ifx::ConstantData_FloatData:
      return decode_constant<float>(std::move(shape),
                                    node.data_as_FloatData());
    case ifx::ConstantData_Int32Data:
      return decode_constant<std::int32_t>(std::move(shape),
                                           node.data_as_Int32Data());
    case ifx::ConstantData_Int8Data:
      return decode_constant<std::int8_t>(std::move(shape),
                                          node.data_as_Int8Data());
    case ifx::ConstantData_Uint8Data:
      return decode_constant<std::uint8_t>(std::move(shape),
                                           node.data_as_Uint8Data());
    default:
      break;
    }
  } catch (const std::invalid_argument &e) {
    malformed(fmt::format("constant '{}': {}", name, e.what()));
  }
  malformed(fmt::format("constant '{}' has no data", name));
}

graph::DimList decode_dims(
    const flatbuffers::Vector<flatbuffers::Offset<ifx::Dim>> &dims) {
  graph::DimList out;
  out.reserve(dims.size());
  for (const ifx::Dim *d : dims) {
    out.push_back(graph::Dim{d->size() < 0 ? -1 : d->size(),
                             string_of(d->name())});
  }
  return out;
}

struct Decoded {
  memory::vector<graph::ValueNode> values;
  memory::vector<graph::OperatorNode> nodes;
  memory::vector<graph::ValueId> inputs;
  memory::vector<graph::ValueId> outputs;
};

class GraphDecoder {
public:
  explicit GraphDecoder(const ifx::Graph &graph) : m_graph(graph) {}

  Decoded decode() {
    const auto *nodes = m_graph.nodes();
    const std::size_t count = nodes == nullptr ? 0 : nodes->size();
    m_valueOf.assign(count, graph::ValueId{});

    for (std::size_t i = 0; i < count; ++i) {
      const ifx::Node *node = nodes->Get(static_cast<flatbuffers::uoffset_t>(i));
      memory::string name = string_of(node->name());
      switch (node->data_type()) {
      case ifx::NodeKind_ValueNode: {
        const ifx::ValueNode *v = node->data_as_ValueNode();
        graph::ValueNode value{.name = std::move(name)};
        if (v->dtype().has_value()) {
          value.dtype = ifx::deserialize_dtype(*v->dtype());
        }
        if (v->shape() != nullptr) {
          value.shape = decode_dims(*v->shape());
        }
        addValue(i, std::move(value));
        break;
      }
      case ifx::NodeKind_ConstantNode: {
        Tensor constant = decode_constant(name, *node->data_as_ConstantNode());
        graph::ValueNode value{.name = std::move(name)};
        value.dtype = constant.dtype();
        value.shape.emplace();
        for (std::int64_t d : constant.shape()) {
          value.shape->push_back(graph::Dim::fixed(d));
        }
        value.constant = std::move(constant);
        addValue(i, std::move(value));
        break;
      }
      case ifx::NodeKind_OperatorNode:
        break;
      default:
        malformed(fmt::format("node {} '{}' has no content", i, name));
      }
    }

    for (std::size_t i = 0; i < count; ++i) {
      const ifx::Node *node = nodes->Get(static_cast<flatbuffers::uoffset_t>(i));
      if (node->data_type() == ifx::NodeKind_OperatorNode) {
        decodeOperator(string_of(node->name()), *node->data_as_OperatorNode());
      }
    }

    if (m_graph.inputs() != nullptr) {
      for (std::uint32_t ref : *m_graph.inputs()) {
        m_out.inputs.push_back(resolve(ref, memory::nullopt, "graph input"));
      }
    }
    if (m_graph.outputs() != nullptr) {
      for (std::uint32_t ref : *m_graph.outputs()) {
        m_out.outputs.push_back(
            resolve(ref, memory::nullopt, "graph output"));
      }
    }
    return std::move(m_out);
  }

private:
  void addValue(std::size_t index, graph::ValueNode value) {
    m_valueOf[index] =
        graph::ValueId{static_cast<std::uint32_t>(m_out.values.size())};
    m_out.values.push_back(std::move(value));
  }

  graph::ValueId resolve(std::int64_t ref, memory::optional<std::size_t> node,
                         std::string_view what) {
    if (ref < 0 || static_cast<std::size_t>(ref) >= m_valueOf.size()) {
      throw LoadError(LoadErrorKind::InvalidGraph,
                      fmt::format("{} refers to node {} of {}", what, ref,
                                  m_valueOf.size()),
                      node);
    }
    graph::ValueId id = m_valueOf[static_cast<std::size_t>(ref)];
    if (!id) {
      throw LoadError(LoadErrorKind::InvalidGraph,
                      fmt::format("{} refers to operator node {}", what, ref),
                      node);
    }
    return id;
  }

  void decodeOperator(memory::string name, const ifx::OperatorNode &op) {
    const std::size_t index = m_out.nodes.size();
    memory::optional<OpKind> kind = ifx::deserialize_op_kind(op.type());
    if (!kind) {
      auto raw = static_cast<unsigned>(op.type());
      INFERA_ERROR("node {} '{}' uses unsupported operator type {}", index,
                   name, raw);
      throw LoadError(LoadErrorKind::UnsupportedOperator,
                      fmt::format("node {} '{}' uses unsupported operator "
                                  "type {}",
                                  index, name, raw),
                      index, fmt::format("#{}", raw));
    }

    graph::OperatorNode node{
        .name = name,
        .op = Operator(*kind),
        .inputs = {},
        .outputs = {},
    };
    const std::uint32_t outputCount =
        op.outputs() == nullptr ? 0 : op.outputs()->size();
    try {
      node.op = ifx::deserialize_operator(*kind, op, outputCount);
    } catch (const ifx::FormatError &e) {
      throw LoadError(LoadErrorKind::MalformedContainer,
                      fmt::format("node {} '{}': {}", index, name, e.what()),
                      index, memory::string(op_name(*kind)));
    }

    const std::string what = fmt::format("node {} '{}'", index, name);
    if (op.inputs() != nullptr) {
      for (std::int32_t ref : *op.inputs()) {
        if (ref == -1) {
          node.inputs.emplace_back(memory::nullopt);
        } else {
          node.inputs.emplace_back(resolve(ref, index, what));
        }
      }
    }
    if (op.outputs() != nullptr) {
      for (std::uint32_t ref : *op.outputs()) {
        node.outputs.push_back(resolve(ref, index, what));
      }
    }
    m_out.nodes.push_back(std::move(node));
  }

  const ifx::Graph &m_graph;
  memory::vector<graph::ValueId> m_valueOf;
  Decoded m_out;
};

} // namespace

ModelHandle load_model(memory::span<const std::byte> bytes,
                       const LoadOptions &options) {
  memory::optional<ifx::ContainerHeader> header = ifx::read_header(bytes);
  if (!header) {
    malformed(fmt::format("not an IFX container ({} bytes)", bytes.size()));
  }
  if (header->version < ifx::MinFormatVersion ||
      header->version > ifx::FormatVersion) {
    auto msg = fmt::format("IFX format version {} is not supported (supported "
                           "{}..{})",
                           header->version, ifx::MinFormatVersion,
                           ifx::FormatVersion);
    INFERA_ERROR("failed to load model: {}", msg);
    throw LoadError(LoadErrorKind::VersionMismatch, msg);
  }
  const std::size_t available = bytes.size() - ifx::HeaderSize;
  if (header->payloadSize != available) {
    malformed(fmt::format("payload length {} does not match the {} bytes "
                          "following the header",
                          header->payloadSize, available));
  }

  // Copied so the flatbuffer is suitably aligned regardless of the caller's
  // buffer.
  memory::vector<std::uint8_t> payload(available);
  std::memcpy(payload.data(), bytes.data() + ifx::HeaderSize, available);
  flatbuffers::Verifier verifier(payload.data(), payload.size());
  if (!ifx::VerifyModelBuffer(verifier)) {
    malformed("flatbuffer verification failed");
  }
  const ifx::Model *model = ifx::GetModel(payload.data());
  if (model->graph() == nullptr) {
    malformed("model has no graph");
  }

  Decoded decoded;
  try {
    decoded = GraphDecoder(*model->graph()).decode();
  } catch (const ifx::FormatError &e) {
    malformed(e.what());
  }

  const std::size_t nodeCount = decoded.nodes.size();
  memory::optional<graph::Graph> graph;
  try {
    graph.emplace(std::move(decoded.values), std::move(decoded.nodes),
                  std::move(decoded.inputs), std::move(decoded.outputs));
  } catch (const graph::GraphError &e) {
    INFERA_ERROR("failed to load model: {}", e.what());
    throw LoadError(LoadErrorKind::InvalidGraph, e.what(), e.node());
  }

  if (options.checkShapes) {
    try {
      graph::propagate_static_shapes(*graph);
    } catch (const graph::GraphError &e) {
      memory::string opName;
      if (e.node()) {
        opName = op_name(graph->node(graph::NodeId{
            static_cast<std::uint32_t>(*e.node())}).op.kind());
      }
      INFERA_ERROR("failed to load model: {}", e.what());
      throw LoadError(LoadErrorKind::InvalidGraph, e.what(), e.node(),
                      std::move(opName));
    }
  }

  ModelMetadata metadata{.formatVersion = header->version};
  if (const ifx::Metadata *meta = model->metadata()) {
    metadata.producer = string_of(meta->producer());
    metadata.producerVersion = string_of(meta->producer_version());
    metadata.description = string_of(meta->description());
  }

  INFERA_DEBUG("loaded model: {} operators, {} values, {} inputs, {} outputs "
               "(format {}, producer '{}')",
               nodeCount, graph->valueCount(), graph->inputs().size(),
               graph->outputs().size(), metadata.formatVersion,
               metadata.producer);
  return std::make_shared<const Model>(std::move(*graph), std::move(metadata));
}

} // namespace infera::runtime
