#include "infera/ifx/ModelWriter.hpp"
#include "infera/ifx/attributes.hpp"

#include <flatbuffers/flatbuffer_builder.h>
#include <ifx.h>

namespace infera::ifx {

std::uint32_t ModelWriter::push(Entry entry) {
  auto index = static_cast<std::uint32_t>(m_nodes.size());
  m_nodes.push_back(std::move(entry));
  return index;
}

std::uint32_t ModelWriter::addInput(memory::string name, TensorDataType dtype,
                                    graph::DimList shape) {
  std::uint32_t index = addValue(std::move(name), dtype, std::move(shape));
  m_inputs.push_back(index);
  return index;
}

std::uint32_t ModelWriter::addValue(memory::string name,
                                    memory::optional<TensorDataType> dtype,
                                    memory::optional<graph::DimList> shape) {
  return push(Entry{std::move(name), ValueEntry{dtype, std::move(shape)}});
}

std::uint32_t ModelWriter::addConstant(memory::string name,
                                       const Tensor &value) {
  return push(Entry{std::move(name), ConstantEntry{value.clone()}});
}

std::uint32_t ModelWriter::addOperator(
    memory::string name, Operator op,
    memory::vector<memory::optional<std::uint32_t>> inputs,
    memory::vector<std::uint32_t> outputs) {
  return push(Entry{std::move(name),
                    OperatorEntry{std::move(op), std::move(inputs),
                                  std::move(outputs)}});
}

void ModelWriter::addOutput(std::uint32_t value) {
  m_outputs.push_back(value);
}

void ModelWriter::setMetadata(memory::string producer,
                              memory::string producerVersion,
                              memory::string description) {
  m_producer = std::move(producer);
  m_producerVersion = std::move(producerVersion);
  m_description = std::move(description);
}

static flatbuffers::Offset<ConstantNode>
serialize_constant(flatbuffers::FlatBufferBuilder &fbb, const Tensor &t) {
  memory::vector<uint32_t> dims(t.shape().begin(), t.shape().end());
  auto shape = fbb.CreateVector(dims);
  ConstantData type = ConstantData_NONE;
  flatbuffers::Offset<void> data = 0;
  switch (t.dtype()) {
  case TensorDataType::Float32: {
    auto v = t.values<float>();
    type = ConstantData_FloatData;
    data = CreateFloatData(fbb, fbb.CreateVector(v.data(), v.size())).Union();
    break;
  }
  case TensorDataType::Int32: {
    auto v = t.values<std::int32_t>();
    type = ConstantData_Int32Data;
    data = CreateInt32Data(fbb, fbb.CreateVector(v.data(), v.size())).Union();
    break;
  }
  case TensorDataType::Int8: {
    auto v = t.values<std::int8_t>();
    type = ConstantData_Int8Data;
    data = CreateInt8Data(fbb, fbb.CreateVector(v.data(), v.size())).Union();
    break;
  }
  case TensorDataType::Uint8: {
    auto v = t.values<std::uint8_t>();
    type = ConstantData_Uint8Data;
    data = CreateUint8Data(fbb, fbb.CreateVector(v.data(), v.size())).Union();
    break;
  }
  }
  return CreateConstantNode(fbb, shape, type, data);
}

static flatbuffers::Offset<ValueNode>
serialize_value(flatbuffers::FlatBufferBuilder &fbb,
                const memory::optional<TensorDataType> &dtype,
                const memory::optional<graph::DimList> &shape) {
  flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<Dim>>> dims = 0;
  if (shape.has_value()) {
    memory::vector<flatbuffers::Offset<Dim>> list;
    list.reserve(shape->size());
    for (const graph::Dim &d : *shape) {
      flatbuffers::Offset<flatbuffers::String> name = 0;
      if (!d.name.empty()) {
        name = fbb.CreateString(d.name);
      }
      list.push_back(CreateDim(fbb, d.size, name));
    }
    dims = fbb.CreateVector(list);
  }
  ValueNodeBuilder builder(fbb);
  if (dtype.has_value()) {
    builder.add_dtype(serialize_dtype(*dtype));
  }
  builder.add_shape(dims);
  return builder.Finish();
}

memory::vector<std::uint8_t> ModelWriter::payload() const {
  flatbuffers::FlatBufferBuilder fbb(1024);

  memory::vector<flatbuffers::Offset<Node>> nodes;
  nodes.reserve(m_nodes.size());
  for (const Entry &entry : m_nodes) {
    NodeKind kind = NodeKind_NONE;
    flatbuffers::Offset<void> data = 0;
    if (const auto *v = std::get_if<ValueEntry>(&entry.data)) {
      kind = NodeKind_ValueNode;
      data = serialize_value(fbb, v->dtype, v->shape).Union();
    } else if (const auto *c = std::get_if<ConstantEntry>(&entry.data)) {
      kind = NodeKind_ConstantNode;
      data = serialize_constant(fbb, c->value).Union();
    } else {
      const auto &o = std::get<OperatorEntry>(entry.data);
      SerializedAttributes attrs = serialize_attributes(fbb, o.op);
      memory::vector<std::int32_t> inputs;
      inputs.reserve(o.inputs.size());
      for (const auto &in : o.inputs) {
        inputs.push_back(in.has_value() ? static_cast<std::int32_t>(*in) : -1);
      }
      auto inputsOffset = fbb.CreateVector(inputs);
      auto outputsOffset = fbb.CreateVector(o.outputs);
      kind = NodeKind_OperatorNode;
      data = CreateOperatorNode(fbb, serialize_op_kind(o.op.kind()),
                                attrs.type, attrs.table, inputsOffset,
                                outputsOffset)
                 .Union();
    }
    auto name = fbb.CreateString(entry.name);
    nodes.push_back(CreateNode(fbb, name, kind, data));
  }

  auto nodesOffset = fbb.CreateVector(nodes);
  auto inputs = fbb.CreateVector(m_inputs);
  auto outputs = fbb.CreateVector(m_outputs);
  auto graph = CreateGraph(fbb, nodesOffset, inputs, outputs);

  auto producer = fbb.CreateString(m_producer);
  auto producerVersion = fbb.CreateString(m_producerVersion);
  auto description = fbb.CreateString(m_description);
  auto metadata =
      CreateMetadata(fbb, producer, producerVersion, description);

  auto model = CreateModel(fbb, FormatVersion, graph, metadata);
  FinishModelBuffer(fbb, model);

  const std::uint8_t *begin = fbb.GetBufferPointer();
  return memory::vector<std::uint8_t>(begin, begin + fbb.GetSize());
}

memory::vector<std::byte> ModelWriter::finish(std::uint32_t version) const {
  memory::vector<std::uint8_t> bytes = payload();
  return write_container(bytes, version);
}

} // namespace infera::ifx
