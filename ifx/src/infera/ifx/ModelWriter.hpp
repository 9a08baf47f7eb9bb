#pragma once

#include "infera/common/ops/Operator.hpp"
#include "infera/graph/Value.hpp"
#include "infera/ifx/container.hpp"
#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/string.hpp"
#include "infera/memory/container/vector.hpp"
#include "infera/tensor/Tensor.hpp"

#include <variant>

namespace infera::ifx {

// Assembles an .ifx model. add* functions return the node index that
// operators use to refer to the value or constant.
class ModelWriter {
public:
  std::uint32_t addInput(memory::string name, TensorDataType dtype,
                         graph::DimList shape);
  std::uint32_t addValue(memory::string name,
                         memory::optional<TensorDataType> dtype = {},
                         memory::optional<graph::DimList> shape = {});
  std::uint32_t addConstant(memory::string name, const Tensor &value);
  // Absent optional inputs are nullopt.
  std::uint32_t
  addOperator(memory::string name, Operator op,
              memory::vector<memory::optional<std::uint32_t>> inputs,
              memory::vector<std::uint32_t> outputs);
  void addOutput(std::uint32_t value);

  void setMetadata(memory::string producer, memory::string producerVersion,
                   memory::string description = {});

  // Flatbuffer payload only, without the container header.
  memory::vector<std::uint8_t> payload() const;

  memory::vector<std::byte> finish(std::uint32_t version = FormatVersion) const;

private:
  struct ValueEntry {
    memory::optional<TensorDataType> dtype;
    memory::optional<graph::DimList> shape;
  };
  struct ConstantEntry {
    Tensor value;
  };
  struct OperatorEntry {
    Operator op;
    memory::vector<memory::optional<std::uint32_t>> inputs;
    memory::vector<std::uint32_t> outputs;
  };
  struct Entry {
    memory::string name;
    std::variant<ValueEntry, ConstantEntry, OperatorEntry> data;
  };

  std::uint32_t push(Entry entry);

  memory::vector<Entry> m_nodes;
  memory::vector<std::uint32_t> m_inputs;
  memory::vector<std::uint32_t> m_outputs;
  memory::string m_producer = "infera";
  memory::string m_producerVersion;
  memory::string m_description;
};

} // namespace infera::ifx
