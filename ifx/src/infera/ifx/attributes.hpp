#pragma once

#include "infera/common/TensorDataType.hpp"
#include "infera/common/ops/OpKind.hpp"
#include "infera/common/ops/Operator.hpp"
#include "infera/memory/container/optional.hpp"

#include <flatbuffers/flatbuffer_builder.h>
#include <ifx.h>

namespace infera::ifx {

DataType serialize_dtype(TensorDataType dtype);
TensorDataType deserialize_dtype(DataType dtype);

// nullopt for operator types this runtime does not know.
memory::optional<OpKind> deserialize_op_kind(OperatorType type);
OperatorType serialize_op_kind(OpKind kind);

struct SerializedAttributes {
  Attributes type = Attributes_NONE;
  flatbuffers::Offset<void> table = 0;
};

SerializedAttributes serialize_attributes(flatbuffers::FlatBufferBuilder &fbb,
                                          const Operator &op);

// Throws FormatError if the attribute table does not belong to the operator.
// numOutputs is forwarded to Split.
Operator deserialize_operator(OpKind kind, const OperatorNode &node,
                              std::uint32_t numOutputs);

} // namespace infera::ifx
