#pragma once

#include "infera/common/ops/Operator.hpp"
#include "infera/graph/ValueId.hpp"
#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/string.hpp"
#include "infera/memory/container/vector.hpp"

namespace infera::graph {

struct OperatorNode {
  memory::string name;
  Operator op;
  // Empty slots are absent optional inputs.
  memory::vector<memory::optional<ValueId>> inputs;
  memory::vector<ValueId> outputs;
};

} // namespace infera::graph
