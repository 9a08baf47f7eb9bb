#pragma once

#include "infera/common/ops/Operator.hpp"
#include "infera/kernels/WorkerPool.hpp"
#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/span.hpp"
#include "infera/memory/container/vector.hpp"
#include "infera/tensor/Tensor.hpp"

#include <array>
#include <cstddef>

namespace infera::kernels {

// What is known about an operator input before execution. `value` is set
// when the data itself is known (constants, or every input at run time).
// An absent optional input has `present == false`.
struct ValueInfo {
  bool present = true;
  TensorInfo info;
  const Tensor *value = nullptr;

  static ValueInfo of(const Tensor &t) { return ValueInfo{true, t.info(), &t}; }
  static ValueInfo absent() { return ValueInfo{false, {}, nullptr}; }
};

struct KernelContext {
  // nullptr for absent optional inputs.
  memory::span<const Tensor *const> inputs;
  // Allocated from the inferred TensorInfos, to be filled by the kernel.
  memory::span<Tensor> outputs;
  WorkerPool &pool;

  bool has(std::size_t i) const {
    return i < inputs.size() && inputs[i] != nullptr;
  }
  const Tensor &input(std::size_t i) const { return *inputs[i]; }
  Tensor &output(std::size_t i) const { return outputs[i]; }
};

// Returns the output infos, or nullopt when they depend on input data that
// is not known yet. Throws ShapeError.
using InferShapeFn = memory::optional<memory::vector<TensorInfo>> (*)(
    const Operator &op, memory::span<const ValueInfo> inputs);

// Throws ShapeError or KernelError. Never mutates inputs.
using ExecuteFn = void (*)(const Operator &op, KernelContext &ctx);

struct Kernel {
  std::size_t minInputs = 0;
  // SIZE_MAX for variadic operators.
  std::size_t maxInputs = 0;
  InferShapeFn inferShape = nullptr;
  ExecuteFn execute = nullptr;
};

using KernelTable = std::array<Kernel, OpKindCount>;

const KernelTable &kernel_table();

inline const Kernel &kernel_for(OpKind kind) {
  return kernel_table()[static_cast<std::size_t>(kind)];
}

// Checks the input count against the kernel, then infers output shapes.
memory::optional<memory::vector<TensorInfo>>
infer(const Operator &op, memory::span<const ValueInfo> inputs);

// Infers, allocates and executes a single operator on concrete inputs.
memory::vector<Tensor> run(const Operator &op,
                           memory::span<const Tensor *const> inputs,
                           WorkerPool &pool);

} // namespace infera::kernels
