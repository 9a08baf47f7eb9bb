#include "infera/kernels/Kernel.hpp"
#include "infera/kernels/ops.hpp"

#include <limits>
#include <string>

namespace infera::kernels {

namespace {

constexpr std::size_t Variadic = std::numeric_limits<std::size_t>::max();

KernelTable build_table() {
  using enum OpKind;
  KernelTable table{};
  auto set = [&](OpKind kind, std::size_t minIn, std::size_t maxIn,
                 InferShapeFn infer, ExecuteFn execute) {
    table[static_cast<std::size_t>(kind)] = Kernel{minIn, maxIn, infer, execute};
  };

  for (OpKind k : {Add, Sub, Mul, Div, Pow, Mod, Equal, Less, LessOrEqual,
                   Greater, GreaterOrEqual, And, Or, Xor}) {
    set(k, 2, 2, ops::binary_infer, ops::binary_execute);
  }
  set(Max, 1, Variadic, ops::variadic_infer, ops::variadic_execute);
  set(Min, 1, Variadic, ops::variadic_infer, ops::variadic_execute);
  set(Where, 3, 3, ops::where_infer, ops::where_execute);

  for (OpKind k : {Relu, LeakyRelu, Sigmoid, Tanh, Sqrt, Exp, Log, Erf, Sin,
                   Cos, Abs, Neg, Reciprocal, Floor, Ceil, Not, Identity}) {
    set(k, 1, 1, ops::unary_infer, ops::unary_execute);
  }
  set(Clip, 1, 3, ops::clip_infer, ops::clip_execute);

  set(Conv, 2, 3, ops::conv_infer, ops::conv_execute);
  set(ConvTranspose, 2, 3, ops::conv_transpose_infer,
      ops::conv_transpose_execute);
  set(MaxPool, 1, 1, ops::pool_infer, ops::max_pool_execute);
  set(AveragePool, 1, 1, ops::pool_infer, ops::average_pool_execute);
  set(GlobalAveragePool, 1, 1, ops::global_average_pool_infer,
      ops::global_average_pool_execute);

  set(BatchNormalization, 5, 5, ops::batch_norm_infer,
      ops::batch_norm_execute);
  set(Softmax, 1, 1, ops::softmax_infer, ops::softmax_execute);
  set(LogSoftmax, 1, 1, ops::softmax_infer, ops::softmax_execute);

  for (OpKind k : {ReduceMean, ReduceSum, ReduceMax, ReduceMin}) {
    set(k, 1, 1, ops::reduce_infer, ops::reduce_execute);
  }

  set(MatMul, 2, 2, ops::matmul_infer, ops::matmul_execute);
  set(Gemm, 2, 3, ops::gemm_infer, ops::gemm_execute);

  set(Reshape, 2, 2, ops::reshape_infer, ops::copy_execute);
  set(Shape, 1, 1, ops::shape_infer, ops::shape_execute);
  set(Flatten, 1, 1, ops::flatten_infer, ops::copy_execute);
  set(Squeeze, 1, 1, ops::squeeze_infer, ops::copy_execute);
  set(Unsqueeze, 1, 1, ops::unsqueeze_infer, ops::copy_execute);
  set(Transpose, 1, 1, ops::transpose_infer, ops::transpose_execute);
  set(Expand, 2, 2, ops::expand_infer, ops::expand_execute);
  set(Slice, 3, 5, ops::slice_infer, ops::slice_execute);
  set(Pad, 2, 3, ops::pad_infer, ops::pad_execute);
  set(Cast, 1, 1, ops::cast_infer, ops::cast_execute);
  set(ConstantOfShape, 1, 1, ops::constant_of_shape_infer,
      ops::constant_of_shape_execute);
  set(Range, 3, 3, ops::range_infer, ops::range_execute);
  set(Resize, 1, 4, ops::resize_infer, ops::resize_execute);

  set(Concat, 1, Variadic, ops::concat_infer, ops::concat_execute);
  set(Split, 1, 2, ops::split_infer, ops::split_execute);
  set(Gather, 2, 2, ops::gather_infer, ops::gather_execute);

  set(QuantizeLinear, 2, 3, ops::quantize_infer, ops::quantize_execute);
  set(DequantizeLinear, 2, 3, ops::dequantize_infer, ops::dequantize_execute);

  for (std::size_t i = 0; i < table.size(); ++i) {
    if (table[i].inferShape == nullptr || table[i].execute == nullptr) {
      diag::invalid_state(fmt::format("no kernel registered for {}",
                                      static_cast<OpKind>(i)));
    }
  }
  return table;
}

} // namespace

const KernelTable &kernel_table() {
  static const KernelTable table = build_table();
  return table;
}

memory::optional<memory::vector<TensorInfo>>
infer(const Operator &op, memory::span<const ValueInfo> inputs) {
  const Kernel &kernel = kernel_for(op.kind());
  if (inputs.size() < kernel.minInputs || inputs.size() > kernel.maxInputs) {
    throw ShapeError(op.kind(),
                     fmt::format("got {} inputs, expected {} to {}",
                                 inputs.size(), kernel.minInputs,
                                 kernel.maxInputs == Variadic
                                     ? std::string("any")
                                     : std::to_string(kernel.maxInputs)));
  }
  return kernel.inferShape(op, inputs);
}

memory::vector<Tensor> run(const Operator &op,
                           memory::span<const Tensor *const> inputs,
                           WorkerPool &pool) {
  memory::vector<ValueInfo> infos;
  infos.reserve(inputs.size());
  for (const Tensor *t : inputs) {
    infos.push_back(t != nullptr ? ValueInfo::of(*t) : ValueInfo::absent());
  }
  auto outInfos = infer(op, infos);
  if (!outInfos) {
    diag::invalid_state(
        fmt::format("{} could not infer its outputs from concrete inputs",
                    op.kind()));
  }
  memory::vector<Tensor> outputs;
  outputs.reserve(outInfos->size());
  for (const TensorInfo &info : *outInfos) {
    outputs.push_back(Tensor::empty(info.dtype, info.shape));
  }
  KernelContext ctx{inputs, outputs, pool};
  kernel_for(op.kind()).execute(op, ctx);
  return outputs;
}

} // namespace infera::kernels
