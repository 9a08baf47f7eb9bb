#pragma once

#include "infera/kernels/details/helpers.hpp"

// Shape inference and execution entry points of every operator family.
namespace infera::kernels::ops {

using details::InferResult;

// elementwise/binary.cpp
InferResult binary_infer(const Operator &op, memory::span<const ValueInfo> in);
void binary_execute(const Operator &op, KernelContext &ctx);
InferResult variadic_infer(const Operator &op,
                           memory::span<const ValueInfo> in);
void variadic_execute(const Operator &op, KernelContext &ctx);
InferResult where_infer(const Operator &op, memory::span<const ValueInfo> in);
void where_execute(const Operator &op, KernelContext &ctx);

// elementwise/unary.cpp
InferResult unary_infer(const Operator &op, memory::span<const ValueInfo> in);
void unary_execute(const Operator &op, KernelContext &ctx);
InferResult clip_infer(const Operator &op, memory::span<const ValueInfo> in);
void clip_execute(const Operator &op, KernelContext &ctx);

// conv/conv.cpp
InferResult conv_infer(const Operator &op, memory::span<const ValueInfo> in);
void conv_execute(const Operator &op, KernelContext &ctx);
InferResult conv_transpose_infer(const Operator &op,
                                 memory::span<const ValueInfo> in);
void conv_transpose_execute(const Operator &op, KernelContext &ctx);

// pool/pool.cpp
InferResult pool_infer(const Operator &op, memory::span<const ValueInfo> in);
void max_pool_execute(const Operator &op, KernelContext &ctx);
void average_pool_execute(const Operator &op, KernelContext &ctx);
InferResult global_average_pool_infer(const Operator &op,
                                      memory::span<const ValueInfo> in);
void global_average_pool_execute(const Operator &op, KernelContext &ctx);

// norm/batch_norm.cpp, norm/softmax.cpp
InferResult batch_norm_infer(const Operator &op,
                             memory::span<const ValueInfo> in);
void batch_norm_execute(const Operator &op, KernelContext &ctx);
InferResult softmax_infer(const Operator &op, memory::span<const ValueInfo> in);
void softmax_execute(const Operator &op, KernelContext &ctx);

// reduce/reduce.cpp
InferResult reduce_infer(const Operator &op, memory::span<const ValueInfo> in);
void reduce_execute(const Operator &op, KernelContext &ctx);

// linalg/matmul.cpp
InferResult matmul_infer(const Operator &op, memory::span<const ValueInfo> in);
void matmul_execute(const Operator &op, KernelContext &ctx);
InferResult gemm_infer(const Operator &op, memory::span<const ValueInfo> in);
void gemm_execute(const Operator &op, KernelContext &ctx);

// shape/reshape.cpp
InferResult reshape_infer(const Operator &op, memory::span<const ValueInfo> in);
InferResult flatten_infer(const Operator &op, memory::span<const ValueInfo> in);
InferResult squeeze_infer(const Operator &op, memory::span<const ValueInfo> in);
InferResult unsqueeze_infer(const Operator &op,
                            memory::span<const ValueInfo> in);
// Reshape, Flatten, Squeeze, Unsqueeze and Identity only copy the data.
void copy_execute(const Operator &op, KernelContext &ctx);
InferResult shape_infer(const Operator &op, memory::span<const ValueInfo> in);
void shape_execute(const Operator &op, KernelContext &ctx);

// shape/transpose.cpp
InferResult transpose_infer(const Operator &op,
                            memory::span<const ValueInfo> in);
void transpose_execute(const Operator &op, KernelContext &ctx);
InferResult expand_infer(const Operator &op, memory::span<const ValueInfo> in);
void expand_execute(const Operator &op, KernelContext &ctx);

// shape/slice.cpp
InferResult slice_infer(const Operator &op, memory::span<const ValueInfo> in);
void slice_execute(const Operator &op, KernelContext &ctx);
InferResult pad_infer(const Operator &op, memory::span<const ValueInfo> in);
void pad_execute(const Operator &op, KernelContext &ctx);

// shape/cast.cpp
InferResult cast_infer(const Operator &op, memory::span<const ValueInfo> in);
void cast_execute(const Operator &op, KernelContext &ctx);

// shape/generate.cpp
InferResult constant_of_shape_infer(const Operator &op,
                                    memory::span<const ValueInfo> in);
void constant_of_shape_execute(const Operator &op, KernelContext &ctx);
InferResult range_infer(const Operator &op, memory::span<const ValueInfo> in);
void range_execute(const Operator &op, KernelContext &ctx);

// shape/resize.cpp
InferResult resize_infer(const Operator &op, memory::span<const ValueInfo> in);
void resize_execute(const Operator &op, KernelContext &ctx);

// combine/concat.cpp, combine/split.cpp, combine/gather.cpp
InferResult concat_infer(const Operator &op, memory::span<const ValueInfo> in);
void concat_execute(const Operator &op, KernelContext &ctx);
InferResult split_infer(const Operator &op, memory::span<const ValueInfo> in);
void split_execute(const Operator &op, KernelContext &ctx);
InferResult gather_infer(const Operator &op, memory::span<const ValueInfo> in);
void gather_execute(const Operator &op, KernelContext &ctx);

// quant/quant.cpp
InferResult quantize_infer(const Operator &op,
                           memory::span<const ValueInfo> in);
void quantize_execute(const Operator &op, KernelContext &ctx);
InferResult dequantize_infer(const Operator &op,
                             memory::span<const ValueInfo> in);
void dequantize_execute(const Operator &op, KernelContext &ctx);

} // namespace infera::kernels::ops
