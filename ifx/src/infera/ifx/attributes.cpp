#include "infera/ifx/attributes.hpp"
#include "infera/diag/unreachable.hpp"
#include "infera/ifx/FormatError.hpp"

#include <fmt/format.h>

namespace infera::ifx {

DataType serialize_dtype(TensorDataType dtype) {
  switch (dtype) {
  case TensorDataType::Float32:
    return DataType_Float32;
  case TensorDataType::Int32:
    return DataType_Int32;
  case TensorDataType::Int8:
    return DataType_Int8;
  case TensorDataType::Uint8:
    return DataType_Uint8;
  }
  diag::unreachable();
}

TensorDataType deserialize_dtype(DataType dtype) {
  switch (dtype) {
  case DataType_Float32:
    return TensorDataType::Float32;
  case DataType_Int32:
    return TensorDataType::Int32;
  case DataType_Int8:
    return TensorDataType::Int8;
  case DataType_Uint8:
    return TensorDataType::Uint8;
  }
  throw FormatError(
      fmt::format("unknown data type {}", static_cast<int>(dtype)));
}

static_assert(static_cast<std::size_t>(OperatorType_MAX) + 1 == OpKindCount,
              "OperatorType and OpKind are out of sync");

memory::optional<OpKind> deserialize_op_kind(OperatorType type) {
  auto raw = static_cast<std::size_t>(type);
  if (raw > static_cast<std::size_t>(OperatorType_MAX)) {
    return memory::nullopt;
  }
  return static_cast<OpKind>(raw);
}

OperatorType serialize_op_kind(OpKind kind) {
  return static_cast<OperatorType>(kind);
}

// Two-element attribute lists are stored [y, x].
static flatbuffers::Offset<flatbuffers::Vector<uint32_t>>
serialize_uvec2(flatbuffers::FlatBufferBuilder &fbb, memory::uvec2 v) {
  uint32_t yx[2] = {v.y, v.x};
  return fbb.CreateVector<uint32_t>(yx, 2);
}

static flatbuffers::Offset<flatbuffers::Vector<uint32_t>>
serialize_pads(flatbuffers::FlatBufferBuilder &fbb, const Padding2d &pads) {
  return fbb.CreateVector<uint32_t>(pads.data(), pads.size());
}

static memory::uvec2 deserialize_uvec2(const flatbuffers::Vector<uint32_t> *v,
                                       memory::uvec2 fallback,
                                       const char *what) {
  if (v == nullptr) {
    return fallback;
  }
  if (v->size() != 2) {
    throw FormatError(
        fmt::format("{} must have 2 entries, got {}", what, v->size()));
  }
  return memory::uvec2{v->Get(1), v->Get(0)};
}

static Padding2d deserialize_pads(const flatbuffers::Vector<uint32_t> *v) {
  Padding2d pads{0, 0, 0, 0};
  if (v == nullptr) {
    return pads;
  }
  if (v->size() != 4) {
    throw FormatError(
        fmt::format("pads must have 4 entries, got {}", v->size()));
  }
  for (uint32_t i = 0; i < 4; ++i) {
    pads[i] = v->Get(i);
  }
  return pads;
}

static infera::PaddingMode deserialize_padding(PaddingMode mode) {
  switch (mode) {
  case PaddingMode_Fixed:
    return infera::PaddingMode::Fixed;
  case PaddingMode_Same:
    return infera::PaddingMode::Same;
  }
  throw FormatError(
      fmt::format("unknown padding mode {}", static_cast<int>(mode)));
}

static PaddingMode serialize_padding(infera::PaddingMode mode) {
  return mode == infera::PaddingMode::Same ? PaddingMode_Same
                                           : PaddingMode_Fixed;
}

template <typename T>
static flatbuffers::Offset<flatbuffers::Vector<T>>
serialize_list(flatbuffers::FlatBufferBuilder &fbb,
               const memory::vector<T> &v) {
  if (v.empty()) {
    return 0;
  }
  return fbb.CreateVector<T>(v.data(), v.size());
}

template <typename T>
static memory::vector<T> deserialize_list(const flatbuffers::Vector<T> *v) {
  memory::vector<T> out;
  if (v != nullptr) {
    out.assign(v->begin(), v->end());
  }
  return out;
}

SerializedAttributes serialize_attributes(flatbuffers::FlatBufferBuilder &fbb,
                                          const Operator &op) {
  switch (op.attrKind()) {
  case AttrKind::None:
    return {};
  case AttrKind::Conv: {
    const auto &c = op.conv();
    auto pads = serialize_pads(fbb, c.pads);
    auto strides = serialize_uvec2(fbb, c.strides);
    auto dilations = serialize_uvec2(fbb, c.dilations);
    return {Attributes_ConvAttrs,
            CreateConvAttrs(fbb, c.groups, serialize_padding(c.padding), pads,
                            strides, dilations)
                .Union()};
  }
  case AttrKind::ConvTranspose: {
    const auto &c = op.convTranspose();
    auto strides = serialize_uvec2(fbb, c.strides);
    auto pads = serialize_pads(fbb, c.pads);
    return {Attributes_ConvTransposeAttrs,
            CreateConvTransposeAttrs(fbb, strides, pads).Union()};
  }
  case AttrKind::Pool: {
    const auto &p = op.pool();
    auto kernel = serialize_uvec2(fbb, p.kernelSize);
    auto pads = serialize_pads(fbb, p.pads);
    auto strides = serialize_uvec2(fbb, p.strides);
    return {Attributes_PoolAttrs,
            CreatePoolAttrs(fbb, kernel, serialize_padding(p.padding), pads,
                            strides, p.countIncludePad)
                .Union()};
  }
  case AttrKind::LeakyRelu:
    return {Attributes_LeakyReluAttrs,
            CreateLeakyReluAttrs(fbb, op.leakyRelu().alpha).Union()};
  case AttrKind::Clip:
    return {Attributes_ClipAttrs,
            CreateClipAttrs(fbb, op.clip().min, op.clip().max).Union()};
  case AttrKind::Axis:
    return {Attributes_AxisAttrs,
            CreateAxisAttrs(fbb, op.axis().axis).Union()};
  case AttrKind::Axes: {
    auto axes = serialize_list(fbb, op.axes().axes);
    return {Attributes_AxesAttrs,
            CreateAxesAttrs(fbb, axes, op.axes().keepDims).Union()};
  }
  case AttrKind::Split: {
    auto split = serialize_list(fbb, op.split().split);
    return {Attributes_SplitAttrs,
            CreateSplitAttrs(fbb, op.split().axis, split).Union()};
  }
  case AttrKind::Transpose: {
    auto perm = serialize_list(fbb, op.transpose().perm);
    return {Attributes_TransposeAttrs,
            CreateTransposeAttrs(fbb, perm).Union()};
  }
  case AttrKind::BatchNorm:
    return {Attributes_BatchNormAttrs,
            CreateBatchNormAttrs(fbb, op.batchNorm().epsilon).Union()};
  case AttrKind::Cast:
    return {Attributes_CastAttrs,
            CreateCastAttrs(fbb, serialize_dtype(op.cast().to)).Union()};
  case AttrKind::ConstantOfShape: {
    const auto &c = op.constantOfShape();
    return {Attributes_ConstantOfShapeAttrs,
            CreateConstantOfShapeAttrs(fbb, serialize_dtype(c.dtype),
                                       c.floatValue, c.intValue)
                .Union()};
  }
  case AttrKind::Gemm: {
    const auto &g = op.gemm();
    return {Attributes_GemmAttrs,
            CreateGemmAttrs(fbb, g.alpha, g.beta, g.transposeA, g.transposeB)
                .Union()};
  }
  case AttrKind::Mod:
    return {Attributes_ModAttrs, CreateModAttrs(fbb, op.mod().fmod).Union()};
  case AttrKind::Resize: {
    const auto &r = op.resize();
    return {Attributes_ResizeAttrs,
            CreateResizeAttrs(fbb, static_cast<ResizeMode>(r.mode),
                              static_cast<CoordTransformMode>(r.coordMode),
                              static_cast<NearestMode>(r.nearestMode))
                .Union()};
  }
  }
  diag::unreachable();
}

template <typename E> static bool in_range(E value, E max) {
  return static_cast<int>(value) >= 0 &&
         static_cast<int>(value) <= static_cast<int>(max);
}

template <typename T>
static const T *expect(const OperatorNode &node, Attributes type, OpKind kind) {
  if (node.attrs_type() == Attributes_NONE) {
    return nullptr;
  }
  if (node.attrs_type() != type) {
    throw FormatError(fmt::format("operator {} carries {} attributes", kind,
                                  EnumNameAttributes(node.attrs_type())));
  }
  return static_cast<const T *>(node.attrs());
}

Operator deserialize_operator(OpKind kind, const OperatorNode &node,
                              std::uint32_t numOutputs) {
  switch (expected_attrs(kind)) {
  case AttrKind::None:
    if (node.attrs_type() != Attributes_NONE) {
      throw FormatError(fmt::format("operator {} takes no attributes, got {}",
                                    kind,
                                    EnumNameAttributes(node.attrs_type())));
    }
    return Operator(kind);
  case AttrKind::Conv: {
    infera::ConvAttrs out;
    if (auto a = expect<ConvAttrs>(node, Attributes_ConvAttrs, kind)) {
      out.groups = a->groups();
      out.padding = deserialize_padding(a->padding());
      out.pads = deserialize_pads(a->pads());
      out.strides = deserialize_uvec2(a->strides(), out.strides, "strides");
      out.dilations =
          deserialize_uvec2(a->dilations(), out.dilations, "dilations");
    }
    if (out.groups == 0) {
      throw FormatError("Conv groups must be positive");
    }
    return Operator(kind, out);
  }
  case AttrKind::ConvTranspose: {
    infera::ConvTransposeAttrs out;
    if (auto a = expect<ConvTransposeAttrs>(
            node, Attributes_ConvTransposeAttrs, kind)) {
      out.strides = deserialize_uvec2(a->strides(), out.strides, "strides");
      out.pads = deserialize_pads(a->pads());
    }
    return Operator(kind, out);
  }
  case AttrKind::Pool: {
    infera::PoolAttrs out;
    if (auto a = expect<PoolAttrs>(node, Attributes_PoolAttrs, kind)) {
      out.kernelSize =
          deserialize_uvec2(a->kernel_size(), out.kernelSize, "kernel_size");
      out.padding = deserialize_padding(a->padding());
      out.pads = deserialize_pads(a->pads());
      out.strides = deserialize_uvec2(a->strides(), out.strides, "strides");
      out.countIncludePad = a->count_include_pad();
    }
    return Operator(kind, out);
  }
  case AttrKind::LeakyRelu: {
    infera::LeakyReluAttrs out;
    if (auto a =
            expect<LeakyReluAttrs>(node, Attributes_LeakyReluAttrs, kind)) {
      out.alpha = a->alpha();
    }
    return Operator(kind, out);
  }
  case AttrKind::Clip: {
    infera::ClipAttrs out;
    if (auto a = expect<ClipAttrs>(node, Attributes_ClipAttrs, kind)) {
      out.min = a->min();
      out.max = a->max();
    }
    return Operator(kind, out);
  }
  case AttrKind::Axis: {
    infera::AxisAttrs out;
    if (auto a = expect<AxisAttrs>(node, Attributes_AxisAttrs, kind)) {
      out.axis = a->axis();
    }
    return Operator(kind, out);
  }
  case AttrKind::Axes: {
    infera::AxesAttrs out;
    if (auto a = expect<AxesAttrs>(node, Attributes_AxesAttrs, kind)) {
      out.axes = deserialize_list(a->axes());
      out.keepDims = a->keep_dims();
    }
    return Operator(kind, out);
  }
  case AttrKind::Split: {
    infera::SplitAttrs out;
    if (auto a = expect<SplitAttrs>(node, Attributes_SplitAttrs, kind)) {
      out.axis = a->axis();
      out.split = deserialize_list(a->split());
    }
    out.numOutputs = numOutputs;
    return Operator(kind, out);
  }
  case AttrKind::Transpose: {
    infera::TransposeAttrs out;
    if (auto a =
            expect<TransposeAttrs>(node, Attributes_TransposeAttrs, kind)) {
      out.perm = deserialize_list(a->perm());
    }
    return Operator(kind, out);
  }
  case AttrKind::BatchNorm: {
    infera::BatchNormAttrs out;
    if (auto a =
            expect<BatchNormAttrs>(node, Attributes_BatchNormAttrs, kind)) {
      out.epsilon = a->epsilon();
    }
    return Operator(kind, out);
  }
  case AttrKind::Cast: {
    auto a = expect<CastAttrs>(node, Attributes_CastAttrs, kind);
    if (a == nullptr) {
      throw FormatError("Cast requires a target type");
    }
    return Operator(kind, infera::CastAttrs{deserialize_dtype(a->to())});
  }
  case AttrKind::ConstantOfShape: {
    infera::ConstantOfShapeAttrs out;
    if (auto a = expect<ConstantOfShapeAttrs>(
            node, Attributes_ConstantOfShapeAttrs, kind)) {
      out.dtype = deserialize_dtype(a->dtype());
      out.floatValue = a->float_value();
      out.intValue = a->int_value();
    }
    return Operator(kind, out);
  }
  case AttrKind::Gemm: {
    infera::GemmAttrs out;
    if (auto a = expect<GemmAttrs>(node, Attributes_GemmAttrs, kind)) {
      out.alpha = a->alpha();
      out.beta = a->beta();
      out.transposeA = a->transpose_a();
      out.transposeB = a->transpose_b();
    }
    return Operator(kind, out);
  }
  case AttrKind::Mod: {
    infera::ModAttrs out;
    if (auto a = expect<ModAttrs>(node, Attributes_ModAttrs, kind)) {
      out.fmod = a->fmod();
    }
    return Operator(kind, out);
  }
  case AttrKind::Resize: {
    infera::ResizeAttrs out;
    if (auto a = expect<ResizeAttrs>(node, Attributes_ResizeAttrs, kind)) {
      if (!in_range(a->mode(), ResizeMode_MAX) ||
          !in_range(a->coord_mode(), CoordTransformMode_MAX) ||
          !in_range(a->nearest_mode(), NearestMode_MAX)) {
        throw FormatError("Resize attribute out of range");
      }
      out.mode = static_cast<infera::ResizeMode>(a->mode());
      out.coordMode = static_cast<infera::CoordTransformMode>(a->coord_mode());
      out.nearestMode = static_cast<infera::NearestMode>(a->nearest_mode());
    }
    return Operator(kind, out);
  }
  }
  diag::unreachable();
}

} // namespace infera::ifx
