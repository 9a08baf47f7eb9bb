#pragma once

#include "infera/common/ops/Attributes.hpp"
#include "infera/common/ops/ConvAttrs.hpp"
#include "infera/common/ops/OpKind.hpp"
#include "infera/common/ops/PoolAttrs.hpp"
#include "infera/common/ops/ResizeAttrs.hpp"
#include "infera/diag/invalid_state.hpp"

#include <fmt/format.h>
#include <stdexcept>
#include <utility>
#include <variant>

namespace infera {

enum class AttrKind {
  None,
  Conv,
  ConvTranspose,
  Pool,
  LeakyRelu,
  Clip,
  Axis,
  Axes,
  Split,
  Transpose,
  BatchNorm,
  Cast,
  ConstantOfShape,
  Gemm,
  Mod,
  Resize,
};

inline AttrKind expected_attrs(OpKind kind) {
  using enum OpKind;
  switch (kind) {
  case Conv:
    return AttrKind::Conv;
  case ConvTranspose:
    return AttrKind::ConvTranspose;
  case MaxPool:
  case AveragePool:
    return AttrKind::Pool;
  case LeakyRelu:
    return AttrKind::LeakyRelu;
  case Clip:
    return AttrKind::Clip;
  case Concat:
  case Softmax:
  case LogSoftmax:
  case Gather:
  case Flatten:
    return AttrKind::Axis;
  case ReduceMean:
  case ReduceSum:
  case ReduceMax:
  case ReduceMin:
  case Squeeze:
  case Unsqueeze:
    return AttrKind::Axes;
  case Split:
    return AttrKind::Split;
  case Transpose:
    return AttrKind::Transpose;
  case BatchNormalization:
    return AttrKind::BatchNorm;
  case Cast:
    return AttrKind::Cast;
  case ConstantOfShape:
    return AttrKind::ConstantOfShape;
  case Gemm:
    return AttrKind::Gemm;
  case Mod:
    return AttrKind::Mod;
  case Resize:
    return AttrKind::Resize;
  default:
    return AttrKind::None;
  }
}

class Operator {
public:
  // Alternative order matches AttrKind.
  using Attributes =
      std::variant<std::monostate, ConvAttrs, ConvTransposeAttrs, PoolAttrs,
                   LeakyReluAttrs, ClipAttrs, AxisAttrs, AxesAttrs, SplitAttrs,
                   TransposeAttrs, BatchNormAttrs, CastAttrs,
                   ConstantOfShapeAttrs, GemmAttrs, ModAttrs, ResizeAttrs>;

  // Missing attributes are replaced by the defaults of the kind's attribute
  // struct; attributes of another kind are rejected.
  explicit Operator(OpKind kind, Attributes attrs = {})
      : m_kind(kind), m_attrs(std::move(attrs)) {
    auto expected = static_cast<std::size_t>(expected_attrs(kind));
    if (m_attrs.index() == 0 && expected != 0) {
      m_attrs = defaultAttributes(expected);
    } else if (m_attrs.index() != expected) {
      throw std::invalid_argument(fmt::format(
          "operator {} does not take attributes of alternative {}", kind,
          m_attrs.index()));
    }
  }

  OpKind kind() const { return m_kind; }
  AttrKind attrKind() const { return static_cast<AttrKind>(m_attrs.index()); }

  const ConvAttrs &conv() const { return get<ConvAttrs>(); }
  const ConvTransposeAttrs &convTranspose() const {
    return get<ConvTransposeAttrs>();
  }
  const PoolAttrs &pool() const { return get<PoolAttrs>(); }
  const LeakyReluAttrs &leakyRelu() const { return get<LeakyReluAttrs>(); }
  const ClipAttrs &clip() const { return get<ClipAttrs>(); }
  const AxisAttrs &axis() const { return get<AxisAttrs>(); }
  const AxesAttrs &axes() const { return get<AxesAttrs>(); }
  const SplitAttrs &split() const { return get<SplitAttrs>(); }
  const TransposeAttrs &transpose() const { return get<TransposeAttrs>(); }
  const BatchNormAttrs &batchNorm() const { return get<BatchNormAttrs>(); }
  const CastAttrs &cast() const { return get<CastAttrs>(); }
  const ConstantOfShapeAttrs &constantOfShape() const {
    return get<ConstantOfShapeAttrs>();
  }
  const GemmAttrs &gemm() const { return get<GemmAttrs>(); }
  const ModAttrs &mod() const { return get<ModAttrs>(); }
  const ResizeAttrs &resize() const { return get<ResizeAttrs>(); }

private:
  template <typename A> const A &get() const {
    const A *a = std::get_if<A>(&m_attrs);
    if (a == nullptr) {
      diag::invalid_state(
          fmt::format("attribute access does not match operator {}", m_kind));
    }
    return *a;
  }

  template <std::size_t... I>
  static Attributes defaultAttributes(std::size_t index,
                                      std::index_sequence<I...>) {
    Attributes out;
    ((I == index ? (out.template emplace<I>(), 0) : 0), ...);
    return out;
  }

  static Attributes defaultAttributes(std::size_t index) {
    return defaultAttributes(
        index, std::make_index_sequence<std::variant_size_v<Attributes>>{});
  }

  OpKind m_kind;
  Attributes m_attrs;
};

} // namespace infera

template <> struct fmt::formatter<infera::Operator> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const infera::Operator &op, FormatContext &ctx) const {
    using infera::AttrKind;
    switch (op.attrKind()) {
    case AttrKind::Conv: {
      const auto &c = op.conv();
      return fmt::format_to(ctx.out(),
                            "Conv{{groups={}, padding={}, stride={}, "
                            "dilation={}}}",
                            c.groups, c.padding, c.strides, c.dilations);
    }
    case AttrKind::Pool: {
      const auto &p = op.pool();
      return fmt::format_to(ctx.out(), "{}{{kernel={}, stride={}}}", op.kind(),
                            p.kernelSize, p.strides);
    }
    case AttrKind::Axis:
      return fmt::format_to(ctx.out(), "{}{{axis={}}}", op.kind(),
                            op.axis().axis);
    case AttrKind::Cast:
      return fmt::format_to(ctx.out(), "Cast{{to={}}}", op.cast().to);
    case AttrKind::Resize:
      return fmt::format_to(ctx.out(), "Resize{{mode={}}}", op.resize().mode);
    default:
      return fmt::format_to(ctx.out(), "{}", op.kind());
    }
  }
};
