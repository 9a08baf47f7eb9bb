#pragma once

#include "infera/common/ops/OpKind.hpp"
#include "infera/memory/container/optional.hpp"

#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace infera::kernels {

// Input shapes or dtypes an operator cannot accept.
class ShapeError : public std::runtime_error {
public:
  ShapeError(OpKind op, const std::string &msg,
             memory::optional<std::size_t> dimension = memory::nullopt)
      : std::runtime_error(fmt::format("{}: {}", op, msg)), m_op(op),
        m_dimension(dimension) {}

  OpKind op() const { return m_op; }
  // First offending dimension, when a single one can be named.
  memory::optional<std::size_t> dimension() const { return m_dimension; }

private:
  OpKind m_op;
  memory::optional<std::size_t> m_dimension;
};

// Numerically invalid data, e.g. integer division by zero or an
// out-of-range gather index.
class KernelError : public std::runtime_error {
public:
  KernelError(OpKind op, const std::string &msg)
      : std::runtime_error(fmt::format("{}: {}", op, msg)), m_op(op) {}

  OpKind op() const { return m_op; }

private:
  OpKind m_op;
};

} // namespace infera::kernels
