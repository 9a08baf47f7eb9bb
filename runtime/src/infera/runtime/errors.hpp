#pragma once

#include "infera/common/ops/OpKind.hpp"
#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/string.hpp"

#include <exception>
#include <fmt/core.h>
#include <stdexcept>

namespace infera::runtime {

enum class LoadErrorKind {
  MalformedContainer,
  VersionMismatch,
  UnsupportedOperator,
  InvalidGraph,
};

class LoadError : public std::runtime_error {
public:
  LoadError(LoadErrorKind kind, const std::string &msg,
            memory::optional<std::size_t> node = memory::nullopt,
            memory::string opName = {})
      : std::runtime_error(msg), m_kind(kind), m_node(node),
        m_opName(std::move(opName)) {}

  LoadErrorKind kind() const { return m_kind; }
  // Index into the model's operator nodes.
  memory::optional<std::size_t> node() const { return m_node; }
  const memory::string &opName() const { return m_opName; }

private:
  LoadErrorKind m_kind;
  memory::optional<std::size_t> m_node;
  memory::string m_opName;
};

enum class RunErrorKind {
  InputMismatch,
  KernelFailure,
};

class RunError : public std::runtime_error {
public:
  static RunError inputMismatch(memory::string input, const std::string &msg) {
    RunError e(RunErrorKind::InputMismatch, msg);
    e.m_input = std::move(input);
    return e;
  }

  static RunError kernelFailure(std::size_t node, memory::string nodeName,
                                OpKind op, bool shapeError,
                                const std::string &msg,
                                memory::optional<std::size_t> dimension =
                                    memory::nullopt) {
    RunError e(RunErrorKind::KernelFailure, msg);
    e.m_node = node;
    e.m_nodeName = std::move(nodeName);
    e.m_op = op;
    e.m_shapeError = shapeError;
    e.m_dimension = dimension;
    return e;
  }

  // Classifies an exception thrown while executing a node. Shape errors and
  // std::invalid_argument are shape failures; everything else derived from
  // std::exception is a data failure. Other exceptions are rethrown.
  static RunError fromException(std::size_t node, memory::string nodeName,
                                OpKind op, std::exception_ptr error);

  RunErrorKind kind() const { return m_kind; }
  memory::optional<std::size_t> node() const { return m_node; }
  const memory::string &nodeName() const { return m_nodeName; }
  memory::optional<OpKind> op() const { return m_op; }
  // InputMismatch: the offending input, or the unknown binding name.
  const memory::string &input() const { return m_input; }
  // KernelFailure: true if the kernel rejected its input shapes, false for
  // data errors.
  bool isShapeError() const { return m_shapeError; }
  // KernelFailure: first offending dimension reported by a ShapeError.
  memory::optional<std::size_t> dimension() const { return m_dimension; }

private:
  RunError(RunErrorKind kind, const std::string &msg)
      : std::runtime_error(msg), m_kind(kind) {}

  RunErrorKind m_kind;
  memory::optional<std::size_t> m_node;
  memory::string m_nodeName;
  memory::optional<OpKind> m_op;
  memory::string m_input;
  bool m_shapeError = false;
  memory::optional<std::size_t> m_dimension;
};

} // namespace infera::runtime

template <> struct fmt::formatter<infera::runtime::LoadErrorKind> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(infera::runtime::LoadErrorKind kind, FormatContext &ctx) const {
    using enum infera::runtime::LoadErrorKind;
    const char *name = nullptr;
    switch (kind) {
    case MalformedContainer:
      name = "malformed-container";
      break;
    case VersionMismatch:
      name = "version-mismatch";
      break;
    case UnsupportedOperator:
      name = "unsupported-operator";
      break;
    case InvalidGraph:
      name = "invalid-graph";
      break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
  }
};
