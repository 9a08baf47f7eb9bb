#pragma once

#include "infera/memory/container/optional.hpp"

#include <fmt/core.h>
#include <stdexcept>
#include <string>

namespace infera::graph {

enum class GraphErrorKind {
  ValueOutOfRange,
  DuplicateProducer,
  DanglingInput,
  Cycle,
  ShapeMismatch,
  InvalidSignature,
};

class GraphError : public std::runtime_error {
public:
  GraphError(GraphErrorKind kind, const std::string &msg,
             memory::optional<std::size_t> node = memory::nullopt)
      : std::runtime_error(msg), m_kind(kind), m_node(node) {}

  GraphErrorKind kind() const { return m_kind; }
  memory::optional<std::size_t> node() const { return m_node; }

private:
  GraphErrorKind m_kind;
  memory::optional<std::size_t> m_node;
};

} // namespace infera::graph
