#pragma once

#include <stdexcept>
#include <string>

namespace infera::ifx {

// Structurally valid flatbuffer whose content does not describe a model,
// e.g. attributes of the wrong kind for an operator.
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace infera::ifx
