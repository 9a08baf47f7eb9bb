#pragma once

#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace infera::diag {

[[noreturn]] inline void invalid_state(const std::string &msg = {}) {
  if (msg.empty()) {
    throw std::runtime_error("invalid state");
  }
  throw std::runtime_error(fmt::format("invalid state: {}", msg));
}

} // namespace infera::diag
