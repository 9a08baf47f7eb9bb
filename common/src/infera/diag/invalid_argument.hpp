#pragma once

#include <stdexcept>
#include <string>

namespace infera::diag {

[[noreturn]] inline void invalid_argument(const std::string &msg) {
  throw std::invalid_argument(msg);
}

} // namespace infera::diag
