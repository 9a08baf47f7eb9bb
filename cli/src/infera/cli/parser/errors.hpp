#pragma once

#include <stdexcept>

struct ParseError : std::runtime_error {
  using std::runtime_error::runtime_error;
};
