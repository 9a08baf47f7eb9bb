#pragma once

#include <fmt/core.h>

namespace infera::memory {

struct uvec2 {
  unsigned int x;
  unsigned int y;

  friend bool operator==(const uvec2 &lhs, const uvec2 &rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y;
  }
};

} // namespace infera::memory

template <> struct fmt::formatter<infera::memory::uvec2> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const infera::memory::uvec2 &v, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "({}, {})", v.x, v.y);
  }
};
