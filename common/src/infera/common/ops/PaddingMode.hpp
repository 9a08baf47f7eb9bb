#pragma once

#include <array>
#include <cstdint>
#include <fmt/core.h>

namespace infera {

enum class PaddingMode {
  Fixed,
  // ONNX SAME_UPPER: the odd pixel goes to the end.
  Same,
};

// top, left, bottom, right
using Padding2d = std::array<std::uint32_t, 4>;

} // namespace infera

template <> struct fmt::formatter<infera::PaddingMode> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(infera::PaddingMode mode, FormatContext &ctx) const {
    const char *name = nullptr;
    switch (mode) {
    case infera::PaddingMode::Fixed:
      name = "fixed";
      break;
    case infera::PaddingMode::Same:
      name = "same";
      break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
  }
};
