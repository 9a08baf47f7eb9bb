#pragma once

#include <fmt/core.h>

namespace infera {

enum class ResizeMode {
  Nearest,
  Linear,
};

enum class CoordTransformMode {
  HalfPixel,
  Asymmetric,
  AlignCorners,
};

enum class NearestMode {
  RoundPreferFloor,
  RoundPreferCeil,
  Floor,
  Ceil,
};

struct ResizeAttrs {
  ResizeMode mode = ResizeMode::Nearest;
  CoordTransformMode coordMode = CoordTransformMode::HalfPixel;
  NearestMode nearestMode = NearestMode::RoundPreferFloor;
};

} // namespace infera

template <> struct fmt::formatter<infera::ResizeMode> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(infera::ResizeMode mode, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}",
                          mode == infera::ResizeMode::Nearest ? "nearest"
                                                              : "linear");
  }
};
