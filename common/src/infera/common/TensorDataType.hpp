#pragma once

#include "infera/diag/unreachable.hpp"

#include <cstddef>
#include <cstdint>
#include <fmt/core.h>
#include <string_view>

namespace infera {

enum class TensorDataType : std::uint8_t {
  Float32,
  Int32,
  Int8,
  Uint8,
};

inline std::size_t size_of(TensorDataType dtype) {
  switch (dtype) {
  case TensorDataType::Float32:
  case TensorDataType::Int32:
    return 4;
  case TensorDataType::Int8:
  case TensorDataType::Uint8:
    return 1;
  }
  diag::unreachable();
}

template <typename T> struct dtype_of;
template <> struct dtype_of<float> {
  static constexpr TensorDataType value = TensorDataType::Float32;
};
template <> struct dtype_of<std::int32_t> {
  static constexpr TensorDataType value = TensorDataType::Int32;
};
template <> struct dtype_of<std::int8_t> {
  static constexpr TensorDataType value = TensorDataType::Int8;
};
template <> struct dtype_of<std::uint8_t> {
  static constexpr TensorDataType value = TensorDataType::Uint8;
};

template <typename T>
inline constexpr TensorDataType dtype_of_v = dtype_of<T>::value;

// Calls fn with a value-initialized element of the dtype's C++ type.
template <typename Fn> decltype(auto) visit_dtype(TensorDataType dtype, Fn &&fn) {
  switch (dtype) {
  case TensorDataType::Float32:
    return fn(float{});
  case TensorDataType::Int32:
    return fn(std::int32_t{});
  case TensorDataType::Int8:
    return fn(std::int8_t{});
  case TensorDataType::Uint8:
    return fn(std::uint8_t{});
  }
  diag::unreachable();
}

} // namespace infera

template <> struct fmt::formatter<infera::TensorDataType> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(infera::TensorDataType type, FormatContext &ctx) const {
    using enum infera::TensorDataType;

    std::string_view name;
    switch (type) {
    case Float32:
      name = "f32";
      break;
    case Int32:
      name = "i32";
      break;
    case Int8:
      name = "i8";
      break;
    case Uint8:
      name = "u8";
      break;
    default:
      name = "unknown";
      break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
  }
};
