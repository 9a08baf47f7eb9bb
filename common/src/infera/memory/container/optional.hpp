#pragma once

#include <optional>

namespace infera::memory {

template <typename T> using optional = std::optional<T>;

inline constexpr std::nullopt_t nullopt = std::nullopt;

} // namespace infera::memory
