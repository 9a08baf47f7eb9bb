#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <limits>

namespace infera::graph {

struct NodeId {
public:
  static constexpr std::uint32_t NullId{
      std::numeric_limits<std::uint32_t>::max()};

  explicit constexpr NodeId() : m_id(NullId) {}
  explicit constexpr NodeId(std::uint32_t id) : m_id(id) {}

  constexpr explicit operator bool() const { return m_id != NullId; }

  constexpr std::uint32_t operator*() const { return m_id; }

  friend bool operator==(const NodeId &lhs, const NodeId &rhs) {
    return lhs.m_id == rhs.m_id;
  }

  friend bool operator<(const NodeId &lhs, const NodeId &rhs) {
    return lhs.m_id < rhs.m_id;
  }

private:
  std::uint32_t m_id;
};

} // namespace infera::graph

template <> struct std::hash<infera::graph::NodeId> {
  std::size_t operator()(const infera::graph::NodeId &id) const noexcept {
    return std::hash<std::uint32_t>{}(*id);
  }
};

template <> struct fmt::formatter<infera::graph::NodeId> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const infera::graph::NodeId &id, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "n{}", *id);
  }
};
