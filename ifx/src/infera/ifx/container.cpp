#include "infera/ifx/container.hpp"

#include <cstring>

namespace infera::ifx {

namespace {

template <typename T> T load_le(const std::byte *p) {
  T v = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    v |= static_cast<T>(static_cast<std::uint8_t>(p[i])) << (8 * i);
  }
  return v;
}

template <typename T> void store_le(std::byte *p, T v) {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    p[i] = static_cast<std::byte>((v >> (8 * i)) & 0xFF);
  }
}

} // namespace

memory::optional<ContainerHeader>
read_header(memory::span<const std::byte> bytes) {
  if (bytes.size() < HeaderSize ||
      std::memcmp(bytes.data(), Magic.data(), Magic.size()) != 0) {
    return memory::nullopt;
  }
  return ContainerHeader{load_le<std::uint32_t>(bytes.data() + 4),
                         load_le<std::uint64_t>(bytes.data() + 8)};
}

memory::vector<std::byte>
write_container(memory::span<const std::uint8_t> payload,
                std::uint32_t version) {
  memory::vector<std::byte> out(HeaderSize + payload.size());
  std::memcpy(out.data(), Magic.data(), Magic.size());
  store_le<std::uint32_t>(out.data() + 4, version);
  store_le<std::uint64_t>(out.data() + 8, payload.size());
  if (!payload.empty()) {
    std::memcpy(out.data() + HeaderSize, payload.data(), payload.size());
  }
  return out;
}

} // namespace infera::ifx
