#pragma once

#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/span.hpp"
#include "infera/memory/container/vector.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace infera::ifx {

// Little-endian container:
//   0  char[4] magic "IFX1"
//   4  u32     format version
//   8  u64     payload length
//   16 payload (flatbuffer, root infera.ifx.Model)
inline constexpr std::array<char, 4> Magic{'I', 'F', 'X', '1'};
inline constexpr std::uint32_t MinFormatVersion = 1;
inline constexpr std::uint32_t FormatVersion = 1;
inline constexpr std::size_t HeaderSize = 16;

struct ContainerHeader {
  std::uint32_t version;
  std::uint64_t payloadSize;
};

// Reads the fixed header only; nullopt if the buffer is too short or the
// magic does not match. Neither the version nor the payload is validated.
memory::optional<ContainerHeader>
read_header(memory::span<const std::byte> bytes);

memory::vector<std::byte> write_container(memory::span<const std::uint8_t> payload,
                                          std::uint32_t version = FormatVersion);

} // namespace infera::ifx
