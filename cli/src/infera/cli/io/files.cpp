#include "infera/cli/io/files.hpp"

#include <bit>
#include <cstring>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

infera::memory::vector<std::byte>
read_file(const infera::memory::string &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    throw std::runtime_error(fmt::format("failed to open '{}'", path));
  }
  const std::streamsize size = file.tellg();
  file.seekg(0);
  infera::memory::vector<std::byte> bytes(static_cast<std::size_t>(size));
  if (!file.read(reinterpret_cast<char *>(bytes.data()), size)) {
    throw std::runtime_error(fmt::format("failed to read '{}'", path));
  }
  return bytes;
}

void write_file(const infera::memory::string &path,
                infera::memory::span<const std::byte> bytes) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file ||
      !file.write(reinterpret_cast<const char *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()))) {
    throw std::runtime_error(fmt::format("failed to write '{}'", path));
  }
}

infera::memory::vector<float> read_f32(const infera::memory::string &path) {
  infera::memory::vector<std::byte> bytes = read_file(path);
  if (bytes.size() % 4 != 0) {
    throw std::runtime_error(fmt::format(
        "'{}' has {} bytes, not a multiple of 4", path, bytes.size()));
  }
  infera::memory::vector<float> values(bytes.size() / 4);
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::uint32_t bits = 0;
    for (std::size_t b = 0; b < 4; ++b) {
      bits |= static_cast<std::uint32_t>(bytes[i * 4 + b]) << (8 * b);
    }
    values[i] = std::bit_cast<float>(bits);
  }
  return values;
}

void write_f32(const infera::memory::string &path,
               infera::memory::span<const float> values) {
  infera::memory::vector<std::byte> bytes(values.size() * 4);
  for (std::size_t i = 0; i < values.size(); ++i) {
    auto bits = std::bit_cast<std::uint32_t>(values[i]);
    for (std::size_t b = 0; b < 4; ++b) {
      bytes[i * 4 + b] = static_cast<std::byte>((bits >> (8 * b)) & 0xFF);
    }
  }
  write_file(path, bytes);
}
