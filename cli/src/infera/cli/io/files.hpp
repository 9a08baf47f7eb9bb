#pragma once

#include "infera/memory/container/span.hpp"
#include "infera/memory/container/string.hpp"
#include "infera/memory/container/vector.hpp"

#include <cstddef>

// Throws std::runtime_error naming the path.
infera::memory::vector<std::byte> read_file(const infera::memory::string &path);
void write_file(const infera::memory::string &path,
                infera::memory::span<const std::byte> bytes);

// Raw little-endian f32.
infera::memory::vector<float> read_f32(const infera::memory::string &path);
void write_f32(const infera::memory::string &path,
               infera::memory::span<const float> values);
