#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace infera::memory {

class dynamic_bitset {
public:
  dynamic_bitset() = default;
  explicit dynamic_bitset(std::size_t size, bool value = false)
      : m_size(size), m_words((size + 63) / 64, value ? ~0ull : 0ull) {
    clearTail();
  }

  std::size_t size() const { return m_size; }

  bool operator[](std::size_t i) const {
    return (m_words[i / 64] >> (i % 64)) & 1ull;
  }

  void set(std::size_t i, bool value = true) {
    if (value) {
      m_words[i / 64] |= (1ull << (i % 64));
    } else {
      m_words[i / 64] &= ~(1ull << (i % 64));
    }
  }

  std::size_t count() const {
    std::size_t c = 0;
    for (std::uint64_t w : m_words) {
      c += static_cast<std::size_t>(__builtin_popcountll(w));
    }
    return c;
  }

  bool all() const { return count() == m_size; }

private:
  void clearTail() {
    if (m_size % 64 != 0 && !m_words.empty()) {
      m_words.back() &= (1ull << (m_size % 64)) - 1;
    }
  }

  std::size_t m_size = 0;
  std::vector<std::uint64_t> m_words;
};

} // namespace infera::memory
