#include "infera/tensor/Storage.hpp"
#include "infera/algorithm/align_up.hpp"
#include "infera/diag/invalid_state.hpp"

#include <cstring>
#include <new>

namespace infera {

void Storage::AlignedDelete::operator()(std::byte *p) const {
  ::operator delete(p, std::align_val_t{Alignment});
}

Storage Storage::allocate(std::size_t bytes) {
  Storage s;
  std::size_t capacity = algorithm::align_up<Alignment>(bytes == 0 ? 1 : bytes);
  auto *p = static_cast<std::byte *>(
      ::operator new(capacity, std::align_val_t{Alignment}));
  std::memset(p, 0, capacity);
  s.m_owned.reset(p);
  s.m_data = p;
  s.m_bytes = bytes;
  return s;
}

Storage Storage::borrow(const void *ptr, std::size_t bytes) {
  if (ptr == nullptr && bytes != 0) {
    diag::invalid_state("borrowed storage without memory");
  }
  Storage s;
  s.m_data = static_cast<const std::byte *>(ptr);
  s.m_bytes = bytes;
  return s;
}

std::byte *Storage::mutableData() {
  if (!m_owned) {
    diag::invalid_state("write access to borrowed tensor storage");
  }
  return m_owned.get();
}

} // namespace infera
