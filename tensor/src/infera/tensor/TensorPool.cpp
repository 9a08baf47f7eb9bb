#include "infera/tensor/TensorPool.hpp"

namespace infera {

Tensor TensorPool::alloc(TensorDataType dtype, Shape shape) {
  const auto bytes = static_cast<std::size_t>(numel(shape)) * size_of(dtype);
  {
    std::lock_guard lock{m_mutex};
    auto it = m_free.lower_bound(bytes);
    if (it != m_free.end() && it->first <= 2 * bytes) {
      Storage storage = std::move(it->second);
      m_free.erase(it);
      ++m_reuses;
      return Tensor::fromStorage(dtype, std::move(shape), std::move(storage));
    }
    ++m_allocations;
  }
  return Tensor::empty(dtype, std::move(shape));
}

void TensorPool::release(Tensor tensor) {
  if (tensor.isBorrowed()) {
    return;
  }
  Storage storage = std::move(tensor).releaseStorage();
  if (storage.empty()) {
    return;
  }
  std::lock_guard lock{m_mutex};
  const std::size_t size = storage.byteSize();
  m_free.emplace(size, std::move(storage));
}

std::size_t TensorPool::allocationCount() const {
  std::lock_guard lock{m_mutex};
  return m_allocations;
}

std::size_t TensorPool::reuseCount() const {
  std::lock_guard lock{m_mutex};
  return m_reuses;
}

std::size_t TensorPool::freeCount() const {
  std::lock_guard lock{m_mutex};
  return m_free.size();
}

} // namespace infera
