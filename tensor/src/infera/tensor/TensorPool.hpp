#pragma once

#include "infera/tensor/Tensor.hpp"

#include <cstddef>
#include <map>
#include <mutex>

namespace infera {

// Per-run arena of released tensor buffers, keyed by byte size. A request is
// served by the smallest free buffer that fits and is at most twice as large,
// otherwise by a fresh allocation. Reused buffers are not cleared.
class TensorPool {
public:
  TensorPool() = default;
  TensorPool(const TensorPool &) = delete;
  TensorPool &operator=(const TensorPool &) = delete;

  Tensor alloc(TensorDataType dtype, Shape shape);
  Tensor alloc(const TensorInfo &info) { return alloc(info.dtype, info.shape); }

  // Borrowed tensors are dropped, owned storage becomes reusable.
  void release(Tensor tensor);

  std::size_t allocationCount() const;
  std::size_t reuseCount() const;
  std::size_t freeCount() const;

private:
  mutable std::mutex m_mutex;
  std::multimap<std::size_t, Storage> m_free;
  std::size_t m_allocations = 0;
  std::size_t m_reuses = 0;
};

} // namespace infera
