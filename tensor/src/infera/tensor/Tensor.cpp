#include "infera/tensor/Tensor.hpp"

namespace infera {

Tensor::Tensor(TensorDataType dtype, Shape shape, Storage storage)
    : m_dtype(dtype), m_shape(std::move(shape)),
      m_numel(infera::numel(m_shape)), m_storage(std::move(storage)) {
  if (byteSize() > m_storage.byteSize()) {
    throw std::invalid_argument(
        fmt::format("storage of {} bytes is too small for {} tensor of shape "
                    "{}",
                    m_storage.byteSize(), m_dtype, m_shape));
  }
}

Tensor Tensor::empty(TensorDataType dtype, Shape shape) {
  std::int64_t n = infera::numel(shape);
  auto bytes = static_cast<std::size_t>(n) * size_of(dtype);
  return Tensor(dtype, std::move(shape), Storage::allocate(bytes));
}

Tensor Tensor::borrow(TensorDataType dtype, Shape shape, const void *data) {
  std::int64_t n = infera::numel(shape);
  auto bytes = static_cast<std::size_t>(n) * size_of(dtype);
  return Tensor(dtype, std::move(shape), Storage::borrow(data, bytes));
}

Tensor Tensor::fromStorage(TensorDataType dtype, Shape shape,
                           Storage storage) {
  return Tensor(dtype, std::move(shape), std::move(storage));
}

Tensor Tensor::clone() const {
  Tensor t = empty(m_dtype, m_shape);
  if (byteSize() != 0) {
    std::memcpy(t.m_storage.mutableData(), m_storage.data(), byteSize());
  }
  return t;
}

Tensor Tensor::reshaped(Shape shape) && {
  if (infera::numel(shape) != m_numel) {
    throw std::invalid_argument(fmt::format(
        "cannot reshape tensor of shape {} to {}", m_shape, shape));
  }
  return Tensor(m_dtype, std::move(shape), std::move(m_storage));
}

Storage Tensor::releaseStorage() && {
  m_shape = Shape{0};
  m_numel = 0;
  return std::move(m_storage);
}

} // namespace infera
