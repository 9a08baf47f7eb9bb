#pragma once

#include "infera/common/TensorDataType.hpp"
#include "infera/diag/invalid_state.hpp"
#include "infera/memory/container/span.hpp"
#include "infera/tensor/Shape.hpp"
#include "infera/tensor/Storage.hpp"

#include <cstring>
#include <fmt/format.h>
#include <initializer_list>
#include <stdexcept>

namespace infera {

struct TensorInfo {
  TensorDataType dtype = TensorDataType::Float32;
  Shape shape;

  friend bool operator==(const TensorInfo &, const TensorInfo &) = default;
};

// Dense, row-major tensor. Always contiguous.
class Tensor {
public:
  Tensor() = default;

  static Tensor empty(TensorDataType dtype, Shape shape);
  static Tensor borrow(TensorDataType dtype, Shape shape, const void *data);
  // Adopts storage (e.g. from a TensorPool); storage must be large enough.
  static Tensor fromStorage(TensorDataType dtype, Shape shape, Storage storage);

  template <typename T>
  static Tensor from(Shape shape, memory::span<const T> values) {
    if (static_cast<std::int64_t>(values.size()) != infera::numel(shape)) {
      throw std::invalid_argument(
          fmt::format("tensor of shape {} needs {} elements, got {}", shape,
                      infera::numel(shape), values.size()));
    }
    Tensor t = empty(dtype_of_v<T>, std::move(shape));
    if (!values.empty()) {
      std::memcpy(t.m_storage.mutableData(), values.data(),
                  values.size() * sizeof(T));
    }
    return t;
  }

  template <typename T>
  static Tensor from(Shape shape, std::initializer_list<T> values) {
    return from<T>(std::move(shape),
                   memory::span<const T>(values.begin(), values.size()));
  }

  template <typename T>
  static Tensor from(Shape shape, const memory::vector<T> &values) {
    return from<T>(std::move(shape), memory::span<const T>(values));
  }

  template <typename T> static Tensor scalar(T value) {
    return from<T>(Shape{}, memory::span<const T>(&value, 1));
  }

  Tensor(Tensor &&) noexcept = default;
  Tensor &operator=(Tensor &&) noexcept = default;
  Tensor(const Tensor &) = delete;
  Tensor &operator=(const Tensor &) = delete;

  Tensor clone() const;

  TensorDataType dtype() const { return m_dtype; }
  const Shape &shape() const { return m_shape; }
  TensorInfo info() const { return TensorInfo{m_dtype, m_shape}; }
  std::size_t rank() const { return m_shape.size(); }
  std::int64_t numel() const { return m_numel; }
  std::int64_t dim(std::size_t i) const { return m_shape[i]; }
  memory::vector<std::int64_t> strides() const { return strides_of(m_shape); }
  std::size_t byteSize() const {
    return static_cast<std::size_t>(m_numel) * size_of(m_dtype);
  }
  bool isBorrowed() const { return m_storage.isBorrowed(); }
  const Storage &storage() const { return m_storage; }

  const std::byte *bytes() const { return m_storage.data(); }
  std::byte *mutableBytes() { return m_storage.mutableData(); }

  template <typename T> const T *data() const {
    checkType<T>();
    return reinterpret_cast<const T *>(m_storage.data());
  }

  template <typename T> T *data() {
    checkType<T>();
    return reinterpret_cast<T *>(m_storage.mutableData());
  }

  template <typename T> memory::span<const T> values() const {
    return memory::span<const T>(data<T>(), static_cast<std::size_t>(m_numel));
  }

  template <typename T> memory::span<T> mutableValues() {
    return memory::span<T>(data<T>(), static_cast<std::size_t>(m_numel));
  }

  template <typename T> T at(std::initializer_list<std::int64_t> index) const {
    if (index.size() != m_shape.size()) {
      throw std::out_of_range(fmt::format(
          "index of rank {} into tensor of rank {}", index.size(), rank()));
    }
    std::int64_t offset = 0;
    std::size_t i = 0;
    for (std::int64_t v : index) {
      if (v < 0 || v >= m_shape[i]) {
        throw std::out_of_range(fmt::format(
            "index {} out of range for dimension {} of shape {}", v, i,
            m_shape));
      }
      offset = offset * m_shape[i] + v;
      ++i;
    }
    return data<T>()[offset];
  }

  // Same storage, new shape with equal element count.
  Tensor reshaped(Shape shape) &&;

  // Hands the storage back, leaving an empty tensor.
  Storage releaseStorage() &&;

private:
  Tensor(TensorDataType dtype, Shape shape, Storage storage);

  template <typename T> void checkType() const {
    if (dtype_of_v<T> != m_dtype) {
      diag::invalid_state(fmt::format("access of {} tensor as {}", m_dtype,
                                      dtype_of_v<T>));
    }
  }

  TensorDataType m_dtype = TensorDataType::Float32;
  Shape m_shape{0};
  std::int64_t m_numel = 0;
  Storage m_storage;
};

} // namespace infera

template <> struct fmt::formatter<infera::TensorInfo> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const infera::TensorInfo &info, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}{}", info.dtype, info.shape);
  }
};
