#pragma once

#include <cstddef>
#include <memory>

namespace infera {

// Backing memory of a tensor: either an owned, 64-byte aligned heap block or
// a read-only view of caller memory that must outlive every use.
class Storage {
public:
  static constexpr std::size_t Alignment = 64;

  Storage() = default;

  static Storage allocate(std::size_t bytes);
  static Storage borrow(const void *ptr, std::size_t bytes);

  Storage(Storage &&) noexcept = default;
  Storage &operator=(Storage &&) noexcept = default;
  Storage(const Storage &) = delete;
  Storage &operator=(const Storage &) = delete;

  const std::byte *data() const { return m_data; }
  // Throws for borrowed storage.
  std::byte *mutableData();

  std::size_t byteSize() const { return m_bytes; }
  bool isBorrowed() const { return m_data != nullptr && !m_owned; }
  bool empty() const { return m_data == nullptr; }

private:
  struct AlignedDelete {
    void operator()(std::byte *p) const;
  };

  std::unique_ptr<std::byte, AlignedDelete> m_owned;
  const std::byte *m_data = nullptr;
  std::size_t m_bytes = 0;
};

} // namespace infera
