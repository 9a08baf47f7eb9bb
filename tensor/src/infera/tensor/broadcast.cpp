#include "infera/tensor/broadcast.hpp"

#include <algorithm>

namespace infera {

memory::optional<Shape> broadcast_shapes(memory::span<const std::int64_t> a,
                                         memory::span<const std::int64_t> b,
                                         BroadcastMismatch *mismatch) {
  const std::size_t rank = std::max(a.size(), b.size());
  Shape out(rank, 1);
  for (std::size_t i = 0; i < rank; ++i) {
    std::int64_t da = i + a.size() >= rank ? a[i + a.size() - rank] : 1;
    std::int64_t db = i + b.size() >= rank ? b[i + b.size() - rank] : 1;
    if (da == db || db == 1) {
      out[i] = da;
    } else if (da == 1) {
      out[i] = db;
    } else {
      if (mismatch != nullptr) {
        *mismatch = BroadcastMismatch{i, da, db};
      }
      return memory::nullopt;
    }
  }
  return out;
}

memory::vector<std::int64_t>
broadcast_strides(memory::span<const std::int64_t> in,
                  memory::span<const std::int64_t> out) {
  memory::vector<std::int64_t> strides(out.size(), 0);
  auto inStrides = strides_of(in);
  const std::size_t lead = out.size() - in.size();
  for (std::size_t i = 0; i < in.size(); ++i) {
    strides[lead + i] = in[i] == 1 ? 0 : inStrides[i];
  }
  return strides;
}

} // namespace infera
