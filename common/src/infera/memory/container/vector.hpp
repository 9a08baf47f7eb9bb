#pragma once

#include <vector>

namespace infera::memory {

template <typename T, typename Alloc = std::allocator<T>>
using vector = std::vector<T, Alloc>;

}
