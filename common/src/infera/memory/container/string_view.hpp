#pragma once

#include <string_view>

namespace infera::memory {

using string_view = std::string_view;

}
