#pragma once

#include <string>

namespace infera::memory {

using string = std::string;

}
