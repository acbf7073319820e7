#pragma once

#include <string>

namespace tnc {

using string = std::string;

}  // namespace tnc
