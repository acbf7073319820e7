#pragma once

#include <cctype>

namespace tnc {

/// Safe std::isspace version. See https://en.cppreference.com/w/cpp/string/byte/isspace
inline bool isspace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

}  // namespace tnc
