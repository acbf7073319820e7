#pragma once

#include <climits>
#include <concepts>
#include <cstddef>
#include <type_traits>

namespace tnc {

/// Writes 'value' as sizeof(IntegralT) bytes in little-endian order starting at 'out', whatever the host endianness.
/// Signed values are written in two's complement.
/// Returns a pointer past the last written byte.
template <std::integral IntegralT>
constexpr char *StoreLittleEndian(IntegralT value, char *out) {
  using UnsignedT = std::make_unsigned_t<IntegralT>;
  auto bits = static_cast<UnsignedT>(value);
  for (std::size_t byteIdx = 0; byteIdx < sizeof(IntegralT); ++byteIdx) {
    *out++ = static_cast<char>(bits & static_cast<UnsignedT>(0xFFU));
    if constexpr (sizeof(IntegralT) > 1) {
      bits >>= CHAR_BIT;
    }
  }
  return out;
}

/// Reads sizeof(IntegralT) little-endian bytes starting at 'in'.
template <std::integral IntegralT>
constexpr IntegralT LoadLittleEndian(const char *in) {
  using UnsignedT = std::make_unsigned_t<IntegralT>;
  UnsignedT bits{};
  for (std::size_t byteIdx = sizeof(IntegralT); byteIdx > 0; --byteIdx) {
    if constexpr (sizeof(IntegralT) > 1) {
      bits <<= CHAR_BIT;
    }
    bits |= static_cast<UnsignedT>(static_cast<unsigned char>(in[byteIdx - 1]));
  }
  return static_cast<IntegralT>(bits);
}

}  // namespace tnc
