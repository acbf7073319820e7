#pragma once

#include <climits>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "tnc_json.hpp"
#include "tnc_string.hpp"

namespace tnc {

/// standard uses '+' and '/' for the last two symbols, urlsafe uses '-' and '_' (RFC 4648 section 5).
enum class Base64Alphabet : int8_t { standard, urlsafe };

enum class Base64Padding : int8_t { kNo, kYes };

namespace details {

inline constexpr std::string_view kB64StandardTable =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
inline constexpr std::string_view kB64UrlSafeTable =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::string_view B64Table(Base64Alphabet alphabet) {
  return alphabet == Base64Alphabet::urlsafe ? kB64UrlSafeTable : kB64StandardTable;
}

/// Encodes 'binData' into 'out' without any padding character and returns a pointer past the last written char.
inline char *B64EncodeImpl(std::span<const char> binData, Base64Alphabet alphabet, char *out) {
  int bitsCollected{};
  uint32_t accumulator{};

  static constexpr auto kB64NbBits = 6;
  static constexpr decltype(accumulator) kMask6 = (1U << kB64NbBits) - 1U;

  const std::string_view b64Table = B64Table(alphabet);

  for (char ch : binData) {
    accumulator = (accumulator << CHAR_BIT) | static_cast<uint8_t>(ch);
    bitsCollected += CHAR_BIT;
    while (bitsCollected >= kB64NbBits) {
      bitsCollected -= kB64NbBits;
      *out++ = b64Table[(accumulator >> bitsCollected) & kMask6];
    }
  }
  if (bitsCollected > 0) {
    accumulator <<= kB64NbBits - bitsCollected;
    *out++ = b64Table[accumulator & kMask6];
  }
  return out;
}

}  // namespace details

/// Number of base64 characters needed to encode 'nbBytes' bytes.
constexpr std::size_t B64EncodedLen(std::size_t nbBytes, Base64Padding padding = Base64Padding::kYes) {
  if (padding == Base64Padding::kYes) {
    return ((nbBytes + 2) / 3) * 4;
  }
  return (nbBytes * 4 + 2) / 3;
}

// const char * arguments are deleted because it would construct into a span including the unwanted null
// terminating character. Use span directly, or string / string_view instead.

/// Base64 encodes given binary data, without ever inserting line breaks.
[[nodiscard]] string B64Encode(std::span<const char> binData, Base64Alphabet alphabet = Base64Alphabet::standard,
                               Base64Padding padding = Base64Padding::kYes);
string B64Encode(const char *, Base64Alphabet = Base64Alphabet::standard, Base64Padding = Base64Padding::kYes) = delete;

/// Decodes base64 data written in either alphabet. Whitespace and padding characters are skipped.
/// Throws invalid_argument if an illegal character is found.
[[nodiscard]] string B64Decode(std::span<const char> ascData);
string B64Decode(const char *) = delete;

}  // namespace tnc

template <>
struct glz::meta<::tnc::Base64Alphabet> {
  using enum ::tnc::Base64Alphabet;
  static constexpr auto value = enumerate(standard, urlsafe);
};
