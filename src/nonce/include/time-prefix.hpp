#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "base64.hpp"
#include "timedef.hpp"

namespace tnc {

/// Layout of the time prefix of a nonce:
///  - bytes [0, 4)  : nanoseconds elapsed since the last whole second, uint32 little-endian
///  - bytes [4, 12) : whole seconds since Unix epoch, int64 little-endian
static constexpr std::size_t kTimePrefixNbBytes = 12;

/// Number of base64 characters encoding the time prefix. As the prefix is a multiple of 3 bytes, these characters
/// only depend on the prefix bytes.
static constexpr std::size_t kTimePrefixNbChars = B64EncodedLen(kTimePrefixNbBytes, Base64Padding::kNo);

void EncodeTimePrefix(TimePoint timePoint, std::span<char, kTimePrefixNbBytes> out);

/// Throws invalid_argument if the nanoseconds are not below one second, or if the instant cannot be represented by
/// TimePoint.
TimePoint DecodeTimePrefix(std::span<const char, kTimePrefixNbBytes> in);

/// Retrieves the instant encoded in the first characters of a nonce text, in either base64 alphabet.
/// Throws invalid_argument if the text is too short, is not base64 or does not encode a valid instant.
TimePoint ExtractTimePrefix(std::string_view nonceText);

}  // namespace tnc
