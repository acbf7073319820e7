#include "time-prefix.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>

#include "base64.hpp"
#include "little-endian.hpp"
#include "timedef.hpp"
#include "tnc_invalid_argument_exception.hpp"
#include "tnc_string.hpp"

namespace tnc {

static_assert(kTimePrefixNbChars == 16);
static_assert(kTimePrefixNbBytes == sizeof(uint32_t) + sizeof(int64_t));

namespace {
constexpr uint32_t kNanosecondsPerSecond = 1000000000U;
}  // namespace

void EncodeTimePrefix(TimePoint timePoint, std::span<char, kTimePrefixNbBytes> out) {
  char *pos = StoreLittleEndian(TimestampToSubSecondNanoseconds(timePoint), out.data());
  StoreLittleEndian(TimestampToSecondsSinceEpoch(timePoint), pos);
}

TimePoint DecodeTimePrefix(std::span<const char, kTimePrefixNbBytes> in) {
  const auto subSecondNanoseconds = LoadLittleEndian<uint32_t>(in.data());
  const auto secondsSinceEpoch = LoadLittleEndian<int64_t>(in.data() + sizeof(uint32_t));

  if (subSecondNanoseconds >= kNanosecondsPerSecond) {
    throw invalid_argument("Invalid time prefix: {} nanoseconds exceed one second", subSecondNanoseconds);
  }

  // sub-second part is never negative, so lower bound is the first whole second above Duration::min()
  static constexpr int64_t kMinSeconds = std::chrono::ceil<seconds>(Duration::min()).count();
  static constexpr int64_t kMaxSeconds = std::chrono::floor<seconds>(Duration::max()).count();

  if (secondsSinceEpoch < kMinSeconds || secondsSinceEpoch > kMaxSeconds) {
    throw invalid_argument("Invalid time prefix: {} seconds out of representable range", secondsSinceEpoch);
  }

  const auto wholeSeconds = std::chrono::duration_cast<Duration>(seconds(secondsSinceEpoch));
  const auto subSecond = std::chrono::duration_cast<Duration>(nanoseconds(subSecondNanoseconds));
  if (wholeSeconds > Duration::max() - subSecond) {
    throw invalid_argument("Invalid time prefix: {}s {}ns out of representable range", secondsSinceEpoch,
                           subSecondNanoseconds);
  }

  return TimePoint(wholeSeconds + subSecond);
}

TimePoint ExtractTimePrefix(std::string_view nonceText) {
  if (nonceText.size() < kTimePrefixNbChars) {
    throw invalid_argument("Nonce text '{}' is too short to contain a time prefix", nonceText);
  }
  const string prefixBytes = B64Decode(nonceText.substr(0, kTimePrefixNbChars));
  if (prefixBytes.size() != kTimePrefixNbBytes) {
    throw invalid_argument("Nonce text '{}' does not start with a base64 time prefix", nonceText);
  }

  return DecodeTimePrefix(std::span<const char, kTimePrefixNbBytes>(prefixBytes.data(), kTimePrefixNbBytes));
}

}  // namespace tnc
