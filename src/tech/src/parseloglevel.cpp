#include "parseloglevel.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>

#include "tnc_exception.hpp"

namespace tnc {

namespace {
// Indexed by level position, from least to most verbose
constexpr std::array<std::string_view, 7> kLogLevelNames = {"off",  "critical", "error", "warning",
                                                            "info", "debug",    "trace"};
}  // namespace

int8_t LogPosFromLogStr(std::string_view logStr) {
  static constexpr auto kMaxLogLevelPos = static_cast<int8_t>(kLogLevelNames.size() - 1U);

  if (logStr.size() == 1U && logStr.front() >= '0' && logStr.front() <= '0' + kMaxLogLevelPos) {
    return static_cast<int8_t>(logStr.front() - '0');
  }

  const auto it = std::ranges::find(kLogLevelNames, logStr);
  if (it == kLogLevelNames.end()) {
    throw exception("Unknown log level '{}', expected off|critical|error|warning|info|debug|trace or 0-{}", logStr,
                    kMaxLogLevelPos);
  }
  return static_cast<int8_t>(it - kLogLevelNames.begin());
}

}  // namespace tnc
