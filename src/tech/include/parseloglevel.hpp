#pragma once

#include <cstdint>
#include <string_view>

namespace tnc {

/// Parses a log level given either as a name (off|critical|error|warning|info|debug|trace) or as a single digit
/// between 0 and 6, and returns its position (0 for off, 6 for trace).
int8_t LogPosFromLogStr(std::string_view logStr);

}  // namespace tnc
