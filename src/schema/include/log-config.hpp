#pragma once

#include <cstdint>

#include "tnc_string.hpp"

namespace tnc::schema {

struct LogConfig {
  string consoleLevel{"info"};
  string fileLevel{"off"};
  int64_t maxFileSize{5L * 1024 * 1024};  // 5Mi
  int32_t maxNbFiles{10};
};

}  // namespace tnc::schema
