#pragma once

#include <cstdint>

#include "base64.hpp"
#include "log-config.hpp"

namespace tnc::schema {

/// Parameters of the generated nonces, readable from json. Example:
/// {"length": 48, "alphabet": "urlsafe", "padded": false, "log": {"consoleLevel": "warning"}}
struct NonceConfig {
  uint32_t length{32};
  Base64Alphabet alphabet{Base64Alphabet::standard};
  bool padded{false};
  LogConfig log;
};

}  // namespace tnc::schema
