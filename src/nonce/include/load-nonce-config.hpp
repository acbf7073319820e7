#pragma once

#include <string_view>

#include "nonce-config.hpp"

namespace tnc {

/// Reads a NonceConfig from its json representation. Missing keys keep their default values.
/// Throws exception on malformed json or unknown keys, and nonce_config_error if the configured length is invalid.
schema::NonceConfig LoadNonceConfig(std::string_view jsonContent);

}  // namespace tnc
