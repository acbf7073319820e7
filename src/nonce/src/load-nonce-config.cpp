#include "load-nonce-config.hpp"

#include <string_view>

#include "enum-string.hpp"
#include "nonce-config-error.hpp"
#include "nonce-config.hpp"
#include "read-json.hpp"
#include "tnc_log.hpp"

namespace tnc {

schema::NonceConfig LoadNonceConfig(std::string_view jsonContent) {
  auto nonceConfig = ReadJsonOrThrow<schema::NonceConfig>(jsonContent);

  if (auto configError = ValidateNonceLength(nonceConfig.length)) {
    log::error("Invalid nonce length {} in configuration ({})", nonceConfig.length, EnumToString(*configError));
    throw nonce_config_error(*configError, nonceConfig.length);
  }

  log::debug("Loaded nonce configuration: {} chars, {} alphabet", nonceConfig.length,
             EnumToString(nonceConfig.alphabet));

  return nonceConfig;
}

}  // namespace tnc
