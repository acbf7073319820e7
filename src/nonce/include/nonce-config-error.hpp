#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "tnc_invalid_argument_exception.hpp"
#include "tnc_json.hpp"

namespace tnc {

/// Minimum number of characters of a text nonce, all of them encoding the time prefix.
static constexpr std::size_t kNonceMinLength = 16;

/// Base64 encodes 3 bytes into 4 characters.
static constexpr std::size_t kNonceLengthAlignment = 4;

enum class NonceConfigError : int8_t { tooshort, notaligned };

/// Checks that 'length' can be the length of a text nonce. The first failing rule is returned.
constexpr std::optional<NonceConfigError> ValidateNonceLength(std::size_t length) {
  if (length < kNonceMinLength) {
    return NonceConfigError::tooshort;
  }
  if (length % kNonceLengthAlignment != 0) {
    return NonceConfigError::notaligned;
  }
  return std::nullopt;
}

/// Thrown when a nonce is requested with an invalid length.
class nonce_config_error : public invalid_argument {
 public:
  nonce_config_error(NonceConfigError code, std::size_t length)
      : invalid_argument("Invalid nonce length {}: {}", length,
                         code == NonceConfigError::tooshort ? "should be at least 16" : "should be a multiple of 4"),
        _code(code) {}

  NonceConfigError code() const noexcept { return _code; }

 private:
  NonceConfigError _code;
};

}  // namespace tnc

template <>
struct glz::meta<::tnc::NonceConfigError> {
  using enum ::tnc::NonceConfigError;
  static constexpr auto value = enumerate(tooshort, notaligned);
};
