#pragma once

#include <cstddef>
#include <functional>
#include <span>

#include "base64.hpp"
#include "nonce-config.hpp"
#include "text-nonce.hpp"
#include "timedef.hpp"

namespace tnc {

/// Builds TextNonce objects from the current time and random bytes.
/// A nonce of N characters is made of (N / 4) * 3 bytes:
///  - the first 12 bytes encode the time (see time-prefix.hpp), giving the first 16 characters
///  - the remaining bytes are random
/// and is base64 encoded without padding nor line breaks.
/// Generation methods are const and can be called concurrently, provided that the time and random sources can.
class NonceGenerator {
 public:
  static constexpr std::size_t kDefaultLength = 32;

  using TimeSource = std::function<TimePoint()>;
  using RandomSource = std::function<void(std::span<char>)>;

  /// Creates a NonceGenerator reading the system clock and drawing secure random bytes from the OS.
  NonceGenerator();

  /// Creates a NonceGenerator with custom sources, mostly useful for reproducible nonces in tests.
  NonceGenerator(TimeSource timeSource, RandomSource randomSource);

  /// Generates a nonce of 32 characters (16 of time, 16 of randomness) in the standard alphabet.
  TextNonce generateDefault() const;

  /// Generates a nonce of 'length' characters in the standard alphabet.
  /// Throws nonce_config_error if 'length' is lower than 16 or not a multiple of 4.
  TextNonce generate(std::size_t length) const;

  /// Same as generate, with the URL safe alphabet ('-' and '_' instead of '+' and '/').
  TextNonce generateUrlSafe(std::size_t length) const;

  /// Generates a nonce of 'length' characters with given base64 settings.
  /// Valid lengths never need base64 padding, so 'padding' has no effect on the produced text.
  TextNonce generateConfigured(std::size_t length, Base64Alphabet alphabet, Base64Padding padding) const;

  TextNonce generateFromConfig(const schema::NonceConfig &nonceConfig) const;

 private:
  TimeSource _timeSource;
  RandomSource _randomSource;
};

}  // namespace tnc
