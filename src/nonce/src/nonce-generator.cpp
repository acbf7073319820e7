#include "nonce-generator.hpp"

#include <cstddef>
#include <span>
#include <utility>

#include "base64.hpp"
#include "entropy-source.hpp"
#include "enum-string.hpp"
#include "nonce-config-error.hpp"
#include "nonce-config.hpp"
#include "text-nonce.hpp"
#include "time-prefix.hpp"
#include "timedef.hpp"
#include "tnc_log.hpp"
#include "tnc_string.hpp"

namespace tnc {

NonceGenerator::NonceGenerator()
    : NonceGenerator([] { return Clock::now(); }, [](std::span<char> out) { RandomFill(out); }) {}

NonceGenerator::NonceGenerator(TimeSource timeSource, RandomSource randomSource)
    : _timeSource(std::move(timeSource)), _randomSource(std::move(randomSource)) {}

TextNonce NonceGenerator::generateDefault() const {
  return generateConfigured(kDefaultLength, Base64Alphabet::standard, Base64Padding::kNo);
}

TextNonce NonceGenerator::generate(std::size_t length) const {
  return generateConfigured(length, Base64Alphabet::standard, Base64Padding::kNo);
}

TextNonce NonceGenerator::generateUrlSafe(std::size_t length) const {
  return generateConfigured(length, Base64Alphabet::urlsafe, Base64Padding::kNo);
}

TextNonce NonceGenerator::generateConfigured(std::size_t length, Base64Alphabet alphabet,
                                             Base64Padding padding) const {
  if (auto configError = ValidateNonceLength(length)) {
    throw nonce_config_error(*configError, length);
  }

  const std::size_t byteLength = (length / kNonceLengthAlignment) * 3;

  string rawBytes(byteLength, '\0');

  std::span<char> rawSpan(rawBytes);

  EncodeTimePrefix(_timeSource(), rawSpan.first<kTimePrefixNbBytes>());

  _randomSource(rawSpan.subspan(kTimePrefixNbBytes));

  log::trace("Generated {} alphabet nonce of {} chars", EnumToString(alphabet), length);

  return TextNonce(B64Encode(rawSpan, alphabet, padding));
}

TextNonce NonceGenerator::generateFromConfig(const schema::NonceConfig &nonceConfig) const {
  return generateConfigured(nonceConfig.length, nonceConfig.alphabet,
                            nonceConfig.padded ? Base64Padding::kYes : Base64Padding::kNo);
}

}  // namespace tnc
