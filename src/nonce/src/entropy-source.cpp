#include "entropy-source.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <sys/random.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstddef>
#include <mutex>
#include <span>
#include <system_error>

#include "tnc_config.hpp"
#include "tnc_exception.hpp"
#include "tnc_log.hpp"

namespace tnc {

bool OsRandomFill(std::span<char> out) noexcept {
  char *pos = out.data();
  std::size_t remainingBytes = out.size();
  while (remainingBytes != 0) {
    const auto nbBytesRead = ::getrandom(pos, remainingBytes, 0);
    if (nbBytesRead < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    pos += nbBytesRead;
    remainingBytes -= static_cast<std::size_t>(nbBytesRead);
  }
  return true;
}

bool FallbackRandomFill(std::span<char> out) {
  static std::mutex gFallbackMutex;

  std::lock_guard<std::mutex> guard(gFallbackMutex);

  auto *pos = reinterpret_cast<unsigned char *>(out.data());
  std::size_t remainingBytes = out.size();
  while (remainingBytes != 0) {
    // RAND_bytes takes an int number of bytes
    const auto nbBytes = static_cast<int>(std::min<std::size_t>(remainingBytes, INT_MAX));
    if (RAND_bytes(pos, nbBytes) != 1) {
      return false;
    }
    pos += nbBytes;
    remainingBytes -= static_cast<std::size_t>(nbBytes);
  }
  return true;
}

void RandomFill(std::span<char> out, const RandomTierFill &primaryFill, const RandomTierFill &fallbackFill) {
  if (out.empty() || TNC_LIKELY(primaryFill(out))) {
    return;
  }

  const std::error_code primaryError(errno, std::generic_category());

  static std::once_flag gFallbackWarningFlag;
  std::call_once(gFallbackWarningFlag, [&primaryError] {
    log::warn("Primary entropy source unavailable ({}), falling back to secondary one", primaryError.message());
  });

  if (TNC_UNLIKELY(!fallbackFill(out))) {
    char errBuf[256];
    ERR_error_string_n(ERR_get_error(), errBuf, sizeof(errBuf));
    log::critical("Unable to draw {} random bytes, primary: {}, secondary: {}", out.size(), primaryError.message(),
                  errBuf);
    throw exception("Unable to draw {} random bytes from any entropy source", out.size());
  }
}

void RandomFill(std::span<char> out) {
  static const RandomTierFill kOsFill = OsRandomFill;
  static const RandomTierFill kFallbackFill = FallbackRandomFill;

  RandomFill(out, kOsFill, kFallbackFill);
}

}  // namespace tnc
