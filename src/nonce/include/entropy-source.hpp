#pragma once

#include <functional>
#include <span>

namespace tnc {

/// Fills 'out' with random bytes from the kernel entropy source.
/// Safe to call concurrently. Returns false if the OS source is not available, in which case errno is set.
[[nodiscard]] bool OsRandomFill(std::span<char> out) noexcept;

/// Fills 'out' with random bytes from the process wide OpenSSL DRBG, seeded by OpenSSL from the OS.
/// Calls are serialized with a mutex. Returns false if OpenSSL could not provide the bytes.
[[nodiscard]] bool FallbackRandomFill(std::span<char> out);

/// A tier of random bytes, with the same contract as OsRandomFill and FallbackRandomFill.
using RandomTierFill = std::function<bool(std::span<char>)>;

/// Fills 'out' from 'primaryFill', or from 'fallbackFill' if the primary tier fails.
/// The first fallback of the process is logged as a warning.
/// Throws exception if both tiers fail.
void RandomFill(std::span<char> out, const RandomTierFill &primaryFill, const RandomTierFill &fallbackFill);

/// Fills 'out' with cryptographically secure random bytes, first from the OS, then from the OpenSSL DRBG if the OS
/// source is unavailable.
/// Throws exception if both sources fail.
void RandomFill(std::span<char> out);

}  // namespace tnc
