#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string_view>
#include <utility>

#include "tnc_format.hpp"
#include "tnc_string.hpp"

namespace tnc {

/// A nonce is a value which is never generated twice.
/// The first 16 characters of a generated TextNonce encode the instant of its creation, with nanosecond precision,
/// and the remaining ones are random, which makes it suitable for session IDs.
/// It is text based, using only characters of the base64 alphabet it was generated with.
/// Once built, a TextNonce is never modified. Two nonces are equal if their texts are equal.
class TextNonce {
 public:
  /// Constructs an empty TextNonce, only useful as a deserialization target.
  TextNonce() noexcept = default;

  /// Wraps an existing nonce text, without any check on its content.
  explicit TextNonce(string str) noexcept : _str(std::move(str)) {}

  std::string_view str() const { return _str; }

  /// Releases the underlying string, leaving this object empty.
  string intoString() && noexcept { return std::move(_str); }

  std::size_t size() const noexcept { return _str.size(); }

  bool empty() const noexcept { return _str.empty(); }

  bool operator==(const TextNonce &) const noexcept = default;
  std::strong_ordering operator<=>(const TextNonce &) const noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, const TextNonce &nonce) { return os << nonce.str(); }

 private:
  string _str;
};

}  // namespace tnc

namespace std {
template <>
struct hash<::tnc::TextNonce> {
  auto operator()(const ::tnc::TextNonce &nonce) const { return std::hash<std::string_view>()(nonce.str()); }
};
}  // namespace std

template <>
struct fmt::formatter<tnc::TextNonce> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    const auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const tnc::TextNonce &nonce, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", nonce.str());
  }
};
