#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <exception>
#include <string_view>
#include <utility>

#include "tnc_format.hpp"

namespace tnc {

/// Exception class storing its message inline, so that throwing it never allocates.
/// Messages longer than kMsgMaxLen characters are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <std::size_t N>
    requires(N <= kMsgMaxLen + 1)
  explicit exception(const char (&literal)[N]) noexcept {
    setMessage(std::string_view(literal, N - 1));
  }

  explicit exception(std::string_view msg) noexcept { setMessage(msg); }

  template <typename... Args>
    requires(sizeof...(Args) != 0)
  explicit exception(format_string<Args...> fmt, Args &&...args) {
    terminate(static_cast<std::size_t>(
        tnc::format_to_n(_msg.data(), kMsgMaxLen, fmt, std::forward<Args>(args)...).size));
  }

  [[nodiscard]] const char *what() const noexcept override { return _msg.data(); }

 private:
  void setMessage(std::string_view msg) noexcept {
    std::memcpy(_msg.data(), msg.data(), std::min(msg.size(), kMsgMaxLen));
    terminate(msg.size());
  }

  // 'msgLen' is the full length of the message, of which at most kMsgMaxLen characters are written
  void terminate(std::size_t msgLen) noexcept {
    if (msgLen > kMsgMaxLen) {
      static constexpr std::string_view kEllipsis = "...";
      std::memcpy(_msg.data() + kMsgMaxLen - kEllipsis.size(), kEllipsis.data(), kEllipsis.size());
      msgLen = kMsgMaxLen;
    }
    _msg[msgLen] = '\0';
  }

  std::array<char, kMsgMaxLen + 1> _msg;
};

}  // namespace tnc
