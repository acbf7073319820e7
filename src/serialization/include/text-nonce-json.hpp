#pragma once

#include <utility>

#include "text-nonce.hpp"
#include "tnc_json.hpp"
#include "tnc_string.hpp"

// A TextNonce is represented in json by its text only, as a plain string.

namespace glz {
template <>
struct from<JSON, ::tnc::TextNonce> {
  template <auto Opts>
  static void op(auto &&value, auto &&...args) {
    ::tnc::string str;
    parse<JSON>::op<Opts>(str, args...);
    value = ::tnc::TextNonce(std::move(str));
  }
};

template <>
struct to<JSON, ::tnc::TextNonce> {
  template <auto Opts>
  static void op(auto &&value, auto &&...args) noexcept {
    serialize<JSON>::op<Opts>(value.str(), args...);
  }
};
}  // namespace glz
