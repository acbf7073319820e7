#pragma once

#include <string_view>
#include <type_traits>

#include "tnc_json.hpp"

namespace tnc {

/**
 * Get the string representation of an enum value, provided that enum values are contiguous and start at 0, and that
 * they are specialized with glz::meta.
 */
constexpr std::string_view EnumToString(auto enumValue) {
  using T = std::remove_cvref_t<decltype(enumValue)>;
  static_assert(std::is_enum_v<T>, "EnumToString can only be used with enum types");
  return json::reflect<T>::keys[static_cast<std::underlying_type_t<T>>(enumValue)];
}

}  // namespace tnc
