#pragma once

#include <cstdint>

#include "tnc_exception.hpp"
#include "tnc_json.hpp"
#include "tnc_string.hpp"

namespace tnc {

enum class JsonFormat : int8_t { kMinified, kPretty };

namespace details {

template <JsonFormat format>
constexpr json::opts JsonWriteOptions() {
  json::opts opts{.raw_string = true};  // NOLINT(readability-implicit-bool-conversion)
  if constexpr (format == JsonFormat::kPretty) {
    opts.prettify = true;  // NOLINT(readability-implicit-bool-conversion)
    opts.indentation_width = 2;
  } else {
    opts.minified = true;  // NOLINT(readability-implicit-bool-conversion)
  }
  return opts;
}

}  // namespace details

/// Serializes 'obj' to json, compact by default.
/// Throws exception if glaze reports an error.
template <JsonFormat format = JsonFormat::kMinified>
string WriteJsonOrThrow(const auto &obj) {
  string buf;

  // NOLINTNEXTLINE(readability-implicit-bool-conversion)
  if (auto ec = json::write<details::JsonWriteOptions<format>()>(obj, buf)) {
    throw exception("Unable to write json: {}", json::format_error(ec, buf));
  }

  return buf;
}

}  // namespace tnc
