// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <algorithm>
#include <cstdint>
#include <string>

#include "vd/value.h"
#include "vd/value_sequence.h"

namespace vd {

// Number of collection elements shown when a list value is formatted.
constexpr int default_collection_elements = 10;

// Convert `v` to the text shown in failure messages:
//  - null -> null
//  - strings -> "text" and characters -> 'c', with control characters escaped.
//  - integers -> decimal digits, with no suffix.
//  - double -> 5.0d, 0.25d, float -> 1.5f (shortest representation that round-trips).
//  - durations -> [-][d.]hh:mm:ss[.fffffffff]
//  - lists -> < a, b, c >
//  - objects -> <object.to_string()>
std::string format_value(const value& v);

// Format up to `max` elements of `sequence`, skipping the first `start`:
//  < a, b, c >    all remaining elements were shown.
//  < a, b, c... > more elements remained.
//  <empty>        nothing was shown.
// The sequence is advanced at most `start + max + 1` times.
std::string format_collection(value_sequence& sequence, std::int64_t start, int max);
std::string format_collection(value_sequence&& sequence, std::int64_t start, int max);

// Format a duration as [-][d.]hh:mm:ss[.fffffffff].
std::string format_duration(duration d);

}  // namespace vd

// Allow values to be passed directly to fmt.
template <>
struct fmt::formatter<vd::value> {
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const vd::value& v, FormatContext& ctx) const -> decltype(ctx.out()) {
    const std::string formatted = vd::format_value(v);
    return std::copy(formatted.begin(), formatted.end(), ctx.out());
  }
};
