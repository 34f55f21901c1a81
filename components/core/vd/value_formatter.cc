// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/value_formatter.h"

#include <cmath>

#include "vd/error_types.h"
#include "vd/string_utils.h"
#include "vd/utility/overloaded_visit.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
VD_END_THIRD_PARTY_INCLUDES

namespace vd {

// Shortest round-trip representation of a floating point value, followed by `suffix`.
template <typename T>
static std::string format_floating_point(const T x, const char suffix) {
  if (std::isnan(x)) {
    return "NaN";
  } else if (std::isinf(x)) {
    return x > 0 ? "Infinity" : "-Infinity";
  }
  std::string result = fmt::format("{}", x);
  if (result.find_first_of(".e") == std::string::npos) {
    result.append(".0");
  }
  result.push_back(suffix);
  return result;
}

std::string format_duration(const duration d) {
  // Work with the magnitude in unsigned arithmetic so the most negative duration is handled.
  const auto count = d.count();
  std::uint64_t remaining = count < 0 ? 0 - static_cast<std::uint64_t>(count)
                                      : static_cast<std::uint64_t>(count);
  constexpr std::uint64_t nanos_per_second = 1'000'000'000;
  const std::uint64_t nanos = remaining % nanos_per_second;
  remaining /= nanos_per_second;
  const std::uint64_t seconds = remaining % 60;
  remaining /= 60;
  const std::uint64_t minutes = remaining % 60;
  remaining /= 60;
  const std::uint64_t hours = remaining % 24;
  const std::uint64_t days = remaining / 24;

  std::string result = count < 0 ? "-" : "";
  if (days > 0) {
    fmt::format_to(std::back_inserter(result), "{}.", days);
  }
  fmt::format_to(std::back_inserter(result), "{:02}:{:02}:{:02}", hours, minutes, seconds);
  if (nanos > 0) {
    fmt::format_to(std::back_inserter(result), ".{:09}", nanos);
  }
  return result;
}

std::string format_value(const value& v) {
  return overloaded_visit(
      v.storage(), [](null_value) -> std::string { return "null"; },
      [](const bool b) -> std::string { return b ? "true" : "false"; },
      [](const char c) { return fmt::format("'{}'", escape_control_chars({&c, 1})); },
      [](const float f) { return format_floating_point(f, 'f'); },
      [](const double d) { return format_floating_point(d, 'd'); },
      [](const std::string& s) { return fmt::format("\"{}\"", escape_control_chars(s)); },
      [](const duration d) { return format_duration(d); },
      [](const list_value& list) {
        if (list.elements == nullptr) {
          return format_collection(make_sequence(absl::Span<const value>{}), 0,
                                   default_collection_elements);
        }
        return format_collection(make_sequence(*list.elements), 0, default_collection_elements);
      },
      [](const object_value& obj) -> std::string {
        if (obj.object == nullptr) {
          return "null";
        }
        return fmt::format("<{}>", obj.object->to_string());
      },
      // Remaining alternatives are integers. int8/uint8 are promoted so they print as numbers.
      [](const auto integer) { return fmt::format("{}", +integer); });
}

std::string format_collection(value_sequence& sequence, const std::int64_t start, const int max) {
  if (start < 0 || max < 0) {
    throw invalid_argument_error("Collection window must be non-negative (start = {}, max = {}).",
                                 start, max);
  }
  std::int64_t index = 0;
  int count = 0;
  std::string result{};
  while (std::optional<value> element = sequence.next()) {
    if (index++ < start) {
      continue;
    }
    if (++count > max) {
      break;
    }
    result.append(count == 1 ? "< " : ", ");
    result.append(format_value(*element));
  }
  if (count == 0) {
    return "<empty>";
  }
  if (count > max) {
    result.append(max == 0 ? "< ..." : "...");
  }
  result.append(" >");
  return result;
}

std::string format_collection(value_sequence&& sequence, const std::int64_t start,
                              const int max) {
  return format_collection(sequence, start, max);
}

}  // namespace vd
