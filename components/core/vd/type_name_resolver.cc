// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/type_name_resolver.h"

#include <algorithm>

#include "vd/value_formatter.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
VD_END_THIRD_PARTY_INCLUDES

namespace vd {

bool needs_type_disambiguation(const value& expected, const value& actual) {
  if (expected.is_null() || actual.is_null()) {
    return false;
  }
  return expected.runtime_type() != actual.runtime_type() &&
         format_value(expected) == format_value(actual);
}

std::pair<std::string, std::string> resolve_type_name_difference(const type_name& expected,
                                                                 const type_name& actual) {
  const std::size_t depth = std::max(expected.max_depth(), actual.max_depth());
  for (std::size_t segments = 1; segments < depth; ++segments) {
    std::string expected_label = expected.to_string(segments);
    std::string actual_label = actual.to_string(segments);
    if (expected_label != actual_label) {
      return std::make_pair(std::move(expected_label), std::move(actual_label));
    }
  }
  return std::make_pair(expected.full_name(), actual.full_name());
}

std::pair<std::string, std::string> resolve_type_name_difference(const value& expected,
                                                                 const value& actual) {
  const auto [expected_label, actual_label] =
      resolve_type_name_difference(expected.type(), actual.type());
  return std::make_pair(decorate_type_label(expected_label), decorate_type_label(actual_label));
}

std::string decorate_type_label(const std::string_view label) {
  return fmt::format(" ({})", label);
}

}  // namespace vd
