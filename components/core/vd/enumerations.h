// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string_view>

namespace vd {

// How a tolerance amount is interpreted when two values are compared.
enum class tolerance_mode {
  // No tolerance was specified.
  none,
  // The amount is an absolute difference.
  linear,
  // The amount is a percentage of the expected value.
  percent,
  // The amount is a count of units in the last place.
  ulps,
};

// Convert `tolerance_mode` to the name appended after tolerance amounts and differences.
constexpr std::string_view string_from_tolerance_mode(const tolerance_mode mode) noexcept {
  switch (mode) {
    case tolerance_mode::none:
      return "None";
    case tolerance_mode::linear:
      return "Linear";
    case tolerance_mode::percent:
      return "Percent";
    case tolerance_mode::ulps:
      return "Ulps";
  }
  return "<NOT A VALID ENUM VALUE>";
}

}  // namespace vd
