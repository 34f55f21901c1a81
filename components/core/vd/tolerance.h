// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include "vd/enumerations.h"
#include "vd/value.h"

namespace vd {

// The tolerance an assertion compared its operands with.
class tolerance {
 public:
  tolerance() = default;
  tolerance(const tolerance_mode mode, value amount) : mode_(mode), amount_(std::move(amount)) {}

  static tolerance linear(value amount) { return {tolerance_mode::linear, std::move(amount)}; }
  static tolerance percent(value amount) { return {tolerance_mode::percent, std::move(amount)}; }
  static tolerance ulps(value amount) { return {tolerance_mode::ulps, std::move(amount)}; }

  constexpr tolerance_mode mode() const noexcept { return mode_; }
  const value& amount() const noexcept { return amount_; }

  // True when a mode is set and the amount is neither null nor zero.
  bool has_variance() const noexcept;

 private:
  tolerance_mode mode_{tolerance_mode::none};
  value amount_{};
};

}  // namespace vd
