// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <optional>

#include "vd/enumerations.h"
#include "vd/value.h"

namespace vd {

// True for the tolerance modes whose difference is shown on an "Off by" line.
constexpr bool difference_line_applies(const tolerance_mode mode) noexcept {
  return mode == tolerance_mode::linear || mode == tolerance_mode::percent;
}

// Compute how far `actual` is from `expected` under `mode`.
//
//  - linear: |actual - expected|, in the widest type of the two operands (double, float,
//    uint64, int64, uint32, int32 in that order, with narrower integers promoted to int32).
//    Two durations produce a duration.
//  - percent: |actual - expected| / |expected| * 100, as a double. A zero `expected` yields
//    infinity, or NaN when both are zero.
//
// Returns nullopt when the operands are not both numbers or both durations, or when `mode` does
// not produce a difference (see `difference_line_applies`).
std::optional<value> numeric_difference(const value& expected, const value& actual,
                                        tolerance_mode mode);

}  // namespace vd
