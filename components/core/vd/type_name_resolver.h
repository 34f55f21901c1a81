// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <utility>

#include "vd/value.h"

namespace vd {

// True when `expected` and `actual` are both non-null, have different runtime types, and yet
// format to the same text (for example `std::int32_t{4}` and `std::int64_t{4}`).
bool needs_type_disambiguation(const value& expected, const value& actual);

// Find the shortest renderings of two type names that differ. Names start unqualified and gain
// one namespace segment per step. If the names are still equal once fully qualified, the fully
// qualified names are returned as they are.
std::pair<std::string, std::string> resolve_type_name_difference(const type_name& expected,
                                                                 const type_name& actual);

// Resolve the type names of two values, decorated with `decorate_type_label`.
std::pair<std::string, std::string> resolve_type_name_difference(const value& expected,
                                                                 const value& actual);

// Produce " (label)", ready to be appended to a formatted value.
std::string decorate_type_label(std::string_view label);

}  // namespace vd
