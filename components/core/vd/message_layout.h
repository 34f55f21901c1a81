// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string_view>

// Fixed layout of failure messages.
namespace vd {

// Width of every line prefix. Clipping and caret placement are computed relative to it.
constexpr int prefix_length = 12;

constexpr std::string_view prefix_expected = "  Expected: ";
constexpr std::string_view prefix_actual = "  But was:  ";
constexpr std::string_view prefix_difference = "  Off by:   ";

static_assert(prefix_expected.size() == prefix_length, "Prefixes must be `prefix_length` wide");
static_assert(prefix_actual.size() == prefix_length, "Prefixes must be `prefix_length` wide");
static_assert(prefix_difference.size() == prefix_length, "Prefixes must be `prefix_length` wide");

// Line length used by writers unless configured otherwise.
constexpr int default_max_line_length = 78;

// Spaces added per indentation level of a message line.
constexpr int indent_width = 2;

}  // namespace vd
