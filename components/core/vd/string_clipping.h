// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace vd {

// Marks content removed by clipping.
constexpr std::string_view ellipsis = "...";

// Returned by `find_mismatch_position` when the strings are equal.
constexpr int no_mismatch = -1;

// Positions and lengths below count UTF-8 encoded characters rather than bytes, so that they
// match columns of the rendered text.

// Index of the first character at or after `start` where `expected` and `actual` differ. Letters
// are compared with `fold_case` when `ignore_case` is set. When one string is a prefix of the
// other, the first character of the longer string that the shorter one lacks is the mismatch.
// Equal strings, and a `start` past the end of both strings, yield `no_mismatch`.
int find_mismatch_position(std::string_view expected, std::string_view actual, int start,
                           bool ignore_case);

// Keep at most `max_length` characters of `s` starting at `clip_start`, with `ellipsis` at either
// end where content was dropped. The ellipses count towards `max_length`.
std::string clip_string(std::string_view s, int max_length, int clip_start);

// Clip both strings to `max_display_length` with a common window that keeps `mismatch` visible.
// Strings that already fit are returned unchanged. The window shows the tails of the strings if
// that includes the mismatch, and is centered on the mismatch otherwise.
std::pair<std::string, std::string> clip_expected_and_actual(std::string_view expected,
                                                             std::string_view actual,
                                                             int max_display_length,
                                                             int mismatch);

// Two spaces, `prefix_length + mismatch - 1` dashes, then `^`. Below a line that starts with a
// message prefix and an opening quote, the caret lands under character `mismatch`.
std::string format_caret_line(int mismatch);

}  // namespace vd
