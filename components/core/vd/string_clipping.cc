// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/string_clipping.h"

#include <algorithm>
#include <vector>

#include "vd/assertions.h"
#include "vd/message_layout.h"
#include "vd/string_utils.h"

namespace vd {

// Character `index` of `s`, where `offsets` came from `utf8_character_offsets(s)`.
static std::string_view character_at(const std::string_view s,
                                     const std::vector<std::size_t>& offsets,
                                     const std::size_t index) {
  return s.substr(offsets[index], offsets[index + 1] - offsets[index]);
}

// A byte of 0x80 and above on its own is not a character, and is only equal to itself.
static bool is_stray_byte(const std::string_view character) noexcept {
  return character.size() == 1 && static_cast<unsigned char>(character[0]) >= 0x80;
}

static bool characters_equal(const std::string_view expected, const std::string_view actual,
                             const bool ignore_case) noexcept {
  if (expected == actual) {
    return true;
  }
  if (!ignore_case || is_stray_byte(expected) || is_stray_byte(actual)) {
    return false;
  }
  return fold_case(decode_utf8_character(expected)) == fold_case(decode_utf8_character(actual));
}

static int character_count(const std::string_view s) {
  return static_cast<int>(utf8_character_offsets(s).size() - 1);
}

int find_mismatch_position(const std::string_view expected, const std::string_view actual,
                           const int start, const bool ignore_case) {
  if (start < 0) {
    throw invalid_argument_error("Mismatch search cannot start at negative offset {}.", start);
  }
  const std::vector<std::size_t> expected_offsets = utf8_character_offsets(expected);
  const std::vector<std::size_t> actual_offsets = utf8_character_offsets(actual);
  const std::size_t expected_length = expected_offsets.size() - 1;
  const std::size_t actual_length = actual_offsets.size() - 1;
  const std::size_t length = std::min(expected_length, actual_length);

  const auto first = static_cast<std::size_t>(start);
  for (std::size_t i = first; i < length; ++i) {
    if (!characters_equal(character_at(expected, expected_offsets, i),
                          character_at(actual, actual_offsets, i), ignore_case)) {
      return static_cast<int>(i);
    }
  }
  if (expected_length == actual_length) {
    return no_mismatch;
  }
  // Every character of the longer string past the end of the shorter one is a mismatch.
  const std::size_t position = std::max(length, first);
  return position < std::max(expected_length, actual_length) ? static_cast<int>(position)
                                                             : no_mismatch;
}

std::string clip_string(const std::string_view s, const int max_length, const int clip_start) {
  VD_ASSERT_GREATER_OR_EQ(clip_start, 0);
  const std::vector<std::size_t> offsets = utf8_character_offsets(s);
  const std::size_t length = offsets.size() - 1;
  const int ellipsis_length = static_cast<int>(ellipsis.size());
  int clip_length = max_length;
  std::string result{};
  if (clip_start > 0) {
    clip_length -= ellipsis_length;
    result.append(ellipsis);
  }
  const std::size_t start = std::min(static_cast<std::size_t>(clip_start), length);
  if (static_cast<int>(length - start) > clip_length) {
    clip_length -= ellipsis_length;
    VD_ASSERT_GREATER_OR_EQ(clip_length, 0, "max_length = {} is too short to clip", max_length);
    const std::size_t end = start + static_cast<std::size_t>(clip_length);
    result.append(s.substr(offsets[start], offsets[end] - offsets[start]));
    result.append(ellipsis);
  } else {
    result.append(s.substr(offsets[start]));
  }
  return result;
}

std::pair<std::string, std::string> clip_expected_and_actual(const std::string_view expected,
                                                             const std::string_view actual,
                                                             const int max_display_length,
                                                             const int mismatch) {
  const int longest = std::max(character_count(expected), character_count(actual));
  if (longest <= max_display_length) {
    return std::make_pair(std::string{expected}, std::string{actual});
  }
  // Leave room for an ellipsis at both ends.
  const int ellipsis_length = static_cast<int>(ellipsis.size());
  if (max_display_length <= 2 * ellipsis_length) {
    throw invalid_argument_error("Cannot clip strings to {} characters.", max_display_length);
  }
  const int clip_length = max_display_length - ellipsis_length;
  int clip_start = longest - clip_length;
  if (clip_start > mismatch) {
    clip_start = std::max(0, mismatch - clip_length / 2);
  }
  return std::make_pair(clip_string(expected, max_display_length, clip_start),
                        clip_string(actual, max_display_length, clip_start));
}

std::string format_caret_line(const int mismatch) {
  VD_ASSERT_GREATER_OR_EQ(mismatch, 0);
  std::string line(static_cast<std::size_t>(indent_width), ' ');
  line.append(static_cast<std::size_t>(prefix_length + mismatch - 1), '-');
  line.push_back('^');
  return line;
}

}  // namespace vd
