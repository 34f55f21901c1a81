// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <string_view>
#include <vector>

// Some utilities for building strings.
namespace vd {

// Join using the provided formatter and separator.
template <typename Formatter, typename Container>
std::string join(const std::string_view separator, const Container& container,
                 Formatter&& formatter) {
  auto it = container.begin();
  if (it == container.end()) {
    return "";
  }
  std::string result{};
  result += formatter(*it);
  for (++it; it != container.end(); ++it) {
    result.append(separator);
    result += formatter(*it);
  }
  return result;
}

// Replace every NUL character with the two character escape `\0`.
std::string escape_null_characters(std::string_view text);

// Replace control characters with C-style escapes (`\n`, `\t`, `\x1B`, ...). Backslashes are left
// untouched, so escaping an already escaped string is a no-op.
std::string escape_control_chars(std::string_view text);

// Byte offset of the first byte of every UTF-8 encoded character in `text`, followed by
// `text.size()`. A byte that does not begin a complete, well-formed sequence is one character.
std::vector<std::size_t> utf8_character_offsets(std::string_view text);

// Code point of a single character, as delimited by `utf8_character_offsets`. A lone byte that
// is not valid UTF-8 decodes to its own value.
char32_t decode_utf8_character(std::string_view character) noexcept;

// Simple lowercase mapping of ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic capitals.
// Every other code point is returned unchanged.
char32_t fold_case(char32_t c) noexcept;

}  // namespace vd
