// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "vd/tolerance.h"
#include "vd/value_formatter.h"
#include "vd/value_sequence.h"

namespace vd {

class comparison_result;

// Writes the description of a failed comparison, one line at a time. Constraints call the
// high-level `display_*` methods, and may use the low-level `write_*` methods from their
// `comparison_result` callbacks to control how their values appear.
//
// Writers hold per-call state and must not be shared between threads.
class message_writer {
 public:
  virtual ~message_writer() = default;

  // Maximum length of a line. Affects every write that follows.
  virtual int max_line_length() const noexcept = 0;
  virtual void set_max_line_length(int length) = 0;

  // Write `message` on its own line, indented by `level` steps. When `args` are provided they are
  // substituted into `message` with fmt syntax, and a template that does not agree with its
  // arguments raises `format_error` before anything is written. Without `args` the message is
  // written verbatim. NUL characters are escaped.
  template <typename... Ts>
  void write_message_line(const int level, const std::string_view message, const Ts&... args) {
    if constexpr (sizeof...(Ts) == 0) {
      write_formatted_message_line(level, message);
    } else {
      write_formatted_message_line(level,
                                   format_message(message, fmt::make_format_args(args...)));
    }
  }

  // Expected line from the result description, actual line from the result, and then whatever
  // additional lines the result appends.
  virtual void display_differences(const comparison_result& result) = 0;

  // Expected and actual lines for two values.
  virtual void display_differences(const value& expected, const value& actual) = 0;

  // Expected and actual lines for two values, with `tol` on the expected line and the difference
  // between the values on a third line (for linear and percent tolerances).
  virtual void display_differences(const value& expected, const value& actual,
                                   const tolerance& tol) = 0;

  // Expected and actual lines for two strings, followed by a caret under the first mismatch. When
  // `clip` is set the strings are shortened to fit `max_line_length`.
  virtual void display_string_differences(std::string_view expected, std::string_view actual,
                                          int mismatch, bool ignore_case, bool clip) = 0;

  // Append raw text to the current line.
  virtual void write(std::string_view text) = 0;

  // Write a value that was produced by the code under test.
  virtual void write_actual_value(const value& actual) = 0;

  // Write any value.
  virtual void write_value(const value& v) = 0;

  // Write up to `max` elements of `sequence`, starting at element `start`.
  virtual void write_collection_elements(value_sequence& sequence, std::int64_t start,
                                         int max) = 0;

  void write_collection_elements(value_sequence&& sequence, const std::int64_t start,
                                 const int max) {
    write_collection_elements(sequence, start, max);
  }

 protected:
  // Indent and write a message that has already been formatted.
  virtual void write_formatted_message_line(int level, std::string_view message) = 0;

  // Substitute `args` into `message`. Throws `format_error` on mismatch.
  static std::string format_message(std::string_view message, fmt::format_args args);
};

}  // namespace vd
