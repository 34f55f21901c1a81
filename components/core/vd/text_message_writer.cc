// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/text_message_writer.h"

#include <tuple>

#include "vd/comparison_result.h"
#include "vd/error_types.h"
#include "vd/numeric_difference.h"
#include "vd/scoped_trace.h"
#include "vd/string_clipping.h"
#include "vd/string_utils.h"
#include "vd/type_name_resolver.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
VD_END_THIRD_PARTY_INCLUDES

namespace vd {

std::string message_writer::format_message(const std::string_view message,
                                           const fmt::format_args args) {
  try {
    return fmt::vformat(message, args);
  } catch (const fmt::format_error& err) {
    throw format_error("Invalid message template `{}`: {}", escape_control_chars(message),
                       err.what());
  }
}

void text_message_writer::set_max_line_length(const int length) {
  if (length < 0) {
    throw invalid_argument_error("Maximum line length must be non-negative, got {}.", length);
  }
  max_line_length_ = length;
}

void text_message_writer::display_differences(const comparison_result& result) {
  VD_FUNCTION_TRACE();
  state_ = idle_state{};
  write_expected_line(result);
  write_actual_line(result);
  result.write_additional_lines_to(*this);
}

void text_message_writer::display_differences(const value& expected, const value& actual) {
  VD_FUNCTION_TRACE();
  display_differences_impl(expected, actual, nullptr);
}

void text_message_writer::display_differences(const value& expected, const value& actual,
                                              const tolerance& tol) {
  VD_FUNCTION_TRACE();
  display_differences_impl(expected, actual, &tol);
}

void text_message_writer::display_differences_impl(const value& expected, const value& actual,
                                                   const tolerance* const tol) {
  state_ = idle_state{};
  if (needs_type_disambiguation(expected, actual)) {
    auto [expected_label, actual_label] = resolve_type_name_difference(expected, actual);
    state_ = rendering_state{std::move(expected_label), std::move(actual_label)};
  }
  write_expected_line(expected, tol);
  write_actual_line(actual);
  if (tol != nullptr) {
    write_difference_line(expected, actual, *tol);
  }
}

void text_message_writer::display_string_differences(const std::string_view expected,
                                                     const std::string_view actual,
                                                     const int mismatch, const bool ignore_case,
                                                     const bool clip) {
  VD_FUNCTION_TRACE();
  state_ = idle_state{};

  // Longest string that fits after the prefix and the two quotes.
  const int max_display_length = max_line_length_ - prefix_length - 2;

  std::string expected_text{expected};
  std::string actual_text{actual};
  if (clip) {
    std::tie(expected_text, actual_text) =
        clip_expected_and_actual(expected, actual, max_display_length, mismatch);
  }
  expected_text = escape_control_chars(expected_text);
  actual_text = escape_control_chars(actual_text);

  // Clipping and escaping both move characters, so the position is found again.
  const int position = find_mismatch_position(expected_text, actual_text, 0, ignore_case);

  sink_.write(prefix_expected);
  sink_.write(format_value(expected_text));
  if (ignore_case) {
    sink_.write(", ignoring case");
  }
  sink_.write_line();
  write_actual_line(actual_text);
  if (position != no_mismatch) {
    write_caret_line(position);
  }
}

void text_message_writer::write(const std::string_view text) { sink_.write(text); }

void text_message_writer::write_actual_value(const value& actual) { write_value(actual); }

void text_message_writer::write_value(const value& v) { sink_.write(format_value(v)); }

void text_message_writer::write_collection_elements(value_sequence& sequence,
                                                    const std::int64_t start, const int max) {
  sink_.write(format_collection(sequence, start, max));
}

void text_message_writer::write_formatted_message_line(const int level,
                                                       const std::string_view message) {
  if (level < 0) {
    throw invalid_argument_error("Message indentation level must be non-negative, got {}.",
                                 level);
  }
  sink_.write(std::string(static_cast<std::size_t>(indent_width * level), ' '));
  sink_.write_line(escape_null_characters(message));
}

void text_message_writer::write_expected_line(const comparison_result& result) {
  sink_.write(prefix_expected);
  sink_.write_line(result.description());
}

void text_message_writer::write_expected_line(const value& expected, const tolerance* const tol) {
  sink_.write(prefix_expected);
  sink_.write(format_value(expected));
  if (const rendering_state* labels = std::get_if<rendering_state>(&state_); labels != nullptr) {
    sink_.write(labels->expected_label);
  }
  if (tol != nullptr && tol->has_variance()) {
    sink_.write(" +/- ");
    sink_.write(format_value(tol->amount()));
    if (tol->mode() != tolerance_mode::linear) {
      sink_.write(" ");
      sink_.write(string_from_tolerance_mode(tol->mode()));
    }
  }
  sink_.write_line();
}

void text_message_writer::write_actual_line(const comparison_result& result) {
  sink_.write(prefix_actual);
  result.write_actual_value_to(*this);
  sink_.write_line();
}

void text_message_writer::write_actual_line(const value& actual) {
  sink_.write(prefix_actual);
  write_actual_value(actual);
  if (const rendering_state* labels = std::get_if<rendering_state>(&state_); labels != nullptr) {
    sink_.write(labels->actual_label);
  }
  sink_.write_line();
}

void text_message_writer::write_difference_line(const value& expected, const value& actual,
                                                const tolerance& tol) {
  if (!difference_line_applies(tol.mode())) {
    return;
  }
  const std::optional<value> difference = numeric_difference(expected, actual, tol.mode());
  if (!difference.has_value()) {
    return;
  }
  sink_.write(prefix_difference);
  sink_.write(format_value(*difference));
  if (tol.mode() != tolerance_mode::linear) {
    sink_.write(" ");
    sink_.write(string_from_tolerance_mode(tol.mode()));
  }
  sink_.write_line();
}

void text_message_writer::write_caret_line(const int mismatch) {
  sink_.write_line(format_caret_line(mismatch));
}

}  // namespace vd
