// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <variant>

#include "vd/message_layout.h"
#include "vd/message_writer.h"
#include "vd/text_sink.h"

namespace vd {

// Writes failure messages in the standard layout:
//
//   Expected: 5.0d +/- 0.05d
//   But was:  6.0d
//   Off by:   1.0d
//
// Lines are streamed to a `text_sink` as soon as they are complete.
class text_message_writer final : public message_writer {
 public:
  explicit text_message_writer(text_sink& sink) noexcept : sink_(sink) {}

  // Construct and write `user_message` (formatted with `args`) if it is not empty.
  template <typename... Ts>
  text_message_writer(text_sink& sink, const std::string_view user_message, const Ts&... args)
      : text_message_writer(sink) {
    if (!user_message.empty()) {
      write_message_line(0, user_message, args...);
    }
  }

  int max_line_length() const noexcept override { return max_line_length_; }
  void set_max_line_length(int length) override;

  void display_differences(const comparison_result& result) override;
  void display_differences(const value& expected, const value& actual) override;
  void display_differences(const value& expected, const value& actual,
                           const tolerance& tol) override;
  void display_string_differences(std::string_view expected, std::string_view actual,
                                  int mismatch, bool ignore_case, bool clip) override;

  void write(std::string_view text) override;
  void write_actual_value(const value& actual) override;
  void write_value(const value& v) override;

  using message_writer::write_collection_elements;
  void write_collection_elements(value_sequence& sequence, std::int64_t start,
                                 int max) override;

 protected:
  void write_formatted_message_line(int level, std::string_view message) override;

 private:
  // No type labels are in use.
  struct idle_state {};

  // Expected and actual format identically, so their type labels are appended.
  struct rendering_state {
    std::string expected_label;
    std::string actual_label;
  };

  void display_differences_impl(const value& expected, const value& actual,
                                const tolerance* tol);

  void write_expected_line(const comparison_result& result);
  void write_expected_line(const value& expected, const tolerance* tol);
  void write_actual_line(const comparison_result& result);
  void write_actual_line(const value& actual);
  void write_difference_line(const value& expected, const value& actual, const tolerance& tol);
  void write_caret_line(int mismatch);

  text_sink& sink_;
  int max_line_length_{default_max_line_length};
  std::variant<idle_state, rendering_state> state_{};
};

}  // namespace vd
