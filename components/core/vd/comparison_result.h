// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>

#include "vd/value.h"

namespace vd {

class message_writer;

// Outcome of a failed comparison, as reported by the constraint that performed it. Constraints
// that need to present their actual value differently, or append more lines (a nested diff, for
// example), override the two `write_*_to` methods.
class comparison_result {
 public:
  comparison_result(std::string description, value actual_value)
      : description_(std::move(description)), actual_value_(std::move(actual_value)) {}

  virtual ~comparison_result() = default;

  // What the constraint expected, in words.
  const std::string& description() const noexcept { return description_; }

  // The value the constraint was applied to.
  const value& actual_value() const noexcept { return actual_value_; }

  // Write the actual value. By default: `writer.write_actual_value(actual_value())`.
  virtual void write_actual_value_to(message_writer& writer) const;

  // Write lines that follow the actual value. Writes nothing by default.
  virtual void write_additional_lines_to(message_writer& writer) const;

 private:
  std::string description_;
  value actual_value_;
};

}  // namespace vd
