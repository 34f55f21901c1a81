// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/comparison_result.h"

#include "vd/message_writer.h"

namespace vd {

void comparison_result::write_actual_value_to(message_writer& writer) const {
  writer.write_actual_value(actual_value_);
}

void comparison_result::write_additional_lines_to(message_writer&) const {}

}  // namespace vd
