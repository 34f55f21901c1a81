// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/type_name.h"

#include <algorithm>

#include "vd/assertions.h"
#include "vd/string_utils.h"

namespace vd {

constexpr std::string_view namespace_separator = "::";

type_name::type_name(const std::string_view qualified_name, std::vector<type_name> template_args)
    : args_(std::move(template_args)) {
  std::size_t begin = 0;
  for (;;) {
    const std::size_t end = qualified_name.find(namespace_separator, begin);
    const std::string_view segment = qualified_name.substr(begin, end - begin);
    if (!segment.empty()) {
      segments_.emplace_back(segment);
    }
    if (end == std::string_view::npos) {
      break;
    }
    begin = end + namespace_separator.size();
  }
  if (segments_.empty()) {
    throw invalid_argument_error("Type name `{}` does not contain a name.", qualified_name);
  }
}

std::string type_name::to_string(const std::size_t segments) const {
  VD_ASSERT(segments > 0, "Cannot render a type name with zero segments.");
  const std::size_t count = std::min(segments, segments_.size());
  std::string result{};
  for (auto it = segments_.end() - static_cast<std::ptrdiff_t>(count); it != segments_.end();
       ++it) {
    if (!result.empty()) {
      result.append(namespace_separator);
    }
    result.append(*it);
  }
  if (!args_.empty()) {
    result.push_back('<');
    result.append(
        join(", ", args_, [segments](const type_name& arg) { return arg.to_string(segments); }));
    result.push_back('>');
  }
  return result;
}

std::string type_name::full_name() const { return to_string(max_depth()); }

std::size_t type_name::max_depth() const noexcept {
  std::size_t depth = segments_.size();
  for (const type_name& arg : args_) {
    depth = std::max(depth, arg.max_depth());
  }
  return depth;
}

bool type_name::operator==(const type_name& other) const {
  return segments_ == other.segments_ && args_ == other.args_;
}

}  // namespace vd
