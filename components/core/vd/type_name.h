// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "vd/third_party_imports.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <absl/container/inlined_vector.h>
#include <fmt/core.h>
VD_END_THIRD_PARTY_INCLUDES

namespace vd {

// Display name of a type: `::` separated namespace segments, plus template arguments.
// For example `geometry::box<std::int32_t>` has segments [geometry, box] and one argument.
class type_name {
 public:
  explicit type_name(std::string_view qualified_name, std::vector<type_name> template_args = {});

  // Render using at most the last `segments` namespace segments of every name, including the
  // names of template arguments. `segments == 1` yields the short name.
  std::string to_string(std::size_t segments) const;

  // Fully qualified rendering.
  std::string full_name() const;

  // Greatest number of segments in this name or any of its template arguments. Rendering with
  // this many segments is identical to `full_name()`.
  std::size_t max_depth() const noexcept;

  const auto& segments() const noexcept { return segments_; }
  const std::vector<type_name>& template_args() const noexcept { return args_; }

  bool operator==(const type_name& other) const;
  bool operator!=(const type_name& other) const { return !operator==(other); }

 private:
  absl::InlinedVector<std::string, 3> segments_;
  std::vector<type_name> args_;
};

}  // namespace vd

// Formats the fully qualified name.
template <>
struct fmt::formatter<vd::type_name> {
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const vd::type_name& name, FormatContext& ctx) const -> decltype(ctx.out()) {
    const std::string full = name.full_name();
    return std::copy(full.begin(), full.end(), ctx.out());
  }
};
