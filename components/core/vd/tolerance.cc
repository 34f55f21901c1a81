// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/tolerance.h"

#include "vd/utility/overloaded_visit.h"

namespace vd {

bool tolerance::has_variance() const noexcept {
  if (mode_ == tolerance_mode::none) {
    return false;
  }
  return overloaded_visit(
      amount_.storage(), [](null_value) { return false; },
      [](const duration d) { return d != duration::zero(); },
      [](const std::string& s) { return !s.empty(); },
      [](const list_value& l) { return l.elements != nullptr && !l.elements->empty(); },
      [](const object_value& obj) { return obj.object != nullptr; },
      [](const auto x) { return x != decltype(x){0}; });
}

}  // namespace vd
