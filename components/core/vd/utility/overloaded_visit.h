// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <variant>

namespace vd {
namespace detail {
template <class... Ts>
struct overloaded_struct : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
overloaded_struct(Ts...) -> overloaded_struct<Ts...>;
}  // namespace detail

// Visit `var` with whichever of `funcs` accepts the active alternative. A trailing `auto` lambda
// catches every remaining alternative.
template <typename... Funcs, typename Variant>
auto overloaded_visit(Variant&& var, Funcs&&... funcs) {
  return std::visit(detail::overloaded_struct{std::forward<Funcs>(funcs)...},
                    std::forward<Variant>(var));
}

}  // namespace vd
