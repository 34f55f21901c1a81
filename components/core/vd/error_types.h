// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <string_view>

#include "vd/third_party_imports.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/core.h>
VD_END_THIRD_PARTY_INCLUDES

// Every exception thrown by the renderer derives from `exception_base`.
namespace vd {

// Base type for errors.
struct exception_base : std::exception {
  explicit exception_base(std::string&& message) noexcept : message_(std::move(message)) {}

  // Construct with format specifier and arguments.
  template <typename... Ts>
  explicit exception_base(fmt::format_string<Ts...> fmt, Ts&&... args)
      : exception_base(fmt::format(fmt, std::forward<Ts>(args)...)) {}

  [[nodiscard]] std::string_view message() const noexcept { return message_; }

  const char* what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

// Thrown when internal assertions fire.
struct assertion_error final : exception_base {
  using exception_base::exception_base;
};

// Thrown when a message template and its arguments do not agree. The line is not written.
struct format_error final : exception_base {
  using exception_base::exception_base;
};

// Thrown when an argument is outside the range an operation accepts.
struct invalid_argument_error final : exception_base {
  using exception_base::exception_base;
};

}  // namespace vd
