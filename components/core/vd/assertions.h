// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <iterator>

#include "vd/error_types.h"

namespace vd {
namespace detail {

// Generates an exception message w/ a formatted string.
template <typename... Ts>
std::string format_assert(const char* const condition, const char* const file, const int line,
                          const char* const reason_fmt = nullptr, Ts&&... args) {
  std::string err = fmt::format("Assertion failed: {}\nFile: {}\nLine: {}", condition, file, line);
  if (reason_fmt != nullptr) {
    err.append("\nDetails: ");
    fmt::format_to(std::back_inserter(err), fmt::runtime(reason_fmt), std::forward<Ts>(args)...);
  }
  return err;
}

// Version that prints operands A & B as well. For binary comparisons.
template <typename A, typename B, typename... Ts>
std::string format_assert_binary(const char* const condition, const char* const file,
                                 const int line, const char* const a_name, A&& a,
                                 const char* const b_name, B&& b,
                                 const char* const reason_fmt = nullptr, Ts&&... args) {
  std::string err = fmt::format(
      "Assertion failed: {}\n"
      "Operands are: `{}` = {}, `{}` = {}\n"
      "File: {}\nLine: {}",
      condition, a_name, std::forward<A>(a), b_name, std::forward<B>(b), file, line);
  if (reason_fmt != nullptr) {
    err.append("\nDetails: ");
    fmt::format_to(std::back_inserter(err), fmt::runtime(reason_fmt), std::forward<Ts>(args)...);
  }
  return err;
}

}  // namespace detail
}  // namespace vd

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif  // __clang__

#define VD_ASSERT_IMPL(cond, file, line, handler, ...)                      \
  do {                                                                      \
    if (!static_cast<bool>(cond)) {                                         \
      throw vd::assertion_error(handler(#cond, file, line, ##__VA_ARGS__)); \
    }                                                                       \
  } while (false)

#define VD_ASSERT(cond, ...) \
  VD_ASSERT_IMPL(cond, __FILE__, __LINE__, vd::detail::format_assert, ##__VA_ARGS__)

#define VD_ASSERT_EQUAL(a, b, ...)                                                               \
  VD_ASSERT_IMPL((a) == (b), __FILE__, __LINE__, vd::detail::format_assert_binary, #a, a, #b, b, \
                 ##__VA_ARGS__)

#define VD_ASSERT_LESS_OR_EQ(a, b, ...)                                                          \
  VD_ASSERT_IMPL((a) <= (b), __FILE__, __LINE__, vd::detail::format_assert_binary, #a, a, #b, b, \
                 ##__VA_ARGS__)

#define VD_ASSERT_GREATER_OR_EQ(a, b, ...)                                                       \
  VD_ASSERT_IMPL((a) >= (b), __FILE__, __LINE__, vd::detail::format_assert_binary, #a, a, #b, b, \
                 ##__VA_ARGS__)

#ifdef __clang__
#pragma clang diagnostic pop
#endif  // __clang__
