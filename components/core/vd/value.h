// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <variant>
#include <vector>

#include "vd/type_name.h"

namespace vd {

class value;

// Interface for user types that can appear in failure messages.
class object_base {
 public:
  virtual ~object_base() = default;

  // Text placed between angle brackets when the object is formatted.
  virtual std::string to_string() const = 0;

  // Name used to tell this object apart from others that format identically.
  virtual type_name type() const = 0;
};

// Placeholder for a missing value.
struct null_value {};

// Durations are stored with nanosecond resolution.
using duration = std::chrono::nanoseconds;

// Ordered list of values, shared so that copies of a `value` are cheap.
struct list_value {
  std::shared_ptr<const std::vector<value>> elements;
};

// A user object.
struct object_value {
  std::shared_ptr<const object_base> object;
};

// A type-erased value that was compared by an assertion.
class value {
 public:
  using storage_type =
      std::variant<null_value, bool, char, std::int8_t, std::int16_t, std::int32_t, std::int64_t,
                   std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t, float, double,
                   std::string, duration, list_value, object_value>;

  // Construct null.
  value() noexcept = default;
  value(std::nullptr_t) noexcept {}  //  NOLINT

  value(bool b) noexcept : storage_(b) {}  //  NOLINT
  value(char c) noexcept : storage_(c) {}  //  NOLINT

  // Integers are stored as the fixed-width type of the same size and signedness.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T> &&
                                                    !std::is_same_v<T, bool> &&
                                                    !std::is_same_v<T, char>>>
  value(T v) noexcept : storage_(to_fixed_width(v)) {}  //  NOLINT

  value(float f) noexcept : storage_(f) {}   //  NOLINT
  value(double d) noexcept : storage_(d) {}  //  NOLINT

  value(const char* str) : storage_(std::string{str}) {}        //  NOLINT
  value(std::string_view str) : storage_(std::string{str}) {}   //  NOLINT
  value(std::string str) noexcept : storage_(std::move(str)) {}  //  NOLINT

  template <typename Rep, typename Period>
  value(const std::chrono::duration<Rep, Period> d)  //  NOLINT
      : storage_(std::chrono::duration_cast<duration>(d)) {}

  value(std::vector<value> elements);  //  NOLINT

  template <typename T, typename = std::enable_if_t<std::is_base_of_v<object_base, T>>>
  value(std::shared_ptr<T> object)  //  NOLINT
      : storage_(object_value{std::shared_ptr<const object_base>(std::move(object))}) {}

  // True if this is the null value, or an object holding a null pointer.
  bool is_null() const noexcept;

  // True if the active alternative is `T`.
  template <typename T>
  bool is_type() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  // Pointer to the alternative `T`, or nullptr.
  template <typename T>
  const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  const storage_type& storage() const noexcept { return storage_; }

  // Display name of the stored type.
  type_name type() const;

  // Identity of the stored C++ type. Two values whose runtime types differ may still report the
  // same `type()`.
  std::type_index runtime_type() const;

 private:
  template <typename T>
  static auto to_fixed_width(const T v) noexcept {
    if constexpr (std::is_signed_v<T>) {
      if constexpr (sizeof(T) == 1) {
        return static_cast<std::int8_t>(v);
      } else if constexpr (sizeof(T) == 2) {
        return static_cast<std::int16_t>(v);
      } else if constexpr (sizeof(T) == 4) {
        return static_cast<std::int32_t>(v);
      } else {
        static_assert(sizeof(T) == 8, "Unsupported integer width");
        return static_cast<std::int64_t>(v);
      }
    } else {
      if constexpr (sizeof(T) == 1) {
        return static_cast<std::uint8_t>(v);
      } else if constexpr (sizeof(T) == 2) {
        return static_cast<std::uint16_t>(v);
      } else if constexpr (sizeof(T) == 4) {
        return static_cast<std::uint32_t>(v);
      } else {
        static_assert(sizeof(T) == 8, "Unsupported integer width");
        return static_cast<std::uint64_t>(v);
      }
    }
  }

  storage_type storage_{};
};

// Construct an object of type `T` and wrap it in a value.
template <typename T, typename... Args>
value make_object(Args&&... args) {
  return value{std::make_shared<const T>(std::forward<Args>(args)...)};
}

}  // namespace vd
