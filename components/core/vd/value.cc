// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/value.h"

#include "vd/utility/overloaded_visit.h"

namespace vd {

value::value(std::vector<value> elements)
    : storage_(list_value{std::make_shared<const std::vector<value>>(std::move(elements))}) {}

bool value::is_null() const noexcept {
  if (std::holds_alternative<null_value>(storage_)) {
    return true;
  }
  const object_value* obj = std::get_if<object_value>(&storage_);
  return obj != nullptr && obj->object == nullptr;
}

// Names of the built-in alternatives.
struct builtin_type_names {
  type_name operator()(null_value) const { return type_name{"std::nullptr_t"}; }
  type_name operator()(bool) const { return type_name{"bool"}; }
  type_name operator()(char) const { return type_name{"char"}; }
  type_name operator()(std::int8_t) const { return type_name{"std::int8_t"}; }
  type_name operator()(std::int16_t) const { return type_name{"std::int16_t"}; }
  type_name operator()(std::int32_t) const { return type_name{"std::int32_t"}; }
  type_name operator()(std::int64_t) const { return type_name{"std::int64_t"}; }
  type_name operator()(std::uint8_t) const { return type_name{"std::uint8_t"}; }
  type_name operator()(std::uint16_t) const { return type_name{"std::uint16_t"}; }
  type_name operator()(std::uint32_t) const { return type_name{"std::uint32_t"}; }
  type_name operator()(std::uint64_t) const { return type_name{"std::uint64_t"}; }
  type_name operator()(float) const { return type_name{"float"}; }
  type_name operator()(double) const { return type_name{"double"}; }
  type_name operator()(const std::string&) const { return type_name{"std::string"}; }
  type_name operator()(duration) const { return type_name{"std::chrono::nanoseconds"}; }
  type_name operator()(const list_value&) const {
    return type_name{"std::vector", {type_name{"vd::value"}}};
  }
  type_name operator()(const object_value& obj) const {
    if (obj.object == nullptr) {
      return type_name{"std::nullptr_t"};
    }
    return obj.object->type();
  }
};

type_name value::type() const { return std::visit(builtin_type_names{}, storage_); }

std::type_index value::runtime_type() const {
  return overloaded_visit(
      storage_,
      [](const object_value& obj) -> std::type_index {
        if (obj.object == nullptr) {
          return typeid(null_value);
        }
        return typeid(*obj.object);
      },
      [](const auto& x) -> std::type_index { return typeid(x); });
}

}  // namespace vd
