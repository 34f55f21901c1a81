// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include <gtest/gtest.h>

#include "vd/error_types.h"
#include "vd/tolerance.h"
#include "vd/value.h"

namespace vd {
using namespace std::chrono_literals;

namespace {
class token final : public object_base {
 public:
  std::string to_string() const override { return "token"; }
  type_name type() const override { return type_name{"auth::token"}; }
};
}  // namespace

TEST(ValueTest, TestIntegerStorage) {
  EXPECT_TRUE(value{static_cast<signed char>(1)}.is_type<std::int8_t>());
  EXPECT_TRUE(value{short{1}}.is_type<std::int16_t>());
  EXPECT_TRUE(value{1}.is_type<std::int32_t>());
  EXPECT_TRUE(value{1ll}.is_type<std::int64_t>());
  EXPECT_TRUE(value{static_cast<unsigned char>(1)}.is_type<std::uint8_t>());
  EXPECT_TRUE(value{1u}.is_type<std::uint32_t>());
  EXPECT_TRUE(value{1ull}.is_type<std::uint64_t>());
  EXPECT_TRUE(value{'c'}.is_type<char>());
  EXPECT_TRUE(value{true}.is_type<bool>());
  EXPECT_EQ(7, *value{std::int64_t{7}}.get_if<std::int64_t>());
  EXPECT_EQ(nullptr, value{7}.get_if<double>());
}

TEST(ValueTest, TestOtherStorage) {
  EXPECT_TRUE(value{}.is_null());
  EXPECT_TRUE(value{nullptr}.is_null());
  EXPECT_TRUE(value{"text"}.is_type<std::string>());
  EXPECT_TRUE(value{std::string_view{"text"}}.is_type<std::string>());
  EXPECT_TRUE(value{2.0f}.is_type<float>());
  EXPECT_TRUE(value{2.0}.is_type<double>());
  const value list{std::vector<value>{1, "a"}};
  EXPECT_TRUE(list.is_type<list_value>());

  // All durations are stored as nanoseconds.
  const value minutes{2min};
  ASSERT_TRUE(minutes.is_type<duration>());
  EXPECT_EQ(duration{120'000'000'000}, *minutes.get_if<duration>());
}

TEST(ValueTest, TestObjects) {
  const value obj = make_object<token>();
  EXPECT_TRUE(obj.is_type<object_value>());
  EXPECT_FALSE(obj.is_null());
  EXPECT_EQ(type_name{"auth::token"}, obj.type());
  EXPECT_EQ(std::type_index(typeid(token)), obj.runtime_type());

  const value empty{std::shared_ptr<token>{}};
  EXPECT_TRUE(empty.is_null());
}

TEST(ValueTest, TestTypeNames) {
  EXPECT_EQ("std::int32_t", value{1}.type().full_name());
  EXPECT_EQ("std::uint64_t", value{1ull}.type().full_name());
  EXPECT_EQ("double", value{1.0}.type().full_name());
  EXPECT_EQ("std::string", value{"a"}.type().full_name());
  EXPECT_EQ("std::chrono::nanoseconds", value{1s}.type().full_name());
  EXPECT_EQ("std::vector<vd::value>", value{std::vector<value>{}}.type().full_name());

  EXPECT_NE(value{std::int32_t{1}}.runtime_type(), value{std::int64_t{1}}.runtime_type());
  EXPECT_EQ(value{1}.runtime_type(), value{2}.runtime_type());
}

TEST(ValueTest, TestTypeNameParsing) {
  const type_name name{"::outer::inner::leaf"};
  EXPECT_EQ(3u, name.segments().size());
  EXPECT_EQ("leaf", name.to_string(1));
  EXPECT_THROW(type_name{"::"}, invalid_argument_error);
  EXPECT_THROW(type_name{""}, invalid_argument_error);
}

TEST(ToleranceTest, TestHasVariance) {
  EXPECT_FALSE(tolerance{}.has_variance());
  EXPECT_FALSE((tolerance{tolerance_mode::none, 5}.has_variance()));
  EXPECT_FALSE(tolerance::linear(value{}).has_variance());
  EXPECT_FALSE(tolerance::linear(0).has_variance());
  EXPECT_FALSE(tolerance::linear(0.0).has_variance());
  EXPECT_FALSE(tolerance::linear(0s).has_variance());
  EXPECT_FALSE(tolerance::linear("").has_variance());
  EXPECT_TRUE(tolerance::linear(0.5).has_variance());
  EXPECT_TRUE(tolerance::percent(-1).has_variance());
  EXPECT_TRUE(tolerance::ulps(std::uint64_t{4}).has_variance());
  EXPECT_TRUE(tolerance::linear(1ms).has_variance());
  EXPECT_TRUE(tolerance::linear(make_object<token>()).has_variance());
}

TEST(ToleranceTest, TestModeNames) {
  EXPECT_EQ("None", string_from_tolerance_mode(tolerance_mode::none));
  EXPECT_EQ("Linear", string_from_tolerance_mode(tolerance_mode::linear));
  EXPECT_EQ("Percent", string_from_tolerance_mode(tolerance_mode::percent));
  EXPECT_EQ("Ulps", string_from_tolerance_mode(tolerance_mode::ulps));
  EXPECT_EQ(tolerance_mode::percent, tolerance::percent(3).mode());
}

}  // namespace vd
