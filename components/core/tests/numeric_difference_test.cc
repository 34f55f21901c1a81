// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "vd/numeric_difference.h"
#include "vd/value_formatter.h"

namespace vd {
using namespace std::chrono_literals;

// Compute a difference that must exist, and return it formatted.
std::string formatted_difference(const value& expected, const value& actual,
                                 const tolerance_mode mode) {
  const std::optional<value> difference = numeric_difference(expected, actual, mode);
  if (!difference.has_value()) {
    ADD_FAILURE() << fmt::format("No difference between {} and {}", expected, actual);
    return "";
  }
  return format_value(*difference);
}

TEST(NumericDifferenceTest, TestModesWithDifferenceLine) {
  EXPECT_TRUE(difference_line_applies(tolerance_mode::linear));
  EXPECT_TRUE(difference_line_applies(tolerance_mode::percent));
  EXPECT_FALSE(difference_line_applies(tolerance_mode::none));
  EXPECT_FALSE(difference_line_applies(tolerance_mode::ulps));

  EXPECT_FALSE(numeric_difference(5.0, 6.0, tolerance_mode::none).has_value());
  EXPECT_FALSE(numeric_difference(5.0, 6.0, tolerance_mode::ulps).has_value());
}

TEST(NumericDifferenceTest, TestLinearFloatingPoint) {
  EXPECT_EQ("1.0d", formatted_difference(5.0, 6.0, tolerance_mode::linear));
  EXPECT_EQ("0.5d", formatted_difference(-0.25, 0.25, tolerance_mode::linear));
  EXPECT_EQ("2.5f", formatted_difference(1.0f, 3.5f, tolerance_mode::linear));

  // The wider operand decides the type.
  const std::optional<value> mixed = numeric_difference(1.5f, 4.0, tolerance_mode::linear);
  ASSERT_TRUE(mixed.has_value());
  EXPECT_TRUE(mixed->is_type<double>());
  const std::optional<value> float_and_int = numeric_difference(7, 2.5f, tolerance_mode::linear);
  ASSERT_TRUE(float_and_int.has_value());
  EXPECT_TRUE(float_and_int->is_type<float>());
  EXPECT_EQ("4.5f", format_value(*float_and_int));
}

TEST(NumericDifferenceTest, TestLinearIsSymmetric) {
  const std::vector<std::pair<value, value>> pairs = {
      {5.0, 6.0},
      {200, 210},
      {std::int64_t{-40}, std::uint32_t{12}},
      {0.1f, 0.7},
      {std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max()},
      {3s, 1500ms},
  };
  for (const auto& [a, b] : pairs) {
    EXPECT_EQ(formatted_difference(a, b, tolerance_mode::linear),
              formatted_difference(b, a, tolerance_mode::linear))
        << fmt::format("a = {}, b = {}", a, b);
  }
}

TEST(NumericDifferenceTest, TestLinearIntegers) {
  const std::optional<value> small = numeric_difference(10, 4, tolerance_mode::linear);
  ASSERT_TRUE(small.has_value());
  EXPECT_TRUE(small->is_type<std::int32_t>());
  EXPECT_EQ("6", format_value(*small));

  // Narrow integers are promoted.
  const std::optional<value> narrow =
      numeric_difference(std::int8_t{-100}, std::uint8_t{100}, tolerance_mode::linear);
  ASSERT_TRUE(narrow.has_value());
  EXPECT_TRUE(narrow->is_type<std::int32_t>());
  EXPECT_EQ("200", format_value(*narrow));

  const std::optional<value> wide =
      numeric_difference(std::int32_t{4}, std::int64_t{9}, tolerance_mode::linear);
  ASSERT_TRUE(wide.has_value());
  EXPECT_TRUE(wide->is_type<std::int64_t>());

  const std::optional<value> unsigned_32 =
      numeric_difference(5, std::uint32_t{7}, tolerance_mode::linear);
  ASSERT_TRUE(unsigned_32.has_value());
  EXPECT_TRUE(unsigned_32->is_type<std::uint32_t>());
  EXPECT_EQ("2", format_value(*unsigned_32));

  const std::optional<value> unsigned_64 =
      numeric_difference(std::int64_t{-1}, std::uint64_t{1}, tolerance_mode::linear);
  ASSERT_TRUE(unsigned_64.has_value());
  EXPECT_TRUE(unsigned_64->is_type<std::uint64_t>());
  EXPECT_EQ("2", format_value(*unsigned_64));
}

TEST(NumericDifferenceTest, TestLinearIntegerOverflow) {
  // The span of int32 does not fit in int32, so int64 is used.
  const std::optional<value> int32_span =
      numeric_difference(std::numeric_limits<std::int32_t>::min(),
                         std::numeric_limits<std::int32_t>::max(), tolerance_mode::linear);
  ASSERT_TRUE(int32_span.has_value());
  EXPECT_TRUE(int32_span->is_type<std::int64_t>());
  EXPECT_EQ("4294967295", format_value(*int32_span));

  const std::optional<value> int64_span =
      numeric_difference(std::numeric_limits<std::int64_t>::min(),
                         std::numeric_limits<std::int64_t>::max(), tolerance_mode::linear);
  ASSERT_TRUE(int64_span.has_value());
  EXPECT_TRUE(int64_span->is_type<std::uint64_t>());
  EXPECT_EQ("18446744073709551615", format_value(*int64_span));

  // Beyond uint64 the difference is reported as a double.
  const std::optional<value> beyond =
      numeric_difference(std::numeric_limits<std::int64_t>::min(),
                         std::numeric_limits<std::uint64_t>::max(), tolerance_mode::linear);
  ASSERT_TRUE(beyond.has_value());
  EXPECT_TRUE(beyond->is_type<double>());
}

TEST(NumericDifferenceTest, TestPercent) {
  EXPECT_EQ("5.0d", formatted_difference(200, 210, tolerance_mode::percent));
  EXPECT_EQ("5.0d", formatted_difference(200.0, 190.0, tolerance_mode::percent));
  EXPECT_EQ("20.0d", formatted_difference(5.0, 6.0, tolerance_mode::percent));
  EXPECT_EQ("20.0d", formatted_difference(-5.0, -6.0, tolerance_mode::percent));
  EXPECT_EQ("5.0d", formatted_difference(std::uint64_t{200}, std::int64_t{210},
                                         tolerance_mode::percent));

  const std::optional<value> percent = numeric_difference(200, 210, tolerance_mode::percent);
  ASSERT_TRUE(percent.has_value());
  ASSERT_TRUE(percent->is_type<double>());
  EXPECT_EQ(5.0, *percent->get_if<double>());
}

TEST(NumericDifferenceTest, TestPercentOfZero) {
  EXPECT_EQ("Infinity", formatted_difference(0, 4, tolerance_mode::percent));
  EXPECT_EQ("NaN", formatted_difference(0.0, 0.0, tolerance_mode::percent));
}

TEST(NumericDifferenceTest, TestDurations) {
  const std::optional<value> linear = numeric_difference(3s, 1500ms, tolerance_mode::linear);
  ASSERT_TRUE(linear.has_value());
  ASSERT_TRUE(linear->is_type<duration>());
  EXPECT_EQ(duration{1500ms}, *linear->get_if<duration>());
  EXPECT_EQ("00:00:01.500000000", format_value(*linear));

  EXPECT_EQ("50.0d", formatted_difference(2s, 3s, tolerance_mode::percent));
}

TEST(NumericDifferenceTest, TestNotComparable) {
  EXPECT_FALSE(numeric_difference(1s, 1.0, tolerance_mode::linear).has_value());
  EXPECT_FALSE(numeric_difference(4, 1s, tolerance_mode::linear).has_value());
  EXPECT_FALSE(numeric_difference("4", 4, tolerance_mode::linear).has_value());
  EXPECT_FALSE(numeric_difference(true, 1, tolerance_mode::linear).has_value());
  EXPECT_FALSE(numeric_difference('a', 'b', tolerance_mode::linear).has_value());
  EXPECT_FALSE(numeric_difference(value{}, 1.0, tolerance_mode::percent).has_value());
  EXPECT_FALSE(numeric_difference(std::vector<value>{1}, std::vector<value>{2},
                                  tolerance_mode::linear)
                   .has_value());
}

}  // namespace vd
