// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/numeric_difference.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "vd/utility/overloaded_visit.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <absl/numeric/int128.h>
VD_END_THIRD_PARTY_INCLUDES

namespace vd {

// Numeric representations, ordered from narrowest to widest.
enum class numeric_rank { int32, uint32, int64, uint64, float32, float64 };

// A number lifted out of a `value`, along with the rank of its original type.
struct numeric_operand {
  numeric_rank rank;
  // Valid when `rank` is an integer rank.
  absl::int128 integer{0};
  // Valid when `rank` is a floating point rank.
  double floating{0.0};

  constexpr bool is_integer() const noexcept { return rank < numeric_rank::float32; }

  double as_double() const noexcept {
    return is_integer() ? static_cast<double>(integer) : floating;
  }
};

static std::optional<numeric_operand> numeric_cast(const value& v) {
  return overloaded_visit(
      v.storage(),
      [](const std::int8_t x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::int32, x};
      },
      [](const std::int16_t x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::int32, x};
      },
      [](const std::int32_t x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::int32, x};
      },
      [](const std::uint8_t x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::int32, x};
      },
      [](const std::uint16_t x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::int32, x};
      },
      [](const std::uint32_t x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::uint32, x};
      },
      [](const std::int64_t x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::int64, x};
      },
      [](const std::uint64_t x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::uint64, x};
      },
      [](const float x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::float32, 0, static_cast<double>(x)};
      },
      [](const double x) -> std::optional<numeric_operand> {
        return numeric_operand{numeric_rank::float64, 0, x};
      },
      [](const auto&) -> std::optional<numeric_operand> { return std::nullopt; });
}

template <typename T>
static bool fits_in(const absl::int128 x) noexcept {
  return x >= absl::int128{std::numeric_limits<T>::min()} &&
         x <= absl::int128{std::numeric_limits<T>::max()};
}

// Store a non-negative integer difference in the type named by `rank`. When it does not fit, the
// next wider integer type that holds it is used, and double as a last resort.
static value integer_value(const absl::int128 difference, const numeric_rank rank) {
  if (rank == numeric_rank::int32 && fits_in<std::int32_t>(difference)) {
    return static_cast<std::int32_t>(difference);
  } else if (rank == numeric_rank::uint32 && fits_in<std::uint32_t>(difference)) {
    return static_cast<std::uint32_t>(difference);
  } else if (rank <= numeric_rank::int64 && fits_in<std::int64_t>(difference)) {
    return static_cast<std::int64_t>(difference);
  } else if (fits_in<std::uint64_t>(difference)) {
    return static_cast<std::uint64_t>(difference);
  }
  return static_cast<double>(difference);
}

static absl::int128 abs_difference(const absl::int128 a, const absl::int128 b) noexcept {
  return a > b ? a - b : b - a;
}

static std::optional<value> linear_difference(const numeric_operand& expected,
                                              const numeric_operand& actual) {
  const numeric_rank rank = std::max(expected.rank, actual.rank);
  if (rank == numeric_rank::float64) {
    return value{std::abs(actual.as_double() - expected.as_double())};
  } else if (rank == numeric_rank::float32) {
    return value{std::abs(static_cast<float>(actual.as_double()) -
                          static_cast<float>(expected.as_double()))};
  }
  return integer_value(abs_difference(actual.integer, expected.integer), rank);
}

static double percent_difference(const numeric_operand& expected, const numeric_operand& actual) {
  const double difference = expected.is_integer() && actual.is_integer()
                                ? static_cast<double>(abs_difference(actual.integer,
                                                                     expected.integer))
                                : std::abs(actual.as_double() - expected.as_double());
  return difference * 100.0 / std::abs(expected.as_double());
}

static std::optional<value> duration_difference(const duration expected, const duration actual,
                                                const tolerance_mode mode) {
  const absl::int128 difference = abs_difference(actual.count(), expected.count());
  if (mode == tolerance_mode::percent) {
    return value{static_cast<double>(difference) * 100.0 /
                 std::abs(static_cast<double>(expected.count()))};
  }
  if (!fits_in<duration::rep>(difference)) {
    // The difference cannot be expressed as a duration.
    return std::nullopt;
  }
  return value{duration{static_cast<duration::rep>(difference)}};
}

std::optional<value> numeric_difference(const value& expected, const value& actual,
                                        const tolerance_mode mode) {
  if (!difference_line_applies(mode)) {
    return std::nullopt;
  }
  const duration* expected_duration = expected.get_if<duration>();
  const duration* actual_duration = actual.get_if<duration>();
  if (expected_duration != nullptr && actual_duration != nullptr) {
    return duration_difference(*expected_duration, *actual_duration, mode);
  }

  const std::optional<numeric_operand> e = numeric_cast(expected);
  const std::optional<numeric_operand> a = numeric_cast(actual);
  if (!e.has_value() || !a.has_value()) {
    return std::nullopt;
  }
  if (mode == tolerance_mode::percent) {
    return value{percent_difference(*e, *a)};
  }
  return linear_difference(*e, *a);
}

}  // namespace vd
