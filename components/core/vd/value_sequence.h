// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <optional>

#include "vd/value.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <absl/types/span.h>
VD_END_THIRD_PARTY_INCLUDES

namespace vd {

// A single-pass source of values. Consumers call `next()` until it returns nullopt, and never
// rewind. Generators that can only be walked once implement this directly.
class value_sequence {
 public:
  virtual ~value_sequence() = default;

  // Produce the next element, or nullopt once the sequence is exhausted.
  virtual std::optional<value> next() = 0;
};

// Walks the half-open range [begin, end). Elements must be convertible to `value`.
template <typename Iterator>
class iterator_sequence final : public value_sequence {
 public:
  iterator_sequence(Iterator begin, Iterator end) : it_(std::move(begin)), end_(std::move(end)) {}

  std::optional<value> next() override {
    if (it_ == end_) {
      return std::nullopt;
    }
    value result{*it_};
    ++it_;
    return result;
  }

 private:
  Iterator it_;
  Iterator end_;
};

template <typename Iterator>
iterator_sequence<Iterator> make_sequence(Iterator begin, Iterator end) {
  return iterator_sequence<Iterator>{std::move(begin), std::move(end)};
}

// Sequence over a contiguous block of values.
inline iterator_sequence<absl::Span<const value>::const_iterator> make_sequence(
    const absl::Span<const value> values) {
  return make_sequence(values.begin(), values.end());
}

}  // namespace vd
