// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/text_sink.h"

namespace vd {

void text_sink::write_line(const std::string_view text) {
  write(text);
  write_line();
}

void string_sink::write(const std::string_view text) { buffer_.append(text); }

void string_sink::write_line() { buffer_.push_back('\n'); }

std::string string_sink::release() noexcept {
  std::string result = std::move(buffer_);
  buffer_.clear();
  return result;
}

ostream_sink::ostream_sink(std::ostream& stream) : stream_(stream) {
  stream_.exceptions(std::ios_base::failbit | std::ios_base::badbit);
}

void ostream_sink::write(const std::string_view text) {
  stream_.write(text.data(), static_cast<std::streamsize>(text.size()));
}

void ostream_sink::write_line() { stream_.put('\n'); }

}  // namespace vd
