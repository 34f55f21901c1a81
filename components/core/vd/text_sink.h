// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <ostream>
#include <string>
#include <string_view>

namespace vd {

// Destination for rendered text. Implementations report failures by throwing.
class text_sink {
 public:
  virtual ~text_sink() = default;

  // Append `text` to the current line.
  virtual void write(std::string_view text) = 0;

  // Append `text` and terminate the current line.
  virtual void write_line(std::string_view text);

  // Terminate the current line.
  virtual void write_line() = 0;
};

// Accumulates text in memory. Lines are terminated with '\n'.
class string_sink final : public text_sink {
 public:
  using text_sink::write_line;

  void write(std::string_view text) override;
  void write_line() override;

  const std::string& str() const noexcept { return buffer_; }

  // Take the accumulated text, leaving the sink empty.
  std::string release() noexcept;

 private:
  std::string buffer_{};
};

// Forwards text to a std::ostream. Stream failures are raised as `std::ios_base::failure`.
class ostream_sink final : public text_sink {
 public:
  // Enables failbit and badbit exceptions on `stream`.
  explicit ostream_sink(std::ostream& stream);

  using text_sink::write_line;

  void write(std::string_view text) override;
  void write_line() override;

 private:
  std::ostream& stream_;
};

}  // namespace vd
