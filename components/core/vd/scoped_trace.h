// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#ifdef VD_ENABLE_TRACING
#define VD_CONCAT_(a, b) a##b
#define VD_CONCAT(a, b) VD_CONCAT_(a, b)

// Time the enclosing scope under the name `str` (a string literal).
#define VD_SCOPED_TRACE_STR(str) \
  vd::scoped_trace VD_CONCAT(__timer, __LINE__) { str }
#else
#define VD_SCOPED_TRACE_STR(str)
#endif  // VD_ENABLE_TRACING

#define VD_SCOPED_TRACE(name) VD_SCOPED_TRACE_STR(#name)
#define VD_FUNCTION_TRACE() VD_SCOPED_TRACE_STR(__FUNCTION__)

namespace vd {

struct trace_collector_impl;

// A completed span of time, as recorded by `scoped_trace`.
struct trace_event {
  // Name of the traced scope.
  std::string_view name;
  // Start time in microseconds.
  std::int64_t ts;
  std::uint32_t pid;
  std::uint32_t tid;
  // Duration in nanoseconds.
  std::int64_t dur_ns;
};

// Process-wide store of trace events. On destruction the events are written to the output path in
// chrome://tracing JSON format. The path is read from the `VD_TRACE_OUTPUT` environment variable
// at startup, and may be replaced with `set_output_path`. Nothing is written while it is empty.
class trace_collector {
 public:
  trace_collector();
  ~trace_collector();

  static trace_collector* get_instance();

  // Record an event. Safe to call from multiple threads.
  void submit_event(trace_event event);

  void set_output_path(const std::string& path);

  // Number of events recorded so far.
  std::size_t num_events() const;

  // Render recorded events as a JSON document.
  std::string to_json() const;

 private:
  void write_traces() const;

  std::unique_ptr<trace_collector_impl> impl_;
};

// Measure time elapsed in a scope, and submit it to the global `trace_collector`.
class scoped_trace {
 public:
  explicit scoped_trace(const std::string_view name) noexcept
      : name_(name), start_(std::chrono::steady_clock::now()) {}
  ~scoped_trace();

  scoped_trace(const scoped_trace&) = delete;
  scoped_trace(scoped_trace&&) = delete;
  scoped_trace& operator=(const scoped_trace&) = delete;
  scoped_trace& operator=(scoped_trace&&) = delete;

 private:
  std::string_view name_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace vd
