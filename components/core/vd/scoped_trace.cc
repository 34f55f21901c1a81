// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/scoped_trace.h"

#include <atomic>
#include <cstdlib>
#include <deque>
#include <exception>
#include <fstream>
#include <mutex>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>  // getpid
#endif  // _WIN32

#include "vd/third_party_imports.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
VD_END_THIRD_PARTY_INCLUDES

// Format vd::trace_event as a chrome://tracing "complete" event.
template <>
struct fmt::formatter<vd::trace_event> {
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const vd::trace_event& event, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(),
        R"json({{ "name": "{}", "cat": "", "ph": "X", "ts": {}, "pid": {}, "tid": {}, )json"
        R"json("dur": {}, "dur_ns": {} }})json",
        event.name, event.ts, event.pid, event.tid, event.dur_ns / 1000, event.dur_ns);
  }
};

namespace vd {

struct trace_collector_impl {
  std::deque<trace_event> events;
  mutable std::mutex mutex;
  std::string output_path{};
};

static std::uint32_t current_process_id() noexcept {
#ifdef _WIN32
  return static_cast<std::uint32_t>(GetCurrentProcessId());
#else
  return static_cast<std::uint32_t>(getpid());
#endif
}

// Threads are numbered in the order they first submit an event.
static std::uint32_t current_thread_number() noexcept {
  static std::atomic<std::uint32_t> next_number{0};
  const thread_local std::uint32_t number = next_number++;
  return number;
}

trace_collector* trace_collector::get_instance() {
  static trace_collector global_collector{};
  return &global_collector;
}

trace_collector::trace_collector() : impl_(std::make_unique<trace_collector_impl>()) {
  if (const char* const path = std::getenv("VD_TRACE_OUTPUT"); path != nullptr) {
    impl_->output_path = path;
  }
}

trace_collector::~trace_collector() {
  if (std::uncaught_exceptions() > 0) {
    return;
  }
  write_traces();
}

void trace_collector::submit_event(trace_event event) {
  std::lock_guard guard{impl_->mutex};
  impl_->events.push_back(event);
}

void trace_collector::set_output_path(const std::string& path) {
  std::lock_guard guard{impl_->mutex};
  impl_->output_path = path;
}

std::size_t trace_collector::num_events() const {
  std::lock_guard guard{impl_->mutex};
  return impl_->events.size();
}

std::string trace_collector::to_json() const {
  std::lock_guard guard{impl_->mutex};
  return fmt::format("{{\n  \"traceEvents\": [\n    {}\n  ],\n  \"displayTimeUnit\": \"ns\"\n}}\n",
                     fmt::join(impl_->events, ",\n    "));
}

void trace_collector::write_traces() const {
  std::string path;
  {
    std::lock_guard guard{impl_->mutex};
    path = impl_->output_path;
  }
  if (path.empty()) {
    return;
  }
  if (std::ofstream output(path); output.good()) {
    fmt::print("Writing trace events to: {}\n", path);
    output << to_json();
  }
}

template <typename U, typename T>
static auto cast_time(const T& dur) {
  return std::chrono::duration_cast<U>(dur).count();
}

scoped_trace::~scoped_trace() {
  const auto end = std::chrono::steady_clock::now();
  if (std::uncaught_exceptions() > 0) {
    return;
  }
  const std::int64_t duration_nanos = cast_time<std::chrono::nanoseconds>(end - start_);
  const std::int64_t start_micros =
      cast_time<std::chrono::microseconds>(start_.time_since_epoch());
  trace_collector::get_instance()->submit_event(trace_event{
      name_, start_micros, current_process_id(), current_thread_number(), duration_nanos});
}

}  // namespace vd
