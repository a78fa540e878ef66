#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

#include "internal/runtime/task.hpp"
#include "internal/util/stack_capture.hpp"
#include "internal/util/time.hpp"

namespace asyncprof::session {

// Nanoseconds since the owning session's epoch.
using Offset = std::chrono::nanoseconds;

struct SourceSite {
  std::string   file;
  std::uint32_t line = 0;
  std::string   function;

  static SourceSite FromLocation(const std::source_location& location) {
    return SourceSite{location.file_name(), location.line(), location.function_name()};
  }

  bool Empty() const noexcept {
    return file.empty() && function.empty();
  }
};

// Terminal transition of a task, assigned in one piece.
struct TaskOutcome {
  runtime::TaskState         state{runtime::TaskState::kCompleted};
  Offset                     completed_at{};
  std::optional<std::string> failure;
};

struct TaskRecord {
  runtime::TaskId id = 0;
  std::string     name;
  std::string     callable;

  Offset                     created_at{};
  std::optional<Offset>      started_at;
  std::optional<TaskOutcome> outcome;

  std::optional<runtime::TaskId> parent_id;
  std::vector<runtime::TaskId>   children;

  SourceSite                   location;
  std::vector<util::StackFrame> stack;

  runtime::TaskState State() const noexcept {
    if (outcome) return outcome->state;
    return started_at ? runtime::TaskState::kRunning : runtime::TaskState::kCreated;
  }
};

enum class Severity : std::uint8_t {
  kWarning  = 0,
  kCritical = 1,
};

inline const char* ToString(Severity severity) {
  return severity == Severity::kCritical ? "critical" : "warning";
}

struct BlockingEvent {
  Offset         detected_at{};
  util::Duration duration{};
  SourceSite     location;
  // Empty for plain callbacks.
  std::string task_name;
  Severity    severity{Severity::kWarning};
};

struct LagSample {
  Offset         timestamp{};
  util::Duration expected_delay{};
  util::Duration actual_delay{};
  util::Duration lag{};
};

struct FunctionTiming {
  std::string   function;
  std::string   file;
  std::uint32_t line  = 0;
  std::uint64_t calls = 0;

  util::Duration total_time{};      // executing
  util::Duration cumulative_time{}; // wall clock, suspension included
  util::Duration suspended_time{};

  util::Duration PerCall() const noexcept {
    return calls == 0 ? util::Duration::zero() : total_time / static_cast<std::int64_t>(calls);
  }
};

} // namespace asyncprof::session
