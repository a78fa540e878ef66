#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/session/records.hpp"

namespace asyncprof::model {

inline constexpr const char* kNoBackend = "none";

// One tracked task with its tracked descendants.
struct TaskNode {
  runtime::TaskId    id = 0;
  std::string        name;
  std::string        callable;
  runtime::TaskState state{runtime::TaskState::kCreated};

  session::Offset                created_at{};
  std::optional<session::Offset> started_at;
  std::optional<session::Offset> completed_at;
  std::optional<util::Duration>  duration;
  std::optional<std::string>     failure;

  session::SourceSite           location;
  std::vector<util::StackFrame> stack;
  std::vector<TaskNode>         children;
};

struct LagSummary {
  util::Duration min{};
  util::Duration avg{};
  util::Duration max{};
  util::Duration p95{};
  std::size_t    sample_count           = 0;
  std::size_t    samples_over_threshold = 0;
};

struct TimelineEntry {
  runtime::TaskId    task_id = 0;
  std::string        name;
  session::Offset    start_offset{};
  util::Duration     duration{};
  std::size_t        depth = 0;
  runtime::TaskState state{runtime::TaskState::kCreated};
};

struct Timeline {
  std::vector<TimelineEntry> entries;
  util::Duration             total_duration{};
  std::size_t                max_concurrent = 0;
};

struct ProfileStats {
  std::string    backend{kNoBackend};
  util::Duration profiling_overhead{};

  std::uint64_t tasks_created   = 0;
  std::uint64_t tasks_completed = 0;
  std::uint64_t tasks_cancelled = 0;
  std::uint64_t tasks_failed    = 0;
  std::uint64_t tasks_dropped   = 0;

  LagSummary                           event_loop_lag;
  std::vector<session::BlockingEvent>  blocking_calls;
  std::vector<TaskNode>                task_hierarchy;
  std::vector<session::FunctionTiming> top_functions;
  Timeline                             timeline;
  std::vector<std::string>             warnings;
};

} // namespace asyncprof::model
