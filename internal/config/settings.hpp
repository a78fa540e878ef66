#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "asyncprof/config/v1/config.pb.h"

namespace asyncprof::config {

inline constexpr const char* kAutoBackend = "auto";

/*
  Resolved, validated profiler options. This is what the engine consumes;
  the protobuf message only exists at the loading boundary.
*/
struct ProfilerSettings {
  std::string backend{kAutoBackend};

  std::chrono::nanoseconds blocking_threshold{std::chrono::milliseconds(100)};
  bool                     enable_blocking_detection{true};

  std::chrono::nanoseconds lag_sample_interval{std::chrono::milliseconds(10)};
  bool                     enable_lag_monitoring{true};
  std::chrono::nanoseconds lag_threshold{std::chrono::milliseconds(5)};

  std::size_t max_tracked_tasks{1000};
  bool        capture_task_stacks{false};
  std::size_t max_stack_depth{10};
  std::size_t top_functions{20};
};

// Applies defaults to unset fields and validates. Throws util::ConfigError.
ProfilerSettings ResolveSettings(const asyncprof::config::v1::ProfilerConfig& config);

} // namespace asyncprof::config
