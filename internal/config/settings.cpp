#include "settings.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace asyncprof::config {

namespace {

std::chrono::nanoseconds ResolveDuration(bool present, const google::protobuf::Duration& value, std::chrono::nanoseconds fallback,
                                         const char* field) {
  if (!present) return fallback;

  const auto resolved = util::FromProto(value);
  if (resolved < std::chrono::nanoseconds::zero()) {
    throw util::ConfigError(std::string("Invalid configuration: ") + field + " must not be negative");
  }
  return resolved;
}

} // namespace

ProfilerSettings ResolveSettings(const asyncprof::config::v1::ProfilerConfig& config) {
  ProfilerSettings settings;

  if (!config.backend().empty()) {
    settings.backend = config.backend();
  }

  settings.blocking_threshold =
      ResolveDuration(config.has_blocking_threshold(), config.blocking_threshold(), settings.blocking_threshold, "blocking_threshold");
  if (config.has_enable_blocking_detection()) {
    settings.enable_blocking_detection = config.enable_blocking_detection();
  }

  settings.lag_sample_interval = ResolveDuration(config.has_lag_sample_interval(), config.lag_sample_interval(),
                                                 settings.lag_sample_interval, "lag_sample_interval");
  if (settings.lag_sample_interval == std::chrono::nanoseconds::zero()) {
    throw util::ConfigError("Invalid configuration: lag_sample_interval must be positive");
  }
  if (config.has_enable_lag_monitoring()) {
    settings.enable_lag_monitoring = config.enable_lag_monitoring();
  }
  settings.lag_threshold =
      ResolveDuration(config.has_lag_threshold(), config.lag_threshold(), settings.lag_threshold, "lag_threshold");

  if (config.has_max_tracked_tasks()) {
    settings.max_tracked_tasks = config.max_tracked_tasks();
  }
  settings.capture_task_stacks = config.capture_task_stacks();
  if (config.has_max_stack_depth()) {
    if (config.max_stack_depth() == 0) {
      throw util::ConfigError("Invalid configuration: max_stack_depth must be positive");
    }
    settings.max_stack_depth = config.max_stack_depth();
  }
  if (config.has_top_functions()) {
    settings.top_functions = config.top_functions();
  }

  return settings;
}

} // namespace asyncprof::config
