#include "profiler_coordinator.hpp"

#include <new>
#include <utility>

#include "internal/model/summary.hpp"
#include "internal/model/task_hierarchy.hpp"
#include "internal/model/timeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace asyncprof::core {

namespace {

template <typename Fn>
void StopQuietly(const char* component, std::vector<std::string>& warnings, Fn&& fn) noexcept {
  try {
    fn();
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_WARN("Profiler component failed to stop cleanly",
                       {observability::StringField("component", component), observability::StringField("error", e.what())});
    try {
      warnings.push_back(std::string(component) + ": " + e.what());
    } catch (const std::bad_alloc&) {
      // The log line above is all we can keep.
    }
  }
}

} // namespace

ProfilerCoordinator::ProfilerCoordinator(runtime::EventLoop& loop, config::ProfilerSettings settings,
                                         const backend::BackendRegistry& registry)
    : loop_(loop), settings_(std::move(settings)), registry_(registry) {
}

ProfilerCoordinator::~ProfilerCoordinator() {
  Stop();
}

void ProfilerCoordinator::Start() noexcept {
  if (phase_ == Phase::kActive) {
    ASYNCPROF_LOG_DEBUG("Profiler already active");
    return;
  }

  const auto started = util::Now();
  try {
    lag_.reset();
    blocking_.reset();
    backend_.reset();
    warnings_.clear();
    backend_name_ = model::kNoBackend;
    overhead_     = util::Duration::zero();
    session_      = std::make_unique<session::Session>(started);
    phase_        = Phase::kActive;

    StartBackend();
    if (backend_) {
      StartDetectors();
    }
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_ERROR("Profiler failed to start", {observability::StringField("error", e.what())});
    backend_.reset();
    backend_name_ = model::kNoBackend;
  }
  overhead_ += util::Now() - started;

  ASYNCPROF_LOG_DEBUG("Profiler started", {observability::StringField("backend", backend_name_),
                                           observability::BoolField("blocking_detection", blocking_ != nullptr),
                                           observability::BoolField("lag_monitoring", lag_ != nullptr)});
}

void ProfilerCoordinator::StartBackend() {
  try {
    auto selection = backend::SelectBackend(registry_, settings_.backend);
    if (selection.warning) {
      Warn(*selection.warning);
    }

    try {
      StartEntry(*selection.entry);
    } catch (const util::BackendStartError& e) {
      // A deep backend can lose its hook between the availability check and Start().
      if (!selection.entry->deep || selection.fallback == selection.entry) throw;
      Warn("profiler backend '" + selection.entry->name + "' failed to start, using " + selection.fallback->name + ": " + e.what());
      StartEntry(*selection.fallback);
    }
  } catch (const std::exception& e) {
    Warn(std::string("profiling disabled: ") + e.what());
    backend_.reset();
    backend_name_ = model::kNoBackend;
  }
}

void ProfilerCoordinator::StartEntry(const backend::BackendEntry& entry) {
  auto instance = entry.create(backend::BackendContext{loop_, *session_, settings_});
  instance->Start();
  backend_name_ = std::string(instance->Name());
  backend_      = std::move(instance);
}

void ProfilerCoordinator::StartDetectors() {
  if (settings_.enable_blocking_detection) {
    try {
      blocking_ = std::make_unique<detectors::BlockingDetector>(loop_, session_->BlockingWriter(), settings_.blocking_threshold);
      blocking_->Start();
    } catch (const std::exception& e) {
      Warn(std::string("blocking detection disabled: ") + e.what());
      blocking_.reset();
    }
  }

  if (settings_.enable_lag_monitoring) {
    try {
      lag_ = std::make_unique<detectors::LagMonitor>(loop_, session_->LagWriter(), settings_.lag_sample_interval);
      lag_->Start();
    } catch (const std::exception& e) {
      Warn(std::string("lag monitoring disabled: ") + e.what());
      lag_.reset();
    }
  }
}

void ProfilerCoordinator::Stop() noexcept {
  if (phase_ != Phase::kActive) return;

  const auto started = util::Now();
  if (lag_) {
    StopQuietly("lag monitor", warnings_, [this] { lag_->Stop(); });
  }
  if (blocking_) {
    StopQuietly("blocking detector", warnings_, [this] { blocking_->Stop(); });
  }
  if (backend_) {
    StopQuietly(backend_name_.c_str(), warnings_, [this] { backend_->Stop(); });
  }

  session_->Finalize();
  phase_ = Phase::kFinalized;
  overhead_ += util::Now() - started;

  ASYNCPROF_LOG_DEBUG("Profiler stopped", {observability::DurationField("session", session_->Elapsed()),
                                           observability::IntField("tasks", static_cast<std::int64_t>(session_->Tasks().size())),
                                           observability::IntField("rejected_writes", static_cast<std::int64_t>(session_->RejectedWrites()))});
}

model::ProfileStats ProfilerCoordinator::GetStats() const noexcept {
  model::ProfileStats stats;
  if (phase_ == Phase::kIdle || !session_) {
    return stats;
  }

  try {
    stats.backend  = backend_name_;
    stats.warnings = warnings_;

    backend::BackendStats backend_stats;
    if (backend_) {
      backend_stats = backend_->GetStats();
    }
    stats.tasks_created = backend_stats.tasks_created;
    stats.tasks_dropped = backend_stats.tasks_dropped;

    const auto& tasks = session_->Tasks();
    for (const auto& task : tasks) {
      switch (task.State()) {
        case runtime::TaskState::kCompleted:
          ++stats.tasks_completed;
          break;
        case runtime::TaskState::kCancelled:
          ++stats.tasks_cancelled;
          break;
        case runtime::TaskState::kFailed:
          ++stats.tasks_failed;
          break;
        default:
          break;
      }
    }

    stats.task_hierarchy = model::BuildTaskHierarchy(tasks);
    stats.blocking_calls = session_->BlockingEvents();
    stats.event_loop_lag = model::SummarizeLag(session_->LagSamples(), settings_.lag_threshold);
    stats.top_functions  = model::TopFunctions(session_->FunctionTimings(), settings_.top_functions);
    stats.timeline       = model::BuildTimeline(stats.task_hierarchy, session_->Elapsed());

    stats.profiling_overhead = overhead_ + backend_stats.hook_overhead;
    if (blocking_) stats.profiling_overhead += blocking_->Overhead();
    if (lag_) stats.profiling_overhead += lag_->Overhead();
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_ERROR("Failed to assemble profile stats", {observability::StringField("error", e.what())});
    return model::ProfileStats{};
  }
  return stats;
}

std::string ProfilerCoordinator::Summary() const noexcept {
  try {
    return model::Summarize(GetStats(), settings_.lag_threshold);
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_ERROR("Failed to summarize profile", {observability::StringField("error", e.what())});
    return {};
  }
}

void ProfilerCoordinator::Warn(std::string message) {
  ASYNCPROF_LOG_WARN("Profiler warning", {observability::StringField("detail", message)});
  warnings_.push_back(std::move(message));
}

} // namespace asyncprof::core
