#include "instrumented_backend.hpp"

#include <exception>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace asyncprof::backend {

// ------------------------------------------------------------
// FunctionTimer
// ------------------------------------------------------------

/*
  Probe sink and task-switch observer in one.

  Open frames are kept per task (0 = outside any task). A frame accrues
  execution time only while its task is running; the gaps between
  suspension and resumption go to suspended time.
*/
class FunctionTimer final : public runtime::TaskSwitchObserver, public ProbeSink {
 public:
  explicit FunctionTimer(runtime::EventLoop& loop) : loop_(loop) {
  }

  void OnEnter(const std::source_location& site, util::TimePoint now) override {
    open_[CurrentTaskId()].push_back(Frame{site, now, now, {}, {}, std::nullopt});
    overhead_ += util::Now() - now;
  }

  void OnExit(const std::source_location& site, util::TimePoint now) override {
    auto it = open_.find(CurrentTaskId());
    if (it == open_.end()) return;

    auto& frames = it->second;
    for (auto frame = frames.rbegin(); frame != frames.rend(); ++frame) {
      if (!SameSite(frame->site, site)) continue;

      Frame closed = *frame;
      // Frames opened after it never saw their exit; drop them with it.
      frames.erase(std::prev(frame.base()), frames.end());
      Record(closed, now);
      break;
    }
    if (frames.empty()) open_.erase(it);
    overhead_ += util::Now() - now;
  }

  void OnTaskResumed(const runtime::Task& task) override {
    auto it = open_.find(task.Id());
    if (it == open_.end()) return;

    const auto now = util::Now();
    for (auto& frame : it->second) {
      if (!frame.suspended_at) continue;
      frame.suspended += now - *frame.suspended_at;
      frame.suspended_at.reset();
      frame.running_since = now;
    }
    overhead_ += util::Now() - now;
  }

  void OnTaskSuspended(const runtime::Task& task) override {
    auto it = open_.find(task.Id());
    if (it == open_.end()) return;

    const auto now = util::Now();
    for (auto& frame : it->second) {
      if (frame.suspended_at) continue;
      frame.executed += now - frame.running_since;
      frame.suspended_at = now;
    }
    overhead_ += util::Now() - now;
  }

  // Completed calls in first-seen order; frames still open are discarded.
  std::vector<session::FunctionTiming> Drain() {
    open_.clear();
    index_.clear();
    return std::exchange(timings_, {});
  }

  util::Duration Overhead() const noexcept {
    return overhead_;
  }

 private:
  struct Frame {
    std::source_location           site;
    util::TimePoint                entered;
    util::TimePoint                running_since;
    util::Duration                 executed{};
    util::Duration                 suspended{};
    std::optional<util::TimePoint> suspended_at;
  };

  static bool SameSite(const std::source_location& a, const std::source_location& b) {
    return a.line() == b.line() && std::string_view(a.file_name()) == b.file_name();
  }

  static std::string Key(const std::source_location& site) {
    return std::string(site.file_name()) + ":" + std::to_string(site.line()) + ":" + site.function_name();
  }

  runtime::TaskId CurrentTaskId() const {
    const auto* task = loop_.CurrentTask();
    return task ? task->Id() : 0;
  }

  void Record(const Frame& frame, util::TimePoint now) {
    auto executed  = frame.executed;
    auto suspended = frame.suspended;
    if (frame.suspended_at) {
      suspended += now - *frame.suspended_at;
    } else {
      executed += now - frame.running_since;
    }

    auto key = Key(frame.site);
    auto it  = index_.find(key);
    if (it == index_.end()) {
      session::FunctionTiming timing;
      timing.function = frame.site.function_name();
      timing.file     = frame.site.file_name();
      timing.line     = frame.site.line();
      it              = index_.emplace(std::move(key), timings_.size()).first;
      timings_.push_back(std::move(timing));
    }

    auto& timing = timings_[it->second];
    ++timing.calls;
    timing.total_time += executed;
    timing.cumulative_time += now - frame.entered;
    timing.suspended_time += suspended;
  }

  runtime::EventLoop&                                        loop_;
  std::unordered_map<runtime::TaskId, std::vector<Frame>>    open_;
  std::unordered_map<std::string, std::size_t>               index_;
  std::vector<session::FunctionTiming>                       timings_;
  util::Duration                                             overhead_{};
};

// ------------------------------------------------------------
// InstrumentedBackend
// ------------------------------------------------------------

InstrumentedBackend::InstrumentedBackend(BackendContext context) : context_(context), tracker_(context) {
}

InstrumentedBackend::~InstrumentedBackend() {
  try {
    Stop();
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_WARN("Instrumented backend stop failed", {observability::StringField("error", e.what())});
  }
}

bool InstrumentedBackend::IsAvailable() noexcept {
  return kProbesEnabled && util::Clock::is_steady && !FunctionProbeRegistry::Instance().Claimed();
}

void InstrumentedBackend::Start() {
  if (active_) return;
  if (!kProbesEnabled) {
    throw util::BackendStartError("function probes are compiled out (ASYNCPROF_ENABLE_PROBES=0)");
  }

  auto  timer    = std::make_shared<FunctionTimer>(context_.loop);
  auto& registry = FunctionProbeRegistry::Instance();
  if (!registry.Claim(timer.get())) {
    throw util::BackendStartError("function probe slot is already claimed by another session");
  }

  try {
    tracker_.Start();
    observer_hook_ = std::make_unique<runtime::ScopedTaskSwitchObserver>(context_.loop, timer);
  } catch (const std::exception& e) {
    registry.Release(timer.get());
    tracker_.Stop();
    throw util::BackendStartError(std::string("instrumented backend failed to start: ") + e.what());
  }

  timer_  = std::move(timer);
  active_ = true;
  ASYNCPROF_LOG_DEBUG("Instrumented backend started");
}

void InstrumentedBackend::Stop() {
  if (!active_) return;
  active_ = false;

  FunctionProbeRegistry::Instance().Release(timer_.get());

  std::exception_ptr conflict;
  try {
    if (observer_hook_) observer_hook_->Restore();
  } catch (const util::HookConflict&) {
    conflict = std::current_exception();
  }
  observer_hook_.reset();

  try {
    tracker_.Stop();
  } catch (const util::HookConflict&) {
    if (!conflict) conflict = std::current_exception();
  }

  auto writer  = context_.session.FunctionWriter();
  auto timings = timer_->Drain();
  for (auto& timing : timings) {
    writer.Append(std::move(timing));
  }
  ASYNCPROF_LOG_DEBUG("Instrumented backend stopped", {observability::IntField("functions", static_cast<std::int64_t>(timings.size()))});

  if (conflict) std::rethrow_exception(conflict);
}

BackendStats InstrumentedBackend::GetStats() const {
  auto stats    = tracker_.GetStats();
  stats.backend = kName;
  if (timer_) stats.hook_overhead += timer_->Overhead();
  return stats;
}

} // namespace asyncprof::backend
