#include "scoped_hooks.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace asyncprof::runtime {

namespace {

template <typename Restorer>
void RestoreQuietly(Restorer& restorer, const char* hook) noexcept {
  try {
    restorer.Restore();
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_WARN("Hook restore failed", {observability::StringField("hook", hook), observability::StringField("error", e.what())});
  }
}

} // namespace

// ------------------------------------------------------------
// ScopedTaskFactory
// ------------------------------------------------------------

ScopedTaskFactory::ScopedTaskFactory(EventLoop& loop, TaskFactory factory)
    : loop_(loop), previous_(loop.GetTaskFactory()), installed_(std::make_shared<const TaskFactory>(std::move(factory))) {
  loop_.SetTaskFactory(installed_);
}

ScopedTaskFactory::~ScopedTaskFactory() {
  RestoreQuietly(*this, "task_factory");
}

void ScopedTaskFactory::Restore() {
  if (!installed_) return;

  const auto current   = loop_.GetTaskFactory();
  const auto installed = std::exchange(installed_, nullptr);

  loop_.SetTaskFactory(previous_);
  if (current != installed) {
    throw util::HookConflict("task factory was replaced while profiling was active");
  }
}

// ------------------------------------------------------------
// ScopedSlowCallbackHook
// ------------------------------------------------------------

ScopedSlowCallbackHook::ScopedSlowCallbackHook(EventLoop& loop, util::Duration threshold, SlowCallbackSinkPtr sink)
    : loop_(loop),
      previous_threshold_(loop.SlowCallbackDuration()),
      previous_sink_(loop.GetSlowCallbackSink()),
      installed_(std::move(sink)) {
  loop_.SetSlowCallbackDuration(threshold);
  loop_.SetSlowCallbackSink(installed_);
}

ScopedSlowCallbackHook::~ScopedSlowCallbackHook() {
  RestoreQuietly(*this, "slow_callback");
}

void ScopedSlowCallbackHook::Restore() {
  if (!installed_) return;

  const auto current   = loop_.GetSlowCallbackSink();
  const auto installed = std::exchange(installed_, nullptr);

  loop_.SetSlowCallbackDuration(previous_threshold_);
  loop_.SetSlowCallbackSink(previous_sink_);
  if (current != installed) {
    throw util::HookConflict("slow callback sink was replaced while profiling was active");
  }
}

// ------------------------------------------------------------
// ScopedTaskSwitchObserver
// ------------------------------------------------------------

ScopedTaskSwitchObserver::ScopedTaskSwitchObserver(EventLoop& loop, TaskSwitchObserverPtr observer)
    : loop_(loop), previous_(loop.GetTaskSwitchObserver()), installed_(std::move(observer)) {
  loop_.SetTaskSwitchObserver(installed_);
}

ScopedTaskSwitchObserver::~ScopedTaskSwitchObserver() {
  RestoreQuietly(*this, "task_switch_observer");
}

void ScopedTaskSwitchObserver::Restore() {
  if (!installed_) return;

  const auto current   = loop_.GetTaskSwitchObserver();
  const auto installed = std::exchange(installed_, nullptr);

  loop_.SetTaskSwitchObserver(previous_);
  if (current != installed) {
    throw util::HookConflict("task switch observer was replaced while profiling was active");
  }
}

} // namespace asyncprof::runtime
