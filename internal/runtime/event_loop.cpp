#include "internal/runtime/event_loop.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace asyncprof::runtime {

namespace {

// Min-heap on (deadline, sequence) so equal deadlines fire in FIFO order.
bool TimerLater(const std::shared_ptr<detail::TimerEntry>& a, const std::shared_ptr<detail::TimerEntry>& b) {
  if (a->when != b->when) return a->when > b->when;
  return a->sequence > b->sequence;
}

std::string SiteString(const std::source_location& site) {
  return std::string(site.file_name()) + ":" + std::to_string(site.line());
}

} // namespace

// ------------------------------------------------------------
// TimerHandle
// ------------------------------------------------------------

void TimerHandle::Cancel() {
  if (auto entry = entry_.lock()) {
    if (!entry->fired && !entry->cancelled) {
      entry->cancelled   = true;
      entry->callback.fn = nullptr;
    }
  }
  entry_.reset();
}

bool TimerHandle::Active() const {
  auto entry = entry_.lock();
  return entry && !entry->cancelled && !entry->fired;
}

// ------------------------------------------------------------
// Awaiters
// ------------------------------------------------------------

void SleepAwaiter::await_suspend(std::coroutine_handle<>) {
  task_ = &loop_.RequireCurrentTask("Sleep");

  std::weak_ptr<Task> weak = task_->weak_from_this();
  auto timer = loop_.CallLater(
      delay_,
      [weak] {
        if (auto task = weak.lock()) task->Schedule();
      },
      site_);
  task_->Suspend(site_, [timer]() mutable { timer.Cancel(); });
}

void SleepAwaiter::await_resume() {
  if (task_) task_->ThrowIfCancelled();
}

void YieldAwaiter::await_suspend(std::coroutine_handle<>) {
  task_ = &loop_.RequireCurrentTask("Yield");
  task_->Suspend(site_, nullptr);
  task_->Schedule();
}

void YieldAwaiter::await_resume() {
  if (task_) task_->ThrowIfCancelled();
}

void JoinAwaiter::await_suspend(std::coroutine_handle<>) {
  task_ = &loop_.RequireCurrentTask("Join");
  if (task_ == target_.get()) {
    throw util::InvalidState("a task cannot join itself");
  }

  target_->AddWaiter(task_->shared_from_this());
  std::weak_ptr<Task> target = target_;
  Task*               waiter = task_;
  task_->Suspend(site_, [target, waiter] {
    if (auto locked = target.lock()) locked->RemoveWaiter(waiter);
  });
}

void JoinAwaiter::await_resume() {
  if (task_) task_->ThrowIfCancelled();

  if (target_->State() == TaskState::kFailed && target_->Exception()) {
    std::rethrow_exception(target_->Exception());
  }
  if (target_->State() == TaskState::kCancelled) {
    throw CancelledError();
  }
}

// ------------------------------------------------------------
// EventLoop
// ------------------------------------------------------------

EventLoop::EventLoop() : task_factory_(DefaultTaskFactory()) {
}

EventLoop::~EventLoop() {
  closing_ = true;

  // Destroying pending tasks destroys their frames, whose destructors may
  // try to schedule more work; Enqueue ignores it while closing.
  while (!ready_.empty() || !timers_.empty()) {
    auto ready  = std::move(ready_);
    auto timers = std::move(timers_);
    ready_.clear();
    timers_.clear();
  }
}

TaskFactoryPtr EventLoop::DefaultTaskFactory() {
  static const TaskFactoryPtr factory = std::make_shared<const TaskFactory>(
      [](EventLoop& loop, Coro coro, const TaskCreationContext& context) { return loop.NewTask(std::move(coro), context); });
  return factory;
}

void EventLoop::SetTaskFactory(TaskFactoryPtr factory) {
  task_factory_ = factory ? std::move(factory) : DefaultTaskFactory();
}

void EventLoop::SetSlowCallbackDuration(util::Duration duration) {
  slow_callback_duration_ = std::max(duration, util::Duration::zero());
}

void EventLoop::SetSlowCallbackSink(SlowCallbackSinkPtr sink) {
  slow_callback_sink_ = std::move(sink);
}

void EventLoop::SetTaskSwitchObserver(TaskSwitchObserverPtr observer) {
  task_switch_observer_ = std::move(observer);
}

void EventLoop::CallSoon(std::function<void()> fn, std::source_location site) {
  Enqueue(ScheduledCallback{std::move(fn), site, nullptr});
}

TimerHandle EventLoop::CallLater(util::Duration delay, std::function<void()> fn, std::source_location site) {
  return CallAt(util::Now() + std::max(delay, util::Duration::zero()), std::move(fn), site);
}

TimerHandle EventLoop::CallAt(util::TimePoint when, std::function<void()> fn, std::source_location site) {
  auto entry      = std::make_shared<detail::TimerEntry>();
  entry->when     = when;
  entry->sequence = ++timer_sequence_;
  entry->callback = ScheduledCallback{std::move(fn), site, nullptr};

  if (closing_) {
    entry->cancelled = true;
    return TimerHandle(entry);
  }

  timers_.push_back(entry);
  std::push_heap(timers_.begin(), timers_.end(), TimerLater);
  return TimerHandle(entry);
}

void EventLoop::Enqueue(ScheduledCallback callback) {
  if (closing_) return;
  ready_.push_back(std::move(callback));
}

TaskPtr EventLoop::CreateTask(Coro coro, TaskOptions options, std::source_location site) {
  TaskCreationContext context{current_task_, site, std::move(options)};

  // Copy: the factory may be swapped while it runs.
  auto factory = task_factory_;
  auto task    = (*factory)(*this, std::move(coro), context);
  if (!task) {
    throw util::InvalidState("task factory returned no task");
  }
  return task;
}

TaskPtr EventLoop::NewTask(Coro coro, const TaskCreationContext& context) {
  if (!coro.Valid()) {
    throw util::InvalidState("cannot create a task from an empty coroutine");
  }

  auto task = std::make_shared<Task>(*this, ++next_task_id_, coro.Release(), context.options, context.site);
  task->Schedule();
  return task;
}

Task& EventLoop::RequireCurrentTask(const char* operation) const {
  if (!current_task_) {
    throw util::InvalidState(std::string(operation) + " awaited outside of a task");
  }
  return *current_task_;
}

std::size_t EventLoop::PendingTimerCount() const {
  return static_cast<std::size_t>(
      std::count_if(timers_.begin(), timers_.end(), [](const auto& entry) { return !entry->cancelled && !entry->fired; }));
}

void EventLoop::DropCancelledTimers() {
  while (!timers_.empty() && timers_.front()->cancelled) {
    std::pop_heap(timers_.begin(), timers_.end(), TimerLater);
    timers_.pop_back();
  }
}

bool EventLoop::RunOnce() {
  DropCancelledTimers();

  if (ready_.empty()) {
    if (timers_.empty()) {
      return false;
    }
    const auto deadline = timers_.front()->when;
    if (deadline > util::Now()) {
      std::this_thread::sleep_until(deadline);
    }
  }

  const auto now = util::Now();
  while (!timers_.empty() && timers_.front()->when <= now) {
    std::pop_heap(timers_.begin(), timers_.end(), TimerLater);
    auto entry = std::move(timers_.back());
    timers_.pop_back();
    if (entry->cancelled) continue;

    entry->fired = true;
    ready_.push_back(std::move(entry->callback));
  }

  // Only what was ready at the start of the iteration; callbacks queued
  // meanwhile wait for the next one.
  auto todo = ready_.size();
  while (todo-- > 0 && !ready_.empty()) {
    auto callback = std::move(ready_.front());
    ready_.pop_front();
    RunCallback(callback);
  }
  return true;
}

void EventLoop::RunUntilComplete(const TaskPtr& task) {
  if (!task) {
    throw util::InvalidState("RunUntilComplete needs a task");
  }
  if (running_) {
    throw util::InvalidState("event loop is already running");
  }

  running_ = true;
  struct RunningReset {
    bool& flag;
    ~RunningReset() {
      flag = false;
    }
  } reset{running_};

  while (!task->Done()) {
    if (!RunOnce()) {
      throw util::InvalidState("event loop ran out of work before task '" + task->Name() + "' finished");
    }
  }
}

void EventLoop::RunCallback(ScheduledCallback& callback) {
  if (!callback.fn) return;

  auto       sink    = slow_callback_sink_;
  const auto started = util::Now();

  try {
    callback.fn();
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_ERROR("Exception in event loop callback",
                        {observability::StringField("site", SiteString(callback.site)), observability::StringField("error", e.what())});
  }

  if (!sink) return;

  const auto elapsed = util::Now() - started;
  if (elapsed < slow_callback_duration_) return;

  SlowCallback report{started, elapsed, callback.site, callback.task ? callback.task->Name() : std::string{}};
  try {
    sink->OnSlowCallback(report);
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_WARN("Slow callback sink failed", {observability::StringField("error", e.what())});
  }
}

void EventLoop::NotifyResumed(const Task& task) {
  if (auto observer = task_switch_observer_) {
    try {
      observer->OnTaskResumed(task);
    } catch (const std::exception& e) {
      ASYNCPROF_LOG_WARN("Task switch observer failed", {observability::StringField("error", e.what())});
    }
  }
}

void EventLoop::NotifySuspended(const Task& task) {
  if (auto observer = task_switch_observer_) {
    try {
      observer->OnTaskSuspended(task);
    } catch (const std::exception& e) {
      ASYNCPROF_LOG_WARN("Task switch observer failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace asyncprof::runtime
