#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

#include "internal/runtime/coro.hpp"
#include "internal/runtime/task.hpp"
#include "internal/util/time.hpp"

namespace asyncprof::runtime {

/*
  EventLoop

  Cooperative single-threaded scheduler:

    ready queue  FIFO of callbacks to run on the next iteration
    timers       min-heap of (deadline, sequence) → callback
    tasks        coroutines stepped through the ready queue

  Three primitives are replaceable so that instrumentation can observe the
  loop without patching it (see scoped_hooks.hpp):

    task factory          creates every Task
    slow-callback sink    told about callbacks that ran past a threshold
    task-switch observer  told when a task resumes and suspends

  Not thread-safe: every call must come from the thread running the loop.
*/

struct ScheduledCallback {
  std::function<void()> fn;
  std::source_location  site;
  // Set for task steps; kept alive by fn.
  const Task* task = nullptr;
};

namespace detail {
struct TimerEntry {
  util::TimePoint   when;
  std::uint64_t     sequence = 0;
  ScheduledCallback callback;
  bool              cancelled = false;
  bool              fired     = false;
};
} // namespace detail

class TimerHandle {
 public:
  TimerHandle() = default;

  // Idempotent; a no-op once the timer fired.
  void Cancel();
  bool Active() const;

 private:
  friend class EventLoop;
  explicit TimerHandle(std::weak_ptr<detail::TimerEntry> entry) : entry_(std::move(entry)) {
  }

  std::weak_ptr<detail::TimerEntry> entry_;
};

// Context handed to the task factory; `parent` is the task running at creation time.
struct TaskCreationContext {
  Task*                parent = nullptr;
  std::source_location site;
  TaskOptions          options;
};

using TaskFactory    = std::function<TaskPtr(EventLoop&, Coro, const TaskCreationContext&)>;
using TaskFactoryPtr = std::shared_ptr<const TaskFactory>;

struct SlowCallback {
  util::TimePoint      started_at;
  util::Duration       duration{};
  std::source_location site;
  std::string          task_name;
};

class SlowCallbackSink {
 public:
  virtual ~SlowCallbackSink()                          = default;
  virtual void OnSlowCallback(const SlowCallback& call) = 0;
};

using SlowCallbackSinkPtr = std::shared_ptr<SlowCallbackSink>;

class TaskSwitchObserver {
 public:
  virtual ~TaskSwitchObserver()                  = default;
  virtual void OnTaskResumed(const Task& task)   = 0;
  virtual void OnTaskSuspended(const Task& task) = 0;
};

using TaskSwitchObserverPtr = std::shared_ptr<TaskSwitchObserver>;

class SleepAwaiter {
 public:
  SleepAwaiter(EventLoop& loop, util::Duration delay, std::source_location site) : loop_(loop), delay_(delay), site_(site) {
  }

  bool await_ready() const noexcept {
    return false;
  }
  void await_suspend(std::coroutine_handle<> handle);
  void await_resume();

 private:
  EventLoop&           loop_;
  util::Duration       delay_;
  std::source_location site_;
  Task*                task_ = nullptr;
};

class YieldAwaiter {
 public:
  YieldAwaiter(EventLoop& loop, std::source_location site) : loop_(loop), site_(site) {
  }

  bool await_ready() const noexcept {
    return false;
  }
  void await_suspend(std::coroutine_handle<> handle);
  void await_resume();

 private:
  EventLoop&           loop_;
  std::source_location site_;
  Task*                task_ = nullptr;
};

// Resumes when `target` finishes; rethrows its failure or cancellation.
class JoinAwaiter {
 public:
  JoinAwaiter(EventLoop& loop, TaskPtr target, std::source_location site) : loop_(loop), target_(std::move(target)), site_(site) {
  }

  bool await_ready() const noexcept {
    return target_->Done();
  }
  void await_suspend(std::coroutine_handle<> handle);
  void await_resume();

 private:
  EventLoop&           loop_;
  TaskPtr              target_;
  std::source_location site_;
  Task*                task_ = nullptr;
};

class EventLoop {
 public:
  EventLoop();
  ~EventLoop();

  EventLoop(const EventLoop&)            = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  // ------------------------------------------------------------------
  // Scheduling
  // ------------------------------------------------------------------
  void        CallSoon(std::function<void()> fn, std::source_location site = std::source_location::current());
  TimerHandle CallLater(util::Duration delay, std::function<void()> fn, std::source_location site = std::source_location::current());
  TimerHandle CallAt(util::TimePoint when, std::function<void()> fn, std::source_location site = std::source_location::current());

  // ------------------------------------------------------------------
  // Tasks
  // ------------------------------------------------------------------
  /*
    Creates a task through the installed task factory. The first step is
    queued; nothing of the coroutine body runs before the caller yields.
  */
  TaskPtr CreateTask(Coro coro, TaskOptions options = {}, std::source_location site = std::source_location::current());

  // The built-in creation primitive every factory ends up delegating to.
  TaskPtr NewTask(Coro coro, const TaskCreationContext& context);

  Task* CurrentTask() const noexcept {
    return current_task_;
  }

  SleepAwaiter Sleep(util::Duration delay, std::source_location site = std::source_location::current()) {
    return SleepAwaiter(*this, delay, site);
  }

  YieldAwaiter Yield(std::source_location site = std::source_location::current()) {
    return YieldAwaiter(*this, site);
  }

  JoinAwaiter Join(TaskPtr task, std::source_location site = std::source_location::current()) {
    return JoinAwaiter(*this, std::move(task), site);
  }

  // ------------------------------------------------------------------
  // Running
  // ------------------------------------------------------------------
  // Throws util::InvalidState if the loop runs dry before `task` is done.
  void RunUntilComplete(const TaskPtr& task);

  // One iteration: sleeps until the next timer if nothing is ready.
  // Returns false when there is no pending work at all.
  bool RunOnce();

  bool IsRunning() const noexcept {
    return running_;
  }

  std::size_t ReadyCount() const noexcept {
    return ready_.size();
  }

  std::size_t PendingTimerCount() const;

  // ------------------------------------------------------------------
  // Replaceable primitives
  // ------------------------------------------------------------------
  TaskFactoryPtr GetTaskFactory() const {
    return task_factory_;
  }
  // nullptr restores the built-in factory.
  void SetTaskFactory(TaskFactoryPtr factory);

  static TaskFactoryPtr DefaultTaskFactory();

  util::Duration SlowCallbackDuration() const noexcept {
    return slow_callback_duration_;
  }
  void SetSlowCallbackDuration(util::Duration duration);

  SlowCallbackSinkPtr GetSlowCallbackSink() const {
    return slow_callback_sink_;
  }
  void SetSlowCallbackSink(SlowCallbackSinkPtr sink);

  TaskSwitchObserverPtr GetTaskSwitchObserver() const {
    return task_switch_observer_;
  }
  void SetTaskSwitchObserver(TaskSwitchObserverPtr observer);

 private:
  friend class Task;
  friend class SleepAwaiter;
  friend class YieldAwaiter;
  friend class JoinAwaiter;

  class CurrentTaskScope;

  void  Enqueue(ScheduledCallback callback);
  void  RunCallback(ScheduledCallback& callback);
  Task& RequireCurrentTask(const char* operation) const;
  void  DropCancelledTimers();

  void NotifyResumed(const Task& task);
  void NotifySuspended(const Task& task);

  std::deque<ScheduledCallback>                    ready_;
  std::vector<std::shared_ptr<detail::TimerEntry>> timers_;
  std::uint64_t                                    timer_sequence_ = 0;
  TaskId                                           next_task_id_   = 0;

  Task* current_task_ = nullptr;
  bool  running_      = false;
  bool  closing_      = false;

  TaskFactoryPtr        task_factory_;
  util::Duration        slow_callback_duration_{std::chrono::milliseconds(100)};
  SlowCallbackSinkPtr   slow_callback_sink_;
  TaskSwitchObserverPtr task_switch_observer_;
};

// Marks `task` as the running task for the duration of one step.
class EventLoop::CurrentTaskScope {
 public:
  CurrentTaskScope(EventLoop& loop, Task& task) : loop_(loop), task_(task), previous_(loop.current_task_) {
    loop_.current_task_ = &task_;
    loop_.NotifyResumed(task_);
  }

  ~CurrentTaskScope() {
    loop_.current_task_ = previous_;
  }

  CurrentTaskScope(const CurrentTaskScope&)            = delete;
  CurrentTaskScope& operator=(const CurrentTaskScope&) = delete;

 private:
  EventLoop& loop_;
  Task&      task_;
  Task*      previous_;
};

} // namespace asyncprof::runtime

// Creates a task named after the coroutine call it is given:
//   ASYNCPROF_CREATE_TASK(loop, FetchUser(loop, 42), "fetch-42")
#define ASYNCPROF_CREATE_TASK(loop, coro_call, ...)                                                                            \
  (loop).CreateTask((coro_call),                                                                                                 \
                    ::asyncprof::runtime::TaskOptions{std::string{__VA_ARGS__}, ::asyncprof::runtime::CallableName(#coro_call)})
