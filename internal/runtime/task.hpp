#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/runtime/coro.hpp"
#include "internal/util/time.hpp"

namespace asyncprof::runtime {

class EventLoop;

using TaskId = std::uint64_t;

enum class TaskState : std::uint8_t {
  kCreated   = 0,
  kRunning   = 1,
  kCompleted = 2,
  kCancelled = 3,
  kFailed    = 4,
};

constexpr bool IsTerminal(TaskState state) {
  return state == TaskState::kCompleted || state == TaskState::kCancelled || state == TaskState::kFailed;
}

const char* ToString(TaskState state);

// Thrown at a suspension point of a task that was cancelled.
class CancelledError : public std::runtime_error {
 public:
  CancelledError() : std::runtime_error("task cancelled") {
  }
};

struct TaskOptions {
  std::string name;
  // Qualified name of the coroutine function, e.g. "api::FetchUser".
  std::string callable;
};

// "ns::Fetch(loop, 1)" → "ns::Fetch"
std::string CallableName(std::string_view call_expression);

/*
  Task

  One coroutine scheduled on an EventLoop. A task only runs inside a loop
  callback (its "step") and gives the thread back at co_await points.
  All members are touched from the loop thread only.
*/
class Task : public std::enable_shared_from_this<Task> {
 public:
  using DoneCallback = std::function<void(const Task&)>;

  Task(EventLoop& loop, TaskId id, Coro::Handle handle, TaskOptions options, std::source_location creation_site);
  ~Task();

  Task(const Task&)            = delete;
  Task& operator=(const Task&) = delete;

  TaskId Id() const noexcept {
    return id_;
  }

  const std::string& Name() const noexcept {
    return name_;
  }

  const std::string& Callable() const noexcept {
    return callable_;
  }

  TaskState State() const noexcept {
    return state_;
  }

  bool Done() const noexcept {
    return IsTerminal(state_);
  }

  const std::source_location& CreationSite() const noexcept {
    return creation_site_;
  }

  // Last co_await the task suspended at; the creation site before that.
  const std::source_location& SuspensionSite() const noexcept {
    return suspension_site_;
  }

  const std::optional<util::TimePoint>& StartedAt() const noexcept {
    return started_at_;
  }

  const std::optional<util::TimePoint>& FinishedAt() const noexcept {
    return finished_at_;
  }

  const std::string& FailureDetail() const noexcept {
    return failure_;
  }

  std::exception_ptr Exception() const noexcept {
    return exception_;
  }

  /*
    Requests cancellation. A task that has not started finishes as
    cancelled without running; a suspended task is woken and sees
    CancelledError at its suspension point. Returns false once done.
  */
  bool Cancel();

  // Runs synchronously when the task finishes, or right away if it already has.
  void AddDoneCallback(DoneCallback callback);

 private:
  friend class EventLoop;
  friend class SleepAwaiter;
  friend class YieldAwaiter;
  friend class JoinAwaiter;

  void Step();
  void Schedule();
  void Suspend(const std::source_location& site, std::function<void()> cancel_wait);
  void ThrowIfCancelled();
  void Finish(TaskState state, std::exception_ptr exception);

  void AddWaiter(const std::shared_ptr<Task>& waiter);
  void RemoveWaiter(const Task* waiter);

  EventLoop&   loop_;
  TaskId       id_;
  Coro::Handle handle_;
  std::string  name_;
  std::string  callable_;

  std::source_location creation_site_;
  std::source_location suspension_site_;

  TaskState state_{TaskState::kCreated};
  bool      scheduled_{false};
  bool      cancel_requested_{false};

  std::optional<util::TimePoint> started_at_;
  std::optional<util::TimePoint> finished_at_;
  std::exception_ptr             exception_;
  std::string                    failure_;

  std::function<void()>             cancel_wait_;
  std::vector<DoneCallback>         done_callbacks_;
  std::vector<std::weak_ptr<Task>>  waiters_;
};

using TaskPtr = std::shared_ptr<Task>;

} // namespace asyncprof::runtime
