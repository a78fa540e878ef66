#include "internal/runtime/task.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/runtime/event_loop.hpp"

namespace asyncprof::runtime {

namespace {

bool IsCancellation(const std::exception_ptr& exception) {
  try {
    std::rethrow_exception(exception);
  } catch (const CancelledError&) {
    return true;
  } catch (...) {
    return false;
  }
}

std::string Describe(const std::exception_ptr& exception) {
  try {
    std::rethrow_exception(exception);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace

const char* ToString(TaskState state) {
  switch (state) {
    case TaskState::kCreated:
      return "created";
    case TaskState::kRunning:
      return "running";
    case TaskState::kCompleted:
      return "completed";
    case TaskState::kCancelled:
      return "cancelled";
    case TaskState::kFailed:
      return "failed";
  }
  return "unknown";
}

std::string CallableName(std::string_view call_expression) {
  auto name = call_expression.substr(0, call_expression.find('('));
  while (!name.empty() && (name.front() == ' ' || name.front() == '&' || name.front() == '*')) name.remove_prefix(1);
  while (!name.empty() && name.back() == ' ') name.remove_suffix(1);
  return std::string(name);
}

Task::Task(EventLoop& loop, TaskId id, Coro::Handle handle, TaskOptions options, std::source_location creation_site)
    : loop_(loop),
      id_(id),
      handle_(handle),
      name_(std::move(options.name)),
      callable_(std::move(options.callable)),
      creation_site_(creation_site),
      suspension_site_(creation_site) {
  if (name_.empty()) {
    name_ = "Task-" + std::to_string(id_);
  }
  if (callable_.empty()) {
    callable_ = "<coroutine>";
  }
}

Task::~Task() {
  if (handle_) {
    handle_.destroy();
  }
}

bool Task::Cancel() {
  if (Done()) {
    return false;
  }

  cancel_requested_ = true;
  if (state_ == TaskState::kCreated) {
    // First step is already queued and finishes the task without running it.
    return true;
  }

  if (cancel_wait_) {
    auto cancel_wait = std::move(cancel_wait_);
    cancel_wait_     = nullptr;
    cancel_wait();
  }
  Schedule();
  return true;
}

void Task::AddDoneCallback(DoneCallback callback) {
  if (!callback) return;

  if (Done()) {
    callback(*this);
    return;
  }
  done_callbacks_.push_back(std::move(callback));
}

void Task::Schedule() {
  if (scheduled_ || Done()) {
    return;
  }

  scheduled_   = true;
  cancel_wait_ = nullptr;
  loop_.Enqueue(ScheduledCallback{[self = shared_from_this()] { self->Step(); }, suspension_site_, this});
}

void Task::Suspend(const std::source_location& site, std::function<void()> cancel_wait) {
  suspension_site_ = site;
  cancel_wait_     = std::move(cancel_wait);
}

void Task::ThrowIfCancelled() {
  if (cancel_requested_) {
    cancel_requested_ = false;
    throw CancelledError();
  }
}

void Task::Step() {
  scheduled_ = false;
  if (Done()) {
    return;
  }

  // A wake-up for any other reason supersedes the pending wait.
  if (cancel_wait_) {
    auto cancel_wait = std::move(cancel_wait_);
    cancel_wait_     = nullptr;
    cancel_wait();
  }

  if (state_ == TaskState::kCreated) {
    if (cancel_requested_) {
      Finish(TaskState::kCancelled, nullptr);
      return;
    }
    state_      = TaskState::kRunning;
    started_at_ = util::Now();
  }

  {
    EventLoop::CurrentTaskScope scope(loop_, *this);
    handle_.resume();
  }

  if (!handle_.done()) {
    loop_.NotifySuspended(*this);
    return;
  }

  auto exception = handle_.promise().exception;
  if (!exception) {
    Finish(TaskState::kCompleted, nullptr);
  } else if (IsCancellation(exception)) {
    Finish(TaskState::kCancelled, exception);
  } else {
    Finish(TaskState::kFailed, exception);
  }
}

void Task::Finish(TaskState state, std::exception_ptr exception) {
  state_       = state;
  finished_at_ = util::Now();
  exception_   = std::move(exception);
  cancel_wait_ = nullptr;
  if (state == TaskState::kFailed && exception_) {
    failure_ = Describe(exception_);
    ASYNCPROF_LOG_DEBUG("Task failed", {observability::StringField("task", name_), observability::StringField("error", failure_)});
  }

  if (handle_) {
    handle_.destroy();
    handle_ = {};
  }

  auto waiters = std::move(waiters_);
  waiters_.clear();
  for (const auto& weak : waiters) {
    if (auto waiter = weak.lock()) {
      waiter->Schedule();
    }
  }

  auto callbacks = std::move(done_callbacks_);
  done_callbacks_.clear();
  for (auto& callback : callbacks) {
    try {
      callback(*this);
    } catch (const std::exception& e) {
      ASYNCPROF_LOG_ERROR("Exception in task done callback",
                          {observability::StringField("task", name_), observability::StringField("error", e.what())});
    }
  }
}

void Task::AddWaiter(const std::shared_ptr<Task>& waiter) {
  waiters_.push_back(waiter);
}

void Task::RemoveWaiter(const Task* waiter) {
  waiters_.erase(std::remove_if(waiters_.begin(), waiters_.end(),
                                [waiter](const std::weak_ptr<Task>& weak) {
                                  auto locked = weak.lock();
                                  return !locked || locked.get() == waiter;
                                }),
                 waiters_.end());
}

} // namespace asyncprof::runtime
