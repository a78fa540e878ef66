#include "task_tracker.hpp"

#include <string_view>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/stack_capture.hpp"

namespace asyncprof::backend {

namespace {

// Creation stacks start at the caller of CreateTask.
constexpr std::string_view kCreationBoundary = "asyncprof::runtime::EventLoop::CreateTask(";

// OnTaskCreated, the factory wrapper and std::function dispatch; used when the
// boundary frame has no symbol.
constexpr std::size_t kHookFrames = 4;

} // namespace

struct TaskTracker::State {
  session::TaskRecordWriter writer;
  std::size_t               max_tracked_tasks;
  bool                      capture_stacks;
  std::size_t               max_stack_depth;

  std::uint64_t  created = 0;
  std::uint64_t  dropped = 0;
  util::Duration overhead{};

  // Tracked tasks, for syncing start times of tasks still pending at stop.
  std::vector<std::weak_ptr<runtime::Task>> tracked;

  void OnTaskCreated(const runtime::TaskPtr& task, const runtime::TaskCreationContext& context, const std::weak_ptr<State>& self) {
    const auto started = util::Now();
    ++created;

    if (writer.Count() >= max_tracked_tasks) {
      ++dropped;
      overhead += util::Now() - started;
      return;
    }

    session::TaskRecord record;
    record.id         = task->Id();
    record.name       = task->Name();
    record.callable   = task->Callable();
    record.created_at = writer.OffsetOf(started);
    record.location   = session::SourceSite::FromLocation(context.site);
    if (context.parent) {
      record.parent_id = context.parent->Id();
    }
    if (capture_stacks) {
      record.stack = util::CaptureStackBelow(kCreationBoundary, max_stack_depth, kHookFrames);
    }

    if (writer.Append(std::move(record))) {
      tracked.push_back(task);
      task->AddDoneCallback([self](const runtime::Task& done) {
        if (auto state = self.lock()) state->OnTaskDone(done);
      });
    }
    overhead += util::Now() - started;
  }

  void OnTaskDone(const runtime::Task& task) {
    const auto started = util::Now();

    if (task.StartedAt()) {
      writer.MarkStarted(task.Id(), writer.OffsetOf(*task.StartedAt()));
    }

    session::TaskOutcome outcome;
    outcome.state        = task.State();
    outcome.completed_at = writer.OffsetOf(task.FinishedAt().value_or(started));
    if (task.State() == runtime::TaskState::kFailed) {
      outcome.failure = task.FailureDetail();
    }
    writer.Finish(task.Id(), std::move(outcome));

    overhead += util::Now() - started;
  }

  void SyncPending() {
    for (const auto& weak : tracked) {
      auto task = weak.lock();
      if (!task || task->Done() || !task->StartedAt()) continue;
      writer.MarkStarted(task->Id(), writer.OffsetOf(*task->StartedAt()));
    }
  }

  BackendStats Snapshot() const {
    return BackendStats{kName, created, dropped, overhead};
  }
};

TaskTracker::TaskTracker(BackendContext context) : context_(context) {
  final_stats_.backend = kName;
}

TaskTracker::~TaskTracker() {
  try {
    Stop();
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_WARN("Task tracker stop failed", {observability::StringField("error", e.what())});
  }
}

void TaskTracker::Start() {
  if (state_) return;

  auto state               = std::make_shared<State>();
  state->writer            = context_.session.TaskWriter();
  state->max_tracked_tasks = context_.settings.max_tracked_tasks;
  state->capture_stacks    = context_.settings.capture_task_stacks;
  state->max_stack_depth   = context_.settings.max_stack_depth;

  std::weak_ptr<State> weak     = state;
  auto                 previous = context_.loop.GetTaskFactory();
  hook_ = std::make_unique<runtime::ScopedTaskFactory>(
      context_.loop, [weak, previous](runtime::EventLoop& loop, runtime::Coro coro, const runtime::TaskCreationContext& context) {
        auto task = (*previous)(loop, std::move(coro), context);
        if (!task) return task;

        if (auto locked = weak.lock()) {
          try {
            locked->OnTaskCreated(task, context, weak);
          } catch (const std::exception& e) {
            ASYNCPROF_LOG_WARN("Task creation hook failed",
                               {observability::StringField("task", task->Name()), observability::StringField("error", e.what())});
          }
        }
        return task;
      });

  state_ = std::move(state);
  ASYNCPROF_LOG_DEBUG("Task tracker started", {observability::IntField("max_tracked_tasks", static_cast<std::int64_t>(state_->max_tracked_tasks))});
}

void TaskTracker::Stop() {
  if (!state_) return;

  auto state = std::exchange(state_, nullptr);
  auto hook  = std::exchange(hook_, nullptr);

  state->SyncPending();
  final_stats_ = state->Snapshot();

  ASYNCPROF_LOG_DEBUG("Task tracker stopped", {observability::IntField("tasks_created", static_cast<std::int64_t>(final_stats_.tasks_created)),
                                               observability::IntField("tasks_dropped", static_cast<std::int64_t>(final_stats_.tasks_dropped))});

  // Throws HookConflict after restoring the previous factory.
  hook->Restore();
}

BackendStats TaskTracker::GetStats() const {
  return state_ ? state_->Snapshot() : final_stats_;
}

} // namespace asyncprof::backend
