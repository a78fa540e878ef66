#pragma once

#include <memory>

#include "internal/backend/profiler_backend.hpp"
#include "internal/runtime/scoped_hooks.hpp"

namespace asyncprof::backend {

/*
  TaskTracker ("taskfactory")

  Wraps the loop's task factory for the lifetime of a session:

    create   → the previous factory builds the task
    record   → TaskRecord appended with the creating task as parent
    finish   → done-callback stamps start, completion and terminal state

  Tasks past max_tracked_tasks are counted as created and dropped.
  Callbacks left on still-pending tasks hold only a weak reference to the
  tracker state, which Stop() releases.
*/
class TaskTracker final : public ProfilerBackend {
 public:
  static constexpr const char* kName = "taskfactory";

  explicit TaskTracker(BackendContext context);
  ~TaskTracker() override;

  static bool IsAvailable() noexcept {
    return true;
  }

  void             Start() override;
  void             Stop() override;
  BackendStats     GetStats() const override;
  std::string_view Name() const override {
    return kName;
  }

  bool Active() const noexcept {
    return state_ != nullptr;
  }

 private:
  struct State;

  BackendContext                              context_;
  std::shared_ptr<State>                      state_;
  std::unique_ptr<runtime::ScopedTaskFactory> hook_;
  BackendStats                                final_stats_;
};

} // namespace asyncprof::backend
