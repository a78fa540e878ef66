#pragma once

#include <memory>

#include "internal/backend/function_probe.hpp"
#include "internal/backend/profiler_backend.hpp"
#include "internal/backend/task_tracker.hpp"
#include "internal/runtime/scoped_hooks.hpp"

namespace asyncprof::backend {

class FunctionTimer;

/*
  InstrumentedBackend ("instrumented")

  Everything TaskTracker records, plus wall-clock attribution to functions
  annotated with ASYNCPROF_PROBE_FUNCTION(). While active it holds the
  process-wide probe slot and the loop's task-switch observer; suspension
  of a task pauses the execution time of that task's open probe frames.
*/
class InstrumentedBackend final : public ProfilerBackend {
 public:
  static constexpr const char* kName = "instrumented";

  explicit InstrumentedBackend(BackendContext context);
  ~InstrumentedBackend() override;

  // Probes compiled in, a monotonic clock, and the probe slot free.
  static bool IsAvailable() noexcept;

  void             Start() override;
  void             Stop() override;
  BackendStats     GetStats() const override;
  std::string_view Name() const override {
    return kName;
  }

 private:
  BackendContext                                     context_;
  TaskTracker                                        tracker_;
  std::shared_ptr<FunctionTimer>                     timer_;
  std::unique_ptr<runtime::ScopedTaskSwitchObserver> observer_hook_;
  bool                                               active_ = false;
};

} // namespace asyncprof::backend
