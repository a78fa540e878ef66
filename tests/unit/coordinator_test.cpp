#include "internal/core/profiler_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/backend/instrumented_backend.hpp"
#include "internal/core/request_scope.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using asyncprof::backend::BackendContext;
using asyncprof::backend::BackendEntry;
using asyncprof::backend::BackendRegistry;
using asyncprof::backend::BackendStats;
using asyncprof::backend::ProfilerBackend;
using asyncprof::backend::ProfilerBackendPtr;
using asyncprof::config::ProfilerSettings;
using asyncprof::core::ProfilerCoordinator;
using asyncprof::core::RequestScope;
using asyncprof::runtime::Coro;
using asyncprof::runtime::EventLoop;
using asyncprof::runtime::TaskOptions;
using asyncprof::runtime::TaskState;

Coro Child(EventLoop& loop) {
  co_await loop.Sleep(10ms);
}

Coro Parent(EventLoop& loop) {
  auto a = loop.CreateTask(Child(loop), TaskOptions{"child-a", {}});
  auto b = loop.CreateTask(Child(loop), TaskOptions{"child-b", {}});
  co_await loop.Join(a);
  co_await loop.Join(b);
}

Coro Block(EventLoop& loop, std::chrono::milliseconds duration) {
  co_await loop.Yield();
  std::this_thread::sleep_for(duration);
}

Coro Noop() {
  co_return;
}

Coro ProfiledSleep(EventLoop& loop, ProfilerCoordinator& profiler) {
  RequestScope scope(profiler);
  co_await loop.Sleep(1s);
}

Coro ProfiledFailure(EventLoop& loop, ProfilerCoordinator& profiler) {
  RequestScope scope(profiler);
  co_await loop.Yield();
  throw std::runtime_error("handler failed");
}

ProfilerSettings Watching(const char* backend) {
  ProfilerSettings settings;
  settings.backend = backend;
  return settings;
}

class RefusingBackend final : public ProfilerBackend {
 public:
  void Start() override {
    throw asyncprof::util::BackendStartError("no hooks today");
  }
  void Stop() override {
  }
  BackendStats GetStats() const override {
    return {};
  }
  std::string_view Name() const override {
    return "taskfactory";
  }
};

ProfilerSettings Quiet(const char* backend) {
  ProfilerSettings settings;
  settings.backend               = backend;
  settings.enable_lag_monitoring = false;
  settings.blocking_threshold    = 1s;
  return settings;
}

void TestIdleCoordinatorReportsNothing() {
  EventLoop           loop;
  ProfilerCoordinator profiler(loop, ProfilerSettings{});

  profiler.Stop();
  assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kIdle);
  assert(profiler.CurrentSession() == nullptr);

  const auto stats = profiler.GetStats();
  assert(stats.backend == "none");
  assert(stats.tasks_created == 0);
  assert(stats.task_hierarchy.empty());
  assert(profiler.Summary() == "disabled");
}

void TestParentWithTwoChildrenEndToEnd() {
  EventLoop           loop;
  const auto          factory   = loop.GetTaskFactory();
  const auto          threshold = loop.SlowCallbackDuration();
  ProfilerSettings    settings;
  settings.backend = "taskfactory";
  ProfilerCoordinator profiler(loop, settings);

  profiler.Start();
  assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kActive);
  assert(loop.GetTaskFactory() != factory);

  auto parent = loop.CreateTask(Parent(loop), TaskOptions{"parent", {}});
  loop.RunUntilComplete(parent);
  profiler.Stop();
  profiler.Stop();

  assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kFinalized);
  assert(loop.GetTaskFactory() == factory);
  assert(loop.SlowCallbackDuration() == threshold);
  assert(loop.GetSlowCallbackSink() == nullptr);
  assert(loop.PendingTimerCount() == 0);

  const auto stats = profiler.GetStats();
  assert(stats.backend == "taskfactory");
  assert(stats.tasks_created == 3);
  assert(stats.tasks_completed == 3);
  assert(stats.tasks_failed == 0);
  assert(stats.task_hierarchy.size() == 1);
  assert(stats.task_hierarchy[0].children.size() == 2);
  assert(stats.timeline.entries.size() == 3);
  assert(stats.timeline.max_concurrent >= 2);
  assert(stats.event_loop_lag.sample_count > 0);
  assert(stats.warnings.empty());
  assert(stats.profiling_overhead > 0ns);
}

void TestUnknownBackendFallsBackWithWarning() {
  EventLoop           loop;
  ProfilerCoordinator profiler(loop, Quiet("ebpf"));

  profiler.Start();
  auto task = loop.CreateTask(Noop());
  loop.RunUntilComplete(task);
  profiler.Stop();

  const auto stats = profiler.GetStats();
  assert(stats.backend == "taskfactory");
  assert(stats.warnings.size() == 1);
  assert(stats.warnings[0].find("ebpf") != std::string::npos);
  assert(stats.tasks_created == 1);
}

void TestTrackingLimitIsHonoured() {
  EventLoop        loop;
  ProfilerSettings settings = Quiet("taskfactory");
  settings.max_tracked_tasks = 2;
  ProfilerCoordinator profiler(loop, settings);

  profiler.Start();
  for (int i = 0; i < 3; ++i) {
    auto task = loop.CreateTask(Noop());
    loop.RunUntilComplete(task);
  }
  profiler.Stop();

  const auto stats = profiler.GetStats();
  assert(stats.tasks_created == 3);
  assert(stats.tasks_dropped == 1);
  assert(stats.task_hierarchy.size() == 2);
}

void TestBlockingCallShowsInSummary() {
  EventLoop        loop;
  ProfilerSettings settings = Quiet("taskfactory");
  settings.blocking_threshold = 10ms;
  settings.lag_threshold      = 1s;
  ProfilerCoordinator profiler(loop, settings);

  profiler.Start();
  auto task = loop.CreateTask(Block(loop, 20ms), TaskOptions{"compress", {}});
  loop.RunUntilComplete(task);
  profiler.Stop();

  const auto stats = profiler.GetStats();
  assert(stats.blocking_calls.size() == 1);
  assert(stats.blocking_calls[0].duration >= 20ms);
  assert(profiler.Summary() == "1 blocking");
}

void TestBackendFailureDisablesProfiling() {
  BackendRegistry registry({BackendEntry{"taskfactory", false, {},
                                         [](const BackendContext&) -> ProfilerBackendPtr { return std::make_unique<RefusingBackend>(); }}});

  EventLoop           loop;
  const auto          factory = loop.GetTaskFactory();
  ProfilerCoordinator profiler(loop, ProfilerSettings{}, registry);

  profiler.Start();
  assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kActive);
  assert(loop.GetTaskFactory() == factory);
  assert(loop.GetSlowCallbackSink() == nullptr);
  assert(loop.PendingTimerCount() == 0);

  profiler.Stop();
  const auto stats = profiler.GetStats();
  assert(stats.backend == "none");
  assert(stats.warnings.size() == 1);
  assert(stats.warnings[0].find("no hooks today") != std::string::npos);
  assert(profiler.Summary() == "disabled");
}

void TestDeepBackendFailureFallsBackToTaskFactory() {
  BackendRegistry registry({BackendEntry{"instrumented", true, [] { return true; },
                                         [](const BackendContext&) -> ProfilerBackendPtr { return std::make_unique<RefusingBackend>(); }},
                            *BackendRegistry::Default().Find("taskfactory")});

  EventLoop           loop;
  ProfilerCoordinator profiler(loop, Quiet("auto"), registry);

  profiler.Start();
  auto task = loop.CreateTask(Noop());
  loop.RunUntilComplete(task);
  profiler.Stop();

  const auto stats = profiler.GetStats();
  assert(stats.backend == "taskfactory");
  assert(stats.tasks_created == 1);
  assert(stats.warnings.size() == 1);
  assert(stats.warnings[0].find("instrumented") != std::string::npos);
  assert(stats.warnings[0].find("no hooks today") != std::string::npos);
}

void TestZeroLagIntervalDisablesOnlyTheMonitor() {
  ProfilerSettings settings    = Watching("taskfactory");
  settings.lag_sample_interval = asyncprof::util::Duration::zero();

  EventLoop           loop;
  ProfilerCoordinator profiler(loop, settings);

  profiler.Start();
  assert(loop.PendingTimerCount() == 0);
  auto task = loop.CreateTask(Noop());
  loop.RunUntilComplete(task);
  profiler.Stop();

  const auto stats = profiler.GetStats();
  assert(stats.backend == "taskfactory");
  assert(stats.event_loop_lag.sample_count == 0);
  assert(stats.warnings.size() == 1);
  assert(stats.warnings[0].find("lag monitoring disabled") != std::string::npos);
}

void TestRequestScopeStopsOnExit() {
  EventLoop           loop;
  const auto          factory = loop.GetTaskFactory();
  ProfilerCoordinator profiler(loop, Quiet("taskfactory"));

  {
    RequestScope scope(profiler);
    assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kActive);
    auto task = loop.CreateTask(Noop());
    loop.RunUntilComplete(task);
  }

  assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kFinalized);
  assert(loop.GetTaskFactory() == factory);
  assert(profiler.GetStats().tasks_created == 1);
}

void TestCancelledRequestStillStops() {
  EventLoop           loop;
  const auto          factory = loop.GetTaskFactory();
  ProfilerCoordinator profiler(loop, Watching("taskfactory"));

  auto request = loop.CreateTask(ProfiledSleep(loop, profiler));
  loop.RunOnce();
  assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kActive);
  assert(loop.GetSlowCallbackSink() != nullptr);
  assert(loop.PendingTimerCount() == 2);

  assert(request->Cancel());
  loop.RunUntilComplete(request);

  assert(request->State() == TaskState::kCancelled);
  assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kFinalized);
  assert(loop.GetTaskFactory() == factory);
  assert(loop.GetSlowCallbackSink() == nullptr);
  assert(loop.PendingTimerCount() == 0);
}

void TestFailingRequestStillStops() {
  EventLoop           loop;
  const auto          factory = loop.GetTaskFactory();
  ProfilerCoordinator profiler(loop, Watching("taskfactory"));

  auto request = loop.CreateTask(ProfiledFailure(loop, profiler));
  loop.RunUntilComplete(request);

  assert(request->State() == TaskState::kFailed);
  assert(profiler.CurrentPhase() == ProfilerCoordinator::Phase::kFinalized);
  assert(loop.GetTaskFactory() == factory);
  assert(loop.GetSlowCallbackSink() == nullptr);
  assert(loop.PendingTimerCount() == 0);
}

void TestRestartBeginsAFreshSession() {
  EventLoop           loop;
  ProfilerCoordinator profiler(loop, Quiet("taskfactory"));

  profiler.Start();
  auto first = loop.CreateTask(Noop());
  loop.RunUntilComplete(first);
  profiler.Stop();
  const auto* first_session = profiler.CurrentSession();
  assert(first_session->Finalized());

  profiler.Start();
  profiler.Start();
  assert(profiler.CurrentSession()->Tasks().empty());
  assert(!profiler.CurrentSession()->Finalized());
  profiler.Stop();
  assert(profiler.GetStats().tasks_created == 0);
}

void TestAutoSelectsInstrumentedWhenPossible() {
  EventLoop           loop;
  ProfilerCoordinator profiler(loop, Quiet("auto"));

  const bool deep = asyncprof::backend::InstrumentedBackend::IsAvailable();
  profiler.Start();
  profiler.Stop();

  assert(profiler.GetStats().backend == (deep ? "instrumented" : "taskfactory"));
  assert(asyncprof::backend::InstrumentedBackend::IsAvailable() == deep);
}

} // namespace

int main() {
  TestIdleCoordinatorReportsNothing();
  TestParentWithTwoChildrenEndToEnd();
  TestUnknownBackendFallsBackWithWarning();
  TestTrackingLimitIsHonoured();
  TestBlockingCallShowsInSummary();
  TestBackendFailureDisablesProfiling();
  TestDeepBackendFailureFallsBackToTaskFactory();
  TestZeroLagIntervalDisablesOnlyTheMonitor();
  TestRequestScopeStopsOnExit();
  TestCancelledRequestStillStops();
  TestFailingRequestStillStops();
  TestRestartBeginsAFreshSession();
  TestAutoSelectsInstrumentedWhenPossible();

  std::cout << "asyncprof_unit_coordinator: pass\n";
  return 0;
}
