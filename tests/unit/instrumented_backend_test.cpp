#include "internal/backend/instrumented_backend.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using asyncprof::backend::BackendContext;
using asyncprof::backend::FunctionProbeRegistry;
using asyncprof::backend::InstrumentedBackend;
using asyncprof::config::ProfilerSettings;
using asyncprof::runtime::Coro;
using asyncprof::runtime::EventLoop;
using asyncprof::session::FunctionTiming;
using asyncprof::session::Session;

void Checksum() {
  ASYNCPROF_PROBE_FUNCTION();
  std::this_thread::sleep_for(2ms);
}

Coro FetchAndRender(EventLoop& loop) {
  ASYNCPROF_PROBE_FUNCTION();
  co_await loop.Sleep(20ms);
  std::this_thread::sleep_for(5ms);
}

class ForeignSink : public asyncprof::backend::ProbeSink {
 public:
  void OnEnter(const std::source_location&, asyncprof::util::TimePoint) override {
  }
  void OnExit(const std::source_location&, asyncprof::util::TimePoint) override {
  }
};

const FunctionTiming* FindTiming(const std::vector<FunctionTiming>& timings, const std::string& needle) {
  for (const auto& timing : timings) {
    if (timing.function.find(needle) != std::string::npos) return &timing;
  }
  return nullptr;
}

void TestSuspensionIsSplitFromExecution() {
  EventLoop           loop;
  Session             session;
  ProfilerSettings    settings;
  InstrumentedBackend backend(BackendContext{loop, session, settings});

  backend.Start();
  auto task = loop.CreateTask(FetchAndRender(loop));
  loop.RunUntilComplete(task);
  backend.Stop();

  const auto* timing = FindTiming(session.FunctionTimings(), "FetchAndRender");
  assert(timing != nullptr);
  assert(timing->calls == 1);
  assert(timing->cumulative_time >= 25ms);
  assert(timing->suspended_time >= 15ms);
  assert(timing->total_time >= 5ms);
  assert(timing->total_time < timing->cumulative_time);

  const auto stats = backend.GetStats();
  assert(stats.backend == "instrumented");
  assert(stats.tasks_created == 1);
  assert(session.Tasks().size() == 1);
}

void TestCallsAreAggregatedPerFunction() {
  EventLoop           loop;
  Session             session;
  ProfilerSettings    settings;
  InstrumentedBackend backend(BackendContext{loop, session, settings});

  backend.Start();
  Checksum();
  Checksum();
  backend.Stop();

  // Not recorded once the slot is released.
  Checksum();

  const auto* timing = FindTiming(session.FunctionTimings(), "Checksum");
  assert(timing != nullptr);
  assert(timing->calls == 2);
  assert(timing->total_time >= 4ms);
  assert(timing->PerCall() >= 2ms);
  assert(timing->suspended_time == 0ms);
}

void TestStopReleasesEveryHook() {
  EventLoop           loop;
  Session             session;
  ProfilerSettings    settings;
  const auto          factory = loop.GetTaskFactory();
  InstrumentedBackend backend(BackendContext{loop, session, settings});

  backend.Start();
  assert(FunctionProbeRegistry::Instance().Claimed());
  assert(!InstrumentedBackend::IsAvailable());
  assert(loop.GetTaskSwitchObserver() != nullptr);
  assert(loop.GetTaskFactory() != factory);

  backend.Stop();
  backend.Stop();
  assert(!FunctionProbeRegistry::Instance().Claimed());
  assert(InstrumentedBackend::IsAvailable());
  assert(loop.GetTaskSwitchObserver() == nullptr);
  assert(loop.GetTaskFactory() == factory);
}

void TestClaimedSlotRefusesStart() {
  ForeignSink foreign;
  auto&       registry = FunctionProbeRegistry::Instance();
  assert(registry.Claim(&foreign));
  assert(!InstrumentedBackend::IsAvailable());

  EventLoop           loop;
  Session             session;
  ProfilerSettings    settings;
  const auto          factory = loop.GetTaskFactory();
  InstrumentedBackend backend(BackendContext{loop, session, settings});

  bool threw = false;
  try {
    backend.Start();
  } catch (const asyncprof::util::BackendStartError&) {
    threw = true;
  }
  assert(threw);
  assert(loop.GetTaskFactory() == factory);

  // Only the holder can release.
  registry.Release(nullptr);
  assert(registry.Claimed());
  registry.Release(&foreign);
  assert(!registry.Claimed());
}

} // namespace

int main() {
  if (!asyncprof::backend::kProbesEnabled) {
    std::cout << "asyncprof_unit_instrumented_backend: skipped (probes compiled out)\n";
    return 0;
  }

  TestSuspensionIsSplitFromExecution();
  TestCallsAreAggregatedPerFunction();
  TestStopReleasesEveryHook();
  TestClaimedSlotRefusesStart();

  std::cout << "asyncprof_unit_instrumented_backend: pass\n";
  return 0;
}
