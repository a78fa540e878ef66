#include "internal/session/session.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;

using asyncprof::runtime::TaskState;
using asyncprof::session::BlockingEvent;
using asyncprof::session::FunctionTiming;
using asyncprof::session::LagSample;
using asyncprof::session::Session;
using asyncprof::session::TaskOutcome;
using asyncprof::session::TaskRecord;

TaskRecord MakeRecord(asyncprof::runtime::TaskId id, std::chrono::nanoseconds created_at, std::optional<asyncprof::runtime::TaskId> parent = {}) {
  TaskRecord record;
  record.id         = id;
  record.name       = "task-" + std::to_string(id);
  record.created_at = created_at;
  record.parent_id  = parent;
  return record;
}

void TestOffsetsAreRelativeToEpochAndClamped() {
  const auto epoch = asyncprof::util::Now();
  Session    session(epoch);

  assert(session.OffsetOf(epoch + 5ms) == 5ms);
  assert(session.OffsetOf(epoch - 5ms) == 0ms);
  assert(session.Epoch() == epoch);
}

void TestTaskWriterLinksChildrenAndCompletesOnce() {
  Session session;
  auto    writer = session.TaskWriter();

  assert(writer.Append(MakeRecord(1, 0ms)));
  assert(writer.Append(MakeRecord(2, 1ms, 1)));
  assert(writer.Append(MakeRecord(3, 2ms, 42)));
  assert(!writer.Append(MakeRecord(2, 3ms)));

  assert(writer.Count() == 3);
  assert(writer.Contains(2));
  assert(!writer.Contains(42));
  assert(session.Tasks()[0].children.size() == 1);
  assert(session.Tasks()[0].children[0] == 2);

  assert(writer.MarkStarted(2, 2ms));
  assert(!writer.MarkStarted(2, 9ms));
  assert(session.Tasks()[1].State() == TaskState::kRunning);

  assert(writer.Finish(2, TaskOutcome{TaskState::kFailed, 12ms, std::string("boom")}));
  assert(!writer.Finish(2, TaskOutcome{TaskState::kCompleted, 20ms, {}}));
  assert(writer.Finished(2));

  const auto& record = session.Tasks()[1];
  assert(record.State() == TaskState::kFailed);
  assert(record.outcome->completed_at == 12ms);
  assert(*record.outcome->failure == "boom");
}

void TestCompletionNeverPrecedesCreation() {
  Session session;
  auto    writer = session.TaskWriter();

  assert(writer.Append(MakeRecord(1, 10ms)));
  assert(writer.Finish(1, TaskOutcome{TaskState::kCompleted, 4ms, {}}));
  assert(session.Tasks()[0].outcome->completed_at == 10ms);
}

void TestWritesAfterFinalizeAreRejectedAndCounted() {
  Session session;
  auto    tasks    = session.TaskWriter();
  auto    blocking = session.BlockingWriter();
  auto    lag      = session.LagWriter();
  auto    timings  = session.FunctionWriter();

  assert(tasks.Append(MakeRecord(1, 0ms)));
  assert(lag.Append(LagSample{1ms, 10ms, 11ms, 1ms}));
  session.Finalize();
  const auto elapsed = session.Elapsed();

  assert(session.Finalized());
  assert(!tasks.Append(MakeRecord(2, 1ms)));
  assert(!tasks.Finish(1, TaskOutcome{}));
  assert(!blocking.Append(BlockingEvent{}));
  assert(!lag.Append(LagSample{}));
  assert(!timings.Append(FunctionTiming{}));

  assert(session.RejectedWrites() == 5);
  assert(session.Tasks().size() == 1);
  assert(!session.Tasks()[0].outcome.has_value());
  assert(session.LagSamples().size() == 1);
  assert(session.BlockingEvents().empty());
  assert(session.FunctionTimings().empty());

  session.Finalize();
  assert(session.Elapsed() == elapsed);
}

void TestDetachedWriterIsInert() {
  asyncprof::session::TaskRecordWriter writer;
  assert(!writer.Append(MakeRecord(1, 0ms)));
  assert(writer.Count() == 0);
  assert(writer.OffsetOf(asyncprof::util::Now()) == 0ms);
}

void TestFunctionTimingPerCall() {
  FunctionTiming timing;
  assert(timing.PerCall() == 0ms);

  timing.calls      = 4;
  timing.total_time = 20ms;
  assert(timing.PerCall() == 5ms);
}

} // namespace

int main() {
  TestOffsetsAreRelativeToEpochAndClamped();
  TestTaskWriterLinksChildrenAndCompletesOnce();
  TestCompletionNeverPrecedesCreation();
  TestWritesAfterFinalizeAreRejectedAndCounted();
  TestDetachedWriterIsInert();
  TestFunctionTimingPerCall();

  std::cout << "asyncprof_unit_session: pass\n";
  return 0;
}
