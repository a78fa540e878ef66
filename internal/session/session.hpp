#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "internal/session/records.hpp"

namespace asyncprof::session {

class Session;

/*
  Writers

  Each observer gets the one writer it needs. Writers only append to (or
  complete) their own sequence; none can read back another observer's
  entries. Every write after Session::Finalize() is dropped and counted.
  A writer is a cheap handle and must not outlive its session.
*/

class TaskRecordWriter {
 public:
  TaskRecordWriter() = default;

  // Links the record under its parent when the parent is tracked.
  bool Append(TaskRecord record);
  bool MarkStarted(runtime::TaskId id, Offset started_at);
  bool Finish(runtime::TaskId id, TaskOutcome outcome);

  std::size_t Count() const;
  bool        Contains(runtime::TaskId id) const;
  bool        Finished(runtime::TaskId id) const;

  Offset OffsetOf(util::TimePoint time) const;

 private:
  friend class Session;
  explicit TaskRecordWriter(Session* session) : session_(session) {
  }

  Session* session_ = nullptr;
};

class BlockingEventWriter {
 public:
  BlockingEventWriter() = default;

  bool   Append(BlockingEvent event);
  Offset OffsetOf(util::TimePoint time) const;

 private:
  friend class Session;
  explicit BlockingEventWriter(Session* session) : session_(session) {
  }

  Session* session_ = nullptr;
};

class LagSampleWriter {
 public:
  LagSampleWriter() = default;

  bool   Append(LagSample sample);
  Offset OffsetOf(util::TimePoint time) const;

 private:
  friend class Session;
  explicit LagSampleWriter(Session* session) : session_(session) {
  }

  Session* session_ = nullptr;
};

class FunctionTimingWriter {
 public:
  FunctionTimingWriter() = default;

  bool Append(FunctionTiming timing);

 private:
  friend class Session;
  explicit FunctionTimingWriter(Session* session) : session_(session) {
  }

  Session* session_ = nullptr;
};

/*
  Session

  Everything observed during one profiled unit of work. Timestamps are
  offsets from the steady-clock epoch taken at construction. Append-only
  while active, immutable once finalized, never reused.
*/
class Session {
 public:
  explicit Session(util::TimePoint epoch = util::Now());

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  util::TimePoint Epoch() const noexcept {
    return epoch_;
  }

  // Clamped at zero.
  Offset OffsetOf(util::TimePoint time) const noexcept;

  // Session length: up to Finalize(), or up to now while active.
  util::Duration Elapsed() const noexcept;

  void Finalize() noexcept;
  bool Finalized() const noexcept {
    return finalized_at_.has_value();
  }

  TaskRecordWriter     TaskWriter();
  BlockingEventWriter  BlockingWriter();
  LagSampleWriter      LagWriter();
  FunctionTimingWriter FunctionWriter();

  const std::vector<TaskRecord>& Tasks() const noexcept {
    return tasks_;
  }
  const std::vector<BlockingEvent>& BlockingEvents() const noexcept {
    return blocking_;
  }
  const std::vector<LagSample>& LagSamples() const noexcept {
    return lag_samples_;
  }
  const std::vector<FunctionTiming>& FunctionTimings() const noexcept {
    return function_timings_;
  }

  std::size_t RejectedWrites() const noexcept {
    return rejected_writes_;
  }

 private:
  friend class TaskRecordWriter;
  friend class BlockingEventWriter;
  friend class LagSampleWriter;
  friend class FunctionTimingWriter;

  bool        AcceptWrite() noexcept;
  TaskRecord* FindTask(runtime::TaskId id);
  const TaskRecord* FindTask(runtime::TaskId id) const;

  util::TimePoint                epoch_;
  std::optional<util::TimePoint> finalized_at_;
  std::size_t                    rejected_writes_ = 0;

  std::vector<TaskRecord>                          tasks_;
  std::unordered_map<runtime::TaskId, std::size_t> task_index_;
  std::vector<BlockingEvent>                       blocking_;
  std::vector<LagSample>                           lag_samples_;
  std::vector<FunctionTiming>                      function_timings_;
};

} // namespace asyncprof::session
