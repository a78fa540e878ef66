#include "session.hpp"

#include <algorithm>
#include <utility>

namespace asyncprof::session {

// ------------------------------------------------------------
// Session
// ------------------------------------------------------------

Session::Session(util::TimePoint epoch) : epoch_(epoch) {
}

Offset Session::OffsetOf(util::TimePoint time) const noexcept {
  return std::max(Offset::zero(), std::chrono::duration_cast<Offset>(time - epoch_));
}

util::Duration Session::Elapsed() const noexcept {
  return OffsetOf(finalized_at_.value_or(util::Now()));
}

void Session::Finalize() noexcept {
  if (!finalized_at_) {
    finalized_at_ = util::Now();
  }
}

TaskRecordWriter Session::TaskWriter() {
  return TaskRecordWriter(this);
}

BlockingEventWriter Session::BlockingWriter() {
  return BlockingEventWriter(this);
}

LagSampleWriter Session::LagWriter() {
  return LagSampleWriter(this);
}

FunctionTimingWriter Session::FunctionWriter() {
  return FunctionTimingWriter(this);
}

bool Session::AcceptWrite() noexcept {
  if (finalized_at_) {
    ++rejected_writes_;
    return false;
  }
  return true;
}

TaskRecord* Session::FindTask(runtime::TaskId id) {
  auto it = task_index_.find(id);
  return it == task_index_.end() ? nullptr : &tasks_[it->second];
}

const TaskRecord* Session::FindTask(runtime::TaskId id) const {
  auto it = task_index_.find(id);
  return it == task_index_.end() ? nullptr : &tasks_[it->second];
}

// ------------------------------------------------------------
// TaskRecordWriter
// ------------------------------------------------------------

bool TaskRecordWriter::Append(TaskRecord record) {
  if (!session_ || !session_->AcceptWrite()) return false;
  if (session_->task_index_.count(record.id) > 0) return false;

  if (record.parent_id) {
    if (auto* parent = session_->FindTask(*record.parent_id)) {
      parent->children.push_back(record.id);
    }
  }

  session_->task_index_.emplace(record.id, session_->tasks_.size());
  session_->tasks_.push_back(std::move(record));
  return true;
}

bool TaskRecordWriter::MarkStarted(runtime::TaskId id, Offset started_at) {
  if (!session_ || !session_->AcceptWrite()) return false;

  auto* record = session_->FindTask(id);
  if (!record || record->started_at) return false;
  record->started_at = started_at;
  return true;
}

bool TaskRecordWriter::Finish(runtime::TaskId id, TaskOutcome outcome) {
  if (!session_ || !session_->AcceptWrite()) return false;

  auto* record = session_->FindTask(id);
  if (!record || record->outcome) return false;

  outcome.completed_at = std::max(outcome.completed_at, record->created_at);
  record->outcome      = std::move(outcome);
  return true;
}

std::size_t TaskRecordWriter::Count() const {
  return session_ ? session_->tasks_.size() : 0;
}

bool TaskRecordWriter::Contains(runtime::TaskId id) const {
  return session_ && session_->FindTask(id) != nullptr;
}

bool TaskRecordWriter::Finished(runtime::TaskId id) const {
  if (!session_) return false;
  const auto* record = session_->FindTask(id);
  return record && record->outcome.has_value();
}

Offset TaskRecordWriter::OffsetOf(util::TimePoint time) const {
  return session_ ? session_->OffsetOf(time) : Offset::zero();
}

// ------------------------------------------------------------
// BlockingEventWriter / LagSampleWriter / FunctionTimingWriter
// ------------------------------------------------------------

bool BlockingEventWriter::Append(BlockingEvent event) {
  if (!session_ || !session_->AcceptWrite()) return false;
  session_->blocking_.push_back(std::move(event));
  return true;
}

Offset BlockingEventWriter::OffsetOf(util::TimePoint time) const {
  return session_ ? session_->OffsetOf(time) : Offset::zero();
}

bool LagSampleWriter::Append(LagSample sample) {
  if (!session_ || !session_->AcceptWrite()) return false;
  session_->lag_samples_.push_back(sample);
  return true;
}

Offset LagSampleWriter::OffsetOf(util::TimePoint time) const {
  return session_ ? session_->OffsetOf(time) : Offset::zero();
}

bool FunctionTimingWriter::Append(FunctionTiming timing) {
  if (!session_ || !session_->AcceptWrite()) return false;
  session_->function_timings_.push_back(std::move(timing));
  return true;
}

} // namespace asyncprof::session
