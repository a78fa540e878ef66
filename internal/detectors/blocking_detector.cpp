#include "blocking_detector.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace asyncprof::detectors {

class BlockingDetector::Sink final : public runtime::SlowCallbackSink {
 public:
  Sink(session::BlockingEventWriter writer, util::Duration threshold) : writer_(writer), threshold_(threshold) {
  }

  void OnSlowCallback(const runtime::SlowCallback& call) override {
    if (stopped_) return;

    const auto started = util::Now();
    try {
      session::BlockingEvent event;
      event.detected_at = writer_.OffsetOf(call.started_at);
      event.duration    = call.duration;
      event.location    = session::SourceSite::FromLocation(call.site);
      event.task_name   = call.task_name;
      event.severity    = call.duration >= 2 * threshold_ ? session::Severity::kCritical : session::Severity::kWarning;

      if (writer_.Append(std::move(event))) {
        ++events_;
        ASYNCPROF_LOG_DEBUG("Blocking call detected", {observability::DurationField("duration", call.duration),
                                                       observability::StringField("task", call.task_name),
                                                       observability::StringField("file", call.site.file_name()),
                                                       observability::IntField("line", call.site.line())});
      }
    } catch (const std::exception& e) {
      ASYNCPROF_LOG_WARN("Blocking detector callback failed", {observability::StringField("error", e.what())});
    }
    overhead_ += util::Now() - started;
  }

  void MarkStopped() noexcept {
    stopped_ = true;
  }

  std::size_t Events() const noexcept {
    return events_;
  }

  util::Duration Overhead() const noexcept {
    return overhead_;
  }

 private:
  session::BlockingEventWriter writer_;
  util::Duration               threshold_;
  std::size_t                  events_ = 0;
  util::Duration               overhead_{};
  bool                         stopped_ = false;
};

BlockingDetector::BlockingDetector(runtime::EventLoop& loop, session::BlockingEventWriter writer, util::Duration threshold)
    : loop_(loop), writer_(writer), threshold_(threshold) {
}

BlockingDetector::~BlockingDetector() {
  try {
    Stop();
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_WARN("Blocking detector stop failed", {observability::StringField("error", e.what())});
  }
}

void BlockingDetector::Start() {
  if (hook_) return;

  sink_ = std::make_shared<Sink>(writer_, threshold_);
  hook_ = std::make_unique<runtime::ScopedSlowCallbackHook>(loop_, threshold_, sink_);
  ASYNCPROF_LOG_DEBUG("Blocking detector started", {observability::DurationField("threshold", threshold_)});
}

void BlockingDetector::Stop() {
  if (!hook_) return;

  // A sink kept alive by someone else must not write any more.
  sink_->MarkStopped();
  auto hook = std::exchange(hook_, nullptr);
  hook->Restore();
}

std::size_t BlockingDetector::EventCount() const noexcept {
  return sink_ ? sink_->Events() : 0;
}

util::Duration BlockingDetector::Overhead() const noexcept {
  return sink_ ? sink_->Overhead() : util::Duration::zero();
}

} // namespace asyncprof::detectors
