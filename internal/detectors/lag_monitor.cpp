#include "lag_monitor.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace asyncprof::detectors {

struct LagMonitor::State {
  runtime::EventLoop&      loop;
  session::LagSampleWriter writer;
  util::Duration           interval;

  runtime::TimerHandle timer;
  std::size_t          samples = 0;
  util::Duration       overhead{};
};

LagMonitor::LagMonitor(runtime::EventLoop& loop, session::LagSampleWriter writer, util::Duration interval)
    : loop_(loop), writer_(writer), interval_(interval) {
  if (interval_ <= util::Duration::zero()) {
    throw util::ConfigError("lag sample interval must be positive");
  }
}

LagMonitor::~LagMonitor() {
  Stop();
}

void LagMonitor::Start() {
  if (state_) return;

  state_ = std::make_shared<State>(State{loop_, writer_, interval_, {}, 0, {}});
  Arm(state_);
  ASYNCPROF_LOG_DEBUG("Lag monitor started", {observability::DurationField("interval", interval_)});
}

void LagMonitor::Stop() {
  if (!state_) return;

  auto state = std::exchange(state_, nullptr);
  state->timer.Cancel();
  final_samples_  = state->samples;
  final_overhead_ = state->overhead;
}

std::size_t LagMonitor::SampleCount() const noexcept {
  return state_ ? state_->samples : final_samples_;
}

util::Duration LagMonitor::Overhead() const noexcept {
  return state_ ? state_->overhead : final_overhead_;
}

void LagMonitor::Arm(const std::shared_ptr<State>& state) {
  std::weak_ptr<State> weak         = state;
  const auto           scheduled_at = util::Now();

  state->timer = state->loop.CallLater(state->interval, [weak, scheduled_at] {
    auto locked = weak.lock();
    if (!locked) return;

    const auto fired = util::Now();
    try {
      session::LagSample sample;
      sample.timestamp      = locked->writer.OffsetOf(fired);
      sample.expected_delay = locked->interval;
      sample.actual_delay   = fired - scheduled_at;
      sample.lag            = sample.actual_delay - sample.expected_delay;
      if (locked->writer.Append(sample)) {
        ++locked->samples;
      }
    } catch (const std::exception& e) {
      ASYNCPROF_LOG_WARN("Lag probe failed", {observability::StringField("error", e.what())});
    }

    Arm(locked);
    locked->overhead += util::Now() - fired;
  });
}

} // namespace asyncprof::detectors
