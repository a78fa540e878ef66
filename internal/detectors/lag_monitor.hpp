#pragma once

#include <cstddef>
#include <memory>

#include "internal/runtime/event_loop.hpp"
#include "internal/session/session.hpp"

namespace asyncprof::detectors {

/*
  LagMonitor

  A timer probe that re-arms itself every `interval`. Each firing records
  how late it ran (actual delay - expected delay) as a LagSample.
  Stop() cancels the pending probe, so the loop holds no monitor timer
  afterwards. A non-positive interval throws util::ConfigError.
*/
class LagMonitor {
 public:
  LagMonitor(runtime::EventLoop& loop, session::LagSampleWriter writer, util::Duration interval);
  ~LagMonitor();

  LagMonitor(const LagMonitor&)            = delete;
  LagMonitor& operator=(const LagMonitor&) = delete;

  void Start();
  void Stop();

  bool Active() const noexcept {
    return state_ != nullptr;
  }

  std::size_t    SampleCount() const noexcept;
  util::Duration Overhead() const noexcept;

 private:
  struct State;

  static void Arm(const std::shared_ptr<State>& state);

  runtime::EventLoop&      loop_;
  session::LagSampleWriter writer_;
  util::Duration           interval_;
  std::shared_ptr<State>   state_;
  std::size_t              final_samples_ = 0;
  util::Duration           final_overhead_{};
};

} // namespace asyncprof::detectors
