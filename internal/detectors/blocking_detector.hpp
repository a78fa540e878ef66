#pragma once

#include <cstddef>
#include <memory>

#include "internal/runtime/scoped_hooks.hpp"
#include "internal/session/session.hpp"

namespace asyncprof::detectors {

/*
  BlockingDetector

  Installs the loop's slow-callback threshold and sink for the session.
  Every handle the loop runs for at least `threshold` (a plain callback or
  a task step) becomes a BlockingEvent:

    duration >= threshold      warning
    duration >= 2 * threshold  critical

  Stalls split across several shorter handles go unnoticed, and handles
  doing legitimate CPU work past the threshold are reported.
*/
class BlockingDetector {
 public:
  BlockingDetector(runtime::EventLoop& loop, session::BlockingEventWriter writer, util::Duration threshold);
  ~BlockingDetector();

  BlockingDetector(const BlockingDetector&)            = delete;
  BlockingDetector& operator=(const BlockingDetector&) = delete;

  void Start();
  // Restores the previous threshold and sink; idempotent.
  void Stop();

  bool Active() const noexcept {
    return hook_ != nullptr;
  }

  std::size_t EventCount() const noexcept;

  util::Duration Overhead() const noexcept;

 private:
  class Sink;

  runtime::EventLoop&                              loop_;
  session::BlockingEventWriter                     writer_;
  util::Duration                                   threshold_;
  std::shared_ptr<Sink>                            sink_;
  std::unique_ptr<runtime::ScopedSlowCallbackHook> hook_;
};

} // namespace asyncprof::detectors
