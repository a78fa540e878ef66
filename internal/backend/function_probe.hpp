#pragma once

#include <atomic>
#include <cstdint>
#include <source_location>
#include <thread>

#include "internal/util/time.hpp"

#ifndef ASYNCPROF_ENABLE_PROBES
#define ASYNCPROF_ENABLE_PROBES 1
#endif

namespace asyncprof::backend {

inline constexpr bool kProbesEnabled = ASYNCPROF_ENABLE_PROBES != 0;

class ProbeSink {
 public:
  virtual ~ProbeSink()                                                     = default;
  virtual void OnEnter(const std::source_location& site, util::TimePoint now) = 0;
  virtual void OnExit(const std::source_location& site, util::TimePoint now)  = 0;
};

/*
  FunctionProbeRegistry

  Process-wide slot for the one sink allowed to receive probe events.
  The slot is bound to the thread that claimed it; probes firing on any
  other thread are ignored. Each claim starts a new generation so that a
  scope opened under one claim never reports its exit to the next one.
*/
class FunctionProbeRegistry {
 public:
  static FunctionProbeRegistry& Instance();

  // False if another sink holds the slot.
  bool Claim(ProbeSink* sink);
  // Only the current holder can release.
  void Release(ProbeSink* sink);

  bool Claimed() const noexcept {
    return sink_.load(std::memory_order_acquire) != nullptr;
  }

  // Sink for probes on the calling thread, or nullptr.
  ProbeSink* ActiveSink() const noexcept;

  std::uint64_t Generation() const noexcept {
    return generation_.load(std::memory_order_acquire);
  }

 private:
  FunctionProbeRegistry() = default;

  std::atomic<ProbeSink*>     sink_{nullptr};
  std::atomic<std::uint64_t>  generation_{0};
  std::atomic<std::thread::id> owner_{};
};

// RAII enter/exit report for the enclosing function.
class ProbeScope {
 public:
  explicit ProbeScope(std::source_location site = std::source_location::current());
  ~ProbeScope();

  ProbeScope(const ProbeScope&)            = delete;
  ProbeScope& operator=(const ProbeScope&) = delete;

 private:
  std::source_location site_;
  std::uint64_t        generation_ = 0;
  bool                 active_     = false;
};

} // namespace asyncprof::backend

#define ASYNCPROF_PROBE_CONCAT_INNER(a, b) a##b
#define ASYNCPROF_PROBE_CONCAT(a, b) ASYNCPROF_PROBE_CONCAT_INNER(a, b)

#if ASYNCPROF_ENABLE_PROBES
#define ASYNCPROF_PROBE_FUNCTION() ::asyncprof::backend::ProbeScope ASYNCPROF_PROBE_CONCAT(asyncprof_probe_, __LINE__)
#else
#define ASYNCPROF_PROBE_FUNCTION() static_cast<void>(0)
#endif
