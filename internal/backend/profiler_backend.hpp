#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/config/settings.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/session/session.hpp"

namespace asyncprof::backend {

struct BackendStats {
  std::string    backend;
  std::uint64_t  tasks_created = 0;
  std::uint64_t  tasks_dropped = 0;
  util::Duration hook_overhead{};
};

// What a backend observes and where it writes. Outlives the backend.
struct BackendContext {
  runtime::EventLoop&             loop;
  session::Session&               session;
  const config::ProfilerSettings& settings;
};

/*
  Profiling backend abstraction.

  Exactly one backend observes a session. Implementations:
    taskfactory   → task lifecycle and hierarchy via the loop's task factory
    instrumented  → the above plus per-function timing from probes
*/

class ProfilerBackend {
 public:
  virtual ~ProfilerBackend() = default;

  // ------------------------------------------------------------------
  // Start
  // ------------------------------------------------------------------
  /*
    Begin observing. Returns quickly.
    Throws util::BackendStartError (or util::HookConflict) on failure,
    leaving nothing installed.
  */
  virtual void Start() = 0;

  // ------------------------------------------------------------------
  // Stop
  // ------------------------------------------------------------------
  /*
    Stop observing and restore every hook. Idempotent; a no-op without
    a prior Start(). Hooks are restored even when this throws
    util::HookConflict.
  */
  virtual void Stop() = 0;

  // No side effects; valid (possibly empty) at any time.
  virtual BackendStats GetStats() const = 0;

  virtual std::string_view Name() const = 0;
};

using ProfilerBackendPtr = std::unique_ptr<ProfilerBackend>;

} // namespace asyncprof::backend
