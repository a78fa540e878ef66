#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/backend/backend_registry.hpp"
#include "internal/config/settings.hpp"
#include "internal/detectors/blocking_detector.hpp"
#include "internal/detectors/lag_monitor.hpp"
#include "internal/model/profile_stats.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/session/session.hpp"

namespace asyncprof::core {

/*
  ProfilerCoordinator

  Owns one profiling session at a time:

    idle ──Start()──▶ active ──Stop()──▶ finalized ──Start()──▶ active …

  Start() creates a fresh session, selects and starts the backend, then the
  blocking detector and the lag monitor. Stop() tears them down in reverse
  and finalizes the session. Nothing here throws: failures are logged,
  reported as warnings, and degrade to profiling less (backend "none" when
  the backend itself could not start).
*/
class ProfilerCoordinator {
 public:
  enum class Phase {
    kIdle,
    kActive,
    kFinalized,
  };

  ProfilerCoordinator(runtime::EventLoop& loop, config::ProfilerSettings settings,
                      const backend::BackendRegistry& registry = backend::BackendRegistry::Default());
  ~ProfilerCoordinator();

  ProfilerCoordinator(const ProfilerCoordinator&)            = delete;
  ProfilerCoordinator& operator=(const ProfilerCoordinator&) = delete;

  // No-op while active.
  void Start() noexcept;
  // No-op unless active.
  void Stop() noexcept;

  // Empty stats with backend "none" while idle.
  model::ProfileStats GetStats() const noexcept;

  // Navigation label, e.g. "2 blocking, lag 12ms" or "OK".
  std::string Summary() const noexcept;

  Phase CurrentPhase() const noexcept {
    return phase_;
  }

  const config::ProfilerSettings& Settings() const noexcept {
    return settings_;
  }

  // nullptr until the first Start().
  const session::Session* CurrentSession() const noexcept {
    return session_.get();
  }

 private:
  void StartBackend();
  void StartEntry(const backend::BackendEntry& entry);
  void StartDetectors();
  void Warn(std::string message);

  runtime::EventLoop&             loop_;
  config::ProfilerSettings        settings_;
  const backend::BackendRegistry& registry_;

  Phase phase_ = Phase::kIdle;

  // Declared first: everything below writes into it.
  std::unique_ptr<session::Session>              session_;
  backend::ProfilerBackendPtr                    backend_;
  std::unique_ptr<detectors::BlockingDetector>   blocking_;
  std::unique_ptr<detectors::LagMonitor>         lag_;

  std::string              backend_name_{model::kNoBackend};
  std::vector<std::string> warnings_;
  util::Duration           overhead_{};
};

} // namespace asyncprof::core
