#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/backend/profiler_backend.hpp"

namespace asyncprof::backend {

struct BackendEntry {
  std::string name;
  // Deep backends are preferred by "auto".
  bool deep = false;
  // Pure capability check; must not touch any hook.
  std::function<bool()>                                  is_available;
  std::function<ProfilerBackendPtr(const BackendContext&)> create;
};

/*
  Static table of the backends compiled into this build.

    taskfactory   always available; the fallback for every selection
    instrumented  deep; available while the probe slot is free
*/
class BackendRegistry {
 public:
  explicit BackendRegistry(std::vector<BackendEntry> entries);

  static const BackendRegistry& Default();

  const BackendEntry*              Find(std::string_view name) const;
  const std::vector<BackendEntry>& Entries() const noexcept {
    return entries_;
  }

 private:
  std::vector<BackendEntry> entries_;
};

struct BackendSelection {
  const BackendEntry*        entry = nullptr;
  // taskfactory; what a deep entry that fails to start gives way to.
  const BackendEntry*        fallback = nullptr;
  std::string                requested;
  std::optional<std::string> warning;
};

/*
  Picks the backend for a session:

    "auto" (or empty)  first available deep backend, else taskfactory
    a known name       that backend if available
    anything else      taskfactory, with a warning naming what was asked for

  Throws util::BackendUnavailable only if the registry has no taskfactory.
*/
BackendSelection SelectBackend(const BackendRegistry& registry, std::string_view requested);

} // namespace asyncprof::backend
