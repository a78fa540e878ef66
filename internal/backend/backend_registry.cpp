#include "backend_registry.hpp"

#include <memory>
#include <utility>

#include "internal/backend/instrumented_backend.hpp"
#include "internal/backend/task_tracker.hpp"
#include "internal/config/settings.hpp"
#include "internal/util/errors.hpp"

namespace asyncprof::backend {

namespace {

bool Available(const BackendEntry& entry) {
  return !entry.is_available || entry.is_available();
}

} // namespace

BackendRegistry::BackendRegistry(std::vector<BackendEntry> entries) : entries_(std::move(entries)) {
}

const BackendRegistry& BackendRegistry::Default() {
  static const BackendRegistry registry({
      BackendEntry{InstrumentedBackend::kName, true, &InstrumentedBackend::IsAvailable,
                   [](const BackendContext& context) -> ProfilerBackendPtr { return std::make_unique<InstrumentedBackend>(context); }},
      BackendEntry{TaskTracker::kName, false, &TaskTracker::IsAvailable,
                   [](const BackendContext& context) -> ProfilerBackendPtr { return std::make_unique<TaskTracker>(context); }},
  });
  return registry;
}

const BackendEntry* BackendRegistry::Find(std::string_view name) const {
  for (const auto& entry : entries_) {
    if (entry.name == name) return &entry;
  }
  return nullptr;
}

BackendSelection SelectBackend(const BackendRegistry& registry, std::string_view requested) {
  BackendSelection selection;
  selection.requested = requested.empty() ? std::string(config::kAutoBackend) : std::string(requested);

  const auto* fallback = registry.Find(TaskTracker::kName);
  if (!fallback) {
    throw util::BackendUnavailable("backend registry has no taskfactory backend");
  }
  selection.fallback = fallback;

  if (selection.requested == config::kAutoBackend) {
    for (const auto& entry : registry.Entries()) {
      if (entry.deep && Available(entry)) {
        selection.entry = &entry;
        return selection;
      }
    }
    selection.entry = fallback;
    return selection;
  }

  const auto* entry = registry.Find(selection.requested);
  if (!entry) {
    selection.entry   = fallback;
    selection.warning = "unknown profiler backend '" + selection.requested + "', using " + fallback->name;
    return selection;
  }
  if (!Available(*entry)) {
    selection.entry   = fallback;
    selection.warning = "profiler backend '" + selection.requested + "' is not available, using " + fallback->name;
    return selection;
  }

  selection.entry = entry;
  return selection;
}

} // namespace asyncprof::backend
