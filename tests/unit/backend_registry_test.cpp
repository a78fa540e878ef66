#include "internal/backend/backend_registry.hpp"

#include <cassert>
#include <iostream>

#include "internal/backend/instrumented_backend.hpp"
#include "internal/util/errors.hpp"

namespace {

using asyncprof::backend::BackendEntry;
using asyncprof::backend::BackendRegistry;
using asyncprof::backend::SelectBackend;

BackendEntry Entry(const std::string& name, bool deep, bool available) {
  return BackendEntry{name, deep, [available] { return available; }, {}};
}

void TestAutoPrefersAvailableDeepBackend() {
  BackendRegistry registry({Entry("sampler", true, false), Entry("instrumented", true, true), Entry("taskfactory", false, true)});

  const auto selection = SelectBackend(registry, "auto");
  assert(selection.entry->name == "instrumented");
  assert(selection.requested == "auto");
  assert(!selection.warning.has_value());

  const auto empty = SelectBackend(registry, "");
  assert(empty.entry->name == "instrumented");
  assert(empty.requested == "auto");
}

void TestAutoFallsBackQuietly() {
  BackendRegistry registry({Entry("instrumented", true, false), Entry("taskfactory", false, true)});

  const auto selection = SelectBackend(registry, "auto");
  assert(selection.entry->name == "taskfactory");
  assert(!selection.warning.has_value());
}

void TestUnknownNameFallsBackWithWarning() {
  BackendRegistry registry({Entry("instrumented", true, true), Entry("taskfactory", false, true)});

  const auto selection = SelectBackend(registry, "ebpf");
  assert(selection.entry->name == "taskfactory");
  assert(selection.requested == "ebpf");
  assert(selection.warning.has_value());
  assert(selection.warning->find("ebpf") != std::string::npos);
}

void TestUnavailableNameFallsBackWithWarning() {
  BackendRegistry registry({Entry("instrumented", true, false), Entry("taskfactory", false, true)});

  const auto selection = SelectBackend(registry, "instrumented");
  assert(selection.entry->name == "taskfactory");
  assert(selection.warning->find("not available") != std::string::npos);
}

void TestExplicitAvailableNameIsUsed() {
  BackendRegistry registry({Entry("instrumented", true, true), Entry("taskfactory", false, true)});

  const auto selection = SelectBackend(registry, "taskfactory");
  assert(selection.entry->name == "taskfactory");
  assert(!selection.warning.has_value());
}

void TestRegistryWithoutFallbackIsRejected() {
  BackendRegistry registry({Entry("instrumented", true, true)});

  bool threw = false;
  try {
    SelectBackend(registry, "auto");
  } catch (const asyncprof::util::BackendUnavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestDefaultRegistry() {
  const auto& registry = BackendRegistry::Default();
  assert(registry.Find("taskfactory") != nullptr);
  assert(registry.Find("instrumented") != nullptr);
  assert(registry.Find("instrumented")->deep);
  assert(registry.Find("missing") == nullptr);

  const auto selection = SelectBackend(registry, "auto");
  if (asyncprof::backend::InstrumentedBackend::IsAvailable()) {
    assert(selection.entry->name == "instrumented");
  } else {
    assert(selection.entry->name == "taskfactory");
  }
}

} // namespace

int main() {
  TestAutoPrefersAvailableDeepBackend();
  TestAutoFallsBackQuietly();
  TestUnknownNameFallsBackWithWarning();
  TestUnavailableNameFallsBackWithWarning();
  TestExplicitAvailableNameIsUsed();
  TestRegistryWithoutFallbackIsRejected();
  TestDefaultRegistry();

  std::cout << "asyncprof_unit_backend_registry: pass\n";
  return 0;
}
