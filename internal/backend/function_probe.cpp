#include "function_probe.hpp"

#include "internal/observability/logging.hpp"

namespace asyncprof::backend {

FunctionProbeRegistry& FunctionProbeRegistry::Instance() {
  static FunctionProbeRegistry registry;
  return registry;
}

bool FunctionProbeRegistry::Claim(ProbeSink* sink) {
  if (!sink) return false;

  ProbeSink* expected = nullptr;
  if (!sink_.compare_exchange_strong(expected, sink, std::memory_order_acq_rel)) {
    return false;
  }
  owner_.store(std::this_thread::get_id(), std::memory_order_release);
  generation_.fetch_add(1, std::memory_order_acq_rel);
  return true;
}

void FunctionProbeRegistry::Release(ProbeSink* sink) {
  ProbeSink* expected = sink;
  if (sink_.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel)) {
    owner_.store(std::thread::id{}, std::memory_order_release);
    generation_.fetch_add(1, std::memory_order_acq_rel);
  }
}

ProbeSink* FunctionProbeRegistry::ActiveSink() const noexcept {
  auto* sink = sink_.load(std::memory_order_acquire);
  if (!sink || owner_.load(std::memory_order_acquire) != std::this_thread::get_id()) {
    return nullptr;
  }
  return sink;
}

ProbeScope::ProbeScope(std::source_location site) : site_(site) {
  auto& registry = FunctionProbeRegistry::Instance();
  auto* sink     = registry.ActiveSink();
  if (!sink) return;

  try {
    sink->OnEnter(site_, util::Now());
    generation_ = registry.Generation();
    active_     = true;
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_WARN("Probe enter failed", {observability::StringField("function", site_.function_name()), observability::StringField("error", e.what())});
  }
}

ProbeScope::~ProbeScope() {
  if (!active_) return;

  auto& registry = FunctionProbeRegistry::Instance();
  auto* sink     = registry.ActiveSink();
  if (!sink || registry.Generation() != generation_) return;

  try {
    sink->OnExit(site_, util::Now());
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_WARN("Probe exit failed", {observability::StringField("function", site_.function_name()), observability::StringField("error", e.what())});
  }
}

} // namespace asyncprof::backend
