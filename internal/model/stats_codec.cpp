#include "stats_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace asyncprof::model {

namespace {

namespace pb = asyncprof::stats::v1;

void FillLocation(const session::SourceSite& site, pb::SourceLocation* out) {
  out->set_file(site.file);
  out->set_line(site.line);
  out->set_function(site.function);
}

void FillNode(const TaskNode& node, const TaskNode* parent, std::uint32_t depth, pb::ProfileStats* stats) {
  auto* out = stats->add_task_hierarchy();
  out->set_id(node.id);
  out->set_name(node.name);
  out->set_callable(node.callable);
  out->set_state(runtime::ToString(node.state));
  out->set_created_ms(util::ToMillis(node.created_at));
  if (node.started_at) out->set_started_ms(util::ToMillis(*node.started_at));
  if (node.completed_at) out->set_completed_ms(util::ToMillis(*node.completed_at));
  if (node.duration) out->set_duration_ms(util::ToMillis(*node.duration));
  if (node.failure) out->set_failure(*node.failure);
  FillLocation(node.location, out->mutable_location());

  for (const auto& frame : node.stack) {
    auto* f = out->add_stack();
    f->set_function(frame.function);
    f->set_module(frame.module);
    f->set_address(frame.address);
  }
  if (parent) out->set_parent_id(parent->id);
  out->set_depth(depth);
  for (const auto& child : node.children) {
    out->add_children(child.id);
  }

  for (const auto& child : node.children) {
    FillNode(child, &node, depth + 1, stats);
  }
}

} // namespace

pb::ProfileStats ToProto(const ProfileStats& stats, const std::string& summary) {
  pb::ProfileStats out;
  out.set_backend(stats.backend);
  out.set_profiling_overhead_ms(util::ToMillis(stats.profiling_overhead));
  out.set_tasks_created(stats.tasks_created);
  out.set_tasks_completed(stats.tasks_completed);
  out.set_tasks_cancelled(stats.tasks_cancelled);
  out.set_tasks_failed(stats.tasks_failed);
  out.set_tasks_dropped(stats.tasks_dropped);

  auto* lag = out.mutable_event_loop_lag();
  lag->set_min_ms(util::ToMillis(stats.event_loop_lag.min));
  lag->set_avg_ms(util::ToMillis(stats.event_loop_lag.avg));
  lag->set_max_ms(util::ToMillis(stats.event_loop_lag.max));
  lag->set_p95_ms(util::ToMillis(stats.event_loop_lag.p95));
  lag->set_sample_count(stats.event_loop_lag.sample_count);
  lag->set_samples_over_threshold(stats.event_loop_lag.samples_over_threshold);

  for (const auto& event : stats.blocking_calls) {
    auto* call = out.add_blocking_calls();
    call->set_detected_ms(util::ToMillis(event.detected_at));
    call->set_duration_ms(util::ToMillis(event.duration));
    FillLocation(event.location, call->mutable_location());
    call->set_task_name(event.task_name);
    call->set_severity(session::ToString(event.severity));
  }

  for (const auto& root : stats.task_hierarchy) {
    FillNode(root, nullptr, 0, &out);
  }

  for (const auto& timing : stats.top_functions) {
    auto* fn = out.add_top_functions();
    fn->set_function(timing.function);
    fn->set_file(timing.file);
    fn->set_line(timing.line);
    fn->set_calls(timing.calls);
    fn->set_total_time_ms(util::ToMillis(timing.total_time));
    fn->set_cumulative_time_ms(util::ToMillis(timing.cumulative_time));
    fn->set_suspended_time_ms(util::ToMillis(timing.suspended_time));
    fn->set_per_call_ms(util::ToMillis(timing.PerCall()));
  }

  auto* timeline = out.mutable_timeline();
  for (const auto& entry : stats.timeline.entries) {
    auto* e = timeline->add_entries();
    e->set_task_id(entry.task_id);
    e->set_name(entry.name);
    e->set_start_ms(util::ToMillis(entry.start_offset));
    e->set_duration_ms(util::ToMillis(entry.duration));
    e->set_depth(static_cast<uint32_t>(entry.depth));
    e->set_state(runtime::ToString(entry.state));
  }
  timeline->set_total_duration_ms(util::ToMillis(stats.timeline.total_duration));
  timeline->set_max_concurrent(static_cast<uint32_t>(stats.timeline.max_concurrent));

  for (const auto& warning : stats.warnings) {
    out.add_warnings(warning);
  }
  out.set_summary(summary);
  return out;
}

std::string ToJson(const ProfileStats& stats, const std::string& summary) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(stats, summary), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize profile stats: " + std::string(status.message()));
  }
  return json;
}

std::vector<std::pair<std::string, double>> ServerTiming(const ProfileStats& stats) {
  return {
      {"profiling", util::ToMillis(stats.profiling_overhead)},
      {"profiled_time", util::ToMillis(stats.timeline.total_duration)},
  };
}

std::string FormatServerTiming(const ProfileStats& stats) {
  std::string header;
  for (const auto& [name, value] : ServerTiming(stats)) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s;dur=%.3f", name.c_str(), value);
    if (!header.empty()) header += ", ";
    header += buf;
  }
  return header;
}

} // namespace asyncprof::model
