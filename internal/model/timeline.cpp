#include "timeline.hpp"

#include <algorithm>
#include <utility>

namespace asyncprof::model {

namespace {

void Flatten(const TaskNode& node, std::size_t depth, util::Duration total_duration, std::vector<TimelineEntry>& out) {
  TimelineEntry entry;
  entry.task_id      = node.id;
  entry.name         = node.name;
  entry.start_offset = node.created_at;
  entry.depth        = depth;
  entry.state        = node.state;

  const auto end = node.completed_at.value_or(std::max(total_duration, node.created_at));
  entry.duration = std::max(util::Duration::zero(), end - node.created_at);
  out.push_back(std::move(entry));

  for (const auto& child : node.children) {
    Flatten(child, depth + 1, total_duration, out);
  }
}

std::size_t MaxConcurrent(const std::vector<TimelineEntry>& entries) {
  // (time, delta); ends sort before starts at the same instant.
  std::vector<std::pair<session::Offset, int>> events;
  events.reserve(entries.size() * 2);
  for (const auto& entry : entries) {
    events.emplace_back(entry.start_offset, +1);
    events.emplace_back(entry.start_offset + entry.duration, -1);
  }
  std::sort(events.begin(), events.end());

  std::size_t peak    = 0;
  long        current = 0;
  for (const auto& [time, delta] : events) {
    current += delta;
    if (current > 0) peak = std::max(peak, static_cast<std::size_t>(current));
  }
  return peak;
}

} // namespace

Timeline BuildTimeline(const std::vector<TaskNode>& forest, util::Duration total_duration) {
  Timeline timeline;
  timeline.total_duration = total_duration;
  for (const auto& root : forest) {
    Flatten(root, 0, total_duration, timeline.entries);
  }
  timeline.max_concurrent = MaxConcurrent(timeline.entries);
  return timeline;
}

} // namespace asyncprof::model
