#pragma once

#include <vector>

#include "internal/model/profile_stats.hpp"

namespace asyncprof::model {

/*
  Projects the task forest onto a time axis.

  Entries come in depth-first order with the nesting depth of each task.
  A task still pending at the end of the session extends to
  `total_duration`. max_concurrent is the peak number of overlapping task
  lifetimes; a task ending exactly when another starts does not overlap it.
*/
Timeline BuildTimeline(const std::vector<TaskNode>& forest, util::Duration total_duration);

} // namespace asyncprof::model
