#pragma once

#include <vector>

#include "internal/model/profile_stats.hpp"

namespace asyncprof::model {

/*
  Rebuilds the parent/child forest from flat task records.

  A record becomes a root when its parent was not tracked, when the parent
  was created after it, or when following parents would loop back to it.
  Roots and siblings keep record (creation) order.
*/
std::vector<TaskNode> BuildTaskHierarchy(const std::vector<session::TaskRecord>& records);

// Number of nodes in the forest.
std::size_t CountNodes(const std::vector<TaskNode>& forest);

} // namespace asyncprof::model
