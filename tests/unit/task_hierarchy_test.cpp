#include "internal/model/task_hierarchy.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>

#include "internal/model/timeline.hpp"

namespace {

using namespace std::chrono_literals;

using asyncprof::model::BuildTaskHierarchy;
using asyncprof::model::BuildTimeline;
using asyncprof::model::CountNodes;
using asyncprof::model::TaskNode;
using asyncprof::runtime::TaskId;
using asyncprof::runtime::TaskState;
using asyncprof::session::TaskOutcome;
using asyncprof::session::TaskRecord;

TaskRecord MakeRecord(TaskId id, std::chrono::nanoseconds created_at, std::optional<TaskId> parent = {},
                      std::optional<std::chrono::nanoseconds> completed_at = {}) {
  TaskRecord record;
  record.id         = id;
  record.name       = "task-" + std::to_string(id);
  record.created_at = created_at;
  record.parent_id  = parent;
  if (completed_at) {
    record.outcome = TaskOutcome{TaskState::kCompleted, *completed_at, {}};
  }
  return record;
}

// Every node appears once, and every child was created no earlier than its parent.
void AssertForest(const std::vector<TaskNode>& forest) {
  std::unordered_set<TaskId>           seen;
  std::function<void(const TaskNode&)> visit = [&](const TaskNode& node) {
    assert(seen.insert(node.id).second);
    for (const auto& child : node.children) {
      assert(child.created_at >= node.created_at);
      visit(child);
    }
  };
  for (const auto& root : forest) visit(root);
}

void TestChildrenNestUnderTrackedParents() {
  std::vector<TaskRecord> records{
      MakeRecord(1, 0ms),
      MakeRecord(2, 1ms, 1),
      MakeRecord(3, 2ms, 1),
      MakeRecord(4, 3ms, 2),
      MakeRecord(5, 4ms),
  };

  const auto forest = BuildTaskHierarchy(records);
  AssertForest(forest);
  assert(forest.size() == 2);
  assert(forest[0].id == 1);
  assert(forest[0].children.size() == 2);
  assert(forest[0].children[0].id == 2);
  assert(forest[0].children[0].children.size() == 1);
  assert(forest[0].children[0].children[0].id == 4);
  assert(forest[1].id == 5);
  assert(CountNodes(forest) == 5);
}

void TestUntrackedParentMakesARoot() {
  std::vector<TaskRecord> records{
      MakeRecord(7, 0ms, 3),
      MakeRecord(8, 1ms, 7),
  };

  const auto forest = BuildTaskHierarchy(records);
  assert(forest.size() == 1);
  assert(forest[0].id == 7);
  assert(forest[0].children.size() == 1);
}

void TestParentCreatedLaterIsIgnored() {
  std::vector<TaskRecord> records{
      MakeRecord(1, 1ms, 2),
      MakeRecord(2, 5ms),
  };

  const auto forest = BuildTaskHierarchy(records);
  AssertForest(forest);
  assert(forest.size() == 2);
  assert(CountNodes(forest) == 2);
}

void TestCyclesAreBroken() {
  std::vector<TaskRecord> records{
      MakeRecord(1, 0ms, 3),
      MakeRecord(2, 0ms, 1),
      MakeRecord(3, 0ms, 2),
      MakeRecord(4, 1ms, 4),
  };

  const auto forest = BuildTaskHierarchy(records);
  AssertForest(forest);
  assert(CountNodes(forest) == 4);
}

void TestNodeCarriesOutcome() {
  std::vector<TaskRecord> records{MakeRecord(1, 2ms, {}, 12ms), MakeRecord(2, 3ms)};

  const auto forest = BuildTaskHierarchy(records);
  assert(forest[0].state == TaskState::kCompleted);
  assert(*forest[0].completed_at == 12ms);
  assert(*forest[0].duration == 10ms);
  assert(forest[1].state == TaskState::kCreated);
  assert(!forest[1].duration.has_value());
}

void TestTimelineDepthsAndConcurrency() {
  std::vector<TaskRecord> records{
      MakeRecord(1, 0ms, {}, 30ms),
      MakeRecord(2, 5ms, 1, 15ms),
      MakeRecord(3, 5ms, 1, 20ms),
      MakeRecord(4, 30ms, {}, 40ms),
      MakeRecord(5, 35ms),
  };

  const auto timeline = BuildTimeline(BuildTaskHierarchy(records), 50ms);
  assert(timeline.total_duration == 50ms);
  assert(timeline.entries.size() == 5);

  assert(timeline.entries[0].task_id == 1);
  assert(timeline.entries[0].depth == 0);
  assert(timeline.entries[0].duration == 30ms);
  assert(timeline.entries[1].task_id == 2);
  assert(timeline.entries[1].depth == 1);
  assert(timeline.entries[1].start_offset == 5ms);
  assert(timeline.entries[1].duration == 10ms);

  // Pending task 5 runs to the end of the session.
  assert(timeline.entries[4].task_id == 5);
  assert(timeline.entries[4].duration == 15ms);

  // 1, 2 and 3 overlap; 4 starts exactly when 1 ends.
  assert(timeline.max_concurrent == 3);
}

void TestEmptyTimeline() {
  const auto timeline = BuildTimeline({}, 5ms);
  assert(timeline.entries.empty());
  assert(timeline.max_concurrent == 0);
  assert(timeline.total_duration == 5ms);
}

} // namespace

int main() {
  TestChildrenNestUnderTrackedParents();
  TestUntrackedParentMakesARoot();
  TestParentCreatedLaterIsIgnored();
  TestCyclesAreBroken();
  TestNodeCarriesOutcome();
  TestTimelineDepthsAndConcurrency();
  TestEmptyTimeline();

  std::cout << "asyncprof_unit_task_hierarchy: pass\n";
  return 0;
}
