#include "task_hierarchy.hpp"

#include <unordered_map>
#include <unordered_set>

namespace asyncprof::model {

namespace {

using Index = std::unordered_map<runtime::TaskId, const session::TaskRecord*>;

bool LinksToParent(const session::TaskRecord& record, const Index& index) {
  if (!record.parent_id) return false;

  auto parent = index.find(*record.parent_id);
  if (parent == index.end()) return false;
  if (parent->second->created_at > record.created_at) return false;

  // Walk up; reaching the record again means a cycle.
  std::unordered_set<runtime::TaskId> visited{record.id};
  const session::TaskRecord*          current = parent->second;
  while (current) {
    if (!visited.insert(current->id).second) return false;
    if (!current->parent_id) break;
    auto next = index.find(*current->parent_id);
    current   = next == index.end() ? nullptr : next->second;
  }
  return true;
}

TaskNode MakeNode(const session::TaskRecord& record) {
  TaskNode node;
  node.id         = record.id;
  node.name       = record.name;
  node.callable   = record.callable;
  node.state      = record.State();
  node.created_at = record.created_at;
  node.started_at = record.started_at;
  node.location   = record.location;
  node.stack      = record.stack;
  if (record.outcome) {
    node.completed_at = record.outcome->completed_at;
    node.duration     = record.outcome->completed_at - record.created_at;
    node.failure      = record.outcome->failure;
  }
  return node;
}

TaskNode BuildSubtree(const session::TaskRecord& record,
                      const std::unordered_map<runtime::TaskId, std::vector<const session::TaskRecord*>>& children,
                      std::unordered_set<runtime::TaskId>& emitted) {
  emitted.insert(record.id);
  TaskNode node = MakeNode(record);

  auto it = children.find(record.id);
  if (it != children.end()) {
    for (const auto* child : it->second) {
      if (emitted.count(child->id) > 0) continue;
      node.children.push_back(BuildSubtree(*child, children, emitted));
    }
  }
  return node;
}

std::size_t CountSubtree(const TaskNode& node) {
  std::size_t count = 1;
  for (const auto& child : node.children) count += CountSubtree(child);
  return count;
}

} // namespace

std::vector<TaskNode> BuildTaskHierarchy(const std::vector<session::TaskRecord>& records) {
  Index index;
  index.reserve(records.size());
  for (const auto& record : records) {
    index.emplace(record.id, &record);
  }

  std::vector<const session::TaskRecord*>                                       roots;
  std::unordered_map<runtime::TaskId, std::vector<const session::TaskRecord*>> children;
  for (const auto& record : records) {
    if (LinksToParent(record, index)) {
      children[*record.parent_id].push_back(&record);
    } else {
      roots.push_back(&record);
    }
  }

  std::vector<TaskNode>               forest;
  std::unordered_set<runtime::TaskId> emitted;
  for (const auto* root : roots) {
    forest.push_back(BuildSubtree(*root, children, emitted));
  }
  return forest;
}

std::size_t CountNodes(const std::vector<TaskNode>& forest) {
  std::size_t count = 0;
  for (const auto& node : forest) count += CountSubtree(node);
  return count;
}

} // namespace asyncprof::model
