#include "internal/hierarchy/task_tree.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace tasktree::hierarchy {

namespace {

constexpr std::size_t kMaxAmbiguousCandidates = 5;

} // namespace

TaskTree::TaskTree(skeleton::Snapshot snapshot, ResolvedForest forest, std::uint64_t generation)
    : snapshot_(std::move(snapshot)), forest_(std::move(forest)), generation_(generation) {
}

const skeleton::TaskSkeleton& TaskTree::Skeleton(const std::string& task_id) const {
  auto it = snapshot_->find(task_id);
  if (it == snapshot_->end()) {
    throw util::NotFound("task not found: " + task_id);
  }
  return it->second;
}

const ResolutionRecord& TaskTree::Resolution(const std::string& task_id) const {
  auto it = forest_.records.find(task_id);
  if (it == forest_.records.end()) {
    throw util::NotFound("task not found: " + task_id);
  }
  return it->second;
}

std::vector<std::string> TaskTree::ChildrenOf(const std::string& task_id) const {
  Skeleton(task_id);
  auto it = forest_.children.find(task_id);
  if (it == forest_.children.end()) {
    return {};
  }
  return it->second;
}

std::optional<std::string> TaskTree::ParentOf(const std::string& task_id) const {
  return Resolution(task_id).parent_task_id;
}

std::string TaskTree::ResolveTaskId(std::string_view id_or_prefix) const {
  if (id_or_prefix.empty()) {
    throw util::InvalidArgument("task id is required");
  }

  const std::string key(id_or_prefix);
  if (snapshot_->count(key) > 0) {
    return key;
  }

  std::vector<std::string> matches;
  for (auto it = snapshot_->lower_bound(key); it != snapshot_->end() && it->first.compare(0, key.size(), key) == 0; ++it) {
    matches.push_back(it->first);
  }

  if (matches.empty()) {
    throw util::NotFound("task not found: " + key);
  }
  if (matches.size() > 1) {
    std::string listed;
    for (std::size_t i = 0; i < std::min(matches.size(), kMaxAmbiguousCandidates); ++i) {
      if (i > 0) listed += ", ";
      listed += matches[i];
    }
    if (matches.size() > kMaxAmbiguousCandidates) listed += ", ...";
    throw util::InvalidState("ambiguous task id prefix '" + key + "' matches " + std::to_string(matches.size()) + " tasks: " + listed);
  }
  return matches.front();
}

TreeNode TaskTree::Build(const std::string& root_id, int max_depth) const {
  Skeleton(root_id);
  std::vector<std::string> path;
  return BuildNode(root_id, 0, max_depth, path);
}

TreeNode TaskTree::BuildNode(const std::string& task_id, std::size_t depth, int max_depth, std::vector<std::string>& path) const {
  TreeNode node;
  node.task_id = task_id;
  node.depth   = depth;

  auto it = forest_.children.find(task_id);
  if (it == forest_.children.end()) {
    return node;
  }
  node.children_count = it->second.size();

  if (max_depth > 0 && depth >= static_cast<std::size_t>(max_depth)) {
    return node;
  }

  path.push_back(task_id);
  for (const auto& child : it->second) {
    if (std::find(path.begin(), path.end(), child) != path.end()) continue;
    node.children.push_back(BuildNode(child, depth + 1, max_depth, path));
  }
  path.pop_back();
  return node;
}

} // namespace tasktree::hierarchy
