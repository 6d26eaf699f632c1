#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/hierarchy/resolution.hpp"
#include "internal/skeleton/skeleton_cache.hpp"

namespace tasktree::hierarchy {

struct TreeNode {
  std::string           task_id;
  std::size_t           depth          = 0;
  std::size_t           children_count = 0;
  std::vector<TreeNode> children;
};

/*
  TaskTree

  Immutable pairing of a skeleton snapshot with the forest resolved from
  it. Answers browse queries; rebuilt by the caller when the cache
  generation moves.
*/
class TaskTree {
 public:
  TaskTree(skeleton::Snapshot snapshot, ResolvedForest forest, std::uint64_t generation);

  // Throws NotFound for unknown ids.
  const skeleton::TaskSkeleton& Skeleton(const std::string& task_id) const;
  const ResolutionRecord&       Resolution(const std::string& task_id) const;

  std::vector<std::string>   ChildrenOf(const std::string& task_id) const;
  std::optional<std::string> ParentOf(const std::string& task_id) const;

  // Exact id, or a prefix matching exactly one task id.
  // Throws NotFound (no match) or InvalidState (ambiguous prefix).
  std::string ResolveTaskId(std::string_view id_or_prefix) const;

  // max_depth <= 0 expands the whole subtree.
  TreeNode Build(const std::string& root_id, int max_depth) const;

  const ResolvedForest& Forest() const {
    return forest_;
  }

  std::uint64_t Generation() const {
    return generation_;
  }

 private:
  TreeNode BuildNode(const std::string& task_id, std::size_t depth, int max_depth, std::vector<std::string>& path) const;

  skeleton::Snapshot snapshot_;
  ResolvedForest     forest_;
  std::uint64_t      generation_;
};

} // namespace tasktree::hierarchy
