#pragma once

#include <memory>
#include <mutex>

#include "internal/hierarchy/task_tree.hpp"
#include "service_context.hpp"
#include "tasktree/v1/tree_service.pb.h"

namespace tasktree::service {

/*
  Browse queries over the reconstructed forest. Every call refreshes the
  skeleton cache first and re-runs resolution when its generation moved.
*/
class TreeService {
 public:
  explicit TreeService(ServiceContext ctx);

  tasktree::v1::GetChildrenResponse GetChildren(const tasktree::v1::GetChildrenRequest& req);

  tasktree::v1::GetParentResponse GetParent(const tasktree::v1::GetParentRequest& req);

  tasktree::v1::GetTreeResponse GetTree(const tasktree::v1::GetTreeRequest& req);

  tasktree::v1::GetResolutionStatsResponse GetResolutionStats(const tasktree::v1::GetResolutionStatsRequest& req);

  // Fresh forest for the current cache generation.
  std::shared_ptr<const hierarchy::TaskTree> CurrentTree();

 private:
  ServiceContext ctx_;

  std::mutex                                 tree_mutex_;
  std::shared_ptr<const hierarchy::TaskTree> tree_;
};

} // namespace tasktree::service
