#include "tree_service.hpp"

#include "internal/hierarchy/hierarchy_resolver.hpp"
#include "internal/skeleton/skeleton_cache.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace tasktree::service {

using namespace tasktree::v1;

namespace {

tasktree::v1::ResolutionMethod ToProto(hierarchy::ResolutionMethod method) {
  switch (method) {
    case hierarchy::ResolutionMethod::kExplicit:
      return RESOLUTION_METHOD_EXPLICIT;
    case hierarchy::ResolutionMethod::kExactPrefixUnique:
      return RESOLUTION_METHOD_EXACT_PREFIX_UNIQUE;
    case hierarchy::ResolutionMethod::kExactPrefixDisambiguated:
      return RESOLUTION_METHOD_EXACT_PREFIX_DISAMBIGUATED;
    case hierarchy::ResolutionMethod::kRootFallback:
      return RESOLUTION_METHOD_ROOT_FALLBACK;
  }
  return RESOLUTION_METHOD_UNSPECIFIED;
}

TaskSummary ToSummary(const hierarchy::TaskTree& tree, const std::string& task_id) {
  const auto& s = tree.Skeleton(task_id);
  const auto& r = tree.Resolution(task_id);

  TaskSummary out;
  out.set_task_id(s.task_id);
  out.set_title(s.title);
  out.set_workspace(s.workspace);
  *out.mutable_created_at()    = util::ToProto(s.created_at);
  *out.mutable_last_activity() = util::ToProto(s.last_activity);
  out.set_message_count(s.message_count);
  out.set_action_count(s.action_count);
  out.set_total_size(s.total_size);
  out.set_instruction(s.instruction);

  auto* res = out.mutable_resolution();
  res->set_parent_task_id(r.parent_task_id.value_or(""));
  res->set_method(ToProto(r.method));
  res->set_confidence(r.confidence);
  return out;
}

void FillNode(const hierarchy::TaskTree& tree, const hierarchy::TreeNode& node, tasktree::v1::TreeNode* out) {
  *out->mutable_task() = ToSummary(tree, node.task_id);
  out->set_depth(static_cast<uint32_t>(node.depth));
  out->set_children_count(static_cast<uint32_t>(node.children_count));
  for (const auto& child : node.children) {
    FillNode(tree, child, out->add_children());
  }
}

} // namespace

TreeService::TreeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::shared_ptr<const hierarchy::TaskTree> TreeService::CurrentTree() {
  ctx_.skeletons->EnsureFresh();

  std::lock_guard lock(tree_mutex_);
  // Generation before snapshot: the snapshot is never older than the stamp.
  const auto generation = ctx_.skeletons->Generation();
  if (tree_ && tree_->Generation() == generation) {
    return tree_;
  }

  auto snapshot = ctx_.skeletons->All();
  auto forest   = ctx_.resolver->Resolve(*snapshot);
  tree_         = std::make_shared<const hierarchy::TaskTree>(std::move(snapshot), std::move(forest), generation);
  return tree_;
}

GetChildrenResponse TreeService::GetChildren(const GetChildrenRequest& req) {
  return ObserveRpc("TreeService.GetChildren", req.task_id(), [&] {
    if (req.task_id().empty()) {
      throw util::InvalidArgument("task_id is required");
    }
    const auto tree = CurrentTree();

    GetChildrenResponse resp;
    for (const auto& child : tree->ChildrenOf(req.task_id())) {
      *resp.add_children() = ToSummary(*tree, child);
    }
    return resp;
  });
}

GetParentResponse TreeService::GetParent(const GetParentRequest& req) {
  return ObserveRpc("TreeService.GetParent", req.task_id(), [&] {
    if (req.task_id().empty()) {
      throw util::InvalidArgument("task_id is required");
    }
    const auto tree = CurrentTree();

    GetParentResponse resp;
    *resp.mutable_task() = ToSummary(*tree, req.task_id());
    if (auto parent = tree->ParentOf(req.task_id())) {
      *resp.mutable_parent() = ToSummary(*tree, *parent);
    }
    return resp;
  });
}

GetTreeResponse TreeService::GetTree(const GetTreeRequest& req) {
  return ObserveRpc("TreeService.GetTree", req.task_id(), [&] {
    const auto tree      = CurrentTree();
    const auto target_id = tree->ResolveTaskId(req.task_id());

    auto root_id = target_id;
    if (req.include_siblings()) {
      if (auto parent = tree->ParentOf(target_id)) root_id = *parent;
    }

    GetTreeResponse resp;
    FillNode(*tree, tree->Build(root_id, req.max_depth()), resp.mutable_root());
    return resp;
  });
}

GetResolutionStatsResponse TreeService::GetResolutionStats(const GetResolutionStatsRequest&) {
  return ObserveRpc("TreeService.GetResolutionStats", "", [&] {
    const auto  tree   = CurrentTree();
    const auto& forest = tree->Forest();

    GetResolutionStatsResponse resp;
    auto* stats = resp.mutable_stats();
    stats->set_skeletons_processed(forest.phase1.skeletons_processed);
    stats->set_parents_with_fragments(forest.phase1.parents_with_fragments);
    stats->set_fragments_indexed(forest.phase1.fragments_indexed);
    stats->set_resolved_count(forest.phase2.resolved);
    stats->set_root_count(forest.phase2.roots);
    stats->set_dangling_parent_count(forest.phase2.dangling_parents);
    stats->set_cycles_broken(forest.phase2.cycles_broken);
    stats->set_average_confidence(forest.phase2.average_confidence);
    stats->set_strict_mode(forest.strict_mode);
    for (const auto& [method, count] : forest.phase2.method_counts) {
      (*stats->mutable_method_counts())[std::string(hierarchy::MethodName(method))] = count;
    }
    return resp;
  });
}

} // namespace tasktree::service
