#include "index_service.hpp"

#include "internal/health/collection_health_monitor.hpp"
#include "internal/indexing/indexing_pipeline.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace tasktree::service {

using namespace tasktree::v1;

IndexService::IndexService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

IndexTaskResponse IndexService::IndexTask(const IndexTaskRequest& req) {
  return ObserveRpc("IndexService.IndexTask", req.task_id(), [&] {
    if (req.task_id().empty()) {
      throw util::InvalidArgument("task_id is required");
    }

    const auto result = ctx_.pipeline->IndexTask(req.task_id());

    IndexTaskResponse resp;
    for (const auto& id : result.chunk_ids) {
      resp.add_chunk_ids(id);
    }
    resp.set_outcome(std::string(indexing::OutcomeName(result.outcome)));
    resp.set_reason(result.reason);
    resp.set_chunks_extracted(static_cast<uint32_t>(result.chunks_extracted));
    resp.set_chunks_indexable(static_cast<uint32_t>(result.chunks_indexable));
    resp.set_invalid_vectors(static_cast<uint32_t>(result.invalid_vectors));
    resp.set_cache_hits(static_cast<uint32_t>(result.cache_hits));
    resp.set_upsert_attempts(static_cast<uint32_t>(result.upsert_attempts));
    return resp;
  });
}

ResetCollectionResponse IndexService::ResetCollection(const ResetCollectionRequest&) {
  return ObserveRpc("IndexService.ResetCollection", "", [&] {
    ctx_.pipeline->ResetCollection();

    ResetCollectionResponse resp;
    resp.set_collection_name(ctx_.pipeline->CollectionName());
    return resp;
  });
}

SearchResponse IndexService::Search(const SearchRequest& req) {
  return ObserveRpc("IndexService.Search", req.task_id(), [&] {
    indexing::SearchFilter filter;
    if (!req.task_id().empty()) filter.task_id = req.task_id();
    if (!req.workspace().empty()) filter.workspace = req.workspace();

    const auto result = ctx_.pipeline->Search(req.query(), filter, req.limit());

    SearchResponse resp;
    resp.set_fallback(result.fallback);
    for (const auto& h : result.hits) {
      auto* hit = resp.add_hits();
      hit->set_task_id(h.task_id);
      hit->set_chunk_id(h.chunk_id);
      hit->set_score(h.score);
      hit->set_content(h.content);
      hit->set_chunk_type(h.chunk_type);
      hit->set_workspace(h.workspace);
      hit->set_task_title(h.task_title);
      hit->set_parent_task_id(h.parent_task_id.value_or(""));
      *hit->mutable_payload() = h.payload;
    }
    return resp;
  });
}

GetCollectionHealthResponse IndexService::GetCollectionHealth(const GetCollectionHealthRequest&) {
  return ObserveRpc("IndexService.GetCollectionHealth", "", [&] {
    GetCollectionHealthResponse resp;

    const auto status = ctx_.health->GetCollectionStatus();
    resp.set_exists(status.exists);
    if (!status.exists) {
      return resp;
    }

    const auto health = ctx_.health->CheckCollectionHealth();
    auto*      out    = resp.mutable_health();
    out->set_status(health.status);
    out->set_point_count(health.point_count);
    out->set_segment_count(health.segment_count);
    out->set_indexed_vector_count(health.indexed_vector_count);
    out->set_optimizer_status(health.optimizer_status);
    return resp;
  });
}

} // namespace tasktree::service
