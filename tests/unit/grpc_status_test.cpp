#include <grpcpp/grpcpp.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/index_server.hpp"
#include "internal/grpc/tree_server.hpp"
#include "internal/health/collection_health_monitor.hpp"
#include "internal/hierarchy/hierarchy_resolver.hpp"
#include "internal/indexing/chunk_extractor.hpp"
#include "internal/indexing/circuit_breaker.hpp"
#include "internal/indexing/embedding_cache.hpp"
#include "internal/indexing/hashing_embedding_service.hpp"
#include "internal/indexing/indexing_pipeline.hpp"
#include "internal/indexing/memory_vector_store.hpp"
#include "internal/indexing/rate_limiter.hpp"
#include "internal/indexing/retry_policy.hpp"
#include "internal/service/index_service.hpp"
#include "internal/service/tree_service.hpp"
#include "internal/skeleton/memory_record_scanner.hpp"
#include "internal/skeleton/skeleton_cache.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using tasktree::skeleton::EntryKind;
using tasktree::skeleton::MakeContent;
using tasktree::skeleton::TaskRecord;

constexpr std::size_t kDims = 16;

TaskRecord MakeRecord(const std::string& id, std::optional<std::string> parent, std::chrono::minutes created) {
  TaskRecord r;
  r.task_id        = id;
  r.parent_task_id = std::move(parent);
  r.workspace      = "ws";
  r.title          = "Task " + id;
  r.created_at     = tasktree::util::FromUnixMillis(1'700'000'000'000ULL) + created;
  r.last_activity  = r.created_at;
  r.instruction    = "instruction of " + id;
  r.outline.push_back(MakeContent(EntryKind::kUserText, "Work on " + id));
  return r;
}

struct Servers {
  Servers() {
    auto scanner = std::make_shared<tasktree::skeleton::MemoryRecordScanner>();
    scanner->Put(MakeRecord("root-0001", std::nullopt, 0min));
    scanner->Put(MakeRecord("child-0001", std::string("root-0001"), 1min));
    scanner->Put(MakeRecord("child-0002", std::string("root-0001"), 2min));

    auto cache = std::make_shared<tasktree::skeleton::SkeletonCache>(scanner);
    auto store = std::make_shared<tasktree::indexing::MemoryVectorStore>();

    tasktree::indexing::PipelineOptions options;
    options.collection_name   = "grpc_status_tasks";
    options.vector_dimensions = kDims;

    tasktree::service::ServiceContext ctx;
    ctx.skeletons = cache;
    ctx.resolver  = std::make_shared<tasktree::hierarchy::HierarchyResolver>();
    ctx.pipeline  = std::make_shared<tasktree::indexing::IndexingPipeline>(
        options, cache, std::make_shared<tasktree::indexing::ChunkExtractor>(cache),
        std::make_shared<tasktree::indexing::HashingEmbeddingService>(kDims), store, std::make_shared<tasktree::indexing::EmbeddingCache>(),
        std::make_shared<tasktree::indexing::RateLimiter>(1ms), std::make_shared<tasktree::indexing::CircuitBreaker>("vector_store"),
        tasktree::indexing::RetryPolicy({}, [](std::chrono::milliseconds) {}));
    ctx.health = std::make_shared<tasktree::health::CollectionHealthMonitor>(store, options.collection_name);

    tree  = std::make_unique<tasktree::grpc::TreeServer>(std::make_shared<tasktree::service::TreeService>(ctx));
    index = std::make_unique<tasktree::grpc::IndexServer>(std::make_shared<tasktree::service::IndexService>(ctx));
  }

  std::unique_ptr<tasktree::grpc::TreeServer>  tree;
  std::unique_ptr<tasktree::grpc::IndexServer> index;
};

void TestErrorMapping() {
  using namespace tasktree::util;

  assert(tasktree::grpc::ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(tasktree::grpc::ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(tasktree::grpc::ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(tasktree::grpc::ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(tasktree::grpc::ToStatus(Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(tasktree::grpc::ToStatus(ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);

  const auto internal = tasktree::grpc::ToStatus(std::runtime_error("boom"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "boom");
}

void TestTreeServerStatuses() {
  Servers                 s;
  ::grpc::ServerContext   ctx;

  tasktree::v1::GetTreeRequest tree_req;
  tree_req.set_task_id("root");
  tasktree::v1::GetTreeResponse tree_resp;
  auto status = s.tree->GetTree(&ctx, &tree_req, &tree_resp);
  assert(status.ok());
  assert(tree_resp.root().task().task_id() == "root-0001");
  assert(tree_resp.root().children_size() == 2);

  tree_req.set_task_id("child");
  status = s.tree->GetTree(&ctx, &tree_req, &tree_resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  tree_req.set_task_id("nope");
  status = s.tree->GetTree(&ctx, &tree_req, &tree_resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  tasktree::v1::GetParentRequest parent_req;
  tasktree::v1::GetParentResponse parent_resp;
  status = s.tree->GetParent(&ctx, &parent_req, &parent_resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  parent_req.set_task_id("child-0002");
  status = s.tree->GetParent(&ctx, &parent_req, &parent_resp);
  assert(status.ok());
  assert(parent_resp.parent().task_id() == "root-0001");
  assert(parent_resp.task().resolution().method() == tasktree::v1::RESOLUTION_METHOD_EXPLICIT);

  tasktree::v1::GetChildrenRequest children_req;
  children_req.set_task_id("missing-task");
  tasktree::v1::GetChildrenResponse children_resp;
  status = s.tree->GetChildren(&ctx, &children_req, &children_resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  tasktree::v1::GetResolutionStatsRequest  stats_req;
  tasktree::v1::GetResolutionStatsResponse stats_resp;
  status = s.tree->GetResolutionStats(&ctx, &stats_req, &stats_resp);
  assert(status.ok());
  assert(stats_resp.stats().skeletons_processed() == 3);
  assert(stats_resp.stats().root_count() == 1);
}

void TestIndexServerStatuses() {
  Servers               s;
  ::grpc::ServerContext ctx;

  tasktree::v1::GetCollectionHealthRequest  health_req;
  tasktree::v1::GetCollectionHealthResponse health_resp;
  auto status = s.index->GetCollectionHealth(&ctx, &health_req, &health_resp);
  assert(status.ok());
  assert(!health_resp.exists());

  tasktree::v1::IndexTaskRequest  index_req;
  tasktree::v1::IndexTaskResponse index_resp;
  status = s.index->IndexTask(&ctx, &index_req, &index_resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  // Nothing to index is a reported outcome, not a transport error.
  index_req.set_task_id("missing-task");
  status = s.index->IndexTask(&ctx, &index_req, &index_resp);
  assert(status.ok());
  assert(index_resp.outcome() == "task_not_found");
  assert(index_resp.chunk_ids_size() == 0);

  index_req.set_task_id("child-0001");
  status = s.index->IndexTask(&ctx, &index_req, &index_resp);
  assert(status.ok());
  assert(index_resp.outcome() == "indexed");
  assert(index_resp.chunk_ids_size() == 1);

  status = s.index->GetCollectionHealth(&ctx, &health_req, &health_resp);
  assert(status.ok());
  assert(health_resp.exists());
  assert(health_resp.health().point_count() == 1);

  tasktree::v1::SearchRequest  search_req;
  tasktree::v1::SearchResponse search_resp;
  status = s.index->Search(&ctx, &search_req, &search_resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  search_req.set_query("Work on child-0001");
  status = s.index->Search(&ctx, &search_req, &search_resp);
  assert(status.ok());
  assert(!search_resp.fallback());
  assert(search_resp.hits_size() == 1);
  assert(search_resp.hits(0).task_id() == "child-0001");
  assert(search_resp.hits(0).parent_task_id() == "root-0001");

  tasktree::v1::ResetCollectionRequest  reset_req;
  tasktree::v1::ResetCollectionResponse reset_resp;
  status = s.index->ResetCollection(&ctx, &reset_req, &reset_resp);
  assert(status.ok());
  assert(reset_resp.collection_name() == "grpc_status_tasks");

  status = s.index->GetCollectionHealth(&ctx, &health_req, &health_resp);
  assert(status.ok());
  assert(health_resp.exists());
  assert(health_resp.health().point_count() == 0);
}

} // namespace

int main() {
  TestErrorMapping();
  TestTreeServerStatuses();
  TestIndexServerStatuses();

  std::cout << "tasktree_unit_grpc_status: pass\n";
  return 0;
}
