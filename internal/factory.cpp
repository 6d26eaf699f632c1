#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/grpc/index_server.hpp"
#include "internal/grpc/tree_server.hpp"
#include "internal/health/collection_health_monitor.hpp"
#include "internal/hierarchy/hierarchy_resolver.hpp"
#include "internal/indexing/chunk_extractor.hpp"
#include "internal/indexing/hashing_embedding_service.hpp"
#include "internal/indexing/indexing_pipeline.hpp"
#include "internal/indexing/memory_vector_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/index_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/tree_service.hpp"
#include "internal/skeleton/memory_record_scanner.hpp"
#include "internal/skeleton/skeleton_cache.hpp"
#include "internal/skeleton/sqlite_record_scanner.hpp"

namespace tasktree::factory {

using namespace tasktree;
using std::chrono::milliseconds;

namespace {

std::shared_ptr<skeleton::RecordScanner> BuildScanner(const tasktree::runtime::config::RuntimeConfig& config) {
  const auto& records = config.records();
  if (records.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(records.sqlite().path());
    skeleton::BootstrapTaskRecordSchema(*sqlite_db);
    TASKTREE_LOG_INFO("Record scanner: sqlite", {observability::StringField("path", records.sqlite().path())});
    return std::make_shared<skeleton::SqliteRecordScanner>(std::move(sqlite_db));
  }

  TASKTREE_LOG_INFO("Record scanner: memory");
  return std::make_shared<skeleton::MemoryRecordScanner>();
}

std::shared_ptr<indexing::EmbeddingService> BuildEmbedder(const tasktree::runtime::config::RuntimeConfig& config) {
  const auto& embedding = config.embedding();
  if (embedding.has_hashing()) {
    return std::make_shared<indexing::HashingEmbeddingService>(embedding.hashing().dimensions());
  }
  throw std::runtime_error("no embedding provider configured");
}

} // namespace

void Application::Shutdown() {
  if (health_monitor) health_monitor->Stop();
  if (rate_limiter) rate_limiter->Shutdown();
}

/*
    Build full application dependency graph
*/
Application Build(const tasktree::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Skeletons and hierarchy
  // ------------------------------------------------------------------
  skeleton::SkeletonCacheOptions cache_options;
  cache_options.staleness_window = milliseconds(config.skeleton_cache().staleness_window_ms());
  cache_options.max_entry_chars  = config.skeleton_cache().max_entry_chars();

  auto skeletons = std::make_shared<skeleton::SkeletonCache>(BuildScanner(config), cache_options);

  hierarchy::ResolverOptions resolver_options;
  resolver_options.prefix_length = config.resolver().prefix_length();
  resolver_options.strict_mode   = config.resolver().strict_mode();
  auto resolver                  = std::make_shared<hierarchy::HierarchyResolver>(resolver_options);

  // ------------------------------------------------------------------
  // Indexing
  // ------------------------------------------------------------------
  const auto& ic = config.indexing();

  auto extractor = std::make_shared<indexing::ChunkExtractor>(skeletons, indexing::ChunkExtractorOptions{ic.max_chunk_chars()});
  auto embedder  = BuildEmbedder(config);
  auto store     = std::make_shared<indexing::MemoryVectorStore>();

  indexing::EmbeddingCacheOptions ec_options;
  ec_options.ttl         = milliseconds(ic.embedding_cache().ttl_ms());
  ec_options.max_entries = ic.embedding_cache().max_entries();
  auto embedding_cache   = std::make_shared<indexing::EmbeddingCache>(ec_options);

  auto limiter = std::make_shared<indexing::RateLimiter>(milliseconds(ic.upsert_interval_ms()));

  indexing::CircuitBreakerOptions cb_options;
  cb_options.failure_threshold = ic.circuit_breaker().failure_threshold();
  cb_options.open_timeout      = milliseconds(ic.circuit_breaker().open_timeout_ms());
  auto breaker                 = std::make_shared<indexing::CircuitBreaker>("vector_store", cb_options);

  indexing::RetryOptions retry_options;
  retry_options.max_retries     = ic.retry().max_retries();
  retry_options.initial_backoff = milliseconds(ic.retry().initial_backoff_ms());

  indexing::PipelineOptions pipeline_options;
  pipeline_options.collection_name   = ic.collection_name();
  pipeline_options.vector_dimensions = ic.vector_dimensions();

  if (embedder->Dimensions() != pipeline_options.vector_dimensions) {
    throw std::runtime_error("Invalid configuration: embedding dimensions (" + std::to_string(embedder->Dimensions()) +
                             ") differ from indexing.vector_dimensions (" + std::to_string(pipeline_options.vector_dimensions) + ")");
  }

  auto pipeline = std::make_shared<indexing::IndexingPipeline>(pipeline_options, skeletons, extractor, embedder, store, embedding_cache, limiter, breaker,
                                                               indexing::RetryPolicy(retry_options));

  auto health_monitor = std::make_shared<health::CollectionHealthMonitor>(store, ic.collection_name());
  if (config.health().enabled()) {
    health_monitor->Start(milliseconds(config.health().poll_interval_ms()));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.skeletons = skeletons;
  ctx.resolver  = resolver;
  ctx.pipeline  = pipeline;
  ctx.health    = health_monitor;

  app.tree_service  = std::make_shared<service::TreeService>(ctx);
  app.index_service = std::make_shared<service::IndexService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TreeServer>(app.tree_service));
  app.grpc_services.push_back(std::make_unique<grpc::IndexServer>(app.index_service));

  // Keep ownership of workers so they live for process lifetime
  app.health_monitor = health_monitor;
  app.rate_limiter   = limiter;

  return app;
}

} // namespace tasktree::factory
