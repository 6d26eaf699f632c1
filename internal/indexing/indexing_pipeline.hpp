#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/indexing/chunk_extractor.hpp"
#include "internal/indexing/circuit_breaker.hpp"
#include "internal/indexing/embedding_cache.hpp"
#include "internal/indexing/embedding_service.hpp"
#include "internal/indexing/rate_limiter.hpp"
#include "internal/indexing/retry_policy.hpp"
#include "internal/indexing/vector_store.hpp"
#include "internal/skeleton/skeleton_cache.hpp"

namespace tasktree::indexing {

inline constexpr const char* kDefaultCollectionName = "roo_tasks_semantic_index";
inline constexpr std::size_t kDefaultVectorDimensions = 1536;
inline constexpr std::size_t kDefaultSearchLimit      = 10;

enum class IndexOutcome {
  kIndexed,
  kTaskNotFound,
  kNoChunks,
  kNoIndexableChunks,
  kEmbeddingFailed,
  kNoValidVectors,
  kCollectionUnavailable,
  kUpsertRejected,
  kUpsertFailed,
  kCircuitOpen,
};

std::string_view OutcomeName(IndexOutcome outcome);

/*
  Result of one IndexTask call. chunk_ids is empty on every outcome but
  kIndexed, and then `reason` says why.
*/
struct IndexResult {
  std::vector<std::string> chunk_ids;
  IndexOutcome             outcome = IndexOutcome::kIndexed;
  std::string              reason;

  std::size_t chunks_extracted = 0;
  std::size_t chunks_indexable = 0;
  std::size_t invalid_vectors  = 0;
  std::size_t cache_hits       = 0;
  std::size_t upsert_attempts  = 0;

  bool Ok() const {
    return outcome == IndexOutcome::kIndexed;
  }
};

struct SearchHit {
  std::string                task_id;
  std::string                chunk_id;
  double                     score = 0.0;
  std::string                content;
  std::string                chunk_type;
  std::string                workspace;
  std::string                task_title;
  std::optional<std::string> parent_task_id;
  google::protobuf::Struct   payload;
};

struct SearchResponse {
  std::vector<SearchHit> hits;
  // Set when the semantic path failed and a text search answered instead.
  bool        fallback = false;
  std::string fallback_reason;
};

struct PipelineOptions {
  std::string collection_name   = kDefaultCollectionName;
  std::size_t vector_dimensions = kDefaultVectorDimensions;
};

/*
  IndexingPipeline

  Chunk -> embed (through the cache) -> validate -> sanitize -> upsert.
  Upsert attempts are serialized through the shared RateLimiter; the
  RetryPolicy backs off on transient failures and the CircuitBreaker
  stops hammering a store that keeps failing.

  Safe to call from several threads at once.
*/
class IndexingPipeline {
 public:
  IndexingPipeline(PipelineOptions options, std::shared_ptr<skeleton::SkeletonCache> cache, std::shared_ptr<ChunkExtractor> extractor,
                   std::shared_ptr<EmbeddingService> embedder, std::shared_ptr<VectorStore> store, std::shared_ptr<EmbeddingCache> embedding_cache,
                   std::shared_ptr<RateLimiter> limiter, std::shared_ptr<CircuitBreaker> breaker, RetryPolicy retry);

  IndexResult IndexTask(const std::string& task_id);

  // Creates the collection with the configured dimensionality if missing.
  void EnsureCollectionExists();

  // Drops and recreates the collection, clears the embedding cache and
  // closes the breaker.
  void ResetCollection();

  SearchResponse Search(const std::string& query, const SearchFilter& filter, std::size_t limit = kDefaultSearchLimit);

  const std::string& CollectionName() const {
    return options_.collection_name;
  }

 private:
  IndexResult Finish(IndexResult result, IndexOutcome outcome, std::string reason, const std::string& task_id) const;

  std::vector<float> EmbedQuery(const std::string& query);

  SearchResponse TextSearch(const std::string& query, const SearchFilter& filter, std::size_t limit) const;

  PipelineOptions                          options_;
  std::shared_ptr<skeleton::SkeletonCache> cache_;
  std::shared_ptr<ChunkExtractor>          extractor_;
  std::shared_ptr<EmbeddingService>        embedder_;
  std::shared_ptr<VectorStore>             store_;
  std::shared_ptr<EmbeddingCache>          embedding_cache_;
  std::shared_ptr<RateLimiter>             limiter_;
  std::shared_ptr<CircuitBreaker>          breaker_;
  RetryPolicy                              retry_;

  std::mutex collection_mutex_;
  bool       collection_ready_ = false;
};

} // namespace tasktree::indexing
