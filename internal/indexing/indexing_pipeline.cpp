#include "internal/indexing/indexing_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>

#include "internal/indexing/payload_sanitizer.hpp"
#include "internal/indexing/vector_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/text/canonicalizer.hpp"
#include "internal/util/errors.hpp"

namespace tasktree::indexing {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kSnippetChars = 200;

std::int64_t AsInt(std::size_t v) {
  return static_cast<std::int64_t>(v);
}

std::optional<std::string> PayloadString(const google::protobuf::Struct& payload, const std::string& key) {
  auto it = payload.fields().find(key);
  if (it == payload.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return std::nullopt;
  }
  return it->second.string_value();
}

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ContainsIgnoreCase(std::string_view haystack, const std::string& lowered_needle) {
  return Lower(haystack).find(lowered_needle) != std::string::npos;
}

} // namespace

std::string_view OutcomeName(IndexOutcome outcome) {
  switch (outcome) {
    case IndexOutcome::kIndexed:
      return "indexed";
    case IndexOutcome::kTaskNotFound:
      return "task_not_found";
    case IndexOutcome::kNoChunks:
      return "no_chunks";
    case IndexOutcome::kNoIndexableChunks:
      return "no_indexable_chunks";
    case IndexOutcome::kEmbeddingFailed:
      return "embedding_failed";
    case IndexOutcome::kNoValidVectors:
      return "no_valid_vectors";
    case IndexOutcome::kCollectionUnavailable:
      return "collection_unavailable";
    case IndexOutcome::kUpsertRejected:
      return "upsert_rejected";
    case IndexOutcome::kUpsertFailed:
      return "upsert_failed";
    case IndexOutcome::kCircuitOpen:
      return "circuit_open";
  }
  return "unknown";
}

IndexingPipeline::IndexingPipeline(PipelineOptions options, std::shared_ptr<skeleton::SkeletonCache> cache, std::shared_ptr<ChunkExtractor> extractor,
                                   std::shared_ptr<EmbeddingService> embedder, std::shared_ptr<VectorStore> store,
                                   std::shared_ptr<EmbeddingCache> embedding_cache, std::shared_ptr<RateLimiter> limiter,
                                   std::shared_ptr<CircuitBreaker> breaker, RetryPolicy retry)
    : options_(std::move(options)),
      cache_(std::move(cache)),
      extractor_(std::move(extractor)),
      embedder_(std::move(embedder)),
      store_(std::move(store)),
      embedding_cache_(std::move(embedding_cache)),
      limiter_(std::move(limiter)),
      breaker_(std::move(breaker)),
      retry_(std::move(retry)) {
}

IndexResult IndexingPipeline::Finish(IndexResult result, IndexOutcome outcome, std::string reason, const std::string& task_id) const {
  result.outcome = outcome;
  result.reason  = std::move(reason);

  if (outcome == IndexOutcome::kIndexed) {
    TASKTREE_LOG_INFO("Task indexed", {StringField("task_id", task_id), IntField("chunks", AsInt(result.chunk_ids.size())),
                                       IntField("invalid_vectors", AsInt(result.invalid_vectors)), IntField("cache_hits", AsInt(result.cache_hits)),
                                       IntField("attempts", AsInt(result.upsert_attempts))});
  } else {
    result.chunk_ids.clear();
    TASKTREE_LOG_WARN("Task not indexed", {StringField("task_id", task_id), StringField("outcome", OutcomeName(outcome)), StringField("reason", result.reason),
                                           IntField("chunks_extracted", AsInt(result.chunks_extracted)),
                                           IntField("chunks_indexable", AsInt(result.chunks_indexable))});
  }

  observability::Metrics::Instance().RecordIndexOutcome(OutcomeName(outcome), result.chunk_ids.size());
  return result;
}

// ---------------------------------------------------------------------------
// Indexing
// ---------------------------------------------------------------------------

IndexResult IndexingPipeline::IndexTask(const std::string& task_id) {
  IndexResult result;

  if (!cache_->Get(task_id)) {
    cache_->EnsureFresh();
  }
  if (!cache_->Get(task_id)) {
    return Finish(std::move(result), IndexOutcome::kTaskNotFound, "task " + task_id + " is not in the skeleton cache", task_id);
  }

  // ------------------------------------------------------------------
  // Chunking
  // ------------------------------------------------------------------
  auto chunks             = extractor_->Extract(task_id);
  result.chunks_extracted = chunks.size();
  if (chunks.empty()) {
    return Finish(std::move(result), IndexOutcome::kNoChunks, "task has no non-empty outline entries to chunk", task_id);
  }

  chunks.erase(std::remove_if(chunks.begin(), chunks.end(), [](const Chunk& c) { return !c.indexed; }), chunks.end());
  result.chunks_indexable = chunks.size();
  if (chunks.empty()) {
    return Finish(std::move(result), IndexOutcome::kNoIndexableChunks,
                  std::to_string(result.chunks_extracted) + " chunks extracted but none indexable (tool interactions only)", task_id);
  }

  // ------------------------------------------------------------------
  // Embedding
  // ------------------------------------------------------------------
  std::vector<std::optional<std::vector<float>>> vectors(chunks.size());
  std::vector<std::size_t>                       missing;
  std::vector<std::string>                       texts;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (auto hit = embedding_cache_->Get(chunks[i].content)) {
      vectors[i] = std::move(*hit);
      ++result.cache_hits;
    } else {
      missing.push_back(i);
      texts.push_back(chunks[i].content);
    }
  }

  if (!texts.empty()) {
    std::vector<std::vector<float>> embedded;
    try {
      embedded = embedder_->Embed(texts);
    } catch (const std::exception& e) {
      return Finish(std::move(result), IndexOutcome::kEmbeddingFailed, std::string("embedding service failed: ") + e.what(), task_id);
    }
    if (embedded.size() != texts.size()) {
      return Finish(std::move(result), IndexOutcome::kEmbeddingFailed,
                    "embedding service returned " + std::to_string(embedded.size()) + " vectors for " + std::to_string(texts.size()) + " texts", task_id);
    }
    for (std::size_t j = 0; j < missing.size(); ++j) {
      vectors[missing[j]] = std::move(embedded[j]);
    }
  }

  // ------------------------------------------------------------------
  // Validation and payloads
  // ------------------------------------------------------------------
  std::vector<Point> points;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const auto& c = chunks[i];
    if (auto problem = ValidateVector(*vectors[i], options_.vector_dimensions)) {
      ++result.invalid_vectors;
      TASKTREE_LOG_WARN("Dropping chunk with invalid vector", {StringField("task_id", task_id), StringField("chunk_id", c.chunk_id), StringField("error", *problem)});
      continue;
    }
    embedding_cache_->Put(c.content, *vectors[i]);
    points.push_back(Point{c.chunk_id, std::move(*vectors[i]), SanitizePayload(c.payload)});
  }

  if (points.empty()) {
    return Finish(std::move(result), IndexOutcome::kNoValidVectors, "all " + std::to_string(result.invalid_vectors) + " embedding vectors failed validation", task_id);
  }

  // ------------------------------------------------------------------
  // Upsert
  // ------------------------------------------------------------------
  if (!breaker_->AllowRequest()) {
    return Finish(std::move(result), IndexOutcome::kCircuitOpen, "vector store circuit breaker is open", task_id);
  }

  try {
    EnsureCollectionExists();
  } catch (const std::exception& e) {
    breaker_->RecordFailure();
    return Finish(std::move(result), IndexOutcome::kCollectionUnavailable, std::string("collection unavailable: ") + e.what(), task_id);
  }

  auto attempt = [&]() -> UpsertResult {
    const auto started = std::chrono::steady_clock::now();
    UpsertResult r;
    try {
      auto fut = limiter_->Schedule([&]() { return store_->Upsert(options_.collection_name, points); });
      r        = fut.get();
    } catch (const util::InvalidArgument& e) {
      r = UpsertResult::Client(e.what());
    } catch (const util::ResourceExhausted& e) {
      r = UpsertResult::Client(e.what());
    } catch (const std::exception& e) {
      r = UpsertResult::Transient(e.what());
    }

    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    const char* label  = r ? "ok" : (r.status == UpsertStatus::kClient ? "client_error" : "transient_error");
    observability::Metrics::Instance().ObserveUpsertDurationMs(label, elapsed);
    return r;
  };

  const auto outcome     = retry_.Run(attempt, task_id);
  result.upsert_attempts = outcome.attempts;

  if (outcome.state == RetryState::kSucceeded) {
    breaker_->RecordSuccess();
    for (const auto& p : points) {
      result.chunk_ids.push_back(p.id);
    }
    return Finish(std::move(result), IndexOutcome::kIndexed, {}, task_id);
  }

  if (outcome.result.status == UpsertStatus::kClient) {
    return Finish(std::move(result), IndexOutcome::kUpsertRejected, "vector store rejected batch: " + outcome.result.message, task_id);
  }

  breaker_->RecordFailure();
  return Finish(std::move(result), IndexOutcome::kUpsertFailed,
                "upsert failed after " + std::to_string(outcome.attempts) + " attempts: " + outcome.result.message, task_id);
}

// ---------------------------------------------------------------------------
// Collection lifecycle
// ---------------------------------------------------------------------------

void IndexingPipeline::EnsureCollectionExists() {
  std::lock_guard lock(collection_mutex_);
  if (collection_ready_) {
    return;
  }

  try {
    const auto info = store_->GetCollection(options_.collection_name);
    if (info.vector_dimensions != 0 && info.vector_dimensions != options_.vector_dimensions) {
      TASKTREE_LOG_WARN("Collection dimensionality differs from configuration",
                        {StringField("collection", options_.collection_name), IntField("collection_dimensions", AsInt(info.vector_dimensions)),
                         IntField("configured_dimensions", AsInt(options_.vector_dimensions))});
    }
  } catch (const util::NotFound&) {
    try {
      store_->CreateCollection(options_.collection_name, options_.vector_dimensions);
    } catch (const util::AlreadyExists&) {
      // created concurrently by another writer
    }
    TASKTREE_LOG_INFO("Collection created", {StringField("collection", options_.collection_name), IntField("dimensions", AsInt(options_.vector_dimensions))});
  }
  collection_ready_ = true;
}

void IndexingPipeline::ResetCollection() {
  {
    std::lock_guard lock(collection_mutex_);
    collection_ready_ = false;

    const bool existed = store_->DeleteCollection(options_.collection_name);
    store_->CreateCollection(options_.collection_name, options_.vector_dimensions);
    collection_ready_ = true;

    TASKTREE_LOG_INFO("Collection reset", {StringField("collection", options_.collection_name), observability::BoolField("existed", existed)});
  }

  embedding_cache_->Clear();
  breaker_->Reset();
}

// ---------------------------------------------------------------------------
// Search
// ---------------------------------------------------------------------------

std::vector<float> IndexingPipeline::EmbedQuery(const std::string& query) {
  if (auto hit = embedding_cache_->Get(query)) {
    return std::move(*hit);
  }

  auto vectors = embedder_->Embed({query});
  if (vectors.size() != 1) {
    throw util::Unavailable("embedding service returned no vector for query");
  }
  if (auto problem = ValidateVector(vectors.front(), options_.vector_dimensions)) {
    throw util::InvalidArgument("query vector invalid: " + *problem);
  }
  embedding_cache_->Put(query, vectors.front());
  return std::move(vectors.front());
}

SearchResponse IndexingPipeline::Search(const std::string& query, const SearchFilter& filter, std::size_t limit) {
  if (query.empty()) {
    throw util::InvalidArgument("search query is required");
  }
  if (limit == 0) {
    limit = kDefaultSearchLimit;
  }

  cache_->EnsureFresh(skeleton::ScanScope{filter.workspace});

  try {
    const auto vector = EmbedQuery(query);
    auto       points = store_->Search(options_.collection_name, vector, filter, limit);

    SearchResponse response;
    const auto     snapshot = cache_->All();
    for (auto& p : points) {
      SearchHit hit;
      hit.chunk_id   = p.id;
      hit.score      = p.score;
      hit.task_id    = PayloadString(p.payload, "task_id").value_or("");
      hit.content    = PayloadString(p.payload, "content").value_or("");
      hit.chunk_type = PayloadString(p.payload, "chunk_type").value_or("");

      auto it = snapshot->find(hit.task_id);
      if (it != snapshot->end()) {
        hit.workspace      = it->second.workspace;
        hit.task_title     = it->second.title;
        hit.parent_task_id = it->second.parent_task_id;
      } else {
        hit.workspace      = PayloadString(p.payload, "workspace").value_or("");
        hit.task_title     = PayloadString(p.payload, "task_title").value_or("");
        hit.parent_task_id = PayloadString(p.payload, "parent_task_id");
      }
      hit.payload = std::move(p.payload);
      response.hits.push_back(std::move(hit));
    }
    return response;
  } catch (const std::exception& e) {
    TASKTREE_LOG_WARN("Semantic search failed; using text search", {StringField("collection", options_.collection_name), StringField("error", e.what())});
    auto response            = TextSearch(query, filter, limit);
    response.fallback_reason = e.what();
    return response;
  }
}

SearchResponse IndexingPipeline::TextSearch(const std::string& query, const SearchFilter& filter, std::size_t limit) const {
  const auto needle   = Lower(query);
  const auto snapshot = cache_->All();

  struct Match {
    const skeleton::TaskSkeleton* skeleton;
    double                        score;
    std::string                   snippet;
  };
  std::vector<Match> matches;

  for (const auto& [id, s] : *snapshot) {
    if (filter.task_id && *filter.task_id != id) continue;
    if (filter.workspace && *filter.workspace != s.workspace) continue;

    if (ContainsIgnoreCase(s.title, needle)) {
      matches.push_back(Match{&s, 1.0, std::string(tasktree::text::Utf8Prefix(s.title, kSnippetChars))});
      continue;
    }
    if (ContainsIgnoreCase(s.instruction, needle)) {
      matches.push_back(Match{&s, 0.75, std::string(tasktree::text::Utf8Prefix(s.instruction, kSnippetChars))});
      continue;
    }
    for (const auto& entry : s.outline) {
      const auto text = skeleton::TextOf(entry.content);
      if (ContainsIgnoreCase(text, needle)) {
        matches.push_back(Match{&s, 0.5, std::string(tasktree::text::Utf8Prefix(text, kSnippetChars))});
        break;
      }
    }
  }

  std::sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.skeleton->last_activity != b.skeleton->last_activity) return a.skeleton->last_activity > b.skeleton->last_activity;
    return a.skeleton->task_id < b.skeleton->task_id;
  });
  if (matches.size() > limit) {
    matches.resize(limit);
  }

  SearchResponse response;
  response.fallback = true;
  for (const auto& m : matches) {
    SearchHit hit;
    hit.task_id        = m.skeleton->task_id;
    hit.score          = m.score;
    hit.content        = m.snippet;
    hit.workspace      = m.skeleton->workspace;
    hit.task_title     = m.skeleton->title;
    hit.parent_task_id = m.skeleton->parent_task_id;
    response.hits.push_back(std::move(hit));
  }

  TASKTREE_LOG_DEBUG("Text search answered", {StringField("query", query), IntField("hits", AsInt(response.hits.size()))});
  return response;
}

} // namespace tasktree::indexing
