#include "internal/indexing/indexing_pipeline.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/indexing/chunk_extractor.hpp"
#include "internal/indexing/circuit_breaker.hpp"
#include "internal/indexing/embedding_cache.hpp"
#include "internal/indexing/hashing_embedding_service.hpp"
#include "internal/indexing/memory_vector_store.hpp"
#include "internal/indexing/rate_limiter.hpp"
#include "internal/indexing/retry_policy.hpp"
#include "internal/skeleton/memory_record_scanner.hpp"
#include "internal/skeleton/skeleton_cache.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace tasktree::indexing;
using tasktree::skeleton::EntryKind;
using tasktree::skeleton::MakeContent;
using tasktree::skeleton::MemoryRecordScanner;
using tasktree::skeleton::SkeletonCache;
using tasktree::skeleton::TaskRecord;

constexpr std::size_t kDims = 16;

// Memory store whose upserts and searches can be made to fail.
class ScriptedStore final : public VectorStore {
 public:
  UpsertResult Upsert(const std::string& collection, const std::vector<Point>& points) override {
    ++upsert_calls;
    if (!scripted.empty()) {
      auto next = scripted.front();
      scripted.pop_front();
      if (!next) return next;
    }
    return inner.Upsert(collection, points);
  }

  CollectionInfo GetCollection(const std::string& name) override {
    return inner.GetCollection(name);
  }

  std::vector<std::string> GetCollections() override {
    return inner.GetCollections();
  }

  void CreateCollection(const std::string& name, std::size_t dimensions) override {
    inner.CreateCollection(name, dimensions);
  }

  bool DeleteCollection(const std::string& name) override {
    return inner.DeleteCollection(name);
  }

  std::vector<ScoredPoint> Search(const std::string& collection, const std::vector<float>& vector, const SearchFilter& filter,
                                  std::size_t limit) override {
    if (fail_search) {
      throw tasktree::util::Unavailable("vector store unreachable");
    }
    return inner.Search(collection, vector, filter, limit);
  }

  MemoryVectorStore        inner;
  std::deque<UpsertResult> scripted;
  bool                     fail_search  = false;
  int                      upsert_calls = 0;
};

// Hashing embedder that emits NaN for any text mentioning "poison".
class PoisonEmbedder final : public EmbeddingService {
 public:
  std::size_t Dimensions() const override {
    return kDims;
  }

  std::vector<std::vector<float>> Embed(const std::vector<std::string>& texts) override {
    ++calls;
    std::vector<std::vector<float>> out;
    for (const auto& t : texts) {
      if (t.find("poison") != std::string::npos) {
        out.emplace_back(kDims, std::nanf(""));
      } else {
        out.push_back(hashing.EmbedOne(t));
      }
    }
    return out;
  }

  HashingEmbeddingService hashing{kDims};
  int                     calls = 0;
};

TaskRecord MakeRecord(const std::string& id, const std::string& title) {
  TaskRecord r;
  r.task_id       = id;
  r.workspace     = "ws";
  r.title         = title;
  r.created_at    = tasktree::util::FromUnixMillis(1'700'000'000'000ULL);
  r.last_activity = r.created_at;
  r.instruction   = "instruction for " + id;
  return r;
}

struct Fixture {
  explicit Fixture(std::size_t failure_threshold = 3) {
    auto ok = MakeRecord("task-ok", "Deploy service");
    ok.outline.push_back(MakeContent(EntryKind::kUserText, "Please deploy the service to staging"));
    ok.outline.push_back(MakeContent(EntryKind::kAssistantText, "Deploying now"));
    scanner->Put(ok);

    auto tools = MakeRecord("task-tools", "Only tools");
    tools.outline.push_back(MakeContent(EntryKind::kToolCall, "list_files .", "list_files"));
    tools.outline.push_back(MakeContent(EntryKind::kToolResult, "a.txt b.txt", "list_files"));
    scanner->Put(tools);

    scanner->Put(MakeRecord("task-empty", "Nothing here"));

    auto mixed = MakeRecord("task-mixed", "Mixed vectors");
    mixed.outline.push_back(MakeContent(EntryKind::kUserText, "good text"));
    mixed.outline.push_back(MakeContent(EntryKind::kToolCall, "run_tests", "execute_command"));
    mixed.outline.push_back(MakeContent(EntryKind::kAssistantText, "poison text"));
    scanner->Put(mixed);

    auto bad = MakeRecord("task-poison", "All bad");
    bad.outline.push_back(MakeContent(EntryKind::kUserText, "poison everywhere"));
    scanner->Put(bad);

    cache = std::make_shared<SkeletonCache>(scanner);

    CircuitBreakerOptions cb;
    cb.failure_threshold = failure_threshold;
    breaker              = std::make_shared<CircuitBreaker>("vector_store", cb);

    PipelineOptions options;
    options.collection_name   = "test_collection";
    options.vector_dimensions = kDims;

    pipeline = std::make_unique<IndexingPipeline>(options, cache, std::make_shared<ChunkExtractor>(cache), embedder, store, embedding_cache, limiter, breaker,
                                                  RetryPolicy({}, [this](std::chrono::milliseconds d) { sleeps.push_back(d); }));
  }

  std::shared_ptr<MemoryRecordScanner> scanner         = std::make_shared<MemoryRecordScanner>();
  std::shared_ptr<SkeletonCache>       cache;
  std::shared_ptr<PoisonEmbedder>      embedder        = std::make_shared<PoisonEmbedder>();
  std::shared_ptr<ScriptedStore>       store           = std::make_shared<ScriptedStore>();
  std::shared_ptr<EmbeddingCache>      embedding_cache = std::make_shared<EmbeddingCache>();
  std::shared_ptr<RateLimiter>         limiter         = std::make_shared<RateLimiter>(1ms);
  std::shared_ptr<CircuitBreaker>      breaker;

  std::vector<std::chrono::milliseconds> sleeps;
  std::unique_ptr<IndexingPipeline>      pipeline;
};

void TestIndexesMessageChunks() {
  Fixture f;
  const auto result = f.pipeline->IndexTask("task-ok");

  assert(result.Ok());
  assert(result.outcome == IndexOutcome::kIndexed);
  assert(result.chunk_ids.size() == 1);
  assert(result.chunks_extracted == 1);
  assert(result.upsert_attempts == 1);
  assert(f.store->GetCollection("test_collection").points_count == 1);
  assert(f.store->GetCollection("test_collection").vector_dimensions == kDims);

  // Same content again: served from the embedding cache.
  const auto again = f.pipeline->IndexTask("task-ok");
  assert(again.Ok());
  assert(again.cache_hits == 1);
  assert(again.chunk_ids == result.chunk_ids);
  assert(f.embedder->calls == 1);
  assert(f.store->GetCollection("test_collection").points_count == 1);
}

void TestNothingToIndexIsReportedNotSilent() {
  Fixture f;

  const auto missing = f.pipeline->IndexTask("no-such-task");
  assert(missing.outcome == IndexOutcome::kTaskNotFound);
  assert(missing.chunk_ids.empty());
  assert(!missing.reason.empty());

  const auto empty = f.pipeline->IndexTask("task-empty");
  assert(empty.outcome == IndexOutcome::kNoChunks);
  assert(!empty.reason.empty());

  const auto tools = f.pipeline->IndexTask("task-tools");
  assert(tools.outcome == IndexOutcome::kNoIndexableChunks);
  assert(tools.chunks_extracted == 1);
  assert(tools.chunks_indexable == 0);
  assert(!tools.reason.empty());

  assert(f.store->upsert_calls == 0);
}

void TestInvalidVectorsAreDropped() {
  Fixture f;

  const auto mixed = f.pipeline->IndexTask("task-mixed");
  assert(mixed.Ok());
  assert(mixed.chunks_indexable == 2);
  assert(mixed.invalid_vectors == 1);
  assert(mixed.chunk_ids.size() == 1);

  const auto bad = f.pipeline->IndexTask("task-poison");
  assert(bad.outcome == IndexOutcome::kNoValidVectors);
  assert(bad.chunk_ids.empty());
  assert(bad.invalid_vectors == 1);

  // Invalid vectors are never cached.
  assert(f.embedding_cache->Size() == 1);
}

void TestClientErrorIsNotRetried() {
  Fixture f;
  f.store->scripted.push_back(UpsertResult::Client("400 bad request"));

  const auto result = f.pipeline->IndexTask("task-ok");
  assert(result.outcome == IndexOutcome::kUpsertRejected);
  assert(result.upsert_attempts == 1);
  assert(result.chunk_ids.empty());
  assert(f.sleeps.empty());
  assert(f.breaker->State() == CircuitState::kClosed);
}

void TestTransientErrorsBackOffThenSucceed() {
  Fixture f;
  f.store->scripted.push_back(UpsertResult::Transient("503"));

  const auto result = f.pipeline->IndexTask("task-ok");
  assert(result.Ok());
  assert(result.upsert_attempts == 2);
  assert((f.sleeps == std::vector<std::chrono::milliseconds>{2000ms}));
}

void TestExhaustedRetriesOpenTheCircuit() {
  Fixture f(1);
  for (int i = 0; i < 4; ++i) {
    f.store->scripted.push_back(UpsertResult::Transient("connection refused"));
  }

  const auto failed = f.pipeline->IndexTask("task-ok");
  assert(failed.outcome == IndexOutcome::kUpsertFailed);
  assert(failed.upsert_attempts == 4);
  assert((f.sleeps == std::vector<std::chrono::milliseconds>{2000ms, 4000ms, 8000ms}));
  assert(f.breaker->State() == CircuitState::kOpen);

  const auto blocked = f.pipeline->IndexTask("task-ok");
  assert(blocked.outcome == IndexOutcome::kCircuitOpen);
  assert(f.store->upsert_calls == 4);

  f.pipeline->ResetCollection();
  assert(f.breaker->State() == CircuitState::kClosed);
  assert(f.pipeline->IndexTask("task-ok").Ok());
}

void TestResetCollectionClearsPointsAndCache() {
  Fixture f;
  assert(f.pipeline->IndexTask("task-ok").Ok());
  assert(f.embedding_cache->Size() == 1);

  f.pipeline->ResetCollection();
  assert(f.store->GetCollection("test_collection").points_count == 0);
  assert(f.embedding_cache->Size() == 0);
}

void TestSearchUsesVectorsThenFallsBack() {
  Fixture f;
  assert(f.pipeline->IndexTask("task-ok").Ok());

  const auto semantic = f.pipeline->Search("deploy the service", SearchFilter{});
  assert(!semantic.fallback);
  assert(semantic.hits.size() == 1);
  assert(semantic.hits[0].task_id == "task-ok");
  assert(semantic.hits[0].task_title == "Deploy service");
  assert(semantic.hits[0].chunk_type == "message_exchange");

  f.store->fail_search = true;
  const auto text = f.pipeline->Search("DEPLOY", SearchFilter{});
  assert(text.fallback);
  assert(!text.fallback_reason.empty());
  assert(!text.hits.empty());
  assert(text.hits[0].task_id == "task-ok");
  assert(text.hits[0].score == 1.0);

  SearchFilter other_workspace;
  other_workspace.workspace = "elsewhere";
  assert(f.pipeline->Search("deploy", other_workspace).hits.empty());

  bool threw = false;
  try {
    f.pipeline->Search("", SearchFilter{});
  } catch (const tasktree::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestIndexesMessageChunks();
  TestNothingToIndexIsReportedNotSilent();
  TestInvalidVectorsAreDropped();
  TestClientErrorIsNotRetried();
  TestTransientErrorsBackOffThenSucceed();
  TestExhaustedRetriesOpenTheCircuit();
  TestResetCollectionClearsPointsAndCache();
  TestSearchUsesVectorsThenFallsBack();

  std::cout << "tasktree_unit_indexing_pipeline: pass\n";
  return 0;
}
