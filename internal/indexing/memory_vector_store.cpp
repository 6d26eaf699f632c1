#include "internal/indexing/memory_vector_store.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace tasktree::indexing {

namespace {

double Cosine(const std::vector<float>& a, const std::vector<float>& b) {
  double dot = 0.0;
  double na  = 0.0;
  double nb  = 0.0;
  for (std::size_t i = 0; i < a.size() && i < b.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    na += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    nb += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }
  if (na <= 0.0 || nb <= 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

bool FieldEquals(const google::protobuf::Struct& payload, const std::string& key, const std::string& expected) {
  auto it = payload.fields().find(key);
  return it != payload.fields().end() && it->second.kind_case() == google::protobuf::Value::kStringValue && it->second.string_value() == expected;
}

} // namespace

UpsertResult MemoryVectorStore::Upsert(const std::string& collection, const std::vector<Point>& points) {
  std::lock_guard lock(mutex_);

  auto it = collections_.find(collection);
  if (it == collections_.end()) {
    return UpsertResult::Client("collection not found: " + collection);
  }

  for (const auto& p : points) {
    if (p.id.empty()) {
      return UpsertResult::Client("point id is required");
    }
    if (p.vector.size() != it->second.dimensions) {
      return UpsertResult::Client("point " + p.id + ": expected dimension " + std::to_string(it->second.dimensions) + ", got " +
                                  std::to_string(p.vector.size()));
    }
  }

  for (const auto& p : points) {
    it->second.points[p.id] = p;
  }
  return UpsertResult::Ok();
}

CollectionInfo MemoryVectorStore::GetCollection(const std::string& name) {
  std::lock_guard lock(mutex_);

  auto it = collections_.find(name);
  if (it == collections_.end()) {
    throw util::NotFound("collection not found: " + name);
  }

  CollectionInfo info;
  info.status                = "green";
  info.points_count          = it->second.points.size();
  info.segments_count        = 1;
  info.indexed_vectors_count = it->second.points.size();
  info.optimizer_status      = "ok";
  info.vector_dimensions     = it->second.dimensions;
  return info;
}

std::vector<std::string> MemoryVectorStore::GetCollections() {
  std::lock_guard lock(mutex_);

  std::vector<std::string> names;
  for (const auto& [name, c] : collections_) {
    names.push_back(name);
  }
  return names;
}

void MemoryVectorStore::CreateCollection(const std::string& name, std::size_t dimensions) {
  if (dimensions == 0) {
    throw util::InvalidArgument("collection dimensions must be positive");
  }

  std::lock_guard lock(mutex_);
  if (collections_.count(name) > 0) {
    throw util::AlreadyExists("collection already exists: " + name);
  }
  collections_[name].dimensions = dimensions;
}

bool MemoryVectorStore::DeleteCollection(const std::string& name) {
  std::lock_guard lock(mutex_);
  return collections_.erase(name) > 0;
}

std::vector<ScoredPoint> MemoryVectorStore::Search(const std::string& collection, const std::vector<float>& vector, const SearchFilter& filter,
                                                   std::size_t limit) {
  std::lock_guard lock(mutex_);

  auto it = collections_.find(collection);
  if (it == collections_.end()) {
    throw util::NotFound("collection not found: " + collection);
  }
  if (vector.size() != it->second.dimensions) {
    throw util::InvalidArgument("query dimension mismatch: expected " + std::to_string(it->second.dimensions) + ", got " +
                                std::to_string(vector.size()));
  }

  std::vector<ScoredPoint> hits;
  for (const auto& [id, p] : it->second.points) {
    if (filter.task_id && !FieldEquals(p.payload, "task_id", *filter.task_id)) continue;
    if (filter.workspace && !FieldEquals(p.payload, "workspace", *filter.workspace)) continue;
    hits.push_back(ScoredPoint{id, Cosine(vector, p.vector), p.payload});
  }

  std::sort(hits.begin(), hits.end(), [](const ScoredPoint& a, const ScoredPoint& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.id < b.id;
  });
  if (limit > 0 && hits.size() > limit) {
    hits.resize(limit);
  }
  return hits;
}

} // namespace tasktree::indexing
