#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "google/protobuf/struct.pb.h"

namespace tasktree::indexing {

struct Point {
  std::string              id;
  std::vector<float>       vector;
  google::protobuf::Struct payload;
};

enum class UpsertStatus {
  kOk = 0,
  // network / server trouble; worth retrying
  kTransient,
  // malformed request; retrying cannot help
  kClient,
};

struct UpsertResult {
  UpsertStatus status = UpsertStatus::kOk;
  std::string  message;

  static UpsertResult Ok() {
    return {};
  }

  static UpsertResult Transient(std::string msg) {
    return {UpsertStatus::kTransient, std::move(msg)};
  }

  static UpsertResult Client(std::string msg) {
    return {UpsertStatus::kClient, std::move(msg)};
  }

  explicit operator bool() const {
    return status == UpsertStatus::kOk;
  }
};

struct CollectionInfo {
  std::string   status;
  std::uint64_t points_count          = 0;
  std::uint64_t segments_count        = 0;
  std::uint64_t indexed_vectors_count = 0;
  std::string   optimizer_status;
  std::size_t   vector_dimensions = 0;
};

struct SearchFilter {
  std::optional<std::string> task_id;
  std::optional<std::string> workspace;
};

struct ScoredPoint {
  std::string              id;
  double                   score = 0.0;
  google::protobuf::Struct payload;
};

/*
  VectorStore

  CRUD surface of the external vector database. Upsert reports failures
  as values; the other calls throw (util::NotFound for a missing
  collection, util::Unavailable for transport trouble).
*/
class VectorStore {
 public:
  virtual ~VectorStore() = default;

  virtual UpsertResult Upsert(const std::string& collection, const std::vector<Point>& points) = 0;

  virtual CollectionInfo GetCollection(const std::string& name) = 0;

  virtual std::vector<std::string> GetCollections() = 0;

  virtual void CreateCollection(const std::string& name, std::size_t dimensions) = 0;

  // Returns false when the collection did not exist.
  virtual bool DeleteCollection(const std::string& name) = 0;

  virtual std::vector<ScoredPoint> Search(const std::string& collection, const std::vector<float>& vector, const SearchFilter& filter,
                                          std::size_t limit) = 0;
};

} // namespace tasktree::indexing
