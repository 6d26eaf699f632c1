#pragma once

#include <map>
#include <mutex>

#include "internal/indexing/vector_store.hpp"

namespace tasktree::indexing {

/*
  In-process vector store with cosine-similarity search.
*/
class MemoryVectorStore final : public VectorStore {
 public:
  UpsertResult Upsert(const std::string& collection, const std::vector<Point>& points) override;

  CollectionInfo GetCollection(const std::string& name) override;

  std::vector<std::string> GetCollections() override;

  void CreateCollection(const std::string& name, std::size_t dimensions) override;

  bool DeleteCollection(const std::string& name) override;

  std::vector<ScoredPoint> Search(const std::string& collection, const std::vector<float>& vector, const SearchFilter& filter,
                                  std::size_t limit) override;

 private:
  struct Collection {
    std::size_t                  dimensions = 0;
    std::map<std::string, Point> points;
  };

  std::mutex                        mutex_;
  std::map<std::string, Collection> collections_;
};

} // namespace tasktree::indexing
