#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/indexing/vector_store.hpp"

namespace tasktree::health {

struct CollectionHealth {
  std::string   status;
  std::uint64_t point_count          = 0;
  std::uint64_t segment_count        = 0;
  std::uint64_t indexed_vector_count = 0;
  std::string   optimizer_status;
};

struct CollectionStatus {
  bool          exists = false;
  std::uint64_t count  = 0;
};

/*
  CollectionHealthMonitor

  CheckCollectionHealth() is a diagnostic call and lets store errors
  propagate. The periodic poller started by Start() logs failures and
  keeps polling.
*/
class CollectionHealthMonitor {
 public:
  CollectionHealthMonitor(std::shared_ptr<indexing::VectorStore> store, std::string collection_name);
  ~CollectionHealthMonitor();

  CollectionHealthMonitor(const CollectionHealthMonitor&)            = delete;
  CollectionHealthMonitor& operator=(const CollectionHealthMonitor&) = delete;

  CollectionHealth CheckCollectionHealth();

  // {false, 0} when the collection does not exist.
  CollectionStatus GetCollectionStatus();

  void Start(std::chrono::milliseconds interval);
  void Stop();

  bool Running() const;

  // Last successful periodic poll, if any.
  std::optional<CollectionHealth> LastHealth() const;

  std::uint64_t PollCount() const;
  std::uint64_t FailedPollCount() const;

 private:
  void Loop(std::chrono::milliseconds interval);
  void PollOnce();

  std::shared_ptr<indexing::VectorStore> store_;
  std::string                            collection_name_;

  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  bool                            running_ = false;
  std::optional<CollectionHealth> last_health_;
  std::uint64_t                   polls_        = 0;
  std::uint64_t                   failed_polls_ = 0;

  std::thread thread_;
};

} // namespace tasktree::health
