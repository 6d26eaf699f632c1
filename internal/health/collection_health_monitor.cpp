#include "internal/health/collection_health_monitor.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace tasktree::health {

using observability::IntField;
using observability::StringField;

CollectionHealthMonitor::CollectionHealthMonitor(std::shared_ptr<indexing::VectorStore> store, std::string collection_name)
    : store_(std::move(store)), collection_name_(std::move(collection_name)) {
}

CollectionHealthMonitor::~CollectionHealthMonitor() {
  Stop();
}

CollectionHealth CollectionHealthMonitor::CheckCollectionHealth() {
  const auto info = store_->GetCollection(collection_name_);

  CollectionHealth h;
  h.status               = info.status;
  h.point_count          = info.points_count;
  h.segment_count        = info.segments_count;
  h.indexed_vector_count = info.indexed_vectors_count;
  h.optimizer_status     = info.optimizer_status;
  return h;
}

CollectionStatus CollectionHealthMonitor::GetCollectionStatus() {
  try {
    const auto info = store_->GetCollection(collection_name_);
    return CollectionStatus{true, info.points_count};
  } catch (const util::NotFound&) {
    return CollectionStatus{false, 0};
  }
}

void CollectionHealthMonitor::Start(std::chrono::milliseconds interval) {
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_  = std::thread(&CollectionHealthMonitor::Loop, this, interval);

  TASKTREE_LOG_INFO("Collection health monitor started", {StringField("collection", collection_name_), IntField("interval_ms", interval.count())});
}

void CollectionHealthMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool CollectionHealthMonitor::Running() const {
  std::lock_guard lock(mutex_);
  return running_;
}

std::optional<CollectionHealth> CollectionHealthMonitor::LastHealth() const {
  std::lock_guard lock(mutex_);
  return last_health_;
}

std::uint64_t CollectionHealthMonitor::PollCount() const {
  std::lock_guard lock(mutex_);
  return polls_;
}

std::uint64_t CollectionHealthMonitor::FailedPollCount() const {
  std::lock_guard lock(mutex_);
  return failed_polls_;
}

void CollectionHealthMonitor::PollOnce() {
  try {
    auto health = CheckCollectionHealth();
    observability::Metrics::Instance().SetCollectionPointCount(collection_name_, health.point_count);

    std::lock_guard lock(mutex_);
    ++polls_;
    last_health_ = std::move(health);
  } catch (const std::exception& e) {
    TASKTREE_LOG_WARN("Collection health poll failed", {StringField("collection", collection_name_), StringField("error", e.what())});

    std::lock_guard lock(mutex_);
    ++polls_;
    ++failed_polls_;
  }
}

void CollectionHealthMonitor::Loop(std::chrono::milliseconds interval) {
  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    PollOnce();
    lock.lock();

    cv_.wait_for(lock, interval, [&] { return !running_; });
  }
}

} // namespace tasktree::health
