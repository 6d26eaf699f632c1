#include "internal/skeleton/memory_record_scanner.hpp"

namespace tasktree::skeleton {

namespace {

bool InScope(const ScanScope& scope, const std::string& workspace) {
  return !scope.workspace || *scope.workspace == workspace;
}

} // namespace

MemoryRecordScanner::MemoryRecordScanner(util::ClockFn clock) : clock_(std::move(clock)) {
}

void MemoryRecordScanner::Put(TaskRecord record) {
  std::lock_guard lock(mutex_);
  tombstones_.erase(record.task_id);
  auto id       = record.task_id;
  records_[id]  = std::move(record);
}

bool MemoryRecordScanner::Remove(const std::string& task_id) {
  std::lock_guard lock(mutex_);
  auto it = records_.find(task_id);
  if (it == records_.end()) {
    return false;
  }
  tombstones_[task_id] = Tombstone{it->second.workspace, clock_()};
  records_.erase(it);
  return true;
}

ScanResult MemoryRecordScanner::Scan(const ScanScope& scope, std::optional<util::TimePoint> since) {
  std::lock_guard lock(mutex_);

  ScanResult result;
  for (const auto& [id, record] : records_) {
    if (!InScope(scope, record.workspace)) continue;
    if (since && record.last_activity <= *since) continue;
    result.records.push_back(record);
  }

  if (since) {
    for (const auto& [id, tombstone] : tombstones_) {
      if (InScope(scope, tombstone.workspace) && tombstone.deleted_at > *since) {
        result.removed_task_ids.push_back(id);
      }
    }
  }

  return result;
}

} // namespace tasktree::skeleton
