#pragma once

#include <map>
#include <mutex>

#include "internal/skeleton/record_scanner.hpp"

namespace tasktree::skeleton {

/*
  In-process record store. Used by tests and when the engine is embedded
  by a host that pushes records directly.
*/
class MemoryRecordScanner final : public RecordScanner {
 public:
  explicit MemoryRecordScanner(util::ClockFn clock = util::Now);

  void Put(TaskRecord record);
  // Returns false when the id is unknown.
  bool Remove(const std::string& task_id);

  ScanResult Scan(const ScanScope& scope, std::optional<util::TimePoint> since) override;

 private:
  struct Tombstone {
    std::string     workspace;
    util::TimePoint deleted_at;
  };

  util::ClockFn clock_;

  std::mutex                        mutex_;
  std::map<std::string, TaskRecord> records_;
  std::map<std::string, Tombstone>  tombstones_;
};

} // namespace tasktree::skeleton
