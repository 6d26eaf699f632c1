#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/skeleton/record_scanner.hpp"
#include "internal/skeleton/task_skeleton.hpp"
#include "internal/util/time.hpp"

namespace tasktree::skeleton {

struct SkeletonCacheOptions {
  std::chrono::milliseconds staleness_window{std::chrono::minutes(5)};
  std::size_t               max_entry_chars = kDefaultMaxEntryChars;
};

using SkeletonMap = std::map<std::string, TaskSkeleton>;
using Snapshot    = std::shared_ptr<const SkeletonMap>;

/*
  SkeletonCache

  Owns one TaskSkeleton per task. Readers take an immutable snapshot;
  refreshes build a new map and swap it in, so an in-flight iteration
  never sees a half-applied rebuild.

  Freshness:
    - empty cache: full scan of the requested scope
    - otherwise: when the scope was last scanned more than
      staleness_window ago, an incremental scan since that time

  Scanner failures are logged and leave the last good content in place.
*/
class SkeletonCache {
 public:
  SkeletonCache(std::shared_ptr<RecordScanner> scanner, SkeletonCacheOptions options = {}, util::ClockFn clock = util::Now);

  void EnsureFresh(const ScanScope& scope = {});

  // Full rescan of the scope, regardless of staleness.
  void Rebuild(const ScanScope& scope = {});

  std::optional<TaskSkeleton> Get(const std::string& task_id) const;

  Snapshot All() const;

  std::size_t Size() const;

  // Bumped every time the content changes.
  std::uint64_t Generation() const {
    return generation_.load();
  }

 private:
  static std::string ScopeKey(const ScanScope& scope);

  void FullScanLocked(const ScanScope& scope);
  void IncrementalScanLocked(const ScanScope& scope, util::TimePoint since);
  void Publish(std::shared_ptr<const SkeletonMap> next);

  std::shared_ptr<RecordScanner> scanner_;
  SkeletonCacheOptions           options_;
  util::ClockFn                  clock_;

  mutable std::mutex                 snapshot_mutex_;
  std::shared_ptr<const SkeletonMap> snapshot_;

  // Serializes refreshes; readers never take it.
  std::mutex                             rebuild_mutex_;
  std::map<std::string, util::TimePoint> last_scan_;

  std::atomic<std::uint64_t> generation_{0};
};

} // namespace tasktree::skeleton
