#include "internal/skeleton/skeleton_cache.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace tasktree::skeleton {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kAllScopes = "*";

bool InScope(const ScanScope& scope, const TaskSkeleton& s) {
  return !scope.workspace || *scope.workspace == s.workspace;
}

} // namespace

SkeletonCache::SkeletonCache(std::shared_ptr<RecordScanner> scanner, SkeletonCacheOptions options, util::ClockFn clock)
    : scanner_(std::move(scanner)), options_(options), clock_(std::move(clock)), snapshot_(std::make_shared<const SkeletonMap>()) {
}

std::string SkeletonCache::ScopeKey(const ScanScope& scope) {
  return scope.workspace ? "ws:" + *scope.workspace : kAllScopes;
}

void SkeletonCache::EnsureFresh(const ScanScope& scope) {
  std::lock_guard lock(rebuild_mutex_);

  if (Size() == 0) {
    FullScanLocked(scope);
    return;
  }

  auto it = last_scan_.find(ScopeKey(scope));
  if (it == last_scan_.end()) {
    it = last_scan_.find(kAllScopes);
  }
  if (it == last_scan_.end()) {
    FullScanLocked(scope);
    return;
  }

  if (clock_() - it->second < options_.staleness_window) {
    return;
  }
  IncrementalScanLocked(scope, it->second);
}

void SkeletonCache::Rebuild(const ScanScope& scope) {
  std::lock_guard lock(rebuild_mutex_);
  FullScanLocked(scope);
}

void SkeletonCache::FullScanLocked(const ScanScope& scope) {
  const auto started = clock_();

  ScanResult result;
  try {
    result = scanner_->Scan(scope, std::nullopt);
  } catch (const std::exception& e) {
    TASKTREE_LOG_WARN("Record scan failed; keeping cached skeletons",
                      {StringField("scope", ScopeKey(scope)), StringField("mode", "full"), StringField("error", e.what())});
    return;
  }

  auto next = std::make_shared<SkeletonMap>();
  if (scope.workspace) {
    // Keep other workspaces untouched.
    for (const auto& [id, s] : *All()) {
      if (!InScope(scope, s)) next->emplace(id, s);
    }
  }
  for (const auto& record : result.records) {
    (*next)[record.task_id] = BuildSkeleton(record, options_.max_entry_chars);
  }

  if (!scope.workspace) {
    last_scan_.clear();
  }
  last_scan_[ScopeKey(scope)] = started;

  TASKTREE_LOG_INFO("Skeleton cache rebuilt", {StringField("scope", ScopeKey(scope)), IntField("records", static_cast<std::int64_t>(result.records.size())),
                                               IntField("size", static_cast<std::int64_t>(next->size()))});
  Publish(std::move(next));
}

void SkeletonCache::IncrementalScanLocked(const ScanScope& scope, util::TimePoint since) {
  const auto started = clock_();

  ScanResult result;
  try {
    result = scanner_->Scan(scope, since);
  } catch (const std::exception& e) {
    TASKTREE_LOG_WARN("Record scan failed; keeping cached skeletons",
                      {StringField("scope", ScopeKey(scope)), StringField("mode", "incremental"), StringField("error", e.what())});
    return;
  }

  last_scan_[ScopeKey(scope)] = started;
  if (result.records.empty() && result.removed_task_ids.empty()) {
    return;
  }

  auto next = std::make_shared<SkeletonMap>(*All());
  for (const auto& record : result.records) {
    (*next)[record.task_id] = BuildSkeleton(record, options_.max_entry_chars);
  }
  for (const auto& id : result.removed_task_ids) {
    next->erase(id);
  }

  TASKTREE_LOG_DEBUG("Skeleton cache refreshed", {StringField("scope", ScopeKey(scope)), IntField("changed", static_cast<std::int64_t>(result.records.size())),
                                                  IntField("removed", static_cast<std::int64_t>(result.removed_task_ids.size()))});
  Publish(std::move(next));
}

void SkeletonCache::Publish(std::shared_ptr<const SkeletonMap> next) {
  {
    std::lock_guard lock(snapshot_mutex_);
    snapshot_ = std::move(next);
  }
  ++generation_;
}

std::optional<TaskSkeleton> SkeletonCache::Get(const std::string& task_id) const {
  const auto snapshot = All();
  auto it = snapshot->find(task_id);
  if (it == snapshot->end()) {
    return std::nullopt;
  }
  return it->second;
}

Snapshot SkeletonCache::All() const {
  std::lock_guard lock(snapshot_mutex_);
  return snapshot_;
}

std::size_t SkeletonCache::Size() const {
  return All()->size();
}

} // namespace tasktree::skeleton
