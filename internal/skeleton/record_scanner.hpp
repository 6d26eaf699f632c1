#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/skeleton/task_record.hpp"
#include "internal/util/time.hpp"

namespace tasktree::skeleton {

struct ScanScope {
  // Restrict the scan to one workspace.
  std::optional<std::string> workspace;
};

struct ScanResult {
  std::vector<TaskRecord>  records;
  std::vector<std::string> removed_task_ids;
};

/*
  RecordScanner

  Source of task records. With `since` unset, returns every record in
  scope; otherwise only records whose last activity is after `since`,
  plus ids of records deleted after `since`.

  Implementations must be idempotent and side-effect free. Failures are
  reported by throwing; the cache treats them as "nothing new".
*/
class RecordScanner {
 public:
  virtual ~RecordScanner() = default;

  virtual ScanResult Scan(const ScanScope& scope, std::optional<util::TimePoint> since) = 0;
};

} // namespace tasktree::skeleton
