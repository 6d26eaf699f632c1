#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/skeleton/record_scanner.hpp"

namespace tasktree::skeleton {

/*
  Creates task_records / task_outline_entries / task_tombstones if missing.
  Called once by the composition root.
*/
void BootstrapTaskRecordSchema(db::sqlite::SqliteDB& db);

/*
  SqliteRecordScanner

  Reads task records written by an external ingester.

    task_records         one row per task, timestamps in unix millis
    task_outline_entries ordered outline (kind: user / assistant /
                         tool_call / tool_result)
    task_tombstones      deletions, reported on incremental scans
*/
class SqliteRecordScanner final : public RecordScanner {
 public:
  explicit SqliteRecordScanner(std::shared_ptr<db::sqlite::SqliteDB> db);

  ScanResult Scan(const ScanScope& scope, std::optional<util::TimePoint> since) override;

 private:
  std::vector<OutlineContent> LoadOutline(const std::string& task_id);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace tasktree::skeleton
