#include "internal/skeleton/sqlite_record_scanner.hpp"

#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tasktree::skeleton {

using db::sqlite::BindI64;
using db::sqlite::BindText;
using db::sqlite::ColI64;
using db::sqlite::ColIsNull;
using db::sqlite::ColText;

namespace {

const std::vector<std::string> kSchemaSql = {
    "CREATE TABLE IF NOT EXISTS task_records (task_id TEXT PRIMARY KEY, parent_task_id TEXT, workspace TEXT NOT NULL DEFAULT '', title TEXT NOT NULL DEFAULT '', host_os TEXT, created_at_ms INTEGER NOT NULL, last_activity_ms INTEGER NOT NULL, instruction TEXT NOT NULL DEFAULT '');",
    "CREATE INDEX IF NOT EXISTS task_records_activity ON task_records(workspace, last_activity_ms);",
    "CREATE TABLE IF NOT EXISTS task_outline_entries (task_id TEXT NOT NULL, seq INTEGER NOT NULL, kind TEXT NOT NULL, tool_name TEXT, text TEXT NOT NULL DEFAULT '', PRIMARY KEY (task_id, seq));",
    "CREATE TABLE IF NOT EXISTS task_tombstones (task_id TEXT PRIMARY KEY, workspace TEXT NOT NULL DEFAULT '', deleted_at_ms INTEGER NOT NULL);"};

void CheckDone(sqlite3* db, int rc) {
  if (rc != SQLITE_DONE) {
    throw util::Unavailable(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

} // namespace

void BootstrapTaskRecordSchema(db::sqlite::SqliteDB& db) {
  for (const auto& sql : kSchemaSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT task_id,parent_task_id,workspace,title,host_os,created_at_ms,last_activity_ms,instruction FROM task_records LIMIT 1;");
  db.Exec("SELECT task_id,seq,kind,tool_name,text FROM task_outline_entries LIMIT 1;");
  db.Exec("SELECT task_id,workspace,deleted_at_ms FROM task_tombstones LIMIT 1;");
}

SqliteRecordScanner::SqliteRecordScanner(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

std::vector<OutlineContent> SqliteRecordScanner::LoadOutline(const std::string& task_id) {
  auto st = db_->Prepare("SELECT seq,kind,tool_name,text FROM task_outline_entries WHERE task_id=? ORDER BY seq;");
  BindText(st.get(), 1, task_id);

  std::vector<OutlineContent> outline;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    const auto kind_name = ColText(st.get(), 1);
    const auto kind      = ParseKind(kind_name);
    if (!kind) {
      TASKTREE_LOG_WARN("Skipping outline entry with unknown kind", {observability::StringField("task_id", task_id),
                                                                     observability::IntField("seq", ColI64(st.get(), 0)),
                                                                     observability::StringField("kind", kind_name)});
      continue;
    }
    outline.push_back(MakeContent(*kind, ColText(st.get(), 3), ColText(st.get(), 2)));
  }
  CheckDone(db_->Handle(), rc);
  return outline;
}

ScanResult SqliteRecordScanner::Scan(const ScanScope& scope, std::optional<util::TimePoint> since) {
  std::string sql = "SELECT task_id,parent_task_id,workspace,title,host_os,created_at_ms,last_activity_ms,instruction FROM task_records WHERE 1=1";
  if (scope.workspace) sql += " AND workspace=?";
  if (since) sql += " AND last_activity_ms>?";
  sql += " ORDER BY task_id;";

  auto st  = db_->Prepare(sql);
  int  idx = 1;
  if (scope.workspace) BindText(st.get(), idx++, *scope.workspace);
  if (since) BindI64(st.get(), idx++, static_cast<std::int64_t>(util::ToUnixMillis(*since)));

  ScanResult result;
  int        rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    TaskRecord r;
    r.task_id = ColText(st.get(), 0);
    if (!ColIsNull(st.get(), 1)) r.parent_task_id = ColText(st.get(), 1);
    r.workspace = ColText(st.get(), 2);
    r.title     = ColText(st.get(), 3);
    if (!ColIsNull(st.get(), 4)) r.host_os = ColText(st.get(), 4);
    r.created_at    = util::FromUnixMillis(static_cast<std::uint64_t>(ColI64(st.get(), 5)));
    r.last_activity = util::FromUnixMillis(static_cast<std::uint64_t>(ColI64(st.get(), 6)));
    r.instruction   = ColText(st.get(), 7);
    result.records.push_back(std::move(r));
  }
  CheckDone(db_->Handle(), rc);

  for (auto& r : result.records) {
    r.outline = LoadOutline(r.task_id);
  }

  if (since) {
    std::string tomb_sql = "SELECT task_id FROM task_tombstones WHERE deleted_at_ms>?";
    if (scope.workspace) tomb_sql += " AND workspace=?";
    tomb_sql += " ORDER BY task_id;";

    auto ts = db_->Prepare(tomb_sql);
    BindI64(ts.get(), 1, static_cast<std::int64_t>(util::ToUnixMillis(*since)));
    if (scope.workspace) BindText(ts.get(), 2, *scope.workspace);

    while ((rc = sqlite3_step(ts.get())) == SQLITE_ROW) {
      result.removed_task_ids.push_back(ColText(ts.get(), 0));
    }
    CheckDone(db_->Handle(), rc);
  }

  return result;
}

} // namespace tasktree::skeleton
