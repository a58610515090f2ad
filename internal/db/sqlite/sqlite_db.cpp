#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace masterplan::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // WAL lets readers from other processes run while we hold the write lock
  Exec("PRAGMA journal_mode=WAL;");

  // job progress is rewritten often; FULL buys little here
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS jobs (id TEXT PRIMARY KEY, type INTEGER NOT NULL, status INTEGER NOT NULL, project_slug TEXT NOT NULL, draft_id TEXT NOT NULL, "
      "progress INTEGER NOT NULL DEFAULT 0, message TEXT NOT NULL DEFAULT '', result_json TEXT NOT NULL DEFAULT '', error TEXT NOT NULL DEFAULT '', "
      "created_at_ms INTEGER NOT NULL, started_at_ms INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0, sequence INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS jobs_by_draft ON jobs(project_slug, draft_id, status);",
      "CREATE TABLE IF NOT EXISTS job_logs (job_id TEXT NOT NULL REFERENCES jobs(id) ON DELETE CASCADE, position INTEGER NOT NULL, timestamp_ms INTEGER NOT NULL, "
      "level TEXT NOT NULL, message TEXT NOT NULL, PRIMARY KEY (job_id, position));",
      "CREATE TABLE IF NOT EXISTS releases (release_id TEXT NOT NULL, project_slug TEXT NOT NULL, draft_id TEXT NOT NULL, manifest_key TEXT NOT NULL, "
      "checksum TEXT NOT NULL, published_by TEXT NOT NULL, overlay_count INTEGER NOT NULL, tile_count INTEGER NOT NULL, published_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (project_slug, release_id));",
      "CREATE TABLE IF NOT EXISTS current_release (project_slug TEXT PRIMARY KEY, release_id TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

} // namespace masterplan::db::sqlite
