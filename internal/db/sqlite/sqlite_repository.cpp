#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace masterplan::db::sqlite {

using masterplan::db::ErrorCode;
using masterplan::db::Result;
namespace v1 = masterplan::release::v1;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static constexpr const char* kJobColumns =
    "id,type,status,project_slug,draft_id,progress,message,result_json,error,created_at_ms,started_at_ms,completed_at_ms,sequence";

static model::JobRecord ReadJob(sqlite3_stmt* st) {
    model::JobRecord r;
    r.id              = ColText(st, 0);
    r.type            = static_cast<v1::JobType>(ColI32(st, 1));
    r.status          = static_cast<v1::JobStatus>(ColI32(st, 2));
    r.project_slug    = ColText(st, 3);
    r.draft_id        = ColText(st, 4);
    r.progress        = ColI32(st, 5);
    r.message         = ColText(st, 6);
    r.result_json     = ColText(st, 7);
    r.error           = ColText(st, 8);
    r.created_at_ms   = ColU64(st, 9);
    r.started_at_ms   = ColU64(st, 10);
    r.completed_at_ms = ColU64(st, 11);
    r.sequence        = ColU64(st, 12);
    return r;
}

static constexpr const char* kReleaseColumns =
    "release_id,project_slug,draft_id,manifest_key,checksum,published_by,overlay_count,tile_count,published_at_ms";

static model::ReleaseRecord ReadRelease(sqlite3_stmt* st) {
    model::ReleaseRecord r;
    r.release_id      = ColText(st, 0);
    r.project_slug    = ColText(st, 1);
    r.draft_id        = ColText(st, 2);
    r.manifest_key    = ColText(st, 3);
    r.checksum        = ColText(st, 4);
    r.published_by    = ColText(st, 5);
    r.overlay_count   = ColI32(st, 6);
    r.tile_count      = ColI64(st, 7);
    r.published_at_ms = ColU64(st, 8);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO jobs(id,type,status,project_slug,draft_id,progress,message,result_json,error,"
        "created_at_ms,started_at_ms,completed_at_ms,sequence) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindI32(st, 2, static_cast<int>(r.type));
    BindI32(st, 3, static_cast<int>(r.status));
    BindText(st, 4, r.project_slug);
    BindText(st, 5, r.draft_id);
    BindI32(st, 6, r.progress);
    BindText(st, 7, r.message);
    BindText(st, 8, r.result_json);
    BindText(st, 9, r.error);
    BindU64(st, 10, r.created_at_ms);
    BindU64(st, 11, r.started_at_ms);
    BindU64(st, 12, r.completed_at_ms);
    BindU64(st, 13, r.sequence);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "job " + r.id);
    return Translate(db, rc);
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE jobs SET status=?,progress=?,message=?,result_json=?,error=?,"
        "started_at_ms=?,completed_at_ms=?,sequence=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(r.status));
    BindI32(st, 2, r.progress);
    BindText(st, 3, r.message);
    BindText(st, 4, r.result_json);
    BindText(st, 5, r.error);
    BindU64(st, 6, r.started_at_ms);
    BindU64(st, 7, r.completed_at_ms);
    BindU64(st, 8, r.sequence);
    BindText(st, 9, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "job " + r.id);
    return Translate(db, rc);
}

std::optional<model::JobRecord>
SqliteRepository::GetJob(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    std::optional<model::JobRecord> out;
    if (sqlite3_step(st) == SQLITE_ROW)
        out = ReadJob(st);

    sqlite3_finalize(st);
    return out;
}

std::vector<model::JobRecord>
SqliteRepository::ListJobs(Transaction& t, const JobFilter& filter) {
    auto* db = TX(t).Handle();

    // ?1 / ?2 are "match anything" when NULL
    const std::string sql = std::string("SELECT ") + kJobColumns +
                            " FROM jobs WHERE (?1 IS NULL OR project_slug=?1) AND (?2 IS NULL OR status=?2)"
                            " ORDER BY rowid DESC LIMIT ?3;";

    std::vector<model::JobRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    if (!filter.project_slug.empty())
        BindText(st, 1, filter.project_slug);
    if (filter.status)
        BindI32(st, 2, static_cast<int>(*filter.status));
    if (filter.limit == 0)
        sqlite3_bind_int64(st, 3, -1); // sqlite: negative limit = no limit
    else
        BindU64(st, 3, filter.limit);

    while (sqlite3_step(st) == SQLITE_ROW)
        out.push_back(ReadJob(st));

    sqlite3_finalize(st);
    return out;
}

std::optional<model::JobRecord>
SqliteRepository::FindActiveJob(Transaction& t, const std::string& project_slug, const std::string& draft_id, v1::JobType type) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kJobColumns +
                            " FROM jobs WHERE project_slug=? AND (?='' OR draft_id=?) AND type=? AND status IN (?,?) LIMIT 1;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, project_slug);
    BindText(st, 2, draft_id);
    BindText(st, 3, draft_id);
    BindI32(st, 4, static_cast<int>(type));
    BindI32(st, 5, static_cast<int>(v1::JOB_STATUS_QUEUED));
    BindI32(st, 6, static_cast<int>(v1::JOB_STATUS_RUNNING));

    std::optional<model::JobRecord> out;
    if (sqlite3_step(st) == SQLITE_ROW)
        out = ReadJob(st);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::AppendJobLog(Transaction& t, model::JobLogRecord& r) {
    auto* db = TX(t).Handle();

    // position = current count for the job; the transaction holds the write lock
    const char* sql =
        "INSERT INTO job_logs(job_id,position,timestamp_ms,level,message) "
        "SELECT ?1, COUNT(*), ?2, ?3, ?4 FROM job_logs WHERE job_id=?1 RETURNING position;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.job_id);
    BindU64(st, 2, r.timestamp_ms);
    BindText(st, 3, r.level);
    BindText(st, 4, r.message);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
        r.position = ColU64(st, 0);
        rc = sqlite3_step(st);
    }
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::NotFound, "job " + r.job_id);
    return Translate(db, rc);
}

std::vector<model::JobLogRecord>
SqliteRepository::ListJobLogs(Transaction& t, const std::string& job_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT job_id,position,timestamp_ms,level,message FROM job_logs WHERE job_id=? ORDER BY position;";

    std::vector<model::JobLogRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindText(st, 1, job_id);

    while (sqlite3_step(st) == SQLITE_ROW) {
        model::JobLogRecord r;
        r.job_id       = ColText(st, 0);
        r.position     = ColU64(st, 1);
        r.timestamp_ms = ColU64(st, 2);
        r.level        = ColText(st, 3);
        r.message      = ColText(st, 4);
        out.push_back(std::move(r));
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Releases
// ------------------------------------------------------------------

Result SqliteRepository::InsertRelease(Transaction& t, const model::ReleaseRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO releases(release_id,project_slug,draft_id,manifest_key,checksum,published_by,"
        "overlay_count,tile_count,published_at_ms) VALUES(?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.release_id);
    BindText(st, 2, r.project_slug);
    BindText(st, 3, r.draft_id);
    BindText(st, 4, r.manifest_key);
    BindText(st, 5, r.checksum);
    BindText(st, 6, r.published_by);
    BindI32(st, 7, r.overlay_count);
    BindI64(st, 8, r.tile_count);
    BindU64(st, 9, r.published_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "release " + r.release_id);
    return Translate(db, rc);
}

std::optional<model::ReleaseRecord>
SqliteRepository::GetRelease(Transaction& t, const std::string& project_slug, const std::string& release_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kReleaseColumns + " FROM releases WHERE project_slug=? AND release_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, project_slug);
    BindText(st, 2, release_id);

    std::optional<model::ReleaseRecord> out;
    if (sqlite3_step(st) == SQLITE_ROW)
        out = ReadRelease(st);

    sqlite3_finalize(st);
    return out;
}

std::vector<model::ReleaseRecord>
SqliteRepository::ListReleases(Transaction& t, const std::string& project_slug) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kReleaseColumns + " FROM releases WHERE project_slug=? ORDER BY rowid DESC;";

    std::vector<model::ReleaseRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindText(st, 1, project_slug);

    while (sqlite3_step(st) == SQLITE_ROW)
        out.push_back(ReadRelease(st));

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::SetCurrentRelease(Transaction& t, const model::CurrentReleaseRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO current_release(project_slug,release_id,updated_at_ms) VALUES(?,?,?) "
        "ON CONFLICT(project_slug) DO UPDATE SET release_id=excluded.release_id, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.project_slug);
    BindText(st, 2, r.release_id);
    BindU64(st, 3, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::CurrentReleaseRecord>
SqliteRepository::GetCurrentRelease(Transaction& t, const std::string& project_slug) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT project_slug,release_id,updated_at_ms FROM current_release WHERE project_slug=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, project_slug);

    std::optional<model::CurrentReleaseRecord> out;
    if (sqlite3_step(st) == SQLITE_ROW) {
        model::CurrentReleaseRecord r;
        r.project_slug  = ColText(st, 0);
        r.release_id    = ColText(st, 1);
        r.updated_at_ms = ColU64(st, 2);
        out = std::move(r);
    }

    sqlite3_finalize(st);
    return out;
}

} // namespace masterplan::db::sqlite
