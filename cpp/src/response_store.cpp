// docflow/cpp/src/response_store.cpp
#include "docflow/response_store.h"
#include "docflow/errors.h"
#include "docflow/log.h"

#include "text_common.h"

#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

namespace docflow {

namespace {

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "sqlite error";
        sqlite3_free(err);
        throw DocflowException(ErrorCode::IoError, msg);
    }
}

std::string column_str(sqlite3_stmt* st, int i) {
    const unsigned char* p = sqlite3_column_text(st, i);
    return p ? (const char*)p : "";
}

ResponseRow read_row(sqlite3_stmt* st) {
    ResponseRow r;
    r.reference = column_str(st, 0);
    r.parent_reference = column_str(st, 1);
    r.root_reference = column_str(st, 2);
    r.status = column_str(st, 3);
    r.description = column_str(st, 4);
    r.content_type = column_str(st, 5);
    r.depth = sqlite3_column_int(st, 6);
    r.imported_at_utc = column_str(st, 7);
    return r;
}

sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw DocflowException(ErrorCode::IoError,
                               std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
    return st;
}

const char* SELECT_COLUMNS =
    "SELECT reference, parent_reference, root_reference, status, description, "
    "content_type, depth, imported_at_utc FROM responses ";

} // namespace

std::vector<ResponseRow> response_rows(const ImporterResponse& root) {
    std::vector<ResponseRow> rows;
    const std::string now = utc_now_iso();
    root.visit([&](const ImporterResponse& r) {
        ResponseRow row;
        row.reference = r.reference();
        row.parent_reference = r.parent_response() ? r.parent_response()->reference() : "";
        row.root_reference = root.reference();
        row.status = status_name(r.status().status());
        row.description = r.status().description();
        if (const Doc* d = r.document()) row.content_type = d->info().content_type;
        row.depth = (int)r.depth();
        row.imported_at_utc = now;
        rows.push_back(std::move(row));
    });
    return rows;
}

SqliteResponseStore::SqliteResponseStore(const std::string& db_path) : path_(db_path) {
    std::error_code ec;
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    sqlite3* db = nullptr;
    if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
        if (db) sqlite3_close(db);
        throw DocflowException(ErrorCode::IoError, "cannot open sqlite: " + path_);
    }
    db_ = db;
}

SqliteResponseStore::~SqliteResponseStore() {
    if (db_) sqlite3_close((sqlite3*)db_);
}

void SqliteResponseStore::init() {
    auto* db = (sqlite3*)db_;
    exec(db, R"SQL(
        PRAGMA journal_mode=WAL;
        PRAGMA synchronous=NORMAL;

        CREATE TABLE IF NOT EXISTS responses (
            reference TEXT NOT NULL PRIMARY KEY,
            parent_reference TEXT,
            root_reference TEXT,
            status TEXT NOT NULL,
            description TEXT,
            content_type TEXT,
            depth INTEGER DEFAULT 0,
            imported_at_utc TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_responses_parent ON responses(parent_reference);
        CREATE INDEX IF NOT EXISTS idx_responses_root   ON responses(root_reference);
    )SQL");
}

void SqliteResponseStore::process(ImporterResponse& response) {
    upsert_rows(response_rows(response));
}

void SqliteResponseStore::upsert_rows(const std::vector<ResponseRow>& rows) {
    if (rows.empty()) return;

    auto* db = (sqlite3*)db_;
    sqlite3_busy_timeout(db, 5000);

    const char* sql = R"SQL(
        INSERT INTO responses(reference, parent_reference, root_reference, status, description, content_type, depth, imported_at_utc)
        VALUES(?,?,?,?,?,?,?,?)
        ON CONFLICT(reference) DO UPDATE SET
            parent_reference=excluded.parent_reference,
            root_reference=excluded.root_reference,
            status=excluded.status,
            description=excluded.description,
            content_type=excluded.content_type,
            depth=excluded.depth,
            imported_at_utc=excluded.imported_at_utc;
    )SQL";

    sqlite3_stmt* st = nullptr;

    exec(db, "BEGIN IMMEDIATE;");
    try {
        st = prepare(db, sql);

        for (const auto& r : rows) {
            sqlite3_reset(st);
            sqlite3_clear_bindings(st);

            sqlite3_bind_text(st, 1, r.reference.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st, 2, r.parent_reference.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st, 3, r.root_reference.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st, 4, r.status.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st, 5, r.description.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st, 6, r.content_type.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int (st, 7, r.depth);
            sqlite3_bind_text(st, 8, r.imported_at_utc.c_str(), -1, SQLITE_TRANSIENT);

            if (sqlite3_step(st) != SQLITE_DONE) {
                throw DocflowException(ErrorCode::IoError,
                                       std::string("sqlite step failed: ") + sqlite3_errmsg(db));
            }
        }

        sqlite3_finalize(st);
        st = nullptr;

        exec(db, "COMMIT;");
    } catch (const std::exception&) {
        if (st) sqlite3_finalize(st);
        try {
            exec(db, "ROLLBACK;");
        } catch (const std::exception& re) {
            log_warn(std::string("sqlite rollback failed: ") + re.what());
        }
        throw;
    }
}

std::optional<ResponseRow> SqliteResponseStore::get(const std::string& reference) {
    auto* db = (sqlite3*)db_;
    const std::string sql = std::string(SELECT_COLUMNS) + "WHERE reference=? LIMIT 1;";
    sqlite3_stmt* st = prepare(db, sql.c_str());
    sqlite3_bind_text(st, 1, reference.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<ResponseRow> out;
    if (sqlite3_step(st) == SQLITE_ROW) out = read_row(st);
    sqlite3_finalize(st);
    return out;
}

std::vector<ResponseRow> SqliteResponseStore::list_children(const std::string& parent_reference) {
    auto* db = (sqlite3*)db_;
    const std::string sql = std::string(SELECT_COLUMNS) +
                            "WHERE parent_reference=? ORDER BY rowid ASC;";
    sqlite3_stmt* st = prepare(db, sql.c_str());
    sqlite3_bind_text(st, 1, parent_reference.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ResponseRow> out;
    while (sqlite3_step(st) == SQLITE_ROW) out.push_back(read_row(st));
    sqlite3_finalize(st);
    return out;
}

std::vector<ResponseRow> SqliteResponseStore::list(int limit, int offset) {
    auto* db = (sqlite3*)db_;
    const std::string sql = std::string(SELECT_COLUMNS) + "ORDER BY rowid ASC LIMIT ? OFFSET ?;";
    sqlite3_stmt* st = prepare(db, sql.c_str());
    sqlite3_bind_int(st, 1, limit);
    sqlite3_bind_int(st, 2, offset);

    std::vector<ResponseRow> out;
    while (sqlite3_step(st) == SQLITE_ROW) out.push_back(read_row(st));
    sqlite3_finalize(st);
    return out;
}

int64_t SqliteResponseStore::count() {
    auto* db = (sqlite3*)db_;
    sqlite3_stmt* st = prepare(db, "SELECT COUNT(*) FROM responses;");
    int64_t n = 0;
    if (sqlite3_step(st) == SQLITE_ROW) n = sqlite3_column_int64(st, 0);
    sqlite3_finalize(st);
    return n;
}

} // namespace docflow
