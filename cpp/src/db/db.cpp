#include "medley/db/db.hpp"
#include "db_internal.hpp"

#include <cstdlib>
#include <memory>
#include <new>
#include <string>

namespace medley::db {

using namespace medley::core;

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return db_error(StatusCode::Invalid);
    }

    std::unique_ptr<DbConn> conn;
    try {
        conn = std::make_unique<DbConn>();
        conn->path = cfg.path.empty() ? std::string(":memory:") : cfg.path;
    } catch (const std::bad_alloc&) {
        return db_error(StatusCode::Unavailable);
    }

    int rc = sqlite3_open_v2(conn->path.c_str(), &conn->db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(conn->db);
        return db_error(rc == SQLITE_CANTOPEN ? StatusCode::Io : StatusCode::Unknown, rc);
    }

    sqlite3_busy_timeout(conn->db, static_cast<int>(cfg.busy_timeout_ms));

    // WAL by default; in-memory databases silently stay in MEMORY mode.
    const char* journal_mode = std::getenv("MEDLEY_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql;
    try {
        journal_sql = "PRAGMA journal_mode=";
        journal_sql += journal_mode;
    } catch (const std::bad_alloc&) {
        sqlite3_close(conn->db);
        return db_error(StatusCode::Unavailable);
    }
    (void)exec_sql(conn->db, journal_sql.c_str());

    (void)exec_sql(conn->db, "PRAGMA synchronous=NORMAL");
    (void)exec_sql(conn->db, "PRAGMA cache_size=-16000");
    (void)exec_sql(conn->db, "PRAGMA temp_store=MEMORY");

    if (!exec_sql(conn->db, "PRAGMA foreign_keys=ON")) {
        sqlite3_close(conn->db);
        return db_error(StatusCode::Unknown);
    }

    out->conn = conn.release();
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return db_error(StatusCode::Invalid);
    }

    std::unique_ptr<DbConn> conn(db.conn);
    {
        std::lock_guard<std::recursive_mutex> lock(conn->mutex);
        if (conn->in_txn) {
            (void)exec_sql(conn->db, "ROLLBACK");
            conn->in_txn = false;
        }
        const int rc = sqlite3_close(conn->db);
        if (rc != SQLITE_OK) {
            (void)conn.release();  // Still open; the caller keeps the handle.
            return db_error(StatusCode::Busy, rc);
        }
        conn->db = nullptr;
    }
    return ok_status();
}

Status db_filename(DbHandle db, const char** out) noexcept {
    if (!db_handle_valid(db) || out == nullptr) {
        return db_error(StatusCode::Invalid);
    }
    *out = db.conn->path.c_str();
    return ok_status();
}

// ============================================================================
// Transaction Management
// ============================================================================

Status db_txn_begin(DbHandle db, DbTxn* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    conn->mutex.lock();

    if (conn->in_txn) {
        conn->mutex.unlock();
        return db_error(StatusCode::Busy);
    }

    char* err_msg = nullptr;
    const int rc = sqlite3_exec(conn->db, "BEGIN IMMEDIATE", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        sqlite3_free(err_msg);
        conn->mutex.unlock();
        return step_error(rc);
    }

    // The lock taken above stays held until commit or rollback.
    conn->in_txn = true;
    out->conn = conn;
    return ok_status();
}

Status db_txn_commit(DbTxn txn) noexcept {
    if (!db_txn_valid(txn)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = txn.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);
    if (!conn->in_txn) {
        return db_error(StatusCode::Invalid);
    }

    char* err_msg = nullptr;
    const int rc = sqlite3_exec(conn->db, "COMMIT", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        sqlite3_free(err_msg);
        (void)exec_sql(conn->db, "ROLLBACK");
    }

    conn->in_txn = false;
    conn->mutex.unlock();  // Pairs with the lock taken in db_txn_begin
    return rc == SQLITE_OK ? ok_status() : step_error(rc);
}

Status db_txn_rollback(DbTxn txn) noexcept {
    if (!db_txn_valid(txn)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = txn.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);
    if (!conn->in_txn) {
        // Already finished (e.g. a failed commit rolled back itself).
        return ok_status();
    }

    const bool ok = exec_sql(conn->db, "ROLLBACK");
    conn->in_txn = false;
    conn->mutex.unlock();  // Pairs with the lock taken in db_txn_begin
    return ok ? ok_status() : db_error(StatusCode::Unknown);
}

} // namespace medley::db
