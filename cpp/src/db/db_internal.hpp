#pragma once

#include <mutex>
#include <string>
#include <string_view>

#include <sqlite3.h>

#include "medley/core/errors.hpp"
#include "medley/db/db.hpp"

namespace medley::db {

enum class SchemaFlavor : u32 {
    None = 0,
    Catalog = 1,
    Mirror = 2,
};

struct DbConn {
    sqlite3* db{nullptr};
    // Held for the duration of a transaction, and per call otherwise.
    std::recursive_mutex mutex;
    std::string path;
    SchemaFlavor flavor{SchemaFlavor::None};
    bool in_txn{false};
};

// Finalizes on scope exit.
class Stmt {
public:
    Stmt(sqlite3* db, const char* sql) noexcept {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Stmt() { sqlite3_finalize(stmt_); }

    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;

    [[nodiscard]] bool ok() const noexcept { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
    int rc_{SQLITE_ERROR};
};

[[nodiscard]] inline medley::core::Status db_error(medley::core::StatusCode code, int rc = 0) noexcept {
    return medley::core::make_status(medley::core::StatusDomain::Db, code, static_cast<medley::core::u32>(rc));
}

// Maps a failed sqlite3_step() result code.
[[nodiscard]] inline medley::core::Status step_error(int rc) noexcept {
    const int primary = rc & 0xff;
    if (primary == SQLITE_CONSTRAINT) {
        return db_error(medley::core::StatusCode::Conflict, rc);
    }
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        return db_error(medley::core::StatusCode::Busy, rc);
    }
    if (primary == SQLITE_IOERR || primary == SQLITE_FULL) {
        return db_error(medley::core::StatusCode::Io, rc);
    }
    return db_error(medley::core::StatusCode::Unknown, rc);
}

[[nodiscard]] inline bool exec_sql(sqlite3* db, const char* sql) noexcept {
    if (!db || !sql) return false;
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (err_msg) sqlite3_free(err_msg);
    return rc == SQLITE_OK;
}

inline void bind_text(sqlite3_stmt* stmt, int idx, std::string_view v) noexcept {
    sqlite3_bind_text(stmt, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

inline void bind_id(sqlite3_stmt* stmt, int idx, medley::core::u64 v) noexcept {
    sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(v));
}

[[nodiscard]] inline medley::core::u64 column_id(sqlite3_stmt* stmt, int col) noexcept {
    return static_cast<medley::core::u64>(sqlite3_column_int64(stmt, col));
}

[[nodiscard]] inline std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* t = sqlite3_column_text(stmt, col);
    if (t == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

// Nested-safe atomic section: works inside or outside db_txn_begin.
class Savepoint {
public:
    explicit Savepoint(sqlite3* db) noexcept : db_(db) {
        active_ = exec_sql(db_, "SAVEPOINT medley_sp");
    }
    ~Savepoint() {
        if (active_) {
            (void)exec_sql(db_, "ROLLBACK TO medley_sp");
            (void)exec_sql(db_, "RELEASE medley_sp");
        }
    }

    Savepoint(const Savepoint&) = delete;
    Savepoint& operator=(const Savepoint&) = delete;

    [[nodiscard]] bool ok() const noexcept { return active_; }

    [[nodiscard]] bool release() noexcept {
        if (!active_) {
            return false;
        }
        active_ = false;
        return exec_sql(db_, "RELEASE medley_sp");
    }

private:
    sqlite3* db_{nullptr};
    bool active_{false};
};

// Runs the shared tables plus the given songs DDL and records the flavor.
[[nodiscard]] medley::core::Status install_schema(DbHandle db, const char* songs_sql, SchemaFlavor flavor) noexcept;

} // namespace medley::db
