#pragma once

#include <string>
#include <type_traits>

#include "medley/core/errors.hpp"
#include "medley/core/types.hpp"

namespace medley::db {
    using u32 = medley::core::u32;

    struct DbConn;

    struct DbConfig {
        std::string path;             // empty = ":memory:"
        u32 busy_timeout_ms{5000};
    };

    struct DbHandle {
        DbConn* conn{nullptr};
    };

    struct DbTxn {
        DbConn* conn{nullptr};
    };

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle db) noexcept { return db.conn != nullptr; }
    [[nodiscard]] constexpr bool db_txn_valid(DbTxn txn) noexcept { return txn.conn != nullptr; }

    // Journal mode comes from MEDLEY_DB_JOURNAL_MODE (default WAL).
    [[nodiscard]] medley::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    medley::core::Status db_close(DbHandle db) noexcept;

    // Write transaction (BEGIN IMMEDIATE). The connection is held exclusively by the
    // calling thread until commit or rollback; other threads' calls block meanwhile.
    // Nested transactions are rejected with Busy.
    [[nodiscard]] medley::core::Status db_txn_begin(DbHandle db, DbTxn* out) noexcept;
    [[nodiscard]] medley::core::Status db_txn_commit(DbTxn txn) noexcept;
    medley::core::Status db_txn_rollback(DbTxn txn) noexcept;

    // Path the connection was opened with (":memory:" for in-memory databases).
    [[nodiscard]] medley::core::Status db_filename(DbHandle db, const char** out) noexcept;

    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_trivially_copyable_v<DbTxn>);
    static_assert(std::is_standard_layout_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbTxn>);

} // namespace medley::db
