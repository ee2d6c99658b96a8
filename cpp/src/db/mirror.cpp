#include "medley/db/mirror.hpp"
#include "db_internal.hpp"

#include <mutex>

namespace medley::db {

using namespace medley::core;

namespace {
    // file_id is nullable: songs cached before file dedup existed have none.
    constexpr const char* kMirrorSongsSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS songs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_id INTEGER REFERENCES files(id),
            library_id INTEGER NOT NULL,
            title TEXT,
            artist TEXT,
            album TEXT,
            album_artist TEXT,
            year INTEGER,
            genre TEXT,
            track_number INTEGER,
            disc_number INTEGER,
            composer TEXT,
            duration_sec INTEGER,
            bitrate_kbps INTEGER,
            sample_rate INTEGER,
            channels INTEGER,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            stream_url TEXT NOT NULL DEFAULT '',
            is_cached INTEGER NOT NULL DEFAULT 0,
            cache_size INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_songs_stream_url ON songs(stream_url);
    )SQL";
} // namespace

Status mirror_install_schema(DbHandle db) noexcept {
    return install_schema(db, kMirrorSongsSQL, SchemaFlavor::Mirror);
}

Status mirror_song_set_stream_url(DbHandle db, SongId id, std::string_view url) noexcept {
    if (!db_handle_valid(db)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    if (conn->flavor != SchemaFlavor::Mirror) {
        return db_error(StatusCode::Unsupported);
    }

    Stmt stmt(conn->db,
              "UPDATE songs SET stream_url = ?, is_cached = 0, cache_size = 0, "
              "updated_at = strftime('%s','now') WHERE id = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_text(stmt.get(), 1, url);
    bind_id(stmt.get(), 2, id.v);

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    if (sqlite3_changes(conn->db) == 0) {
        return db_error(StatusCode::NotFound);
    }
    return ok_status();
}

Status mirror_song_set_cached(DbHandle db, SongId id, bool cached, u64 cache_size) noexcept {
    if (!db_handle_valid(db)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    if (conn->flavor != SchemaFlavor::Mirror) {
        return db_error(StatusCode::Unsupported);
    }

    Stmt stmt(conn->db, "UPDATE songs SET is_cached = ?, cache_size = ?, updated_at = strftime('%s','now') WHERE id = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    sqlite3_bind_int(stmt.get(), 1, cached ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 2, cached ? static_cast<sqlite3_int64>(cache_size) : 0);
    bind_id(stmt.get(), 3, id.v);

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    if (sqlite3_changes(conn->db) == 0) {
        return db_error(StatusCode::NotFound);
    }
    return ok_status();
}

Status mirror_library_stats(DbHandle db, LibraryId library, MirrorLibraryStats* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    if (conn->flavor != SchemaFlavor::Mirror) {
        return db_error(StatusCode::Unsupported);
    }

    Stmt stmt(conn->db,
              "SELECT COUNT(*), COALESCE(SUM(is_cached != 0), 0), "
              "COALESCE(SUM(CASE WHEN is_cached != 0 THEN cache_size ELSE 0 END), 0) "
              "FROM songs WHERE library_id = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, library.v);

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        return step_error(rc);
    }
    out->song_count = static_cast<u64>(sqlite3_column_int64(stmt.get(), 0));
    out->cached_count = static_cast<u64>(sqlite3_column_int64(stmt.get(), 1));
    out->cached_bytes = static_cast<u64>(sqlite3_column_int64(stmt.get(), 2));
    return ok_status();
}

} // namespace medley::db
