#include "medley/db/catalog.hpp"
#include "db_internal.hpp"

#include <cstring>
#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace medley::db {

using namespace medley::core;

// Song columns in read order. The mirror appends stream_url, is_cached, cache_size.
#define MEDLEY_SONG_COLUMNS                                                                     \
    "id, file_id, library_id, title, artist, album, album_artist, year, genre, track_number, " \
    "disc_number, composer, duration_sec, bitrate_kbps, sample_rate, channels, created_at, updated_at"
#define MEDLEY_MIRROR_SONG_COLUMNS MEDLEY_SONG_COLUMNS ", stream_url, is_cached, cache_size"

#define MEDLEY_FILE_COLUMNS                                                                     \
    "id, hash, storage_key, size_bytes, mime_type, duration_sec, bitrate_kbps, sample_rate, "  \
    "channels, ref_count, created_at"

namespace {

    constexpr const char* kSharedSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            hash BLOB NOT NULL UNIQUE,
            storage_key TEXT NOT NULL,
            size_bytes INTEGER NOT NULL,
            mime_type TEXT NOT NULL,
            duration_sec INTEGER,
            bitrate_kbps INTEGER,
            sample_rate INTEGER,
            channels INTEGER,
            ref_count INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS libraries (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner_id INTEGER NOT NULL,
            name TEXT NOT NULL,
            song_count INTEGER NOT NULL DEFAULT 0,
            can_delete INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_libraries_owner ON libraries(owner_id);

        CREATE TABLE IF NOT EXISTS playlists (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner_id INTEGER NOT NULL,
            name TEXT NOT NULL,
            song_count INTEGER NOT NULL DEFAULT 0,
            linked_library_id INTEGER,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_playlists_owner ON playlists(owner_id);
    )SQL";

    // Runs after the flavor-specific songs table exists.
    constexpr const char* kLinkSchemaSQL = R"SQL(
        CREATE INDEX IF NOT EXISTS idx_songs_library ON songs(library_id);
        CREATE INDEX IF NOT EXISTS idx_songs_file ON songs(file_id);

        CREATE TABLE IF NOT EXISTS playlist_songs (
            playlist_id INTEGER NOT NULL REFERENCES playlists(id) ON DELETE CASCADE,
            song_id INTEGER NOT NULL REFERENCES songs(id) ON DELETE CASCADE,
            position INTEGER NOT NULL DEFAULT 0,
            added_at INTEGER NOT NULL,
            PRIMARY KEY (playlist_id, song_id)
        );
        CREATE INDEX IF NOT EXISTS idx_playlist_songs_song ON playlist_songs(song_id);
    )SQL";

    // songs.library_id carries no foreign key: a best-effort library delete can
    // leave failed songs behind, and a retry finds them by library_id.
    constexpr const char* kCatalogSongsSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS songs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_id INTEGER NOT NULL REFERENCES files(id),
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
            updated_at INTEGER NOT NULL
        );
    )SQL";

    [[nodiscard]] Timestamp now_seconds() noexcept {
        return static_cast<Timestamp>(std::time(nullptr));
    }

    [[nodiscard]] bool table_has_column(sqlite3* db, const char* table, const char* column) noexcept {
        if (!db || !table || !column) {
            return false;
        }
        std::string sql = "PRAGMA table_info(";
        sql += table;
        sql += ")";

        Stmt stmt(db, sql.c_str());
        if (!stmt.ok()) {
            return false;
        }

        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
            if (name && std::strcmp(name, column) == 0) {
                return true;
            }
        }
        return false;
    }

    void bind_opt_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& v) noexcept {
        if (v) {
            bind_text(stmt, idx, *v);
        } else {
            sqlite3_bind_null(stmt, idx);
        }
    }

    void bind_opt_u32(sqlite3_stmt* stmt, int idx, const std::optional<u32>& v) noexcept {
        if (v) {
            sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(*v));
        } else {
            sqlite3_bind_null(stmt, idx);
        }
    }

    [[nodiscard]] std::optional<std::string> column_opt_text(sqlite3_stmt* stmt, int col) {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return column_text(stmt, col);
    }

    [[nodiscard]] std::optional<u32> column_opt_u32(sqlite3_stmt* stmt, int col) noexcept {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return static_cast<u32>(sqlite3_column_int64(stmt, col));
    }

    void bind_physical(sqlite3_stmt* stmt, int first, const PhysicalProperties& p) noexcept {
        bind_opt_u32(stmt, first, p.duration_sec);
        bind_opt_u32(stmt, first + 1, p.bitrate_kbps);
        bind_opt_u32(stmt, first + 2, p.sample_rate);
        bind_opt_u32(stmt, first + 3, p.channels);
    }

    void read_physical(sqlite3_stmt* stmt, int first, PhysicalProperties* out) noexcept {
        out->duration_sec = column_opt_u32(stmt, first);
        out->bitrate_kbps = column_opt_u32(stmt, first + 1);
        out->sample_rate = column_opt_u32(stmt, first + 2);
        out->channels = column_opt_u32(stmt, first + 3);
    }

    void read_file_row(sqlite3_stmt* stmt, FileRecord* out) {
        out->id = FileId{column_id(stmt, 0)};
        const void* hash_blob = sqlite3_column_blob(stmt, 1);
        if (hash_blob && sqlite3_column_bytes(stmt, 1) == static_cast<int>(out->hash.b.size())) {
            std::memcpy(out->hash.b.data(), hash_blob, out->hash.b.size());
        } else {
            out->hash = Hash256{};
        }
        out->storage_key = column_text(stmt, 2);
        out->size_bytes = static_cast<u64>(sqlite3_column_int64(stmt, 3));
        out->mime_type = column_text(stmt, 4);
        read_physical(stmt, 5, &out->physical);
        out->ref_count = sqlite3_column_int64(stmt, 9);
        out->created_at = sqlite3_column_int64(stmt, 10);
    }

    void read_song_row(sqlite3_stmt* stmt, bool mirror, SongRecord* out) {
        out->id = SongId{column_id(stmt, 0)};
        out->file_id = sqlite3_column_type(stmt, 1) == SQLITE_NULL ? FileId::invalid() : FileId{column_id(stmt, 1)};
        out->library_id = LibraryId{column_id(stmt, 2)};
        out->tags.title = column_opt_text(stmt, 3);
        out->tags.artist = column_opt_text(stmt, 4);
        out->tags.album = column_opt_text(stmt, 5);
        out->tags.album_artist = column_opt_text(stmt, 6);
        out->tags.year = column_opt_u32(stmt, 7);
        out->tags.genre = column_opt_text(stmt, 8);
        out->tags.track_number = column_opt_u32(stmt, 9);
        out->tags.disc_number = column_opt_u32(stmt, 10);
        out->tags.composer = column_opt_text(stmt, 11);
        read_physical(stmt, 12, &out->tags.physical);
        out->created_at = sqlite3_column_int64(stmt, 16);
        out->updated_at = sqlite3_column_int64(stmt, 17);
        if (mirror) {
            out->stream_url = column_text(stmt, 18);
            out->is_cached = sqlite3_column_int(stmt, 19) != 0;
            out->cache_size = static_cast<u64>(sqlite3_column_int64(stmt, 20));
        } else {
            out->stream_url.clear();
            out->is_cached = false;
            out->cache_size = 0;
        }
    }

    void read_library_row(sqlite3_stmt* stmt, LibraryRecord* out) {
        out->id = LibraryId{column_id(stmt, 0)};
        out->owner = UserId{column_id(stmt, 1)};
        out->name = column_text(stmt, 2);
        out->song_count = static_cast<u32>(sqlite3_column_int64(stmt, 3));
        out->can_delete = sqlite3_column_int(stmt, 4) != 0;
        out->created_at = sqlite3_column_int64(stmt, 5);
    }

    void read_playlist_row(sqlite3_stmt* stmt, PlaylistRecord* out) {
        out->id = PlaylistId{column_id(stmt, 0)};
        out->owner = UserId{column_id(stmt, 1)};
        out->name = column_text(stmt, 2);
        out->song_count = static_cast<u32>(sqlite3_column_int64(stmt, 3));
        out->linked_library = sqlite3_column_type(stmt, 4) == SQLITE_NULL ? LibraryId::invalid()
                                                                           : LibraryId{column_id(stmt, 4)};
        out->created_at = sqlite3_column_int64(stmt, 5);
    }

    [[nodiscard]] bool is_mirror(const DbConn* conn) noexcept {
        return conn->flavor == SchemaFlavor::Mirror;
    }

    // Applies a ref_count delta and reads back the new value in one statement.
    [[nodiscard]] Status file_ref_delta(DbHandle db, FileId id, const char* sql, FileRefChange* out) noexcept {
        if (!db_handle_valid(db) || !out || !id.is_valid()) {
            return db_error(StatusCode::Invalid);
        }

        DbConn* conn = db.conn;
        std::lock_guard<std::recursive_mutex> lock(conn->mutex);

        Stmt stmt(conn->db, sql);
        if (!stmt.ok()) {
            return db_error(StatusCode::Unknown);
        }
        bind_id(stmt.get(), 1, id.v);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return db_error(StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) {
            return step_error(rc);
        }

        out->ref_count = sqlite3_column_int64(stmt.get(), 0);
        out->storage_key = column_text(stmt.get(), 1);

        rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            return step_error(rc);
        }
        return ok_status();
    }

    // Shared body for single-row "DELETE ... WHERE id = ?" statements.
    [[nodiscard]] Status delete_by_id(DbConn* conn, const char* sql, u64 id) noexcept {
        Stmt stmt(conn->db, sql);
        if (!stmt.ok()) {
            return db_error(StatusCode::Unknown);
        }
        bind_id(stmt.get(), 1, id);
        const int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            return step_error(rc);
        }
        if (sqlite3_changes(conn->db) == 0) {
            return db_error(StatusCode::NotFound);
        }
        return ok_status();
    }

    [[nodiscard]] Status exec_bound_id(DbConn* conn, const char* sql, u64 id) noexcept {
        Stmt stmt(conn->db, sql);
        if (!stmt.ok()) {
            return db_error(StatusCode::Unknown);
        }
        bind_id(stmt.get(), 1, id);
        const int rc = sqlite3_step(stmt.get());
        return rc == SQLITE_DONE ? ok_status() : step_error(rc);
    }

} // namespace

// ============================================================================
// Schema
// ============================================================================

Status install_schema(DbHandle db, const char* songs_sql, SchemaFlavor flavor) noexcept {
    if (!db_handle_valid(db) || songs_sql == nullptr) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    if (!exec_sql(conn->db, kSharedSchemaSQL) || !exec_sql(conn->db, songs_sql) ||
        !exec_sql(conn->db, kLinkSchemaSQL)) {
        return db_error(StatusCode::Unknown);
    }

    // A database created for the other tier keeps its songs table; refuse it.
    const bool has_stream_url = table_has_column(conn->db, "songs", "stream_url");
    if (has_stream_url != (flavor == SchemaFlavor::Mirror)) {
        return db_error(StatusCode::Unsupported);
    }

    conn->flavor = flavor;
    return ok_status();
}

Status catalog_install_schema(DbHandle db) noexcept {
    return install_schema(db, kCatalogSongsSQL, SchemaFlavor::Catalog);
}

// ============================================================================
// Files
// ============================================================================

Status db_file_find_by_hash(DbHandle db, const Hash256& hash, FileRecord* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db, "SELECT " MEDLEY_FILE_COLUMNS " FROM files WHERE hash = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    sqlite3_bind_blob(stmt.get(), 1, hash.b.data(), static_cast<int>(hash.b.size()), SQLITE_STATIC);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        read_file_row(stmt.get(), out);
        return ok_status();
    }
    return rc == SQLITE_DONE ? db_error(StatusCode::NotFound) : step_error(rc);
}

Status db_file_get(DbHandle db, FileId id, FileRecord* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db, "SELECT " MEDLEY_FILE_COLUMNS " FROM files WHERE id = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, id.v);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        read_file_row(stmt.get(), out);
        return ok_status();
    }
    return rc == SQLITE_DONE ? db_error(StatusCode::NotFound) : step_error(rc);
}

Status db_file_create(DbHandle db, const FileRecord& file, FileId* out) noexcept {
    if (!db_handle_valid(db) || !out || file.storage_key.empty()) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db,
              "INSERT INTO files (hash, storage_key, size_bytes, mime_type, duration_sec, bitrate_kbps, "
              "sample_rate, channels, ref_count, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }

    sqlite3_bind_blob(stmt.get(), 1, file.hash.b.data(), static_cast<int>(file.hash.b.size()), SQLITE_STATIC);
    bind_text(stmt.get(), 2, file.storage_key);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(file.size_bytes));
    bind_text(stmt.get(), 4, file.mime_type);
    bind_physical(stmt.get(), 5, file.physical);
    sqlite3_bind_int64(stmt.get(), 9, file.ref_count);
    sqlite3_bind_int64(stmt.get(), 10, file.created_at != 0 ? file.created_at : now_seconds());

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        // Unique violation on hash surfaces as Conflict.
        return step_error(rc);
    }

    *out = FileId{static_cast<u64>(sqlite3_last_insert_rowid(conn->db))};
    return ok_status();
}

Status db_file_increment_ref(DbHandle db, FileId id, FileRefChange* out) noexcept {
    return file_ref_delta(db, id,
                          "UPDATE files SET ref_count = ref_count + 1 WHERE id = ? "
                          "RETURNING ref_count, storage_key",
                          out);
}

Status db_file_decrement_ref(DbHandle db, FileId id, FileRefChange* out) noexcept {
    return file_ref_delta(db, id,
                          "UPDATE files SET ref_count = ref_count - 1 WHERE id = ? "
                          "RETURNING ref_count, storage_key",
                          out);
}

Status db_file_recount_ref(DbHandle db, FileId id, FileRefChange* out) noexcept {
    return file_ref_delta(db, id,
                          "UPDATE files SET ref_count = "
                          "(SELECT COUNT(*) FROM songs WHERE songs.file_id = files.id) WHERE id = ? "
                          "RETURNING ref_count, storage_key",
                          out);
}

Status db_file_delete_if_unreferenced(DbHandle db, FileId id, bool* deleted) noexcept {
    if (!db_handle_valid(db) || !deleted) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db, "DELETE FROM files WHERE id = ? AND ref_count <= 0");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, id.v);

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    *deleted = sqlite3_changes(conn->db) > 0;
    return ok_status();
}

Status db_file_set_ref_count(DbHandle db, FileId id, i64 ref_count) noexcept {
    if (!db_handle_valid(db)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db, "UPDATE files SET ref_count = ? WHERE id = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    sqlite3_bind_int64(stmt.get(), 1, ref_count);
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

Status db_file_list(DbHandle db, std::vector<FileRecord>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db, "SELECT " MEDLEY_FILE_COLUMNS " FROM files ORDER BY id");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }

    out->clear();
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        FileRecord rec;
        read_file_row(stmt.get(), &rec);
        out->push_back(std::move(rec));
    }
    return rc == SQLITE_DONE ? ok_status() : step_error(rc);
}

Status db_file_ref_audit(DbHandle db, std::vector<FileRefAudit>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db,
              "SELECT f.id, f.ref_count, (SELECT COUNT(*) FROM songs s WHERE s.file_id = f.id), f.storage_key "
              "FROM files f ORDER BY f.id");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }

    out->clear();
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        FileRefAudit row;
        row.file_id = FileId{column_id(stmt.get(), 0)};
        row.ref_count = sqlite3_column_int64(stmt.get(), 1);
        row.song_count = sqlite3_column_int64(stmt.get(), 2);
        row.storage_key = column_text(stmt.get(), 3);
        out->push_back(std::move(row));
    }
    return rc == SQLITE_DONE ? ok_status() : step_error(rc);
}

// ============================================================================
// Libraries
// ============================================================================

Status db_library_create(DbHandle db, const LibraryRecord& library, LibraryId* out) noexcept {
    if (!db_handle_valid(db) || !out || library.name.empty()) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db,
              "INSERT INTO libraries (owner_id, name, song_count, can_delete, created_at) VALUES (?, ?, 0, ?, ?)");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, library.owner.v);
    bind_text(stmt.get(), 2, library.name);
    sqlite3_bind_int(stmt.get(), 3, library.can_delete ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 4, library.created_at != 0 ? library.created_at : now_seconds());

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    *out = LibraryId{static_cast<u64>(sqlite3_last_insert_rowid(conn->db))};
    return ok_status();
}

Status db_library_get(DbHandle db, LibraryId id, LibraryRecord* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db,
              "SELECT id, owner_id, name, song_count, can_delete, created_at FROM libraries WHERE id = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, id.v);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        read_library_row(stmt.get(), out);
        return ok_status();
    }
    return rc == SQLITE_DONE ? db_error(StatusCode::NotFound) : step_error(rc);
}

Status db_library_list_by_owner(DbHandle db, UserId owner, std::vector<LibraryRecord>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db,
              "SELECT id, owner_id, name, song_count, can_delete, created_at FROM libraries "
              "WHERE owner_id = ? ORDER BY id");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, owner.v);

    out->clear();
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        LibraryRecord rec;
        read_library_row(stmt.get(), &rec);
        out->push_back(std::move(rec));
    }
    return rc == SQLITE_DONE ? ok_status() : step_error(rc);
}

Status db_library_delete(DbHandle db, LibraryId id) noexcept {
    if (!db_handle_valid(db)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Savepoint sp(conn->db);
    if (!sp.ok()) {
        return db_error(StatusCode::Busy);
    }

    Status s = exec_bound_id(conn, "UPDATE playlists SET linked_library_id = NULL WHERE linked_library_id = ?", id.v);
    if (!is_ok(s)) {
        return s;
    }
    s = delete_by_id(conn, "DELETE FROM libraries WHERE id = ?", id.v);
    if (!is_ok(s)) {
        return s;
    }
    return sp.release() ? ok_status() : db_error(StatusCode::Unknown);
}

// ============================================================================
// Songs
// ============================================================================

Status db_song_create(DbHandle db, const SongRecord& song, SongId* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    const bool mirror = is_mirror(conn);
    if (!mirror && !song.file_id.is_valid()) {
        return db_error(StatusCode::Invalid);
    }

    Savepoint sp(conn->db);
    if (!sp.ok()) {
        return db_error(StatusCode::Busy);
    }

    const char* sql = mirror
        ? "INSERT INTO songs (file_id, library_id, title, artist, album, album_artist, year, genre, "
          "track_number, disc_number, composer, duration_sec, bitrate_kbps, sample_rate, channels, "
          "created_at, updated_at, stream_url, is_cached, cache_size) "
          "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
        : "INSERT INTO songs (file_id, library_id, title, artist, album, album_artist, year, genre, "
          "track_number, disc_number, composer, duration_sec, bitrate_kbps, sample_rate, channels, "
          "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    {
        Stmt stmt(conn->db, sql);
        if (!stmt.ok()) {
            return db_error(StatusCode::Unknown);
        }

        sqlite3_stmt* st = stmt.get();
        if (song.file_id.is_valid()) {
            bind_id(st, 1, song.file_id.v);
        } else {
            sqlite3_bind_null(st, 1);
        }
        bind_id(st, 2, song.library_id.v);
        bind_opt_text(st, 3, song.tags.title);
        bind_opt_text(st, 4, song.tags.artist);
        bind_opt_text(st, 5, song.tags.album);
        bind_opt_text(st, 6, song.tags.album_artist);
        bind_opt_u32(st, 7, song.tags.year);
        bind_opt_text(st, 8, song.tags.genre);
        bind_opt_u32(st, 9, song.tags.track_number);
        bind_opt_u32(st, 10, song.tags.disc_number);
        bind_opt_text(st, 11, song.tags.composer);
        bind_physical(st, 12, song.tags.physical);
        const Timestamp created = song.created_at != 0 ? song.created_at : now_seconds();
        sqlite3_bind_int64(st, 16, created);
        sqlite3_bind_int64(st, 17, song.updated_at != 0 ? song.updated_at : created);
        if (mirror) {
            bind_text(st, 18, song.stream_url);
            sqlite3_bind_int(st, 19, song.is_cached ? 1 : 0);
            sqlite3_bind_int64(st, 20, static_cast<sqlite3_int64>(song.cache_size));
        }

        const int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            return step_error(rc);
        }
        *out = SongId{static_cast<u64>(sqlite3_last_insert_rowid(conn->db))};
    }

    const Status s = exec_bound_id(conn, "UPDATE libraries SET song_count = song_count + 1 WHERE id = ?",
                                   song.library_id.v);
    if (!is_ok(s)) {
        return s;
    }
    return sp.release() ? ok_status() : db_error(StatusCode::Unknown);
}

Status db_song_get(DbHandle db, SongId id, SongRecord* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    const bool mirror = is_mirror(conn);
    Stmt stmt(conn->db, mirror ? "SELECT " MEDLEY_MIRROR_SONG_COLUMNS " FROM songs WHERE id = ?"
                               : "SELECT " MEDLEY_SONG_COLUMNS " FROM songs WHERE id = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, id.v);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        read_song_row(stmt.get(), mirror, out);
        return ok_status();
    }
    return rc == SQLITE_DONE ? db_error(StatusCode::NotFound) : step_error(rc);
}

Status db_song_list_by_library(DbHandle db, LibraryId library, std::vector<SongRecord>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    const bool mirror = is_mirror(conn);
    Stmt stmt(conn->db,
              mirror ? "SELECT " MEDLEY_MIRROR_SONG_COLUMNS " FROM songs WHERE library_id = ? ORDER BY id"
                     : "SELECT " MEDLEY_SONG_COLUMNS " FROM songs WHERE library_id = ? ORDER BY id");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, library.v);

    out->clear();
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        SongRecord rec;
        read_song_row(stmt.get(), mirror, &rec);
        out->push_back(std::move(rec));
    }
    return rc == SQLITE_DONE ? ok_status() : step_error(rc);
}

Status db_song_delete(DbHandle db, SongId id) noexcept {
    if (!db_handle_valid(db)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Savepoint sp(conn->db);
    if (!sp.ok()) {
        return db_error(StatusCode::Busy);
    }

    // Playlist entries go with the song (ON DELETE CASCADE); keep their counters in step.
    Status s = exec_bound_id(conn,
        "UPDATE playlists SET song_count = MAX(song_count - 1, 0) "
        "WHERE id IN (SELECT playlist_id FROM playlist_songs WHERE song_id = ?)",
        id.v);
    if (!is_ok(s)) {
        return s;
    }

    u64 library_id = 0;
    {
        Stmt stmt(conn->db, "DELETE FROM songs WHERE id = ? RETURNING library_id");
        if (!stmt.ok()) {
            return db_error(StatusCode::Unknown);
        }
        bind_id(stmt.get(), 1, id.v);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return db_error(StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) {
            return step_error(rc);
        }
        library_id = column_id(stmt.get(), 0);
        rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            return step_error(rc);
        }
    }

    s = exec_bound_id(conn, "UPDATE libraries SET song_count = MAX(song_count - 1, 0) WHERE id = ?", library_id);
    if (!is_ok(s)) {
        return s;
    }
    return sp.release() ? ok_status() : db_error(StatusCode::Unknown);
}

Status db_song_list_orphaned(DbHandle db, std::vector<SongRecord>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    const bool mirror = is_mirror(conn);
    Stmt stmt(conn->db,
              mirror ? "SELECT " MEDLEY_MIRROR_SONG_COLUMNS " FROM songs "
                       "WHERE library_id NOT IN (SELECT id FROM libraries) ORDER BY id"
                     : "SELECT " MEDLEY_SONG_COLUMNS " FROM songs "
                       "WHERE library_id NOT IN (SELECT id FROM libraries) ORDER BY id");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }

    out->clear();
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        SongRecord rec;
        read_song_row(stmt.get(), mirror, &rec);
        out->push_back(std::move(rec));
    }
    return rc == SQLITE_DONE ? ok_status() : step_error(rc);
}

// ============================================================================
// Playlists
// ============================================================================

Status db_playlist_create(DbHandle db, const PlaylistRecord& playlist, PlaylistId* out) noexcept {
    if (!db_handle_valid(db) || !out || playlist.name.empty()) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db,
              "INSERT INTO playlists (owner_id, name, song_count, linked_library_id, created_at) "
              "VALUES (?, ?, 0, ?, ?)");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, playlist.owner.v);
    bind_text(stmt.get(), 2, playlist.name);
    if (playlist.linked_library.is_valid()) {
        bind_id(stmt.get(), 3, playlist.linked_library.v);
    } else {
        sqlite3_bind_null(stmt.get(), 3);
    }
    sqlite3_bind_int64(stmt.get(), 4, playlist.created_at != 0 ? playlist.created_at : now_seconds());

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    *out = PlaylistId{static_cast<u64>(sqlite3_last_insert_rowid(conn->db))};
    return ok_status();
}

Status db_playlist_get(DbHandle db, PlaylistId id, PlaylistRecord* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db,
              "SELECT id, owner_id, name, song_count, linked_library_id, created_at FROM playlists WHERE id = ?");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, id.v);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        read_playlist_row(stmt.get(), out);
        return ok_status();
    }
    return rc == SQLITE_DONE ? db_error(StatusCode::NotFound) : step_error(rc);
}

Status db_playlist_delete(DbHandle db, PlaylistId id) noexcept {
    if (!db_handle_valid(db)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    // playlist_songs rows go with it (ON DELETE CASCADE).
    return delete_by_id(conn, "DELETE FROM playlists WHERE id = ?", id.v);
}

Status db_playlist_song_add(DbHandle db, const PlaylistSongRecord& link) noexcept {
    if (!db_handle_valid(db)) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Savepoint sp(conn->db);
    if (!sp.ok()) {
        return db_error(StatusCode::Busy);
    }

    {
        Stmt stmt(conn->db,
                  "INSERT INTO playlist_songs (playlist_id, song_id, position, added_at) VALUES (?, ?, ?, ?)");
        if (!stmt.ok()) {
            return db_error(StatusCode::Unknown);
        }
        bind_id(stmt.get(), 1, link.playlist_id.v);
        bind_id(stmt.get(), 2, link.song_id.v);
        sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(link.order));
        sqlite3_bind_int64(stmt.get(), 4, link.added_at != 0 ? link.added_at : now_seconds());

        const int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            // Duplicate entry or a missing playlist/song (foreign key).
            return step_error(rc);
        }
    }

    const Status s = exec_bound_id(conn, "UPDATE playlists SET song_count = song_count + 1 WHERE id = ?",
                                   link.playlist_id.v);
    if (!is_ok(s)) {
        return s;
    }
    return sp.release() ? ok_status() : db_error(StatusCode::Unknown);
}

Status db_playlist_song_list(DbHandle db, PlaylistId playlist, std::vector<PlaylistSongRecord>* out) noexcept {
    if (!db_handle_valid(db) || !out) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Stmt stmt(conn->db,
              "SELECT playlist_id, song_id, position, added_at FROM playlist_songs "
              "WHERE playlist_id = ? ORDER BY position, song_id");
    if (!stmt.ok()) {
        return db_error(StatusCode::Unknown);
    }
    bind_id(stmt.get(), 1, playlist.v);

    out->clear();
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        PlaylistSongRecord rec;
        rec.playlist_id = PlaylistId{column_id(stmt.get(), 0)};
        rec.song_id = SongId{column_id(stmt.get(), 1)};
        rec.order = static_cast<u32>(sqlite3_column_int64(stmt.get(), 2));
        rec.added_at = sqlite3_column_int64(stmt.get(), 3);
        out->push_back(rec);
    }
    return rc == SQLITE_DONE ? ok_status() : step_error(rc);
}

Status db_playlist_songs_delete_for_songs(DbHandle db, const std::vector<SongId>& songs, u64* removed) noexcept {
    if (!db_handle_valid(db) || !removed) {
        return db_error(StatusCode::Invalid);
    }

    *removed = 0;
    if (songs.empty()) {
        return ok_status();
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Savepoint sp(conn->db);
    if (!sp.ok()) {
        return db_error(StatusCode::Busy);
    }

    // playlist id -> entries removed from it
    std::map<u64, i64> per_playlist;
    u64 total = 0;
    {
        Stmt del(conn->db, "DELETE FROM playlist_songs WHERE song_id = ? RETURNING playlist_id");
        if (!del.ok()) {
            return db_error(StatusCode::Unknown);
        }
        for (const SongId song : songs) {
            sqlite3_reset(del.get());
            sqlite3_clear_bindings(del.get());
            bind_id(del.get(), 1, song.v);

            int rc;
            while ((rc = sqlite3_step(del.get())) == SQLITE_ROW) {
                ++per_playlist[column_id(del.get(), 0)];
                ++total;
            }
            if (rc != SQLITE_DONE) {
                return step_error(rc);
            }
        }
    }

    {
        Stmt upd(conn->db, "UPDATE playlists SET song_count = MAX(song_count - ?, 0) WHERE id = ?");
        if (!upd.ok()) {
            return db_error(StatusCode::Unknown);
        }
        for (const auto& [playlist_id, count] : per_playlist) {
            sqlite3_reset(upd.get());
            sqlite3_clear_bindings(upd.get());
            sqlite3_bind_int64(upd.get(), 1, count);
            bind_id(upd.get(), 2, playlist_id);
            const int rc = sqlite3_step(upd.get());
            if (rc != SQLITE_DONE) {
                return step_error(rc);
            }
        }
    }

    if (!sp.release()) {
        return db_error(StatusCode::Unknown);
    }
    *removed = total;
    return ok_status();
}

Status db_playlist_songs_delete_for_playlist(DbHandle db, PlaylistId playlist, u64* removed) noexcept {
    if (!db_handle_valid(db) || !removed) {
        return db_error(StatusCode::Invalid);
    }

    DbConn* conn = db.conn;
    std::lock_guard<std::recursive_mutex> lock(conn->mutex);

    Savepoint sp(conn->db);
    if (!sp.ok()) {
        return db_error(StatusCode::Busy);
    }

    Status s = exec_bound_id(conn, "DELETE FROM playlist_songs WHERE playlist_id = ?", playlist.v);
    if (!is_ok(s)) {
        return s;
    }
    const u64 count = static_cast<u64>(sqlite3_changes(conn->db));

    s = exec_bound_id(conn, "UPDATE playlists SET song_count = 0 WHERE id = ?", playlist.v);
    if (!is_ok(s)) {
        return s;
    }
    if (!sp.release()) {
        return db_error(StatusCode::Unknown);
    }
    *removed = count;
    return ok_status();
}

#undef MEDLEY_FILE_COLUMNS
#undef MEDLEY_MIRROR_SONG_COLUMNS
#undef MEDLEY_SONG_COLUMNS

} // namespace medley::db
