#include "medley/library/backend.hpp"

#include "medley/db/catalog.hpp"

namespace medley::library {

using namespace medley::core;
namespace db = medley::db;

// ============================================================================
// SqliteBackend
// ============================================================================

Status SqliteBackend::find_by_hash(const Hash256& hash, FileRecord* out) noexcept {
    return db::db_file_find_by_hash(db_, hash, out);
}

Status SqliteBackend::get_file(FileId id, FileRecord* out) noexcept {
    return db::db_file_get(db_, id, out);
}

Status SqliteBackend::create_file(const FileRecord& file, FileId* out) noexcept {
    return db::db_file_create(db_, file, out);
}

Status SqliteBackend::increment_ref(FileId id, db::FileRefChange* out) noexcept {
    return db::db_file_increment_ref(db_, id, out);
}

Status SqliteBackend::decrement_ref(FileId id, db::FileRefChange* out) noexcept {
    return db::db_file_decrement_ref(db_, id, out);
}

Status SqliteBackend::delete_file_if_unreferenced(FileId id, bool* deleted) noexcept {
    return db::db_file_delete_if_unreferenced(db_, id, deleted);
}

Status SqliteBackend::create_song(const SongRecord& song, SongId* out) noexcept {
    return db::db_song_create(db_, song, out);
}

Status SqliteBackend::txn_begin(db::DbTxn* out) noexcept {
    return db::db_txn_begin(db_, out);
}

Status SqliteBackend::txn_commit(db::DbTxn txn) noexcept {
    return db::db_txn_commit(txn);
}

Status SqliteBackend::txn_rollback(db::DbTxn txn) noexcept {
    return db::db_txn_rollback(txn);
}

Status SqliteBackend::get_library(LibraryId id, LibraryRecord* out) noexcept {
    return db::db_library_get(db_, id, out);
}

Status SqliteBackend::list_library_songs(LibraryId id, std::vector<SongRecord>* out) noexcept {
    return db::db_song_list_by_library(db_, id, out);
}

Status SqliteBackend::get_song(SongId id, SongRecord* out) noexcept {
    return db::db_song_get(db_, id, out);
}

Status SqliteBackend::delete_song_row(SongId id) noexcept {
    return db::db_song_delete(db_, id);
}

Status SqliteBackend::delete_library_row(LibraryId id) noexcept {
    return db::db_library_delete(db_, id);
}

Status SqliteBackend::delete_playlist_links(const std::vector<SongId>& songs, u64* removed) noexcept {
    return db::db_playlist_songs_delete_for_songs(db_, songs, removed);
}

Status SqliteBackend::get_playlist(PlaylistId id, PlaylistRecord* out) noexcept {
    return db::db_playlist_get(db_, id, out);
}

Status SqliteBackend::delete_playlist_entries(PlaylistId id, u64* removed) noexcept {
    return db::db_playlist_songs_delete_for_playlist(db_, id, removed);
}

Status SqliteBackend::delete_playlist_row(PlaylistId id) noexcept {
    return db::db_playlist_delete(db_, id);
}

// ============================================================================
// CatalogBackend
// ============================================================================

std::string CatalogBackend::purge_key(const SongRecord& /*song*/, const db::FileRefChange& purged) const {
    return purged.storage_key;
}

Status CatalogBackend::put_blob(std::string_view key, medley::storage::BufferView data,
                                std::string_view content_type) noexcept {
    return blobs_.put(key, data, content_type);
}

Status CatalogBackend::delete_blob(std::string_view key) noexcept {
    return blobs_.remove(key);
}

// ============================================================================
// MirrorBackend
// ============================================================================

std::string MirrorBackend::purge_key(const SongRecord& song, const db::FileRefChange& /*purged*/) const {
    return song.stream_url;
}

Status MirrorBackend::put_blob(std::string_view key, medley::storage::BufferView data,
                               std::string_view /*content_type*/) noexcept {
    return cache_.put(key, data);
}

Status MirrorBackend::delete_blob(std::string_view key) noexcept {
    return cache_.remove(key);
}

} // namespace medley::library
