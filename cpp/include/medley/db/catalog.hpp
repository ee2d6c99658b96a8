#pragma once

#include <string>
#include <vector>

#include "medley/core/errors.hpp"
#include "medley/core/models.hpp"
#include "medley/db/db.hpp"

// Relational records shared by both tiers. The server catalog and the client
// mirror install the same tables (the mirror adds stream/cache columns to songs
// and allows songs without a file), so every query here runs against either.
namespace medley::db {
    using i64 = medley::core::i64;
    using u64 = medley::core::u64;

    // Installs the server-side schema. Idempotent.
    [[nodiscard]] medley::core::Status catalog_install_schema(DbHandle db) noexcept;

    // ------------------------------------------------------------------------
    // Files
    // ------------------------------------------------------------------------

    struct FileRefChange {
        i64 ref_count{0};
        std::string storage_key;
    };

    struct FileRefAudit {
        medley::core::FileId file_id{};
        i64 ref_count{0};
        i64 song_count{0};
        std::string storage_key;
    };

    [[nodiscard]] medley::core::Status db_file_find_by_hash(DbHandle db, const medley::core::Hash256& hash,
        medley::core::FileRecord* out) noexcept;

    [[nodiscard]] medley::core::Status db_file_get(DbHandle db, medley::core::FileId id,
        medley::core::FileRecord* out) noexcept;

    // Conflict when a file with the same hash already exists.
    [[nodiscard]] medley::core::Status db_file_create(DbHandle db, const medley::core::FileRecord& file,
        medley::core::FileId* out) noexcept;

    // Single-statement increment/decrement returning the new count. NotFound when the row is gone.
    [[nodiscard]] medley::core::Status db_file_increment_ref(DbHandle db, medley::core::FileId id,
        FileRefChange* out) noexcept;
    [[nodiscard]] medley::core::Status db_file_decrement_ref(DbHandle db, medley::core::FileId id,
        FileRefChange* out) noexcept;

    // Sets ref_count to the number of songs pointing at the file, in the same statement.
    [[nodiscard]] medley::core::Status db_file_recount_ref(DbHandle db, medley::core::FileId id,
        FileRefChange* out) noexcept;

    // Deletes the row only while ref_count <= 0; *deleted reports whether it did.
    [[nodiscard]] medley::core::Status db_file_delete_if_unreferenced(DbHandle db, medley::core::FileId id,
        bool* deleted) noexcept;

    [[nodiscard]] medley::core::Status db_file_set_ref_count(DbHandle db, medley::core::FileId id,
        i64 ref_count) noexcept;

    [[nodiscard]] medley::core::Status db_file_list(DbHandle db, std::vector<medley::core::FileRecord>* out) noexcept;

    // Every file with its stored ref_count and the number of songs pointing at it.
    [[nodiscard]] medley::core::Status db_file_ref_audit(DbHandle db, std::vector<FileRefAudit>* out) noexcept;

    // ------------------------------------------------------------------------
    // Libraries
    // ------------------------------------------------------------------------

    [[nodiscard]] medley::core::Status db_library_create(DbHandle db, const medley::core::LibraryRecord& library,
        medley::core::LibraryId* out) noexcept;

    [[nodiscard]] medley::core::Status db_library_get(DbHandle db, medley::core::LibraryId id,
        medley::core::LibraryRecord* out) noexcept;

    [[nodiscard]] medley::core::Status db_library_list_by_owner(DbHandle db, medley::core::UserId owner,
        std::vector<medley::core::LibraryRecord>* out) noexcept;

    // Unlinks playlists that pointed at the library. Songs are not touched.
    [[nodiscard]] medley::core::Status db_library_delete(DbHandle db, medley::core::LibraryId id) noexcept;

    // ------------------------------------------------------------------------
    // Songs
    // ------------------------------------------------------------------------

    // Bumps the owning library's song_count.
    [[nodiscard]] medley::core::Status db_song_create(DbHandle db, const medley::core::SongRecord& song,
        medley::core::SongId* out) noexcept;

    [[nodiscard]] medley::core::Status db_song_get(DbHandle db, medley::core::SongId id,
        medley::core::SongRecord* out) noexcept;

    // Lists by songs.library_id, so songs left behind by a deleted library are still found.
    [[nodiscard]] medley::core::Status db_song_list_by_library(DbHandle db, medley::core::LibraryId library,
        std::vector<medley::core::SongRecord>* out) noexcept;

    // Lowers the owning library's song_count. NotFound when absent.
    [[nodiscard]] medley::core::Status db_song_delete(DbHandle db, medley::core::SongId id) noexcept;

    // Songs whose library row no longer exists.
    [[nodiscard]] medley::core::Status db_song_list_orphaned(DbHandle db,
        std::vector<medley::core::SongRecord>* out) noexcept;

    // ------------------------------------------------------------------------
    // Playlists
    // ------------------------------------------------------------------------

    [[nodiscard]] medley::core::Status db_playlist_create(DbHandle db, const medley::core::PlaylistRecord& playlist,
        medley::core::PlaylistId* out) noexcept;

    [[nodiscard]] medley::core::Status db_playlist_get(DbHandle db, medley::core::PlaylistId id,
        medley::core::PlaylistRecord* out) noexcept;

    [[nodiscard]] medley::core::Status db_playlist_delete(DbHandle db, medley::core::PlaylistId id) noexcept;

    // Conflict when the song is already on the playlist.
    [[nodiscard]] medley::core::Status db_playlist_song_add(DbHandle db, const medley::core::PlaylistSongRecord& link) noexcept;

    [[nodiscard]] medley::core::Status db_playlist_song_list(DbHandle db, medley::core::PlaylistId playlist,
        std::vector<medley::core::PlaylistSongRecord>* out) noexcept;

    // Removes every playlist entry that references one of the songs, in any
    // playlist, and lowers those playlists' song_count. Atomic.
    [[nodiscard]] medley::core::Status db_playlist_songs_delete_for_songs(DbHandle db,
        const std::vector<medley::core::SongId>& songs, u64* removed) noexcept;

    [[nodiscard]] medley::core::Status db_playlist_songs_delete_for_playlist(DbHandle db,
        medley::core::PlaylistId playlist, u64* removed) noexcept;

} // namespace medley::db
