#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "medley/core/errors.hpp"
#include "medley/core/models.hpp"
#include "medley/db/catalog.hpp"
#include "medley/db/db.hpp"
#include "medley/storage/binary_cache.hpp"
#include "medley/storage/blob_store.hpp"
#include "medley/storage/buffer.hpp"

namespace medley::library {
    using u8 = medley::core::u8;
    using u64 = medley::core::u64;

    // When a purged file's bytes are released relative to the per-song transaction.
    enum class BlobPurgeOrder : u8 {
        InTransaction = 0,  // inside; a failure rolls the song back
        AfterCommit = 1,    // after commit, as a compensating action; a failure is reported only
    };

    // Ref-counted file records plus the bytes behind them, for one tier.
    class FileRefStore {
    public:
        virtual ~FileRefStore() = default;

        [[nodiscard]] virtual medley::core::Status find_by_hash(const medley::core::Hash256& hash,
            medley::core::FileRecord* out) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status get_file(medley::core::FileId id,
            medley::core::FileRecord* out) noexcept = 0;

        // Conflict when the hash already has a row.
        [[nodiscard]] virtual medley::core::Status create_file(const medley::core::FileRecord& file,
            medley::core::FileId* out) noexcept = 0;

        // Atomic; the new count comes back in the same operation.
        [[nodiscard]] virtual medley::core::Status increment_ref(medley::core::FileId id,
            medley::db::FileRefChange* out) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status decrement_ref(medley::core::FileId id,
            medley::db::FileRefChange* out) noexcept = 0;

        // Removes the row only while its ref_count <= 0.
        [[nodiscard]] virtual medley::core::Status delete_file_if_unreferenced(medley::core::FileId id,
            bool* deleted) noexcept = 0;

        [[nodiscard]] virtual medley::core::Status put_blob(std::string_view key, medley::storage::BufferView data,
            std::string_view content_type) noexcept = 0;

        // NotFound when the key is already absent.
        [[nodiscard]] virtual medley::core::Status delete_blob(std::string_view key) noexcept = 0;

        [[nodiscard]] virtual medley::core::Status create_song(const medley::core::SongRecord& song,
            medley::core::SongId* out) noexcept = 0;

        [[nodiscard]] virtual medley::core::Status txn_begin(medley::db::DbTxn* out) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status txn_commit(medley::db::DbTxn txn) noexcept = 0;
        virtual medley::core::Status txn_rollback(medley::db::DbTxn txn) noexcept = 0;
    };

    // Everything the cascade routine needs from a tier.
    class CascadeBackend : public FileRefStore {
    public:
        [[nodiscard]] virtual BlobPurgeOrder purge_order() const noexcept = 0;
        [[nodiscard]] virtual const char* tier_name() const noexcept = 0;

        // Storage key released when the song's file purges, or when a song
        // without a file is deleted. Empty means nothing to release.
        [[nodiscard]] virtual std::string purge_key(const medley::core::SongRecord& song,
            const medley::db::FileRefChange& purged) const = 0;

        [[nodiscard]] virtual medley::core::Status get_library(medley::core::LibraryId id,
            medley::core::LibraryRecord* out) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status list_library_songs(medley::core::LibraryId id,
            std::vector<medley::core::SongRecord>* out) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status get_song(medley::core::SongId id,
            medley::core::SongRecord* out) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status delete_song_row(medley::core::SongId id) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status delete_library_row(medley::core::LibraryId id) noexcept = 0;

        [[nodiscard]] virtual medley::core::Status delete_playlist_links(
            const std::vector<medley::core::SongId>& songs, u64* removed) noexcept = 0;

        [[nodiscard]] virtual medley::core::Status get_playlist(medley::core::PlaylistId id,
            medley::core::PlaylistRecord* out) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status delete_playlist_entries(medley::core::PlaylistId id,
            u64* removed) noexcept = 0;
        [[nodiscard]] virtual medley::core::Status delete_playlist_row(medley::core::PlaylistId id) noexcept = 0;
    };

    // Relational half of both tiers, over one SQLite connection.
    class SqliteBackend : public CascadeBackend {
    public:
        explicit SqliteBackend(medley::db::DbHandle db) noexcept : db_(db) {}

        [[nodiscard]] medley::db::DbHandle db() const noexcept { return db_; }

        medley::core::Status find_by_hash(const medley::core::Hash256& hash,
            medley::core::FileRecord* out) noexcept override;
        medley::core::Status get_file(medley::core::FileId id, medley::core::FileRecord* out) noexcept override;
        medley::core::Status create_file(const medley::core::FileRecord& file,
            medley::core::FileId* out) noexcept override;
        medley::core::Status increment_ref(medley::core::FileId id, medley::db::FileRefChange* out) noexcept override;
        medley::core::Status decrement_ref(medley::core::FileId id, medley::db::FileRefChange* out) noexcept override;
        medley::core::Status delete_file_if_unreferenced(medley::core::FileId id, bool* deleted) noexcept override;
        medley::core::Status create_song(const medley::core::SongRecord& song,
            medley::core::SongId* out) noexcept override;

        medley::core::Status txn_begin(medley::db::DbTxn* out) noexcept override;
        medley::core::Status txn_commit(medley::db::DbTxn txn) noexcept override;
        medley::core::Status txn_rollback(medley::db::DbTxn txn) noexcept override;

        medley::core::Status get_library(medley::core::LibraryId id,
            medley::core::LibraryRecord* out) noexcept override;
        medley::core::Status list_library_songs(medley::core::LibraryId id,
            std::vector<medley::core::SongRecord>* out) noexcept override;
        medley::core::Status get_song(medley::core::SongId id, medley::core::SongRecord* out) noexcept override;
        medley::core::Status delete_song_row(medley::core::SongId id) noexcept override;
        medley::core::Status delete_library_row(medley::core::LibraryId id) noexcept override;
        medley::core::Status delete_playlist_links(const std::vector<medley::core::SongId>& songs,
            u64* removed) noexcept override;
        medley::core::Status get_playlist(medley::core::PlaylistId id,
            medley::core::PlaylistRecord* out) noexcept override;
        medley::core::Status delete_playlist_entries(medley::core::PlaylistId id, u64* removed) noexcept override;
        medley::core::Status delete_playlist_row(medley::core::PlaylistId id) noexcept override;

    private:
        medley::db::DbHandle db_;
    };

    // Server tier: canonical catalog plus the object store. Blobs are keyed
    // by the file's storage key and removed inside the song's transaction.
    class CatalogBackend final : public SqliteBackend {
    public:
        CatalogBackend(medley::db::DbHandle db, medley::storage::BlobStore& blobs) noexcept
            : SqliteBackend(db), blobs_(blobs) {}

        [[nodiscard]] BlobPurgeOrder purge_order() const noexcept override { return BlobPurgeOrder::InTransaction; }
        [[nodiscard]] const char* tier_name() const noexcept override { return "catalog"; }
        [[nodiscard]] std::string purge_key(const medley::core::SongRecord& song,
            const medley::db::FileRefChange& purged) const override;

        medley::core::Status put_blob(std::string_view key, medley::storage::BufferView data,
            std::string_view content_type) noexcept override;
        medley::core::Status delete_blob(std::string_view key) noexcept override;

        [[nodiscard]] medley::storage::BlobStore& blobs() noexcept { return blobs_; }

    private:
        medley::storage::BlobStore& blobs_;
    };

    // Client tier: offline mirror plus the binary cache. Cache entries are
    // keyed by the song's stream URL and removed after the song's transaction commits.
    class MirrorBackend final : public SqliteBackend {
    public:
        MirrorBackend(medley::db::DbHandle db, medley::storage::BinaryCache& cache) noexcept
            : SqliteBackend(db), cache_(cache) {}

        [[nodiscard]] BlobPurgeOrder purge_order() const noexcept override { return BlobPurgeOrder::AfterCommit; }
        [[nodiscard]] const char* tier_name() const noexcept override { return "mirror"; }
        [[nodiscard]] std::string purge_key(const medley::core::SongRecord& song,
            const medley::db::FileRefChange& purged) const override;

        medley::core::Status put_blob(std::string_view key, medley::storage::BufferView data,
            std::string_view content_type) noexcept override;
        medley::core::Status delete_blob(std::string_view key) noexcept override;

        [[nodiscard]] medley::storage::BinaryCache& cache() noexcept { return cache_; }

    private:
        medley::storage::BinaryCache& cache_;
    };

} // namespace medley::library
