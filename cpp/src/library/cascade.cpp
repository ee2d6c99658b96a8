#include "medley/library/cascade.hpp"

#include <new>
#include <utility>

#include <fmt/format.h>

#include "medley/core/log.hpp"

namespace medley::library {

using namespace medley::core;
using medley::db::DbTxn;
using medley::db::FileRefChange;

namespace {

    // Rolls back on scope exit unless committed.
    class TxnGuard {
    public:
        TxnGuard(FileRefStore& store, DbTxn txn) noexcept : store_(store), txn_(txn) {}
        ~TxnGuard() {
            if (active_) {
                const Status s = store_.txn_rollback(txn_);
                if (!is_ok(s)) {
                    logger()->error("rollback failed status={}", describe(s));
                }
            }
        }

        TxnGuard(const TxnGuard&) = delete;
        TxnGuard& operator=(const TxnGuard&) = delete;

        [[nodiscard]] Status commit() noexcept {
            active_ = false;
            return store_.txn_commit(txn_);
        }

    private:
        FileRefStore& store_;
        DbTxn txn_;
        bool active_{true};
    };

    struct PurgePlan {
        std::string key;        // storage to release, empty for none
        bool release_now{false};
    };

    // Inside an open transaction: one reference fewer, and at zero the row goes.
    // The blob goes too when plan.release_now; otherwise plan.key is left for the caller.
    [[nodiscard]] Status drop_file_ref_locked(FileRefStore& store, FileId id,
        const std::function<std::string(const FileRefChange&)>& key_for, bool release_in_txn,
        FileReleaseResult* out, std::string* deferred_key) {
        FileRefChange change;
        Status s = store.decrement_ref(id, &change);
        if (!is_ok(s)) {
            return s;
        }
        out->ref_count = change.ref_count;
        logger()->debug("file ref dropped file_id={} ref_count={}", id.v, change.ref_count);
        if (change.ref_count > 0) {
            return ok_status();
        }

        const std::string key = key_for(change);
        if (!key.empty()) {
            if (release_in_txn) {
                s = store.delete_blob(key);
                if (is_ok(s)) {
                    out->blob_deleted = true;
                } else if (is_not_found(s)) {
                    logger()->warn("blob already absent key={} file_id={}", key, id.v);
                } else {
                    return s;
                }
            } else if (deferred_key != nullptr) {
                *deferred_key = key;
            }
        }

        bool deleted = false;
        s = store.delete_file_if_unreferenced(id, &deleted);
        if (!is_ok(s)) {
            return s;
        }
        out->file_deleted = deleted;
        if (deleted) {
            logger()->info("file purged file_id={} key={}", id.v, change.storage_key);
        }
        return ok_status();
    }

    [[nodiscard]] DeleteResult fatal(DeleteResult result, Status s, std::string message) {
        logger()->error("{} status={}", message, describe(s));
        result.success = false;
        result.errors.push_back(SongError{SongId::invalid(), s, std::move(message)});
        return result;
    }

    void report(const ProgressFn& on_progress, DeleteStage stage, u64 current, u64 total, std::string message) {
        if (on_progress) {
            on_progress(DeleteProgress{stage, current, total, std::move(message)});
        }
    }

} // namespace

const char* delete_stage_name(DeleteStage stage) noexcept {
    switch (stage) {
        case DeleteStage::Songs:
            return "songs";
        case DeleteStage::PlaylistSongs:
            return "playlistSongs";
        case DeleteStage::Library:
            return "library";
        case DeleteStage::Complete:
            return "complete";
    }
    return "unknown";
}

Status release_file_ref(FileRefStore& store, FileId id, FileReleaseResult* out) noexcept {
    FileReleaseResult local;
    FileReleaseResult* res = out != nullptr ? out : &local;
    *res = FileReleaseResult{};

    DbTxn txn;
    Status s = store.txn_begin(&txn);
    if (!is_ok(s)) {
        return s;
    }

    try {
        TxnGuard guard(store, txn);
        s = drop_file_ref_locked(
            store, id, [](const FileRefChange& c) { return c.storage_key; }, true, res, nullptr);
        if (is_not_found(s)) {
            logger()->warn("release_file_ref: file not found file_id={}", id.v);
            return ok_status();
        }
        if (!is_ok(s)) {
            *res = FileReleaseResult{};
            return s;
        }
        s = guard.commit();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Library, StatusCode::Unavailable);
    }
    if (!is_ok(s)) {
        *res = FileReleaseResult{};
    }
    return s;
}

Status CascadeDeleter::decrement_file_ref(FileId file, FileReleaseResult* out) noexcept {
    FileReleaseResult local;
    FileReleaseResult* res = out != nullptr ? out : &local;
    *res = FileReleaseResult{};

    const bool in_txn = backend_.purge_order() == BlobPurgeOrder::InTransaction;
    const SongRecord no_song{};
    std::string deferred;

    DbTxn txn;
    Status s = backend_.txn_begin(&txn);
    if (!is_ok(s)) {
        return s;
    }

    try {
        {
            TxnGuard guard(backend_, txn);
            s = drop_file_ref_locked(
                backend_, file, [&](const FileRefChange& c) { return backend_.purge_key(no_song, c); }, in_txn, res,
                &deferred);
            if (is_not_found(s)) {
                logger()->warn("decrement_file_ref: file not found file_id={} tier={}", file.v, backend_.tier_name());
                *res = FileReleaseResult{};
                return ok_status();
            }
            if (!is_ok(s)) {
                *res = FileReleaseResult{};
                return s;
            }
            s = guard.commit();
            if (!is_ok(s)) {
                *res = FileReleaseResult{};
                return s;
            }
        }

        if (!deferred.empty()) {
            s = backend_.delete_blob(deferred);
            if (is_ok(s)) {
                res->blob_deleted = true;
            } else if (is_not_found(s)) {
                logger()->warn("cache entry already absent key={}", deferred);
            } else {
                logger()->error("cache delete failed after commit key={} status={}", deferred, describe(s));
                return s;
            }
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Library, StatusCode::Unavailable);
    }
    return ok_status();
}

void CascadeDeleter::delete_one_song(const SongRecord& song, DeleteResult* result) {
    const bool release_in_txn = backend_.purge_order() == BlobPurgeOrder::InTransaction;
    std::string deferred_key;
    FileReleaseResult released;

    auto record_error = [&](Status s, std::string_view step) {
        std::string message = fmt::format("song {}: {} failed: {}", song.id.v, step, describe(s));
        logger()->error("{} tier={}", message, backend_.tier_name());
        result->errors.push_back(SongError{song.id, s, std::move(message)});
    };

    DbTxn txn;
    Status s = backend_.txn_begin(&txn);
    if (!is_ok(s)) {
        record_error(s, "begin transaction");
        return;
    }

    {
        TxnGuard guard(backend_, txn);

        s = backend_.delete_song_row(song.id);
        if (is_not_found(s)) {
            logger()->warn("song already deleted song_id={}", song.id.v);
            return;
        }
        if (!is_ok(s)) {
            record_error(s, "delete song row");
            return;
        }

        if (song.file_id.is_valid()) {
            s = drop_file_ref_locked(
                backend_, song.file_id, [&](const FileRefChange& c) { return backend_.purge_key(song, c); },
                release_in_txn, &released, &deferred_key);
            if (is_not_found(s)) {
                logger()->warn("song references a missing file song_id={} file_id={}", song.id.v, song.file_id.v);
            } else if (!is_ok(s)) {
                record_error(s, "release file");
                return;
            }
        } else {
            // Predates file dedup: the song owns its storage outright.
            const std::string key = backend_.purge_key(song, FileRefChange{});
            if (!key.empty()) {
                if (release_in_txn) {
                    s = backend_.delete_blob(key);
                    if (is_ok(s)) {
                        released.blob_deleted = true;
                    } else if (is_not_found(s)) {
                        logger()->warn("blob already absent key={} song_id={}", key, song.id.v);
                    } else {
                        record_error(s, "delete blob");
                        return;
                    }
                } else {
                    deferred_key = key;
                }
            }
        }

        s = guard.commit();
        if (!is_ok(s)) {
            record_error(s, "commit");
            return;
        }
    }

    ++result->deleted_songs;
    if (released.blob_deleted) {
        ++result->deleted_cache_entries;
    }

    if (!deferred_key.empty()) {
        s = backend_.delete_blob(deferred_key);
        if (is_ok(s)) {
            ++result->deleted_cache_entries;
        } else if (is_not_found(s)) {
            logger()->warn("cache entry already absent key={} song_id={}", deferred_key, song.id.v);
        } else {
            record_error(s, "delete cache entry");
        }
    }
}

DeleteResult CascadeDeleter::delete_library(LibraryId library, const ProgressFn& on_progress) {
    DeleteResult result;

    LibraryRecord lib;
    Status s = backend_.get_library(library, &lib);
    const bool library_exists = is_ok(s);
    if (!library_exists && !is_not_found(s)) {
        return fatal(std::move(result), s, fmt::format("library {}: lookup failed", library.v));
    }
    if (library_exists && cfg_.respect_can_delete && !lib.can_delete) {
        return fatal(std::move(result), make_status(StatusDomain::Library, StatusCode::PermissionDenied),
                     fmt::format("library {}: cannot delete default library", library.v));
    }

    std::vector<SongRecord> songs;
    s = backend_.list_library_songs(library, &songs);
    if (!is_ok(s)) {
        return fatal(std::move(result), s, fmt::format("library {}: enumerating songs failed", library.v));
    }

    if (!library_exists && songs.empty()) {
        logger()->warn("delete_library: library not found library_id={} tier={}", library.v, backend_.tier_name());
        return result;
    }

    const u64 total = songs.size();
    logger()->info("delete_library start library_id={} songs={} tier={}", library.v, total, backend_.tier_name());
    report(on_progress, DeleteStage::Songs, 0, total, fmt::format("Found {} songs", total));

    report(on_progress, DeleteStage::PlaylistSongs, 0, total, "Removing songs from playlists");
    std::vector<SongId> ids;
    ids.reserve(songs.size());
    for (const SongRecord& song : songs) {
        ids.push_back(song.id);
    }
    s = backend_.delete_playlist_links(ids, &result.deleted_playlist_songs);
    if (!is_ok(s)) {
        return fatal(std::move(result), s, fmt::format("library {}: removing playlist entries failed", library.v));
    }

    u64 processed = 0;
    report(on_progress, DeleteStage::Songs, processed, total, "Deleting songs and cache");
    for (const SongRecord& song : songs) {
        delete_one_song(song, &result);
        ++processed;
        report(on_progress, DeleteStage::Songs, processed, total,
               fmt::format("Deleted {} of {} songs", processed, total));
    }

    report(on_progress, DeleteStage::Library, total, total, "Deleting library");
    if (cfg_.policy == CascadePolicy::Strict && !result.errors.empty()) {
        logger()->warn("delete_library: keeping library_id={} after {} song errors (strict)", library.v,
                       result.errors.size());
    } else if (library_exists) {
        s = backend_.delete_library_row(library);
        if (is_ok(s)) {
            result.library_deleted = true;
        } else if (is_not_found(s)) {
            logger()->warn("delete_library: library row already gone library_id={}", library.v);
        } else {
            result = fatal(std::move(result), s, fmt::format("library {}: deleting library row failed", library.v));
        }
    }

    report(on_progress, DeleteStage::Complete, total, total, "Library deleted");
    logger()->info("delete_library done library_id={} deleted_songs={} playlist_songs={} purged={} errors={}",
                   library.v, result.deleted_songs, result.deleted_playlist_songs, result.deleted_cache_entries,
                   result.errors.size());
    return result;
}

DeleteResult CascadeDeleter::delete_song_from_library(LibraryId library, SongId song_id) {
    DeleteResult result;

    SongRecord song;
    Status s = backend_.get_song(song_id, &song);
    if (is_not_found(s)) {
        logger()->warn("delete_song: song not found song_id={}", song_id.v);
        return result;
    }
    if (!is_ok(s)) {
        return fatal(std::move(result), s, fmt::format("song {}: lookup failed", song_id.v));
    }
    if (song.library_id != library) {
        logger()->warn("delete_song: song_id={} is not in library_id={}", song_id.v, library.v);
        return result;
    }

    s = backend_.delete_playlist_links({song_id}, &result.deleted_playlist_songs);
    if (!is_ok(s)) {
        return fatal(std::move(result), s, fmt::format("song {}: removing playlist entries failed", song_id.v));
    }

    delete_one_song(song, &result);
    return result;
}

DeleteResult CascadeDeleter::delete_playlist(PlaylistId playlist) {
    DeleteResult result;

    PlaylistRecord rec;
    Status s = backend_.get_playlist(playlist, &rec);
    if (is_not_found(s)) {
        logger()->warn("delete_playlist: playlist not found playlist_id={}", playlist.v);
        return result;
    }
    if (!is_ok(s)) {
        return fatal(std::move(result), s, fmt::format("playlist {}: lookup failed", playlist.v));
    }

    DbTxn txn;
    s = backend_.txn_begin(&txn);
    if (!is_ok(s)) {
        return fatal(std::move(result), s, fmt::format("playlist {}: begin transaction failed", playlist.v));
    }

    u64 removed = 0;
    {
        TxnGuard guard(backend_, txn);
        s = backend_.delete_playlist_entries(playlist, &removed);
        if (is_ok(s)) {
            s = backend_.delete_playlist_row(playlist);
        }
        if (is_ok(s)) {
            s = guard.commit();
        }
    }
    if (!is_ok(s)) {
        return fatal(std::move(result), s, fmt::format("playlist {}: delete failed", playlist.v));
    }

    result.deleted_playlist_songs = removed;
    result.playlist_deleted = true;
    logger()->info("playlist deleted playlist_id={} entries={}", playlist.v, removed);
    return result;
}

} // namespace medley::library
