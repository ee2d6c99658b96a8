#include "medley/library/mirror_ops.hpp"

#include <ctime>
#include <new>

#include <fmt/format.h>

#include "medley/core/log.hpp"
#include "medley/db/mirror.hpp"
#include "medley/library/uploader.hpp"
#include "medley/storage/hashing.hpp"
#include "medley/storage/storage_key.hpp"

namespace medley::library {

using namespace medley::core;
using medley::storage::BufferView;

namespace {
    constexpr u32 kMirrorAcquireAttempts = 4;

    // Marks the song cached once the bytes are in.
    [[nodiscard]] Status cache_and_mark(MirrorBackend& backend, SongId id, std::string_view url, BufferView data) {
        Status s = backend.cache().put(url, data);
        if (!is_ok(s)) {
            return s;
        }
        s = medley::db::mirror_song_set_cached(backend.db(), id, true, data.len);
        if (!is_ok(s)) {
            // The flag is what readers trust; drop the bytes rather than leave them unaccounted.
            const Status rs = backend.cache().remove(url);
            if (!is_ok(rs) && !is_not_found(rs)) {
                logger()->warn("cache entry left behind url={} status={}", url, describe(rs));
            }
        }
        return s;
    }
} // namespace

std::string stream_url_for(SongId id) {
    return fmt::format("/api/songs/{}/stream", id.v);
}

Status mirror_add_song(MirrorBackend& backend, const MirrorSongInput& in, MirrorAddResult* out) noexcept {
    if (out == nullptr || !in.library.is_valid() || (in.data.len > 0 && in.data.data == nullptr)) {
        return make_status(StatusDomain::Library, StatusCode::Invalid);
    }

    Hash256 hash;
    Status s = medley::storage::hash_compute(in.data, &hash);
    if (!is_ok(s)) {
        return s;
    }

    try {
        const std::string_view mime = in.mime_type.empty() ? std::string_view("audio/mpeg") : in.mime_type;

        medley::db::DbTxn txn;
        s = backend.txn_begin(&txn);
        if (!is_ok(s)) {
            return s;
        }

        // The mirror's file rows describe content only; bytes live in the cache under the song URL.
        const NewFilePreparer prepare = [&](FileRecord* candidate) -> Status {
            candidate->storage_key = medley::storage::storage_key_for(hash, mime);
            candidate->size_bytes = in.data.len;
            candidate->mime_type = std::string(mime);
            candidate->physical = in.tags.physical;
            candidate->created_at = static_cast<Timestamp>(std::time(nullptr));
            return ok_status();
        };

        FileAcquireResult acquired;
        s = acquire_file_ref(backend, hash, kMirrorAcquireAttempts, prepare, &acquired);

        SongId song_id;
        if (is_ok(s)) {
            SongRecord song;
            song.file_id = acquired.file.id;
            song.library_id = in.library;
            song.tags = in.tags;
            s = backend.create_song(song, &song_id);
        }
        std::string url;
        if (is_ok(s)) {
            url = stream_url_for(song_id);
            s = medley::db::mirror_song_set_stream_url(backend.db(), song_id, url);
        }
        if (!is_ok(s)) {
            (void)backend.txn_rollback(txn);
            logger()->error("mirror add failed library_id={} status={}", in.library.v, describe(s));
            return s;
        }
        s = backend.txn_commit(txn);
        if (!is_ok(s)) {
            return s;
        }

        out->song_id = song_id;
        out->file_id = acquired.file.id;
        out->is_new_file = acquired.is_new_file;
        out->stream_url = url;
        out->cached = false;

        const Status cs = cache_and_mark(backend, song_id, url, in.data);
        if (is_ok(cs)) {
            out->cached = true;
        } else {
            logger()->warn("mirrored song not cached song_id={} status={}", song_id.v, describe(cs));
        }
        logger()->info("mirror song added song_id={} file_id={} cached={}", song_id.v, out->file_id.v,
                       out->cached);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Library, StatusCode::Unavailable);
    }
    return ok_status();
}

Status mirror_cache_song(MirrorBackend& backend, SongId id, BufferView data) noexcept {
    SongRecord song;
    Status s = backend.get_song(id, &song);
    if (!is_ok(s)) {
        return s;
    }
    if (song.stream_url.empty()) {
        return make_status(StatusDomain::Library, StatusCode::Invalid);
    }
    try {
        return cache_and_mark(backend, id, song.stream_url, data);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Library, StatusCode::Unavailable);
    }
}

Status mirror_evict_song(MirrorBackend& backend, SongId id) noexcept {
    SongRecord song;
    Status s = backend.get_song(id, &song);
    if (!is_ok(s)) {
        return s;
    }
    if (!song.stream_url.empty()) {
        s = backend.cache().remove(song.stream_url);
        if (!is_ok(s) && !is_not_found(s)) {
            return s;
        }
    }
    return medley::db::mirror_song_set_cached(backend.db(), id, false, 0);
}

} // namespace medley::library
