#include "medley/library/uploader.hpp"

#include <ctime>
#include <exception>
#include <new>
#include <optional>
#include <string>
#include <utility>

#include "medley/core/log.hpp"
#include "medley/library/cascade.hpp"
#include "medley/storage/hashing.hpp"
#include "medley/storage/storage_key.hpp"

namespace medley::library {

using namespace medley::core;
using medley::storage::BufferView;

namespace {
    constexpr std::string_view kDefaultMime = "audio/mpeg";

    [[nodiscard]] Status library_error(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Library, code, aux);
    }

    // The prepared key, unless a row for this hash has since claimed it.
    [[nodiscard]] std::string unclaimed_key(FileRefStore& store, const Hash256& hash, const std::string& key) {
        FileRecord existing;
        const Status s = store.find_by_hash(hash, &existing);
        if (is_ok(s) && existing.storage_key == key) {
            return {};
        }
        if (!is_ok(s) && !is_not_found(s)) {
            return {};
        }
        return key;
    }

    template <typename T>
    void override_field(std::optional<T>* dst, const std::optional<T>& src) {
        if (src.has_value()) {
            *dst = src;
        }
    }
} // namespace

Status acquire_file_ref(FileRefStore& store, const Hash256& hash, u32 max_attempts, const NewFilePreparer& prepare,
                        FileAcquireResult* out) noexcept {
    if (out == nullptr || max_attempts == 0) {
        return library_error(StatusCode::Invalid);
    }

    FileRecord candidate;
    bool prepared = false;

    for (u32 attempt = 0; attempt < max_attempts; ++attempt) {
        FileRecord existing;
        Status s = store.find_by_hash(hash, &existing);
        if (is_ok(s)) {
            medley::db::FileRefChange change;
            s = store.increment_ref(existing.id, &change);
            if (is_ok(s)) {
                existing.ref_count = change.ref_count;
                out->is_new_file = false;
                out->discarded_key.clear();
                if (prepared && candidate.storage_key != existing.storage_key) {
                    out->discarded_key = candidate.storage_key;
                }
                out->file = std::move(existing);
                logger()->debug("file ref taken file_id={} ref_count={}", out->file.id.v, change.ref_count);
                return ok_status();
            }
            if (!is_not_found(s)) {
                return s;
            }
            // Purged between lookup and increment.
            logger()->debug("file vanished before increment file_id={} attempt={}", existing.id.v, attempt);
            continue;
        }
        if (!is_not_found(s)) {
            return s;
        }

        if (!prepared) {
            candidate.hash = hash;
            if (prepare) {
                try {
                    s = prepare(&candidate);
                } catch (const std::exception& e) {
                    logger()->error("file preparation threw: {}", e.what());
                    return library_error(StatusCode::Unknown);
                }
                if (!is_ok(s)) {
                    return s;
                }
            }
            prepared = true;
        }

        candidate.ref_count = 1;
        FileId id;
        s = store.create_file(candidate, &id);
        if (is_ok(s)) {
            candidate.id = id;
            out->file = candidate;
            out->is_new_file = true;
            out->discarded_key.clear();
            logger()->info("file created file_id={} key={} size={}", id.v, candidate.storage_key,
                           candidate.size_bytes);
            return ok_status();
        }
        if (s.code != StatusCode::Conflict) {
            out->discarded_key = unclaimed_key(store, hash, candidate.storage_key);
            return s;
        }
        // Another writer inserted this hash first; take the increment path.
        logger()->debug("hash insert conflict, retrying as increment attempt={}", attempt);
    }

    logger()->warn("file ref acquire gave up after {} attempts", max_attempts);
    if (prepared) {
        out->discarded_key = unclaimed_key(store, hash, candidate.storage_key);
    }
    return library_error(StatusCode::Busy);
}

TagRecord merge_tags(const TagRecord& suggested, const TagRecord* overrides) {
    TagRecord merged = suggested;
    if (overrides == nullptr) {
        return merged;
    }
    override_field(&merged.title, overrides->title);
    override_field(&merged.artist, overrides->artist);
    override_field(&merged.album, overrides->album);
    override_field(&merged.album_artist, overrides->album_artist);
    override_field(&merged.year, overrides->year);
    override_field(&merged.genre, overrides->genre);
    override_field(&merged.track_number, overrides->track_number);
    override_field(&merged.disc_number, overrides->disc_number);
    override_field(&merged.composer, overrides->composer);
    return merged;
}

Uploader::Uploader(FileRefStore& store, medley::media::TagExtractor* extractor, UploaderConfig cfg) noexcept
    : store_(store), extractor_(extractor), cfg_(cfg) {}

TagRecord Uploader::extract_tags(BufferView data, std::string_view filename, std::string_view mime_type) {
    TagRecord tags;
    if (extractor_ != nullptr) {
        Status s;
        try {
            s = extractor_->extract(data, mime_type, &tags);
        } catch (const std::exception& e) {
            logger()->warn("tag extraction threw filename={} error={}", filename, e.what());
            s = make_status(StatusDomain::Media, StatusCode::Unknown);
        }
        if (!is_ok(s)) {
            logger()->debug("tag extraction failed filename={} status={}", filename, describe(s));
            tags = TagRecord{};
        }
    }
    medley::media::apply_filename_fallback(filename, &tags);
    return tags;
}

Status Uploader::upload(BufferView data, std::string_view filename, std::string_view mime_type, UploadResult* out,
                        const Hash256* expected_hash) noexcept {
    if (out == nullptr || (data.len > 0 && data.data == nullptr)) {
        return library_error(StatusCode::Invalid);
    }
    if (data.len > cfg_.max_bytes) {
        logger()->warn("upload rejected filename={} size={} limit={}", filename, data.len, cfg_.max_bytes);
        return library_error(StatusCode::Invalid, 1);
    }

    Hash256 hash;
    Status s = medley::storage::hash_compute(data, &hash);
    if (!is_ok(s)) {
        return s;
    }
    if (expected_hash != nullptr && *expected_hash != hash) {
        logger()->warn("upload hash mismatch filename={} expected={} actual={}", filename,
                       medley::storage::hash_to_hex(*expected_hash), medley::storage::hash_to_hex(hash));
        return library_error(StatusCode::Corrupt);
    }

    const std::string_view mime = mime_type.empty() ? kDefaultMime : mime_type;

    try {
        TagRecord tags = extract_tags(data, filename, mime);

        const NewFilePreparer prepare = [&](FileRecord* candidate) -> Status {
            candidate->storage_key = medley::storage::storage_key_for(hash, mime);
            candidate->size_bytes = data.len;
            candidate->mime_type = std::string(mime);
            candidate->physical = tags.physical;
            candidate->created_at = static_cast<Timestamp>(std::time(nullptr));
            return store_.put_blob(candidate->storage_key, data, mime);
        };

        FileAcquireResult acquired;
        s = acquire_file_ref(store_, hash, cfg_.max_attempts, prepare, &acquired);
        if (!acquired.discarded_key.empty()) {
            const Status ds = store_.delete_blob(acquired.discarded_key);
            if (!is_ok(ds) && !is_not_found(ds)) {
                logger()->warn("orphan blob left key={} status={}", acquired.discarded_key, describe(ds));
            }
        }
        if (!is_ok(s)) {
            return s;
        }

        out->file_id = acquired.file.id;
        out->hash = hash;
        out->is_new_file = acquired.is_new_file;
        out->physical = acquired.file.physical;
        out->storage_key = acquired.file.storage_key;
        out->ref_count = acquired.file.ref_count;
        tags.physical = acquired.file.physical;
        out->suggested_tags = std::move(tags);
    } catch (const std::bad_alloc&) {
        return library_error(StatusCode::Unavailable);
    }

    logger()->info("upload filename={} file_id={} new={} ref_count={}", filename, out->file_id.v, out->is_new_file,
                   out->ref_count);
    return ok_status();
}

Status Uploader::upload_song(LibraryId library, BufferView data, std::string_view filename,
                             std::string_view mime_type, const TagRecord* overrides, UploadResult* result,
                             SongId* song_out) noexcept {
    if (result == nullptr || song_out == nullptr) {
        return library_error(StatusCode::Invalid);
    }

    Status s = upload(data, filename, mime_type, result, nullptr);
    if (!is_ok(s)) {
        return s;
    }

    SongRecord song;
    song.file_id = result->file_id;
    song.library_id = library;
    try {
        song.tags = merge_tags(result->suggested_tags, overrides);
    } catch (const std::bad_alloc&) {
        s = library_error(StatusCode::Unavailable);
    }
    song.tags.physical = result->physical;

    if (is_ok(s)) {
        s = store_.create_song(song, song_out);
    }
    if (!is_ok(s)) {
        logger()->error("song insert failed file_id={} library_id={} status={}", result->file_id.v, library.v,
                        describe(s));
        FileReleaseResult released;
        const Status rs = release_file_ref(store_, result->file_id, &released);
        if (!is_ok(rs)) {
            logger()->error("releasing file ref after failed song insert failed file_id={} status={}",
                            result->file_id.v, describe(rs));
        }
        return s;
    }
    return ok_status();
}

Status Uploader::link_file(FileId file, LibraryId library, const TagRecord& tags, SongId* out) noexcept {
    if (out == nullptr || !file.is_valid()) {
        return library_error(StatusCode::Invalid);
    }

    medley::db::DbTxn txn;
    Status s = store_.txn_begin(&txn);
    if (!is_ok(s)) {
        return s;
    }

    FileRecord rec;
    s = store_.get_file(file, &rec);
    if (is_ok(s)) {
        medley::db::FileRefChange change;
        s = store_.increment_ref(file, &change);
    }
    if (is_ok(s)) {
        SongRecord song;
        song.file_id = file;
        song.library_id = library;
        song.tags = tags;
        song.tags.physical = rec.physical;
        s = store_.create_song(song, out);
    }
    if (!is_ok(s)) {
        (void)store_.txn_rollback(txn);
        if (is_not_found(s)) {
            logger()->warn("link_file: file not found file_id={}", file.v);
        }
        return s;
    }
    return store_.txn_commit(txn);
}

} // namespace medley::library
