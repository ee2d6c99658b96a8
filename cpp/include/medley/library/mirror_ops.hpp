#pragma once

#include <string>
#include <string_view>

#include "medley/core/errors.hpp"
#include "medley/core/models.hpp"
#include "medley/library/backend.hpp"
#include "medley/storage/buffer.hpp"

namespace medley::library {

    // "/api/songs/{id}/stream": the URL the client cache is keyed by.
    [[nodiscard]] std::string stream_url_for(medley::core::SongId id);

    struct MirrorSongInput {
        medley::core::LibraryId library{medley::core::LibraryId::invalid()};
        medley::core::TagRecord tags{};
        medley::storage::BufferView data{};
        std::string_view mime_type;
    };

    struct MirrorAddResult {
        medley::core::SongId song_id{medley::core::SongId::invalid()};
        medley::core::FileId file_id{medley::core::FileId::invalid()};
        bool is_new_file{false};
        std::string stream_url;
        bool cached{false};
    };

    // Records a song in the offline mirror: the file reference, the song row and
    // its stream URL are written in one transaction, then the bytes are cached
    // under the URL. A failed cache write leaves the song uncached (warning logged).
    // Entries are per song URL even when the file is shared, but a cascade delete only
    // purges the URL of the song that drops the file to zero references. Evict a
    // song's entry before deleting it if other songs still share its file.
    [[nodiscard]] medley::core::Status mirror_add_song(MirrorBackend& backend, const MirrorSongInput& in,
        MirrorAddResult* out) noexcept;

    // (Re)caches a mirrored song's bytes under its stream URL.
    [[nodiscard]] medley::core::Status mirror_cache_song(MirrorBackend& backend, medley::core::SongId id,
        medley::storage::BufferView data) noexcept;

    // Drops the cache entry; the song stays in the mirror. An absent entry is fine.
    [[nodiscard]] medley::core::Status mirror_evict_song(MirrorBackend& backend, medley::core::SongId id) noexcept;

} // namespace medley::library
