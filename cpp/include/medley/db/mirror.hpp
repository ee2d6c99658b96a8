#pragma once

#include <string_view>
#include <type_traits>

#include "medley/core/errors.hpp"
#include "medley/core/types.hpp"
#include "medley/db/db.hpp"

namespace medley::db {
    using u64 = medley::core::u64;

    struct MirrorLibraryStats {
        u64 song_count{0};
        u64 cached_count{0};
        u64 cached_bytes{0};
    };

    // Installs the client-side schema: the catalog tables with nullable
    // songs.file_id and the stream_url/is_cached/cache_size song columns.
    [[nodiscard]] medley::core::Status mirror_install_schema(DbHandle db) noexcept;

    // Also clears the cached flag: a new URL has no cache entry yet.
    [[nodiscard]] medley::core::Status mirror_song_set_stream_url(DbHandle db, medley::core::SongId id,
        std::string_view url) noexcept;

    [[nodiscard]] medley::core::Status mirror_song_set_cached(DbHandle db, medley::core::SongId id,
        bool cached, u64 cache_size) noexcept;

    [[nodiscard]] medley::core::Status mirror_library_stats(DbHandle db, medley::core::LibraryId library,
        MirrorLibraryStats* out) noexcept;

    static_assert(std::is_trivially_copyable_v<MirrorLibraryStats>);

} // namespace medley::db
