#pragma once

#include <optional>
#include <string>

#include "medley/core/types.hpp"

namespace medley::core {

    struct PhysicalProperties {
        std::optional<u32> duration_sec;
        std::optional<u32> bitrate_kbps;
        std::optional<u32> sample_rate;
        std::optional<u32> channels;
    };

    // Best-effort descriptive tags; every field may be absent.
    struct TagRecord {
        std::optional<std::string> title;
        std::optional<std::string> artist;
        std::optional<std::string> album;
        std::optional<std::string> album_artist;
        std::optional<u32> year;
        std::optional<std::string> genre;
        std::optional<u32> track_number;
        std::optional<u32> disc_number;
        std::optional<std::string> composer;
        PhysicalProperties physical{};
    };

    struct FileRecord {
        FileId id{FileId::invalid()};
        Hash256 hash{};
        std::string storage_key;
        u64 size_bytes{0};
        std::string mime_type;
        PhysicalProperties physical{};
        i64 ref_count{0};
        Timestamp created_at{0};
    };

    struct SongRecord {
        SongId id{SongId::invalid()};
        // invalid() on mirror rows that predate file dedup
        FileId file_id{FileId::invalid()};
        LibraryId library_id{LibraryId::invalid()};
        TagRecord tags{};
        Timestamp created_at{0};
        Timestamp updated_at{0};

        // Mirror-only columns
        std::string stream_url;
        bool is_cached{false};
        u64 cache_size{0};
    };

    struct LibraryRecord {
        LibraryId id{LibraryId::invalid()};
        UserId owner{UserId::invalid()};
        std::string name;
        u32 song_count{0};
        bool can_delete{true};
        Timestamp created_at{0};
    };

    struct PlaylistRecord {
        PlaylistId id{PlaylistId::invalid()};
        UserId owner{UserId::invalid()};
        std::string name;
        u32 song_count{0};
        LibraryId linked_library{LibraryId::invalid()};
        Timestamp created_at{0};
    };

    struct PlaylistSongRecord {
        PlaylistId playlist_id{PlaylistId::invalid()};
        SongId song_id{SongId::invalid()};
        u32 order{0};
        Timestamp added_at{0};
    };

} // namespace medley::core
