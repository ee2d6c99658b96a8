#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "medley/core/errors.hpp"
#include "medley/core/models.hpp"
#include "medley/library/backend.hpp"

namespace medley::library {
    using i64 = medley::core::i64;

    enum class CascadePolicy : u8 {
        BestEffort = 0,  // the parent row goes even when some songs failed
        Strict = 1,      // the parent row stays when any song failed
    };

    struct CascadeConfig {
        CascadePolicy policy{CascadePolicy::BestEffort};
        // Refuse libraries flagged can_delete = false (the owner's default library).
        bool respect_can_delete{false};
    };

    enum class DeleteStage : u8 {
        Songs = 0,
        PlaylistSongs = 1,
        Library = 2,
        Complete = 3,
    };

    // current/total count songs and never decrease within one call.
    struct DeleteProgress {
        DeleteStage stage{DeleteStage::Songs};
        u64 current{0};
        u64 total{0};
        std::string message;
    };

    using ProgressFn = std::function<void(const DeleteProgress&)>;

    struct SongError {
        medley::core::SongId song_id{medley::core::SongId::invalid()};  // invalid() for non-song failures
        medley::core::Status status{};
        std::string message;
    };

    // success is false only for failures outside the per-song loop.
    struct DeleteResult {
        bool success{true};
        u64 deleted_playlist_songs{0};
        u64 deleted_songs{0};
        u64 deleted_cache_entries{0};  // blobs or cache entries actually removed
        bool library_deleted{false};
        bool playlist_deleted{false};
        std::vector<SongError> errors;
    };

    struct FileReleaseResult {
        i64 ref_count{0};
        bool file_deleted{false};
        bool blob_deleted{false};
    };

    [[nodiscard]] const char* delete_stage_name(DeleteStage stage) noexcept;

    // Drops one reference on a file; at zero the blob at its storage key and the
    // row are removed in one transaction. A blob already gone counts as removed.
    // A missing file is a no-op (ok status, warning logged).
    [[nodiscard]] medley::core::Status release_file_ref(FileRefStore& store, medley::core::FileId id,
        FileReleaseResult* out) noexcept;

    // One cascade routine for both tiers; the backend decides where purged bytes
    // live and when they are released.
    class CascadeDeleter {
    public:
        explicit CascadeDeleter(CascadeBackend& backend, CascadeConfig cfg = {}) noexcept
            : backend_(backend), cfg_(cfg) {}

        // Removes the library's songs (each in its own transaction), every playlist
        // entry pointing at them, purges files that lose their last reference, and
        // then the library row. Re-running on a library deleted best-effort picks
        // up the songs that failed.
        [[nodiscard]] DeleteResult delete_library(medley::core::LibraryId library,
            const ProgressFn& on_progress = {});

        // A song that is missing or belongs to another library is a no-op.
        [[nodiscard]] DeleteResult delete_song_from_library(medley::core::LibraryId library,
            medley::core::SongId song);

        // Playlist entries and the playlist row; songs and files are untouched.
        [[nodiscard]] DeleteResult delete_playlist(medley::core::PlaylistId playlist);

        [[nodiscard]] medley::core::Status decrement_file_ref(medley::core::FileId file,
            FileReleaseResult* out = nullptr) noexcept;

    private:
        // Per-song transaction; failures land in result->errors.
        void delete_one_song(const medley::core::SongRecord& song, DeleteResult* result);

        CascadeBackend& backend_;
        CascadeConfig cfg_;
    };

} // namespace medley::library
