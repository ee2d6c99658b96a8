#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "medley/core/config.hpp"
#include "medley/core/errors.hpp"
#include "medley/core/models.hpp"
#include "medley/library/backend.hpp"
#include "medley/media/tags.hpp"
#include "medley/storage/buffer.hpp"

namespace medley::library {
    using u32 = medley::core::u32;
    using i64 = medley::core::i64;

    struct UploaderConfig {
        medley::core::u64 max_bytes{medley::core::kDefaultMaxUploadBytes};
        // find/create/increment rounds before giving up with Busy
        u32 max_attempts{4};
    };

    struct UploadResult {
        medley::core::FileId file_id{medley::core::FileId::invalid()};
        medley::core::Hash256 hash{};
        bool is_new_file{false};
        medley::core::PhysicalProperties physical{};
        medley::core::TagRecord suggested_tags{};
        std::string storage_key;
        i64 ref_count{0};
    };

    struct FileAcquireResult {
        medley::core::FileRecord file{};  // ref_count is the post-acquire count
        bool is_new_file{false};
        // Key the preparer wrote that no row uses; the caller should delete it.
        // Also set when the acquire fails after preparing.
        std::string discarded_key;
    };

    // Fills the candidate row for a first-time hash (and writes its bytes, if any).
    // Runs at most once per acquire.
    using NewFilePreparer = std::function<medley::core::Status(medley::core::FileRecord* candidate)>;

    // Takes one reference on the file with this hash, creating it with ref_count 1
    // if none exists. A Conflict on create (another writer inserted the hash first)
    // is retried as an increment; an increment that finds the row purged is retried
    // from the lookup. Busy after max_attempts rounds.
    [[nodiscard]] medley::core::Status acquire_file_ref(FileRefStore& store, const medley::core::Hash256& hash,
        u32 max_attempts, const NewFilePreparer& prepare, FileAcquireResult* out) noexcept;

    // Overrides win field by field; physical properties come from the file.
    [[nodiscard]] medley::core::TagRecord merge_tags(const medley::core::TagRecord& suggested,
        const medley::core::TagRecord* overrides);

    class Uploader {
    public:
        // extractor may be null: tags then come from the filename only.
        Uploader(FileRefStore& store, medley::media::TagExtractor* extractor, UploaderConfig cfg = {}) noexcept;

        // Stores the bytes once per distinct content and takes a reference on the file.
        // Invalid when larger than max_bytes; Corrupt when expected_hash is given and differs.
        [[nodiscard]] medley::core::Status upload(medley::storage::BufferView data, std::string_view filename,
            std::string_view mime_type, UploadResult* out,
            const medley::core::Hash256* expected_hash = nullptr) noexcept;

        // upload() plus a Song row in the library. If the song cannot be created the
        // file reference is released again.
        [[nodiscard]] medley::core::Status upload_song(medley::core::LibraryId library,
            medley::storage::BufferView data, std::string_view filename, std::string_view mime_type,
            const medley::core::TagRecord* overrides, UploadResult* result, medley::core::SongId* song_out) noexcept;

        // New Song for an existing file; increment and insert share one transaction.
        [[nodiscard]] medley::core::Status link_file(medley::core::FileId file, medley::core::LibraryId library,
            const medley::core::TagRecord& tags, medley::core::SongId* out) noexcept;

        [[nodiscard]] const UploaderConfig& config() const noexcept { return cfg_; }

    private:
        [[nodiscard]] medley::core::TagRecord extract_tags(medley::storage::BufferView data,
            std::string_view filename, std::string_view mime_type);

        FileRefStore& store_;
        medley::media::TagExtractor* extractor_;
        UploaderConfig cfg_;
    };

} // namespace medley::library
