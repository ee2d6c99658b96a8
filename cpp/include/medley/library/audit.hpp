#pragma once

#include <string>
#include <vector>

#include "medley/core/errors.hpp"
#include "medley/core/models.hpp"
#include "medley/db/db.hpp"
#include "medley/storage/blob_store.hpp"

namespace medley::library {

    struct AuditOptions {
        // Rewrite drifted ref_counts to the number of songs actually pointing at the
        // file; files that drop to zero are purged (row, then blob after commit).
        bool repair{false};
        bool check_blobs{true};
    };

    struct RefDrift {
        medley::core::FileId file_id{medley::core::FileId::invalid()};
        medley::core::i64 stored{0};
        medley::core::i64 actual{0};
        std::string storage_key;
    };

    struct AuditReport {
        medley::core::u64 files_checked{0};
        std::vector<RefDrift> drifts;
        // Songs whose library is gone; delete_library on their library_id collects them.
        std::vector<medley::core::SongRecord> orphaned_songs;
        std::vector<std::string> missing_blobs;
        medley::core::u64 repaired{0};
        medley::core::u64 purged_files{0};
        // Rows purged by the repair whose blob could not be removed.
        std::vector<std::string> unpurged_blobs;
    };

    [[nodiscard]] inline bool audit_clean(const AuditReport& r) noexcept {
        return r.drifts.empty() && r.orphaned_songs.empty() && r.missing_blobs.empty();
    }

    // Consistency check of a catalog database. blobs may be null (no blob checks).
    // Repairs run in one transaction; a failure rolls all of them back. Blob removal
    // follows the commit and its failures land in unpurged_blobs.
    [[nodiscard]] medley::core::Status audit_catalog(medley::db::DbHandle db, medley::storage::BlobStore* blobs,
        const AuditOptions& opts, AuditReport* out) noexcept;

} // namespace medley::library
