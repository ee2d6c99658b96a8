#include "medley/library/audit.hpp"

#include <new>
#include <string>
#include <vector>

#include "medley/core/log.hpp"
#include "medley/db/catalog.hpp"

namespace medley::library {

using namespace medley::core;
namespace db = medley::db;

namespace {

    // Counts are recomputed inside the transaction, so songs linked after the scan
    // are honoured. Blobs go only after the rows are gone for good.
    [[nodiscard]] Status repair_drifts(db::DbHandle handle, medley::storage::BlobStore* blobs,
                                       AuditReport* report) noexcept {
        std::vector<std::string> purged_keys;

        db::DbTxn txn;
        Status s = db::db_txn_begin(handle, &txn);
        if (!is_ok(s)) {
            return s;
        }

        u64 repaired = 0;
        try {
            for (const RefDrift& d : report->drifts) {
                db::FileRefChange change;
                s = db::db_file_recount_ref(handle, d.file_id, &change);
                if (is_not_found(s)) {
                    // Purged since the scan.
                    s = ok_status();
                    continue;
                }
                if (!is_ok(s)) {
                    break;
                }
                ++repaired;
                if (change.ref_count > 0) {
                    continue;
                }
                bool deleted = false;
                s = db::db_file_delete_if_unreferenced(handle, d.file_id, &deleted);
                if (!is_ok(s)) {
                    break;
                }
                if (deleted) {
                    purged_keys.push_back(change.storage_key);
                }
            }
        } catch (const std::bad_alloc&) {
            s = make_status(StatusDomain::Library, StatusCode::Unavailable);
        }

        if (!is_ok(s)) {
            (void)db::db_txn_rollback(txn);
            logger()->error("audit repair rolled back status={}", describe(s));
            return s;
        }
        s = db::db_txn_commit(txn);
        if (!is_ok(s)) {
            return s;
        }
        report->repaired = repaired;
        report->purged_files = purged_keys.size();

        if (blobs == nullptr) {
            return ok_status();
        }
        try {
            for (const std::string& key : purged_keys) {
                if (key.empty()) {
                    continue;
                }
                const Status bs = blobs->remove(key);
                if (!is_ok(bs) && !is_not_found(bs)) {
                    logger()->warn("purged file left its blob key={} status={}", key, describe(bs));
                    report->unpurged_blobs.push_back(key);
                }
            }
        } catch (const std::bad_alloc&) {
            return make_status(StatusDomain::Library, StatusCode::Unavailable);
        }
        return ok_status();
    }

} // namespace

Status audit_catalog(db::DbHandle handle, medley::storage::BlobStore* blobs, const AuditOptions& opts,
                     AuditReport* out) noexcept {
    if (out == nullptr || !db::db_handle_valid(handle)) {
        return make_status(StatusDomain::Library, StatusCode::Invalid);
    }
    *out = AuditReport{};

    try {
        std::vector<db::FileRefAudit> rows;
        Status s = db::db_file_ref_audit(handle, &rows);
        if (!is_ok(s)) {
            return s;
        }
        out->files_checked = rows.size();

        for (const db::FileRefAudit& row : rows) {
            // A zero-song file is garbage even when its counter agrees.
            if (row.ref_count != row.song_count || row.song_count == 0) {
                logger()->warn("ref_count drift file_id={} stored={} actual={}", row.file_id.v, row.ref_count,
                               row.song_count);
                out->drifts.push_back(RefDrift{row.file_id, row.ref_count, row.song_count, row.storage_key});
            }
            if (blobs != nullptr && opts.check_blobs) {
                bool present = false;
                s = blobs->exists(row.storage_key, &present);
                if (!is_ok(s)) {
                    return s;
                }
                if (!present) {
                    logger()->warn("blob missing file_id={} key={}", row.file_id.v, row.storage_key);
                    out->missing_blobs.push_back(row.storage_key);
                }
            }
        }

        s = db::db_song_list_orphaned(handle, &out->orphaned_songs);
        if (!is_ok(s)) {
            return s;
        }
        if (!out->orphaned_songs.empty()) {
            logger()->warn("{} songs belong to deleted libraries", out->orphaned_songs.size());
        }

        if (opts.repair && !out->drifts.empty()) {
            s = repair_drifts(handle, blobs, out);
            if (!is_ok(s)) {
                return s;
            }
            logger()->info("audit repaired={} purged={}", out->repaired, out->purged_files);
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Library, StatusCode::Unavailable);
    }
    return ok_status();
}

} // namespace medley::library
