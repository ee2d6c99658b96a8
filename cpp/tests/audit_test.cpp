#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "medley/db/catalog.hpp"
#include "medley/library/audit.hpp"
#include "medley/library/backend.hpp"
#include "medley/library/uploader.hpp"
#include "test_support.hpp"

using namespace medley::core;
using namespace medley::library;
using medley::storage::view_of;
using medley::testing::bytes_of;
using medley::testing::get_file;
using medley::testing::make_library;

namespace {

// Runs a hook on the first exists() call, then forwards everything.
class LinkDuringScan final : public medley::storage::BlobStore {
public:
    LinkDuringScan(medley::storage::BlobStore& inner, std::function<void()> hook)
        : inner_(inner), hook_(std::move(hook)) {}

    Status put(std::string_view key, medley::storage::BufferView data, std::string_view content_type) noexcept override {
        return inner_.put(key, data, content_type);
    }
    Status get(std::string_view key, std::vector<u8>* out) noexcept override { return inner_.get(key, out); }
    Status stream_range(std::string_view key, u64 start, u64 end, std::vector<u8>* out) noexcept override {
        return inner_.stream_range(key, start, end, out);
    }
    Status remove(std::string_view key) noexcept override { return inner_.remove(key); }
    Status exists(std::string_view key, bool* out) noexcept override {
        if (hook_) {
            auto hook = std::move(hook_);
            hook_ = nullptr;
            hook();
        }
        return inner_.exists(key, out);
    }
    Status get_metadata(std::string_view key, medley::storage::BlobMetadata* out) noexcept override {
        return inner_.get_metadata(key, out);
    }
    Status list(std::string_view prefix, std::vector<std::string>* out) noexcept override {
        return inner_.list(prefix, out);
    }

private:
    medley::storage::BlobStore& inner_;
    std::function<void()> hook_;
};

class AuditTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = medley::testing::open_catalog();
        backend = std::make_unique<CatalogBackend>(db, blobs);
        lib = make_library(db, "L");
    }
    void TearDown() override {
        backend.reset();
        (void)medley::db::db_close(db);
    }

    UploadResult upload_song(std::string_view content) {
        Uploader up(*backend, nullptr);
        const std::vector<u8> data = bytes_of(content);
        UploadResult result;
        SongId song;
        EXPECT_TRUE(is_ok(up.upload_song(lib, view_of(data), "t.mp3", "audio/mpeg", nullptr, &result, &song)));
        return result;
    }

    medley::db::DbHandle db{};
    medley::testing::FlakyBlobStore blobs;
    std::unique_ptr<CatalogBackend> backend;
    LibraryId lib{};
};

} // namespace

TEST_F(AuditTest, ConsistentCatalogIsClean) {
    upload_song("a");
    upload_song("a");
    upload_song("b");

    AuditReport report;
    ASSERT_TRUE(is_ok(audit_catalog(db, &blobs, AuditOptions{}, &report)));
    EXPECT_EQ(report.files_checked, 2u);
    EXPECT_TRUE(audit_clean(report));
}

TEST_F(AuditTest, ReportsDriftWithoutRepairing) {
    const UploadResult r = upload_song("a");
    ASSERT_TRUE(is_ok(medley::db::db_file_set_ref_count(db, r.file_id, 5)));

    AuditReport report;
    ASSERT_TRUE(is_ok(audit_catalog(db, &blobs, AuditOptions{}, &report)));
    ASSERT_EQ(report.drifts.size(), 1u);
    EXPECT_EQ(report.drifts[0].file_id, r.file_id);
    EXPECT_EQ(report.drifts[0].stored, 5);
    EXPECT_EQ(report.drifts[0].actual, 1);
    EXPECT_EQ(report.repaired, 0u);
    EXPECT_EQ(get_file(db, r.file_id).ref_count, 5);
}

TEST_F(AuditTest, RepairResetsCountsAndPurgesUnreferenced) {
    const UploadResult kept = upload_song("kept");
    ASSERT_TRUE(is_ok(medley::db::db_file_set_ref_count(db, kept.file_id, 3)));

    // A file with no songs at all.
    Uploader up(*backend, nullptr);
    const std::vector<u8> data = bytes_of("loose");
    UploadResult loose;
    ASSERT_TRUE(is_ok(up.upload(view_of(data), "loose.mp3", "audio/mpeg", &loose)));

    AuditOptions opts;
    opts.repair = true;
    AuditReport report;
    ASSERT_TRUE(is_ok(audit_catalog(db, &blobs, opts, &report)));
    EXPECT_EQ(report.drifts.size(), 2u);
    EXPECT_EQ(report.repaired, 2u);
    EXPECT_EQ(report.purged_files, 1u);

    EXPECT_EQ(get_file(db, kept.file_id).ref_count, 1);
    Status fs;
    get_file(db, loose.file_id, &fs);
    EXPECT_EQ(fs.code, StatusCode::NotFound);
    bool present = true;
    ASSERT_TRUE(is_ok(blobs.inner().exists(loose.storage_key, &present)));
    EXPECT_FALSE(present);

    AuditReport again;
    ASSERT_TRUE(is_ok(audit_catalog(db, &blobs, AuditOptions{}, &again)));
    EXPECT_TRUE(audit_clean(again));
}

TEST_F(AuditTest, BlobFailureAfterRepairIsReported) {
    const UploadResult drifted = upload_song("drifted");
    ASSERT_TRUE(is_ok(medley::db::db_file_set_ref_count(db, drifted.file_id, 9)));

    Uploader up(*backend, nullptr);
    const std::vector<u8> data = bytes_of("loose");
    UploadResult loose;
    ASSERT_TRUE(is_ok(up.upload(view_of(data), "loose.mp3", "audio/mpeg", &loose)));
    blobs.fail_remove(loose.storage_key);

    AuditOptions opts;
    opts.repair = true;
    AuditReport report;
    ASSERT_TRUE(is_ok(audit_catalog(db, &blobs, opts, &report)));
    EXPECT_EQ(get_file(db, drifted.file_id).ref_count, 1);
    EXPECT_EQ(report.purged_files, 1u);
    ASSERT_EQ(report.unpurged_blobs.size(), 1u);
    EXPECT_EQ(report.unpurged_blobs[0], loose.storage_key);

    Status fs;
    get_file(db, loose.file_id, &fs);
    EXPECT_EQ(fs.code, StatusCode::NotFound);
}

TEST_F(AuditTest, RepairRecountsSongsLinkedAfterScan) {
    const UploadResult r = upload_song("relinked");
    std::vector<SongRecord> songs;
    ASSERT_TRUE(is_ok(medley::db::db_song_list_by_library(db, lib, &songs)));
    ASSERT_EQ(songs.size(), 1u);
    ASSERT_TRUE(is_ok(medley::db::db_song_delete(db, songs[0].id)));

    // The scan sees stored=1, actual=0; a song is linked while blobs are checked.
    LinkDuringScan store(blobs, [&] {
        Uploader up(*backend, nullptr);
        TagRecord tags;
        tags.title = "Back again";
        SongId linked;
        EXPECT_TRUE(is_ok(up.link_file(r.file_id, lib, tags, &linked)));
    });

    AuditOptions opts;
    opts.repair = true;
    AuditReport report;
    ASSERT_TRUE(is_ok(audit_catalog(db, &store, opts, &report)));
    ASSERT_EQ(report.drifts.size(), 1u);
    EXPECT_EQ(report.drifts[0].actual, 0);
    EXPECT_EQ(report.purged_files, 0u);

    EXPECT_EQ(get_file(db, r.file_id).ref_count, 1);
    bool present = false;
    ASSERT_TRUE(is_ok(blobs.inner().exists(r.storage_key, &present)));
    EXPECT_TRUE(present);

    AuditReport again;
    ASSERT_TRUE(is_ok(audit_catalog(db, &blobs, AuditOptions{}, &again)));
    EXPECT_TRUE(audit_clean(again));
}

TEST_F(AuditTest, MissingBlobsAndOrphans) {
    const UploadResult r = upload_song("vanishing");
    ASSERT_TRUE(is_ok(blobs.inner().remove(r.storage_key)));
    ASSERT_TRUE(is_ok(medley::db::db_library_delete(db, lib)));

    AuditReport report;
    ASSERT_TRUE(is_ok(audit_catalog(db, &blobs, AuditOptions{}, &report)));
    ASSERT_EQ(report.missing_blobs.size(), 1u);
    EXPECT_EQ(report.missing_blobs[0], r.storage_key);
    ASSERT_EQ(report.orphaned_songs.size(), 1u);
    EXPECT_EQ(report.orphaned_songs[0].file_id, r.file_id);
    EXPECT_FALSE(audit_clean(report));

    // Without a blob store only the database is checked.
    ASSERT_TRUE(is_ok(audit_catalog(db, nullptr, AuditOptions{}, &report)));
    EXPECT_TRUE(report.missing_blobs.empty());
}

TEST(Audit, NullReportIsInvalid) {
    EXPECT_EQ(audit_catalog(medley::db::DbHandle{}, nullptr, AuditOptions{}, nullptr).code, StatusCode::Invalid);
}
