#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "medley/library/backend.hpp"
#include "medley/library/uploader.hpp"
#include "medley/media/tags.hpp"
#include "medley/storage/hashing.hpp"
#include "test_support.hpp"

using namespace medley::core;
using namespace medley::library;
using medley::db::DbTxn;
using medley::db::FileRefChange;
using medley::storage::BufferView;
using medley::storage::view_of;
using medley::testing::bytes_of;
using medley::testing::get_file;
using medley::testing::make_library;

namespace {

// Forwards everything to another store; tests override single steps.
class ForwardingStore : public FileRefStore {
public:
    explicit ForwardingStore(FileRefStore& inner) : inner_(inner) {}

    Status find_by_hash(const Hash256& hash, FileRecord* out) noexcept override {
        return inner_.find_by_hash(hash, out);
    }
    Status get_file(FileId id, FileRecord* out) noexcept override { return inner_.get_file(id, out); }
    Status create_file(const FileRecord& file, FileId* out) noexcept override { return inner_.create_file(file, out); }
    Status increment_ref(FileId id, FileRefChange* out) noexcept override { return inner_.increment_ref(id, out); }
    Status decrement_ref(FileId id, FileRefChange* out) noexcept override { return inner_.decrement_ref(id, out); }
    Status delete_file_if_unreferenced(FileId id, bool* deleted) noexcept override {
        return inner_.delete_file_if_unreferenced(id, deleted);
    }
    Status put_blob(std::string_view key, BufferView data, std::string_view content_type) noexcept override {
        return inner_.put_blob(key, data, content_type);
    }
    Status delete_blob(std::string_view key) noexcept override { return inner_.delete_blob(key); }
    Status create_song(const SongRecord& song, SongId* out) noexcept override { return inner_.create_song(song, out); }
    Status txn_begin(DbTxn* out) noexcept override { return inner_.txn_begin(out); }
    Status txn_commit(DbTxn txn) noexcept override { return inner_.txn_commit(txn); }
    Status txn_rollback(DbTxn txn) noexcept override { return inner_.txn_rollback(txn); }

protected:
    FileRefStore& inner_;
};

class SongInsertFails final : public ForwardingStore {
public:
    using ForwardingStore::ForwardingStore;
    Status create_song(const SongRecord&, SongId*) noexcept override {
        return make_status(StatusDomain::Db, StatusCode::Io);
    }
};

class FileInsertFails final : public ForwardingStore {
public:
    using ForwardingStore::ForwardingStore;
    Status create_file(const FileRecord&, FileId*) noexcept override {
        return make_status(StatusDomain::Db, StatusCode::Io);
    }
};

// Another writer inserts the same hash between our lookup and our insert.
class RacingInsert final : public ForwardingStore {
public:
    using ForwardingStore::ForwardingStore;
    Status find_by_hash(const Hash256& hash, FileRecord* out) noexcept override {
        if (!raced_) {
            raced_ = true;
            FileRecord rival;
            rival.hash = hash;
            rival.storage_key = "files/rival.mp3";
            rival.size_bytes = 1;
            rival.mime_type = "audio/mpeg";
            rival.ref_count = 1;
            FileId id;
            EXPECT_TRUE(is_ok(inner_.create_file(rival, &id)));
            return make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        return inner_.find_by_hash(hash, out);
    }

private:
    bool raced_{false};
};

class ThrowingExtractor final : public medley::media::TagExtractor {
public:
    Status extract(BufferView, std::string_view, TagRecord*) override { throw std::runtime_error("decoder crashed"); }
};

class UploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = medley::testing::open_catalog();
        backend = std::make_unique<CatalogBackend>(db, blobs);
        lib = make_library(db, "Uploads");
    }
    void TearDown() override {
        backend.reset();
        (void)medley::db::db_close(db);
    }

    medley::db::DbHandle db{};
    medley::storage::MemoryBlobStore blobs;
    std::unique_ptr<CatalogBackend> backend;
    medley::media::BasicTagExtractor extractor;
    LibraryId lib{};
};

} // namespace

TEST_F(UploaderTest, SameBytesStoredOnce) {
    Uploader up(*backend, &extractor);
    const std::vector<u8> data = bytes_of("the same song twice");

    UploadResult first;
    ASSERT_TRUE(is_ok(up.upload(view_of(data), "a.mp3", "audio/mpeg", &first)));
    EXPECT_TRUE(first.is_new_file);
    EXPECT_EQ(first.ref_count, 1);
    EXPECT_EQ(first.storage_key, "files/" + medley::storage::hash_to_hex(first.hash) + ".mp3");

    UploadResult second;
    ASSERT_TRUE(is_ok(up.upload(view_of(data), "b.flac", "audio/flac", &second)));
    EXPECT_FALSE(second.is_new_file);
    EXPECT_EQ(second.file_id, first.file_id);
    EXPECT_EQ(second.ref_count, 2);
    EXPECT_EQ(second.storage_key, first.storage_key);

    EXPECT_EQ(blobs.put_count(), 1u);
    EXPECT_EQ(get_file(db, first.file_id).ref_count, 2);
}

TEST_F(UploaderTest, UploadSongCreatesRowWithMergedTags) {
    Uploader up(*backend, &extractor);
    const std::vector<u8> data = bytes_of("not decodable, tags come from the name");

    TagRecord overrides;
    overrides.album = "Override Album";
    overrides.artist = "Override Artist";

    UploadResult result;
    SongId song_id;
    ASSERT_TRUE(is_ok(up.upload_song(lib, view_of(data), "Someone - Tune.mp3", "", &overrides, &result, &song_id)));

    SongRecord song;
    ASSERT_TRUE(is_ok(medley::db::db_song_get(db, song_id, &song)));
    EXPECT_EQ(song.file_id, result.file_id);
    EXPECT_EQ(song.library_id, lib);
    EXPECT_EQ(song.tags.title, "Tune");
    EXPECT_EQ(song.tags.artist, "Override Artist");
    EXPECT_EQ(song.tags.album, "Override Album");

    // Empty mime falls back to audio/mpeg.
    EXPECT_EQ(get_file(db, result.file_id).mime_type, "audio/mpeg");
}

TEST_F(UploaderTest, OversizedUploadRejected) {
    Uploader up(*backend, &extractor, UploaderConfig{8, 4});
    const std::vector<u8> data = bytes_of("nine byte");
    UploadResult result;
    const Status s = up.upload(view_of(data), "big.mp3", "audio/mpeg", &result);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Library);
    EXPECT_EQ(s.aux, 1u);
    EXPECT_EQ(blobs.size(), 0u);
}

TEST_F(UploaderTest, ExpectedHashMismatchIsCorrupt) {
    Uploader up(*backend, &extractor);
    const std::vector<u8> data = bytes_of("payload");
    Hash256 wrong;
    wrong.b.fill(0xAB);
    UploadResult result;
    EXPECT_EQ(up.upload(view_of(data), "x.mp3", "audio/mpeg", &result, &wrong).code, StatusCode::Corrupt);

    Hash256 right;
    ASSERT_TRUE(is_ok(medley::storage::hash_compute(view_of(data), &right)));
    EXPECT_TRUE(is_ok(up.upload(view_of(data), "x.mp3", "audio/mpeg", &result, &right)));
}

TEST_F(UploaderTest, NoExtractorUsesFilename) {
    Uploader up(*backend, nullptr);
    const std::vector<u8> data = bytes_of("bytes");
    UploadResult result;
    ASSERT_TRUE(is_ok(up.upload(view_of(data), "07 - Seventh.wav", "audio/wav", &result)));
    EXPECT_EQ(result.suggested_tags.title, "Seventh");
    EXPECT_EQ(result.storage_key.substr(result.storage_key.size() - 4), ".wav");
}

TEST_F(UploaderTest, ThrowingExtractorFallsBackToFilename) {
    ThrowingExtractor throwing;
    Uploader up(*backend, &throwing);
    const std::vector<u8> data = bytes_of("bytes");
    UploadResult result;
    ASSERT_TRUE(is_ok(up.upload(view_of(data), "Fallback.mp3", "audio/mpeg", &result)));
    EXPECT_EQ(result.suggested_tags.title, "Fallback");
}

TEST_F(UploaderTest, FailedSongInsertReleasesNewFile) {
    SongInsertFails store(*backend);
    Uploader up(store, &extractor);
    const std::vector<u8> data = bytes_of("doomed upload");

    UploadResult result;
    SongId song_id;
    const Status s = up.upload_song(lib, view_of(data), "doomed.mp3", "audio/mpeg", nullptr, &result, &song_id);
    EXPECT_EQ(s.code, StatusCode::Io);

    Status fs;
    get_file(db, result.file_id, &fs);
    EXPECT_EQ(fs.code, StatusCode::NotFound);
    EXPECT_EQ(blobs.size(), 0u);
}

TEST_F(UploaderTest, FailedSongInsertKeepsSharedFile) {
    Uploader good(*backend, &extractor);
    const std::vector<u8> data = bytes_of("shared upload");
    UploadResult first;
    SongId first_song;
    ASSERT_TRUE(is_ok(good.upload_song(lib, view_of(data), "s.mp3", "audio/mpeg", nullptr, &first, &first_song)));

    SongInsertFails store(*backend);
    Uploader bad(store, &extractor);
    UploadResult second;
    SongId second_song;
    EXPECT_FALSE(is_ok(bad.upload_song(lib, view_of(data), "s.mp3", "audio/mpeg", nullptr, &second, &second_song)));

    EXPECT_EQ(get_file(db, first.file_id).ref_count, 1);
    EXPECT_EQ(blobs.size(), 1u);
}

TEST_F(UploaderTest, InsertConflictRetriesAsIncrement) {
    RacingInsert store(*backend);
    Uploader up(store, &extractor);
    const std::vector<u8> data = bytes_of("contended content");

    UploadResult result;
    ASSERT_TRUE(is_ok(up.upload(view_of(data), "race.mp3", "audio/mpeg", &result)));
    EXPECT_FALSE(result.is_new_file);
    EXPECT_EQ(result.ref_count, 2);
    EXPECT_EQ(result.storage_key, "files/rival.mp3");

    // The blob written for the losing insert is cleaned up.
    std::vector<std::string> keys;
    ASSERT_TRUE(is_ok(blobs.list("files/", &keys)));
    EXPECT_TRUE(keys.empty());
}

TEST_F(UploaderTest, FailedFileInsertRemovesWrittenBlob) {
    FileInsertFails failing(*backend);
    Uploader up(failing, nullptr);
    const std::vector<u8> data = bytes_of("never recorded");

    UploadResult result;
    EXPECT_EQ(up.upload(view_of(data), "lost.mp3", "audio/mpeg", &result).code, StatusCode::Io);

    std::vector<std::string> keys;
    ASSERT_TRUE(is_ok(blobs.list("files/", &keys)));
    EXPECT_TRUE(keys.empty());
    std::vector<FileRecord> files;
    ASSERT_TRUE(is_ok(medley::db::db_file_list(db, &files)));
    EXPECT_TRUE(files.empty());
}

TEST_F(UploaderTest, ConcurrentUploadsConvergeOnOneFile) {
    constexpr int kThreads = 8;
    const std::vector<u8> data = bytes_of("popular track uploaded by everyone at once");

    std::atomic<int> ok{0};
    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            Uploader up(*backend, nullptr, UploaderConfig{kDefaultMaxUploadBytes, 16});
            UploadResult result;
            if (is_ok(up.upload(view_of(data), "hit.mp3", "audio/mpeg", &result))) {
                ++ok;
                if (result.is_new_file) {
                    ++created;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ok.load(), kThreads);
    EXPECT_EQ(created.load(), 1);

    std::vector<FileRecord> files;
    ASSERT_TRUE(is_ok(medley::db::db_file_list(db, &files)));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].ref_count, kThreads);
}

TEST_F(UploaderTest, LinkFileSharesExistingFile) {
    Uploader up(*backend, &extractor);
    const std::vector<u8> data = bytes_of("linked");
    UploadResult result;
    SongId original;
    ASSERT_TRUE(is_ok(up.upload_song(lib, view_of(data), "o.mp3", "audio/mpeg", nullptr, &result, &original)));

    const LibraryId other = make_library(db, "Friend", true, UserId{2});
    TagRecord tags;
    tags.title = "Shared copy";
    SongId linked;
    ASSERT_TRUE(is_ok(up.link_file(result.file_id, other, tags, &linked)));

    SongRecord song;
    ASSERT_TRUE(is_ok(medley::db::db_song_get(db, linked, &song)));
    EXPECT_EQ(song.file_id, result.file_id);
    EXPECT_EQ(song.library_id, other);
    EXPECT_EQ(get_file(db, result.file_id).ref_count, 2);
}

TEST_F(UploaderTest, LinkMissingFileCreatesNothing) {
    Uploader up(*backend, &extractor);
    SongId linked;
    EXPECT_EQ(up.link_file(FileId{999}, lib, TagRecord{}, &linked).code, StatusCode::NotFound);

    std::vector<SongRecord> songs;
    ASSERT_TRUE(is_ok(medley::db::db_song_list_by_library(db, lib, &songs)));
    EXPECT_TRUE(songs.empty());
    EXPECT_EQ(up.link_file(FileId::invalid(), lib, TagRecord{}, &linked).code, StatusCode::Invalid);
}

TEST(MergeTags, OverridesOnlySetFields) {
    TagRecord suggested;
    suggested.title = "From file";
    suggested.year = 2000;
    TagRecord overrides;
    overrides.year = 2020;
    const TagRecord merged = merge_tags(suggested, &overrides);
    EXPECT_EQ(merged.title, "From file");
    EXPECT_EQ(merged.year, 2020u);
    EXPECT_EQ(merge_tags(suggested, nullptr).year, 2000u);
}
