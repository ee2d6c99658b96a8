#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "medley/db/catalog.hpp"
#include "test_support.hpp"

using namespace medley::db;
using namespace medley::core;
using medley::testing::add_to_playlist;
using medley::testing::make_library;
using medley::testing::make_playlist;

namespace {

Hash256 hash_of(u8 fill) {
    Hash256 h;
    h.b.fill(fill);
    return h;
}

FileId make_file(DbHandle db, u8 fill, i64 refs = 1) {
    FileRecord rec;
    rec.hash = hash_of(fill);
    rec.storage_key = "files/" + std::to_string(fill) + ".mp3";
    rec.size_bytes = 1000u + fill;
    rec.mime_type = "audio/mpeg";
    rec.physical.duration_sec = 180;
    rec.ref_count = refs;
    FileId id;
    EXPECT_TRUE(is_ok(db_file_create(db, rec, &id)));
    return id;
}

SongId make_song(DbHandle db, FileId file, LibraryId lib, const char* title) {
    SongRecord song;
    song.file_id = file;
    song.library_id = lib;
    song.tags.title = title;
    SongId id;
    EXPECT_TRUE(is_ok(db_song_create(db, song, &id)));
    return id;
}

class CatalogTest : public ::testing::Test {
protected:
    void SetUp() override { db = medley::testing::open_catalog(); }
    void TearDown() override { (void)db_close(db); }

    DbHandle db{};
};

} // namespace

//=============================================================================
// Files
//=============================================================================

TEST_F(CatalogTest, FileCreateAndLookup) {
    const FileId id = make_file(db, 7);

    FileRecord by_hash;
    ASSERT_TRUE(is_ok(db_file_find_by_hash(db, hash_of(7), &by_hash)));
    EXPECT_EQ(by_hash.id, id);
    EXPECT_EQ(by_hash.storage_key, "files/7.mp3");
    EXPECT_EQ(by_hash.size_bytes, 1007u);
    EXPECT_EQ(by_hash.ref_count, 1);
    EXPECT_EQ(by_hash.physical.duration_sec, 180u);
    EXPECT_FALSE(by_hash.physical.bitrate_kbps.has_value());
    EXPECT_NE(by_hash.created_at, 0);

    FileRecord by_id;
    ASSERT_TRUE(is_ok(db_file_get(db, id, &by_id)));
    EXPECT_EQ(by_id.hash, hash_of(7));

    EXPECT_EQ(db_file_find_by_hash(db, hash_of(8), &by_id).code, StatusCode::NotFound);
    EXPECT_EQ(db_file_get(db, FileId{999}, &by_id).code, StatusCode::NotFound);
}

TEST_F(CatalogTest, DuplicateHashIsConflict) {
    make_file(db, 1);
    FileRecord rec;
    rec.hash = hash_of(1);
    rec.storage_key = "files/other.mp3";
    rec.mime_type = "audio/mpeg";
    FileId id;
    EXPECT_EQ(db_file_create(db, rec, &id).code, StatusCode::Conflict);
}

TEST_F(CatalogTest, FileWithoutStorageKeyIsInvalid) {
    FileRecord rec;
    rec.hash = hash_of(2);
    FileId id;
    EXPECT_EQ(db_file_create(db, rec, &id).code, StatusCode::Invalid);
}

TEST_F(CatalogTest, RefCountDeltasReturnNewValue) {
    const FileId id = make_file(db, 3);

    FileRefChange change;
    ASSERT_TRUE(is_ok(db_file_increment_ref(db, id, &change)));
    EXPECT_EQ(change.ref_count, 2);
    EXPECT_EQ(change.storage_key, "files/3.mp3");

    ASSERT_TRUE(is_ok(db_file_decrement_ref(db, id, &change)));
    ASSERT_TRUE(is_ok(db_file_decrement_ref(db, id, &change)));
    EXPECT_EQ(change.ref_count, 0);

    EXPECT_EQ(db_file_increment_ref(db, FileId{404}, &change).code, StatusCode::NotFound);
    EXPECT_EQ(db_file_decrement_ref(db, FileId::invalid(), &change).code, StatusCode::Invalid);
}

TEST_F(CatalogTest, DeleteIfUnreferencedHonoursCount) {
    const FileId id = make_file(db, 4);

    bool deleted = true;
    ASSERT_TRUE(is_ok(db_file_delete_if_unreferenced(db, id, &deleted)));
    EXPECT_FALSE(deleted);

    FileRefChange change;
    ASSERT_TRUE(is_ok(db_file_decrement_ref(db, id, &change)));
    ASSERT_TRUE(is_ok(db_file_delete_if_unreferenced(db, id, &deleted)));
    EXPECT_TRUE(deleted);

    // A second attempt finds nothing; not an error.
    ASSERT_TRUE(is_ok(db_file_delete_if_unreferenced(db, id, &deleted)));
    EXPECT_FALSE(deleted);
}

TEST_F(CatalogTest, FileReferencedBySongCannotBeDeleted) {
    const LibraryId lib = make_library(db, "L");
    const FileId file = make_file(db, 5, 0);
    make_song(db, file, lib, "held");

    bool deleted = false;
    const Status s = db_file_delete_if_unreferenced(db, file, &deleted);
    EXPECT_EQ(s.code, StatusCode::Conflict);
}

TEST_F(CatalogTest, RefAuditComparesAgainstSongs) {
    const LibraryId lib = make_library(db, "L");
    const FileId a = make_file(db, 1, 2);
    const FileId b = make_file(db, 2, 5);
    make_song(db, a, lib, "a1");
    make_song(db, a, lib, "a2");
    make_song(db, b, lib, "b1");

    std::vector<FileRefAudit> rows;
    ASSERT_TRUE(is_ok(db_file_ref_audit(db, &rows)));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].file_id, a);
    EXPECT_EQ(rows[0].ref_count, 2);
    EXPECT_EQ(rows[0].song_count, 2);
    EXPECT_EQ(rows[1].file_id, b);
    EXPECT_EQ(rows[1].ref_count, 5);
    EXPECT_EQ(rows[1].song_count, 1);

    ASSERT_TRUE(is_ok(db_file_set_ref_count(db, b, 1)));
    ASSERT_TRUE(is_ok(db_file_ref_audit(db, &rows)));
    EXPECT_EQ(rows[1].ref_count, 1);
    EXPECT_EQ(db_file_set_ref_count(db, FileId{77}, 1).code, StatusCode::NotFound);
}

TEST_F(CatalogTest, FileListIsOrderedById) {
    const FileId a = make_file(db, 9);
    const FileId b = make_file(db, 3);
    std::vector<FileRecord> files;
    ASSERT_TRUE(is_ok(db_file_list(db, &files)));
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].id, a);
    EXPECT_EQ(files[1].id, b);
}

//=============================================================================
// Libraries and songs
//=============================================================================

TEST_F(CatalogTest, LibraryCrudAndSongCounter) {
    const LibraryId lib = make_library(db, "Main", false, UserId{42});
    make_library(db, "Other owner", true, UserId{7});

    LibraryRecord rec;
    ASSERT_TRUE(is_ok(db_library_get(db, lib, &rec)));
    EXPECT_EQ(rec.name, "Main");
    EXPECT_EQ(rec.owner, UserId{42});
    EXPECT_FALSE(rec.can_delete);
    EXPECT_EQ(rec.song_count, 0u);

    const FileId file = make_file(db, 1);
    const SongId s1 = make_song(db, file, lib, "one");
    make_song(db, file, lib, "two");
    ASSERT_TRUE(is_ok(db_library_get(db, lib, &rec)));
    EXPECT_EQ(rec.song_count, 2u);

    ASSERT_TRUE(is_ok(db_song_delete(db, s1)));
    ASSERT_TRUE(is_ok(db_library_get(db, lib, &rec)));
    EXPECT_EQ(rec.song_count, 1u);

    std::vector<LibraryRecord> owned;
    ASSERT_TRUE(is_ok(db_library_list_by_owner(db, UserId{42}, &owned)));
    ASSERT_EQ(owned.size(), 1u);
    EXPECT_EQ(owned[0].id, lib);

    ASSERT_TRUE(is_ok(db_library_delete(db, lib)));
    EXPECT_EQ(db_library_get(db, lib, &rec).code, StatusCode::NotFound);
    EXPECT_EQ(db_library_delete(db, lib).code, StatusCode::NotFound);
}

TEST_F(CatalogTest, EmptyLibraryNameIsInvalid) {
    LibraryRecord rec;
    rec.owner = UserId{1};
    LibraryId id;
    EXPECT_EQ(db_library_create(db, rec, &id).code, StatusCode::Invalid);
}

TEST_F(CatalogTest, CatalogSongRequiresFile) {
    const LibraryId lib = make_library(db, "L");
    SongRecord song;
    song.library_id = lib;
    SongId id;
    EXPECT_EQ(db_song_create(db, song, &id).code, StatusCode::Invalid);

    song.file_id = FileId{12345};
    EXPECT_EQ(db_song_create(db, song, &id).code, StatusCode::Conflict);
}

TEST_F(CatalogTest, SongRoundTripsTags) {
    const LibraryId lib = make_library(db, "L");
    const FileId file = make_file(db, 1);

    SongRecord song;
    song.file_id = file;
    song.library_id = lib;
    song.tags.title = "Title";
    song.tags.artist = "Artist";
    song.tags.year = 1999;
    song.tags.track_number = 3;
    song.tags.physical.sample_rate = 44100;
    SongId id;
    ASSERT_TRUE(is_ok(db_song_create(db, song, &id)));

    SongRecord got;
    ASSERT_TRUE(is_ok(db_song_get(db, id, &got)));
    EXPECT_EQ(got.file_id, file);
    EXPECT_EQ(got.library_id, lib);
    EXPECT_EQ(got.tags.title, "Title");
    EXPECT_EQ(got.tags.artist, "Artist");
    EXPECT_FALSE(got.tags.album.has_value());
    EXPECT_EQ(got.tags.year, 1999u);
    EXPECT_EQ(got.tags.track_number, 3u);
    EXPECT_EQ(got.tags.physical.sample_rate, 44100u);
    EXPECT_TRUE(got.stream_url.empty());
    EXPECT_EQ(got.created_at, got.updated_at);
}

TEST_F(CatalogTest, SongsListedByLibraryInIdOrder) {
    const LibraryId a = make_library(db, "A");
    const LibraryId b = make_library(db, "B");
    const FileId file = make_file(db, 1);
    const SongId a1 = make_song(db, file, a, "a1");
    make_song(db, file, b, "b1");
    const SongId a2 = make_song(db, file, a, "a2");

    std::vector<SongRecord> songs;
    ASSERT_TRUE(is_ok(db_song_list_by_library(db, a, &songs)));
    ASSERT_EQ(songs.size(), 2u);
    EXPECT_EQ(songs[0].id, a1);
    EXPECT_EQ(songs[1].id, a2);

    ASSERT_TRUE(is_ok(db_song_list_by_library(db, LibraryId{999}, &songs)));
    EXPECT_TRUE(songs.empty());
}

TEST_F(CatalogTest, SongsOutlivingTheirLibraryAreOrphans) {
    const LibraryId lib = make_library(db, "Gone");
    const LibraryId kept = make_library(db, "Kept");
    const FileId file = make_file(db, 1);
    const SongId orphan = make_song(db, file, lib, "left behind");
    make_song(db, file, kept, "fine");

    ASSERT_TRUE(is_ok(db_library_delete(db, lib)));

    std::vector<SongRecord> orphans;
    ASSERT_TRUE(is_ok(db_song_list_orphaned(db, &orphans)));
    ASSERT_EQ(orphans.size(), 1u);
    EXPECT_EQ(orphans[0].id, orphan);
}

TEST_F(CatalogTest, DeleteMissingSongIsNotFound) {
    EXPECT_EQ(db_song_delete(db, SongId{31337}).code, StatusCode::NotFound);
}

//=============================================================================
// Playlists
//=============================================================================

TEST_F(CatalogTest, PlaylistEntriesAndCounters) {
    const LibraryId lib = make_library(db, "L");
    const FileId file = make_file(db, 1);
    const SongId s1 = make_song(db, file, lib, "one");
    const SongId s2 = make_song(db, file, lib, "two");
    const PlaylistId pl = make_playlist(db, "Mix");
    add_to_playlist(db, pl, s2, 0);
    add_to_playlist(db, pl, s1, 1);

    std::vector<PlaylistSongRecord> entries;
    ASSERT_TRUE(is_ok(db_playlist_song_list(db, pl, &entries)));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].song_id, s2);
    EXPECT_EQ(entries[1].song_id, s1);

    PlaylistRecord rec;
    ASSERT_TRUE(is_ok(db_playlist_get(db, pl, &rec)));
    EXPECT_EQ(rec.song_count, 2u);
    EXPECT_FALSE(rec.linked_library.is_valid());

    // Duplicate entry.
    PlaylistSongRecord dup;
    dup.playlist_id = pl;
    dup.song_id = s1;
    EXPECT_EQ(db_playlist_song_add(db, dup).code, StatusCode::Conflict);

    // Deleting a song removes its entries and keeps the counter in step.
    ASSERT_TRUE(is_ok(db_song_delete(db, s1)));
    ASSERT_TRUE(is_ok(db_playlist_get(db, pl, &rec)));
    EXPECT_EQ(rec.song_count, 1u);
    ASSERT_TRUE(is_ok(db_playlist_song_list(db, pl, &entries)));
    EXPECT_EQ(entries.size(), 1u);
}

TEST_F(CatalogTest, DeleteEntriesForSongsAcrossPlaylists) {
    const LibraryId lib = make_library(db, "L");
    const FileId file = make_file(db, 1);
    const SongId s1 = make_song(db, file, lib, "one");
    const SongId s2 = make_song(db, file, lib, "two");
    const SongId s3 = make_song(db, file, lib, "three");
    const PlaylistId p1 = make_playlist(db, "P1");
    const PlaylistId p2 = make_playlist(db, "P2");
    add_to_playlist(db, p1, s1);
    add_to_playlist(db, p1, s2);
    add_to_playlist(db, p2, s2);
    add_to_playlist(db, p2, s3);

    u64 removed = 0;
    ASSERT_TRUE(is_ok(db_playlist_songs_delete_for_songs(db, {s1, s2}, &removed)));
    EXPECT_EQ(removed, 3u);

    PlaylistRecord rec;
    ASSERT_TRUE(is_ok(db_playlist_get(db, p1, &rec)));
    EXPECT_EQ(rec.song_count, 0u);
    ASSERT_TRUE(is_ok(db_playlist_get(db, p2, &rec)));
    EXPECT_EQ(rec.song_count, 1u);

    ASSERT_TRUE(is_ok(db_playlist_songs_delete_for_songs(db, {}, &removed)));
    EXPECT_EQ(removed, 0u);
}

TEST_F(CatalogTest, DeletePlaylistEntriesThenRow) {
    const LibraryId lib = make_library(db, "L");
    const FileId file = make_file(db, 1);
    const PlaylistId pl = make_playlist(db, "P");
    add_to_playlist(db, pl, make_song(db, file, lib, "one"));
    add_to_playlist(db, pl, make_song(db, file, lib, "two"));

    u64 removed = 0;
    ASSERT_TRUE(is_ok(db_playlist_songs_delete_for_playlist(db, pl, &removed)));
    EXPECT_EQ(removed, 2u);
    ASSERT_TRUE(is_ok(db_playlist_delete(db, pl)));

    PlaylistRecord rec;
    EXPECT_EQ(db_playlist_get(db, pl, &rec).code, StatusCode::NotFound);
    EXPECT_EQ(db_playlist_delete(db, pl).code, StatusCode::NotFound);
}

TEST_F(CatalogTest, LibraryDeleteUnlinksPlaylists) {
    const LibraryId lib = make_library(db, "L");
    PlaylistRecord linked;
    linked.owner = UserId{1};
    linked.name = "Linked";
    linked.linked_library = lib;
    PlaylistId pl;
    ASSERT_TRUE(is_ok(db_playlist_create(db, linked, &pl)));

    ASSERT_TRUE(is_ok(db_library_delete(db, lib)));

    PlaylistRecord rec;
    ASSERT_TRUE(is_ok(db_playlist_get(db, pl, &rec)));
    EXPECT_FALSE(rec.linked_library.is_valid());
}
