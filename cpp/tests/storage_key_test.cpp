#include <string>

#include <gtest/gtest.h>

#include "medley/storage/blob_store.hpp"
#include "medley/storage/hashing.hpp"
#include "medley/storage/storage_key.hpp"

using namespace medley::core;
using namespace medley::storage;

namespace {

Hash256 hash_of(const char* s) {
    Hash256 h{};
    EXPECT_TRUE(is_ok(hash_compute({reinterpret_cast<const u8*>(s), std::char_traits<char>::length(s)}, &h)));
    return h;
}

} // namespace

TEST(StorageKey, ExtensionFromMime) {
    EXPECT_EQ(extension_for_mime("audio/mpeg"), ".mp3");
    EXPECT_EQ(extension_for_mime("AUDIO/MPEG"), ".mp3");
    EXPECT_EQ(extension_for_mime("audio/flac"), ".flac");
    EXPECT_EQ(extension_for_mime("audio/x-wav"), ".wav");
    EXPECT_EQ(extension_for_mime("audio/mp4"), ".m4a");
    EXPECT_EQ(extension_for_mime("application/x-unknown"), ".audio");
    EXPECT_EQ(extension_for_mime(""), ".audio");
}

TEST(StorageKey, MimeParametersIgnored) {
    EXPECT_EQ(extension_for_mime("audio/mpeg; charset=binary"), ".mp3");
}

TEST(StorageKey, MimeFromKey) {
    EXPECT_EQ(mime_for_key("files/abc.mp3"), "audio/mpeg");
    EXPECT_EQ(mime_for_key("song.FLAC"), "audio/flac");
    EXPECT_EQ(mime_for_key("files/abc.audio"), "application/octet-stream");
    EXPECT_EQ(mime_for_key("noext"), "application/octet-stream");
}

TEST(StorageKey, KeyIsHashPlusExtension) {
    const Hash256 h = hash_of("payload");
    const std::string key = storage_key_for(h, "audio/mpeg");
    EXPECT_EQ(key, "files/" + hash_to_hex(h) + ".mp3");
    EXPECT_TRUE(blob_key_is_valid(key));
}

TEST(StorageKey, SameContentDifferentMimeDiffersOnlyInExtension) {
    const Hash256 h = hash_of("payload");
    const std::string mp3 = storage_key_for(h, "audio/mpeg");
    const std::string wav = storage_key_for(h, "audio/wav");
    EXPECT_NE(mp3, wav);
    EXPECT_EQ(mp3.substr(0, mp3.size() - 4), wav.substr(0, wav.size() - 4));
}
