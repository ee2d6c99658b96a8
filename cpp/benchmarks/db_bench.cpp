#include <benchmark/benchmark.h>
#include "medley/db/catalog.hpp"
#include "medley/db/db.hpp"
#include <cstring>
#include <string>
#include <vector>

using namespace medley::db;
using namespace medley::core;

namespace {

FileRecord make_bench_file(u32 counter) {
    FileRecord f;
    // Use counter to create unique hashes
    std::memcpy(f.hash.b.data(), &counter, sizeof(counter));
    for (size_t i = sizeof(counter); i < 32; ++i) {
        f.hash.b[i] = static_cast<u8>(counter ^ i);
    }
    f.storage_key = "files/bench-" + std::to_string(counter) + ".mp3";
    f.size_bytes = 4096;
    f.mime_type = "audio/mpeg";
    f.ref_count = 1;
    f.created_at = 1234567890;
    return f;
}

DbHandle open_bench_catalog() {
    DbHandle handle;
    (void)db_open(DbConfig{}, &handle);
    (void)catalog_install_schema(handle);
    return handle;
}

} // namespace

//=============================================================================
// Database Lifecycle Benchmarks
//=============================================================================

static void BM_DatabaseOpenWithSchema(benchmark::State& state) {
    for (auto _ : state) {
        DbHandle handle;
        Status s = db_open(DbConfig{}, &handle);
        if (is_ok(s)) {
            s = catalog_install_schema(handle);
        }
        benchmark::DoNotOptimize(s);
        (void)db_close(handle);
    }
}
BENCHMARK(BM_DatabaseOpenWithSchema);

//=============================================================================
// Transaction Benchmarks
//=============================================================================

static void BM_TransactionBeginCommit(benchmark::State& state) {
    DbHandle handle = open_bench_catalog();

    for (auto _ : state) {
        DbTxn txn;
        (void)db_txn_begin(handle, &txn);
        Status s = db_txn_commit(txn);
        benchmark::DoNotOptimize(s);
    }

    (void)db_close(handle);
}
BENCHMARK(BM_TransactionBeginCommit);

//=============================================================================
// File Reference Benchmarks
//=============================================================================

static void BM_FileCreate(benchmark::State& state) {
    DbHandle handle = open_bench_catalog();
    u32 counter = 0;

    for (auto _ : state) {
        const FileRecord f = make_bench_file(counter++);
        FileId id;
        Status s = db_file_create(handle, f, &id);
        benchmark::DoNotOptimize(s);
    }

    (void)db_close(handle);
}
BENCHMARK(BM_FileCreate);

static void BM_FileFindByHash(benchmark::State& state) {
    DbHandle handle = open_bench_catalog();
    const u32 n = static_cast<u32>(state.range(0));
    for (u32 i = 0; i < n; ++i) {
        FileId id;
        (void)db_file_create(handle, make_bench_file(i), &id);
    }
    const FileRecord probe = make_bench_file(n / 2);

    for (auto _ : state) {
        FileRecord out;
        Status s = db_file_find_by_hash(handle, probe.hash, &out);
        benchmark::DoNotOptimize(s);
    }

    (void)db_close(handle);
}
BENCHMARK(BM_FileFindByHash)->Arg(100)->Arg(10000);

static void BM_FileRefIncrementDecrement(benchmark::State& state) {
    DbHandle handle = open_bench_catalog();
    FileId id;
    (void)db_file_create(handle, make_bench_file(0), &id);

    for (auto _ : state) {
        FileRefChange change;
        (void)db_file_increment_ref(handle, id, &change);
        Status s = db_file_decrement_ref(handle, id, &change);
        benchmark::DoNotOptimize(s);
    }

    (void)db_close(handle);
}
BENCHMARK(BM_FileRefIncrementDecrement);

//=============================================================================
// Song Listing Benchmarks
//=============================================================================

static void BM_SongListByLibrary(benchmark::State& state) {
    DbHandle handle = open_bench_catalog();
    const u32 n = static_cast<u32>(state.range(0));

    LibraryRecord lib;
    lib.owner = UserId{1};
    lib.name = "bench";
    LibraryId lib_id;
    (void)db_library_create(handle, lib, &lib_id);
    FileId file_id;
    (void)db_file_create(handle, make_bench_file(0), &file_id);
    for (u32 i = 0; i < n; ++i) {
        SongRecord song;
        song.file_id = file_id;
        song.library_id = lib_id;
        SongId song_id;
        (void)db_song_create(handle, song, &song_id);
    }

    for (auto _ : state) {
        std::vector<SongRecord> songs;
        Status s = db_song_list_by_library(handle, lib_id, &songs);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(songs.size());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * n);

    (void)db_close(handle);
}
BENCHMARK(BM_SongListByLibrary)->Arg(10)->Arg(1000);
