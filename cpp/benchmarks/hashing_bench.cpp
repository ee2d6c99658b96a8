#include <array>
#include <cstddef>

#include <benchmark/benchmark.h>

#include "medley/storage/hashing.hpp"
#include "medley/storage/storage_key.hpp"

static void BM_HashCompute(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::array<medley::core::u8, 65536> buf{};
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<medley::core::u8>(i & 0xffu);
    }

    for (auto _ : state){
        medley::core::Hash256 out{};
        medley::core::Status s = medley::storage::hash_compute({buf.data(), static_cast<medley::core::u64>(n)}, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_HashCompute)->Arg(0)->Arg(64)->Arg(4096)->Arg(65536);

static void BM_StorageKeyFor(benchmark::State& state){
    medley::core::Hash256 h{};
    for (size_t i = 0; i < h.b.size(); ++i){
        h.b[i] = static_cast<medley::core::u8>(i * 7u);
    }
    for (auto _ : state){
        auto key = medley::storage::storage_key_for(h, "audio/flac");
        benchmark::DoNotOptimize(key);
    }
}

BENCHMARK(BM_StorageKeyFor);
