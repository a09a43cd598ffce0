/**
 * @file bench_content_hasher.cpp
 * @brief Benchmarks for SHA-256 content hashing
 */

#include <benchmark/benchmark.h>

#include <kcenon/storage_transfer/core/content_hasher.h>

#include "utils/benchmark_helpers.h"

#include <span>

namespace kcenon::storage_transfer::benchmark {

/**
 * @brief Hash an in-memory buffer in one call
 */
static void BM_ContentHasher_Buffer(::benchmark::State& state) {
    if (!content_hasher::is_available()) {
        state.SkipWithError("Built without digest support");
        return;
    }
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = random_payload(data_size, 42);

    for (auto _ : state) {
        auto digest = content_hasher::hash_buffer(std::span<const std::byte>(data));
        if (!digest) {
            state.SkipWithError("Failed to hash buffer");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Hash a file on disk with a given read size
 */
static void BM_ContentHasher_File(::benchmark::State& state) {
    if (!content_hasher::is_available()) {
        state.SkipWithError("Built without digest support");
        return;
    }
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    scratch_file scratch("hash_test.bin", file_size, 42);
    auto file = file_ref::from_path(scratch.path());
    if (!scratch.ok() || !file) {
        state.SkipWithError("Failed to open test file");
        return;
    }

    hasher_config config;
    config.chunk_size = chunk_size;
    config.pre_upload_threshold = file_size;
    content_hasher hasher(config);

    for (auto _ : state) {
        auto digest = hasher.hash(file.value());
        if (!digest) {
            state.SkipWithError("Failed to hash file");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Cost of per-chunk progress reporting
 */
static void BM_ContentHasher_WithProgress(::benchmark::State& state) {
    if (!content_hasher::is_available()) {
        state.SkipWithError("Built without digest support");
        return;
    }
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto file = file_ref::from_buffer("progress.bin",
                                      random_payload(data_size, 7));
    content_hasher hasher;

    uint64_t last = 0;
    hash_request request;
    request.on_progress = [&last](uint64_t processed, uint64_t) { last = processed; };

    for (auto _ : state) {
        auto digest = hasher.hash(file, request);
        ::benchmark::DoNotOptimize(digest);
        ::benchmark::DoNotOptimize(last);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ContentHasher_Buffer)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::quick_hash_limit))
    ->Arg(static_cast<int64_t>(sizes::pre_upload_limit))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ContentHasher_File)
    ->Args({static_cast<int64_t>(sizes::pre_upload_limit), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::pre_upload_limit),
            static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::pre_upload_limit), static_cast<int64_t>(sizes::max_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ContentHasher_WithProgress)
    ->Arg(static_cast<int64_t>(sizes::quick_hash_limit))
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::storage_transfer::benchmark
