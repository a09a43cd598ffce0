/**
 * @file bench_upload_pipeline.cpp
 * @brief Client-side overhead of the upload pipeline and retry machinery
 *
 * The storage backend and object store are in-process, so these numbers
 * measure orchestration cost only: state transitions, JSON handling,
 * callbacks and backoff computation.
 */

#include <benchmark/benchmark.h>

#include <kcenon/storage_transfer/upload/upload_orchestrator.h>

#include "fake_storage_service.h"
#include "mock_transfer_backend.h"
#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::storage_transfer::benchmark {

namespace {

struct pipeline {
    std::shared_ptr<test::mock_http_client> http = std::make_shared<test::mock_http_client>();
    test::fake_storage_service service{http};
    orchestrator_dependencies deps;

    explicit pipeline(bool hashing) {
        api_client_config config;
        config.base_url = "https://storage.example.com/api";
        config.api_key = "bench";
        deps.api = std::make_shared<storage_api_client>(config, http);
        deps.duplicates = std::make_shared<duplicate_detector>(deps.api);
        deps.transfer =
            std::make_shared<direct_transfer_client>(std::make_shared<test::mock_transfer_backend>());
        if (hashing) {
            deps.hasher = std::make_shared<content_hasher>();
        }
    }
};

}  // namespace

/**
 * @brief Full run: optional hash, duplicate check, initiate, PUT, complete
 */
static void BM_UploadPipeline_Run(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const bool hashing = state.range(1) != 0;

    pipeline p(hashing);
    auto file = file_ref::from_buffer("bench.bin",
                                      random_payload(file_size, 42));

    for (auto _ : state) {
        upload_orchestrator orchestrator(session_id::generate(), "b1", file, {}, p.deps);
        auto outcome = orchestrator.run();
        if (!outcome) {
            state.SkipWithError("Upload failed");
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Jittered backoff computation
 */
static void BM_RetryPolicy_Delay(::benchmark::State& state) {
    const auto policy = retry_policy::upload();
    std::size_t attempt = 0;

    for (auto _ : state) {
        auto delay = delay_for(attempt++ % policy.max_retries, policy);
        ::benchmark::DoNotOptimize(delay);
    }
}

/**
 * @brief execute_with_retry around an operation that succeeds on the last allowed attempt
 */
static void BM_ExecuteWithRetry_Recovers(::benchmark::State& state) {
    const auto failures = static_cast<int>(state.range(0));
    auto policy = retry_policy::api();
    retry_hooks hooks;
    hooks.sleep = [](std::chrono::milliseconds) { return true; };

    for (auto _ : state) {
        int calls = 0;
        auto outcome = execute_with_retry(
            [&]() -> result<int> {
                if (calls++ < failures) {
                    return unexpected(error(error_kind::network, "reset"));
                }
                return calls;
            },
            policy, hooks);
        ::benchmark::DoNotOptimize(outcome);
    }
}

BENCHMARK(BM_UploadPipeline_Run)
    ->Args({static_cast<int64_t>(sizes::small_file), 0})
    ->Args({static_cast<int64_t>(sizes::small_file), 1})
    ->Args({static_cast<int64_t>(sizes::quick_hash_limit), 1})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_RetryPolicy_Delay);

BENCHMARK(BM_ExecuteWithRetry_Recovers)->Arg(0)->Arg(1)->Arg(3);

}  // namespace kcenon::storage_transfer::benchmark
