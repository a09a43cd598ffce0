// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file storage_client.h
 * @brief Client facade for uploads and signed download URLs
 */

#ifndef KCENON_STORAGE_TRANSFER_CLIENT_STORAGE_CLIENT_H
#define KCENON_STORAGE_TRANSFER_CLIENT_STORAGE_CLIENT_H

#include "kcenon/storage_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/storage_transfer/api/http_types.h"
#include "kcenon/storage_transfer/core/clock.h"
#include "kcenon/storage_transfer/core/content_hasher.h"
#include "kcenon/storage_transfer/core/retry_policy.h"
#include "kcenon/storage_transfer/core/timer_scheduler.h"
#include "kcenon/storage_transfer/core/types.h"
#include "kcenon/storage_transfer/core/upload_types.h"
#include "kcenon/storage_transfer/transfer/transfer_backend.h"
#include "kcenon/storage_transfer/upload/upload_manager.h"
#include "kcenon/storage_transfer/url/signed_url_cache.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::storage_transfer {

/**
 * @brief Client configuration
 */
struct storage_client_config {
    std::string base_url = "http://localhost:5000/api";
    std::string api_key;
    transfer_mode mode = transfer_mode::streamed;
    std::size_t worker_count = 0;  ///< 0 = hardware concurrency
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds transfer_timeout{300000};
    retry_policy_set policies;
    hasher_config hashing;
    bool enable_hashing = true;
    std::optional<validation_options> validation;

    // Injected collaborators; defaults are created when null
    std::shared_ptr<http_client_interface> http_client;
    std::shared_ptr<transfer_backend> backend;
    std::shared_ptr<clock_source> clock;
    std::shared_ptr<timer_scheduler> scheduler;
    std::shared_ptr<adapters::transfer_thread_pool_interface> thread_pool;
};

/**
 * @brief Storage client
 *
 * Owns one upload manager, one signed-URL cache and the shared REST and
 * transfer clients behind them.
 *
 * @code
 * auto client = storage_client::builder()
 *     .with_base_url("https://storage.example.com/api")
 *     .with_api_key(key)
 *     .with_transfer_mode(transfer_mode::streamed)
 *     .build();
 * if (client) {
 *     auto file = file_ref::from_path("photo.jpg");
 *     auto outcome = client.value().upload("b1", file.value());
 * }
 * @endcode
 */
class storage_client {
public:
    /**
     * @brief Builder for storage_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the REST base URL (http:// or https://)
         */
        auto with_base_url(std::string url) -> builder&;

        /**
         * @brief Set the API key sent as a bearer token
         */
        auto with_api_key(std::string key) -> builder&;

        /**
         * @brief Choose buffered or streamed PUTs (default: streamed)
         */
        auto with_transfer_mode(transfer_mode mode) -> builder&;

        /**
         * @brief Number of upload workers (0 = hardware concurrency)
         */
        auto with_worker_count(std::size_t count) -> builder&;

        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;
        auto with_transfer_timeout(std::chrono::milliseconds timeout) -> builder&;
        auto with_retry_policies(retry_policy_set policies) -> builder&;

        /**
         * @brief Hashing thresholds; enabled = false skips duplicate detection
         */
        auto with_hasher_config(hasher_config config, bool enabled = true) -> builder&;

        /**
         * @brief Reject files before any network call
         */
        auto with_validation(validation_options options) -> builder&;

        auto with_http_client(std::shared_ptr<http_client_interface> client) -> builder&;
        auto with_transfer_backend(std::shared_ptr<transfer_backend> backend) -> builder&;
        auto with_clock(std::shared_ptr<clock_source> clock) -> builder&;
        auto with_timer_scheduler(std::shared_ptr<timer_scheduler> scheduler) -> builder&;
        auto with_thread_pool(
            std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder&;

        /**
         * @brief Build the client
         * @return Client, or a validation error for an unusable configuration
         */
        [[nodiscard]] auto build() -> result<storage_client>;

    private:
        storage_client_config config_;
    };

    storage_client(const storage_client&) = delete;
    auto operator=(const storage_client&) -> storage_client& = delete;
    storage_client(storage_client&&) noexcept;
    auto operator=(storage_client&&) noexcept -> storage_client&;
    ~storage_client();

    // ------------------------------------------------------------------
    // Uploads
    // ------------------------------------------------------------------

    /**
     * @brief Upload a file and block until it completes, fails or pauses
     */
    [[nodiscard]] auto upload(const std::string& bucket_id,
                              const file_ref& file,
                              upload_options options = {}) -> result<upload_outcome>;

    /**
     * @brief Upload a file in the background
     */
    [[nodiscard]] auto start_upload(const std::string& bucket_id,
                                    const file_ref& file,
                                    upload_options options = {}) -> result<session_id>;

    [[nodiscard]] auto upload_batch(const std::string& bucket_id,
                                    std::vector<file_ref> files,
                                    batch_upload_options options = {}) -> batch_upload_result;

    [[nodiscard]] auto continue_anyway(const session_id& id) -> result<void>;
    [[nodiscard]] auto reuse_existing(const session_id& id,
                                      std::optional<std::string> file_id = std::nullopt)
        -> result<upload_outcome>;
    [[nodiscard]] auto cancel_upload(const session_id& id) -> result<void>;
    [[nodiscard]] auto wait(const session_id& id) -> result<upload_outcome>;
    [[nodiscard]] auto get_upload_status(const session_id& id) -> result<upload_status_info>;

    /**
     * @brief The manager owning every upload session of this client
     */
    [[nodiscard]] auto uploads() -> upload_manager&;

    /**
     * @brief Client-side size and type check
     */
    [[nodiscard]] static auto validate_file(const file_ref& file,
                                            const validation_options& options = {})
        -> validation_result;

    // ------------------------------------------------------------------
    // Content
    // ------------------------------------------------------------------

    /**
     * @brief SHA-256 of a file, lowercase hex
     */
    [[nodiscard]] auto hash(const file_ref& file) -> result<std::string>;

    [[nodiscard]] auto check_duplicate(const std::string& bucket_id, const std::string& digest)
        -> result<duplicate_info>;

    // ------------------------------------------------------------------
    // Download URLs
    // ------------------------------------------------------------------

    [[nodiscard]] auto get_signed_url(const std::string& file_id,
                                      url_purpose purpose = url_purpose::download,
                                      signed_url_options options = {})
        -> result<signed_url_cache::entry_ptr>;

    [[nodiscard]] auto get_public_url(const std::string& file_id)
        -> result<signed_url_cache::entry_ptr>;

    /**
     * @brief Warm the URL cache; failures are skipped
     */
    auto preload_urls(const std::vector<std::string>& file_ids,
                      url_purpose purpose = url_purpose::preview) -> std::size_t;

    void clear_url_cache(const std::string& file_id);
    void clear_url_cache();

    /**
     * @brief URL of a resized or re-encoded image derivative
     */
    [[nodiscard]] auto get_transformed_url(const std::string& file_id,
                                           const transform_options& options)
        -> result<transformed_url>;

    [[nodiscard]] auto url_cache() -> signed_url_cache&;

    [[nodiscard]] auto config() const -> const storage_client_config&;

private:
    explicit storage_client(storage_client_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CLIENT_STORAGE_CLIENT_H
