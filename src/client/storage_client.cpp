// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file storage_client.cpp
 * @brief Implementation of the storage client facade
 */

#include "kcenon/storage_transfer/client/storage_client.h"
#include "kcenon/storage_transfer/api/network_http_client.h"
#include "kcenon/storage_transfer/api/storage_api_client.h"
#include "kcenon/storage_transfer/core/logging.h"
#include "kcenon/storage_transfer/duplicate/duplicate_detector.h"
#include "kcenon/storage_transfer/transfer/direct_transfer_client.h"
#include "kcenon/storage_transfer/upload/file_validation.h"

namespace kcenon::storage_transfer {

namespace {

auto has_http_scheme(const std::string& url) -> bool {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

auto check_transform(const transform_options& options) -> result<void> {
    if (options.preset) {
        if (options.preset->empty()) {
            return unexpected(error(error_kind::validation, "Transform preset is empty"));
        }
        return {};
    }
    if (!options.width && !options.height && !options.quality && !options.format) {
        return unexpected(error(error_kind::validation,
                                "Transform needs a preset or at least one parameter"));
    }
    if ((options.width && *options.width == 0) || (options.height && *options.height == 0)) {
        return unexpected(error(error_kind::validation, "Transform dimensions must be positive"));
    }
    if (options.quality && (*options.quality == 0 || *options.quality > 100)) {
        return unexpected(error(error_kind::validation,
                                "Transform quality must be between 1 and 100"));
    }
    return {};
}

}  // namespace

struct storage_client::impl {
    storage_client_config config;

    // Declaration order is teardown order reversed: the manager stops its
    // workers and the cache cancels its timers before the pool goes away.
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::shared_ptr<timer_scheduler> scheduler;
    std::shared_ptr<storage_api_client> api;
    std::shared_ptr<content_hasher> hasher;
    std::shared_ptr<duplicate_detector> duplicates;
    std::shared_ptr<direct_transfer_client> transfer;
    std::unique_ptr<signed_url_cache> cache;
    std::unique_ptr<upload_manager> manager;

    explicit impl(storage_client_config cfg) : config(std::move(cfg)) {
        if (!config.clock) {
            config.clock = make_system_clock();
        }

        pool = config.thread_pool ? config.thread_pool
                                  : adapters::transfer_pool_factory::create(config.worker_count);
        scheduler = config.scheduler
                        ? config.scheduler
                        : std::make_shared<pool_timer_scheduler>(pool, config.clock);

        auto rest_http = config.http_client ? config.http_client
                                            : make_network_http_client(config.request_timeout);

        api = std::make_shared<storage_api_client>(
            api_client_config{config.base_url, config.api_key, {}}, rest_http);

        if (config.enable_hashing) {
            hasher = std::make_shared<content_hasher>(config.hashing);
            if (!content_hasher::is_available()) {
                ST_LOG_INFO(log_category::hasher,
                            "Digest support not built in; duplicate detection disabled");
            }
        }
        duplicates = std::make_shared<duplicate_detector>(api, config.policies.api);

        if (config.backend) {
            transfer = std::make_shared<direct_transfer_client>(config.backend,
                                                                config.transfer_timeout);
        } else {
            auto transfer_http = config.http_client
                                     ? config.http_client
                                     : make_network_http_client(config.transfer_timeout);
            transfer = direct_transfer_client::create(config.mode, transfer_http,
                                                      config.transfer_timeout);
        }

        cache = std::make_unique<signed_url_cache>(api, scheduler, config.clock,
                                                   config.policies.api);

        orchestrator_dependencies deps;
        deps.api = api;
        deps.duplicates = duplicates;
        deps.transfer = transfer;
        deps.hasher = hasher;
        deps.policies = config.policies;
        manager = std::make_unique<upload_manager>(std::move(deps), pool, config.validation);
    }
};

// ============================================================================
// Builder
// ============================================================================

storage_client::builder::builder() = default;

auto storage_client::builder::with_base_url(std::string url) -> builder& {
    config_.base_url = std::move(url);
    return *this;
}

auto storage_client::builder::with_api_key(std::string key) -> builder& {
    config_.api_key = std::move(key);
    return *this;
}

auto storage_client::builder::with_transfer_mode(transfer_mode mode) -> builder& {
    config_.mode = mode;
    return *this;
}

auto storage_client::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto storage_client::builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto storage_client::builder::with_transfer_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.transfer_timeout = timeout;
    return *this;
}

auto storage_client::builder::with_retry_policies(retry_policy_set policies) -> builder& {
    config_.policies = std::move(policies);
    return *this;
}

auto storage_client::builder::with_hasher_config(hasher_config config, bool enabled)
    -> builder& {
    config_.hashing = config;
    config_.enable_hashing = enabled;
    return *this;
}

auto storage_client::builder::with_validation(validation_options options) -> builder& {
    config_.validation = std::move(options);
    return *this;
}

auto storage_client::builder::with_http_client(std::shared_ptr<http_client_interface> client)
    -> builder& {
    config_.http_client = std::move(client);
    return *this;
}

auto storage_client::builder::with_transfer_backend(std::shared_ptr<transfer_backend> backend)
    -> builder& {
    config_.backend = std::move(backend);
    return *this;
}

auto storage_client::builder::with_clock(std::shared_ptr<clock_source> clock) -> builder& {
    config_.clock = std::move(clock);
    return *this;
}

auto storage_client::builder::with_timer_scheduler(std::shared_ptr<timer_scheduler> scheduler)
    -> builder& {
    config_.scheduler = std::move(scheduler);
    return *this;
}

auto storage_client::builder::with_thread_pool(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder& {
    config_.thread_pool = std::move(pool);
    return *this;
}

auto storage_client::builder::build() -> result<storage_client> {
    if (!has_http_scheme(config_.base_url)) {
        return unexpected(error(error_kind::validation,
                                "Base URL must start with http:// or https://"));
    }
    if (config_.api_key.empty()) {
        return unexpected(error(error_kind::validation, "API key is required"));
    }
    if (config_.request_timeout.count() <= 0 || config_.transfer_timeout.count() <= 0) {
        return unexpected(error(error_kind::validation, "Timeouts must be positive"));
    }
    if (config_.hashing.chunk_size == 0) {
        return unexpected(error(error_kind::validation, "Hash chunk size must be positive"));
    }

    return storage_client{std::move(config_)};
}

// ============================================================================
// Client
// ============================================================================

storage_client::storage_client(storage_client_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    // Safe to call multiple times
    get_logger().initialize();
}

storage_client::storage_client(storage_client&&) noexcept = default;
auto storage_client::operator=(storage_client&&) noexcept -> storage_client& = default;
storage_client::~storage_client() = default;

auto storage_client::upload(const std::string& bucket_id,
                            const file_ref& file,
                            upload_options options) -> result<upload_outcome> {
    return impl_->manager->upload(bucket_id, file, std::move(options));
}

auto storage_client::start_upload(const std::string& bucket_id,
                                  const file_ref& file,
                                  upload_options options) -> result<session_id> {
    return impl_->manager->start_upload(bucket_id, file, std::move(options));
}

auto storage_client::upload_batch(const std::string& bucket_id,
                                  std::vector<file_ref> files,
                                  batch_upload_options options) -> batch_upload_result {
    return impl_->manager->upload_batch(bucket_id, std::move(files), std::move(options));
}

auto storage_client::continue_anyway(const session_id& id) -> result<void> {
    return impl_->manager->continue_anyway(id);
}

auto storage_client::reuse_existing(const session_id& id, std::optional<std::string> file_id)
    -> result<upload_outcome> {
    return impl_->manager->reuse_existing(id, std::move(file_id));
}

auto storage_client::cancel_upload(const session_id& id) -> result<void> {
    return impl_->manager->cancel(id);
}

auto storage_client::wait(const session_id& id) -> result<upload_outcome> {
    return impl_->manager->wait(id);
}

auto storage_client::get_upload_status(const session_id& id) -> result<upload_status_info> {
    return impl_->manager->get_upload_status(id);
}

auto storage_client::uploads() -> upload_manager& { return *impl_->manager; }

auto storage_client::validate_file(const file_ref& file, const validation_options& options)
    -> validation_result {
    return storage_transfer::validate_file(file, options);
}

auto storage_client::hash(const file_ref& file) -> result<std::string> {
    if (!impl_->hasher) {
        return unexpected(error(error_kind::hash_unavailable, "Hashing disabled"));
    }
    return impl_->hasher->hash(file);
}

auto storage_client::check_duplicate(const std::string& bucket_id, const std::string& digest)
    -> result<duplicate_info> {
    return impl_->duplicates->check_duplicate(bucket_id, digest);
}

auto storage_client::get_signed_url(const std::string& file_id,
                                    url_purpose purpose,
                                    signed_url_options options)
    -> result<signed_url_cache::entry_ptr> {
    return impl_->cache->get(file_id, purpose, options);
}

auto storage_client::get_public_url(const std::string& file_id)
    -> result<signed_url_cache::entry_ptr> {
    return impl_->cache->get_public_url(file_id);
}

auto storage_client::preload_urls(const std::vector<std::string>& file_ids,
                                  url_purpose purpose) -> std::size_t {
    return impl_->cache->preload(file_ids, purpose);
}

void storage_client::clear_url_cache(const std::string& file_id) {
    impl_->cache->clear(file_id);
}

void storage_client::clear_url_cache() { impl_->cache->clear(); }

auto storage_client::get_transformed_url(const std::string& file_id,
                                         const transform_options& options)
    -> result<transformed_url> {
    if (file_id.empty()) {
        return unexpected(error(error_kind::validation, "File id is required"));
    }
    auto checked = check_transform(options);
    if (!checked) {
        return unexpected(checked.error());
    }

    auto api = impl_->api;
    return execute_with_retry([&] { return api->get_transformed_url(file_id, options); },
                              impl_->config.policies.transform);
}

auto storage_client::url_cache() -> signed_url_cache& { return *impl_->cache; }

auto storage_client::config() const -> const storage_client_config& { return impl_->config; }

}  // namespace kcenon::storage_transfer
