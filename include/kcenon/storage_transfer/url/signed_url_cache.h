/**
 * @file signed_url_cache.h
 * @brief Cache of signed download URLs with proactive refresh
 */

#ifndef KCENON_STORAGE_TRANSFER_URL_SIGNED_URL_CACHE_H
#define KCENON_STORAGE_TRANSFER_URL_SIGNED_URL_CACHE_H

#include "kcenon/storage_transfer/api/storage_api_client.h"
#include "kcenon/storage_transfer/core/clock.h"
#include "kcenon/storage_transfer/core/retry_policy.h"
#include "kcenon/storage_transfer/core/timer_scheduler.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::storage_transfer {

/**
 * @brief Signed-URL cache and refresh scheduler
 *
 * Entries are keyed by file id and purpose. A hit returns the same entry
 * object until it expires. Each fetched entry with a known expiry gets one
 * refresh timer at expires_at - refresh_lead, replacing any earlier timer for
 * the key. Concurrent misses for one key share a single fetch.
 *
 * Destruction cancels every pending timer.
 */
class signed_url_cache {
public:
    using entry_ptr = std::shared_ptr<const signed_url_entry>;

    static constexpr std::chrono::minutes refresh_lead{2};

    /**
     * @param api REST client used for fetches
     * @param scheduler Timer scheduler for proactive refresh
     * @param clock Time source; system clock when null
     * @param policy Retry policy for fetches
     */
    signed_url_cache(std::shared_ptr<storage_api_client> api,
                     std::shared_ptr<timer_scheduler> scheduler,
                     std::shared_ptr<clock_source> clock = nullptr,
                     retry_policy policy = retry_policy::api());
    ~signed_url_cache();

    signed_url_cache(const signed_url_cache&) = delete;
    auto operator=(const signed_url_cache&) -> signed_url_cache& = delete;

    /**
     * @brief Cached or freshly fetched URL for a file
     */
    [[nodiscard]] auto get(const std::string& file_id,
                           url_purpose purpose = url_purpose::download,
                           signed_url_options options = {}) -> result<entry_ptr>;

    /**
     * @brief Permanent URL of a public file, cached without expiry
     */
    [[nodiscard]] auto get_public_url(const std::string& file_id) -> result<entry_ptr>;

    /**
     * @brief Warm the cache for several files; failures are logged and skipped
     * @return Number of entries now available
     */
    auto preload(const std::vector<std::string>& file_ids,
                 url_purpose purpose = url_purpose::preview) -> std::size_t;

    /**
     * @brief Evict every purpose of one file and cancel its timers
     */
    void clear(const std::string& file_id);

    /**
     * @brief Evict everything and cancel all timers
     */
    void clear();

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto pending_refreshes() const -> std::size_t;

    /**
     * @brief Key used in logs, e.g. "f1-preview"
     */
    [[nodiscard]] static auto cache_key(const std::string& file_id, url_purpose purpose)
        -> std::string;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_URL_SIGNED_URL_CACHE_H
