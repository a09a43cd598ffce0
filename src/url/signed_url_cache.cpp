/**
 * @file signed_url_cache.cpp
 * @brief Implementation of signed_url_cache
 */

#include "kcenon/storage_transfer/url/signed_url_cache.h"
#include "kcenon/storage_transfer/core/logging.h"

#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace kcenon::storage_transfer {

namespace {

constexpr const char* public_purpose = "public";

}  // namespace

struct signed_url_cache::impl : std::enable_shared_from_this<signed_url_cache::impl> {
    using key_type = std::pair<std::string, std::string>;
    using fetch_future = std::shared_future<result<entry_ptr>>;

    struct slot {
        entry_ptr entry;
        std::chrono::seconds expiry{0};
        std::optional<timer_id> refresh_timer;
        uint64_t refresh_generation = 0;  ///< 0 when no timer is tracked
        std::optional<fetch_future> in_flight;
        uint64_t fetch_id = 0;
    };

    std::shared_ptr<storage_api_client> api;
    std::shared_ptr<timer_scheduler> scheduler;
    std::shared_ptr<clock_source> clock;
    retry_policy policy;

    mutable std::mutex mutex;
    std::map<key_type, slot> slots;
    uint64_t next_fetch_id = 0;
    uint64_t next_refresh_generation = 0;
    bool shut_down = false;

    [[nodiscard]] auto is_fresh(const signed_url_entry& entry) const -> bool {
        if (entry.is_public) {
            return true;
        }
        return entry.expires_at && clock->now() < *entry.expires_at;
    }

    void cancel_timer(slot& s) {
        if (s.refresh_timer && scheduler) {
            scheduler->cancel(*s.refresh_timer);
        }
        s.refresh_timer.reset();
        s.refresh_generation = 0;
    }

    // Called with mutex held
    void schedule_refresh(const key_type& key, slot& s, url_purpose purpose) {
        cancel_timer(s);
        if (!scheduler || shut_down || !s.entry || s.entry->is_public || !s.entry->expires_at) {
            return;
        }

        const auto at = *s.entry->expires_at - refresh_lead;
        if (at <= clock->now()) {
            return;
        }

        // A timer already handed to a worker cannot be cancelled; the
        // generation lets it recognise that it has been replaced.
        std::weak_ptr<impl> weak = shared_from_this();
        const auto file_id = key.first;
        const auto generation = ++next_refresh_generation;
        s.refresh_generation = generation;
        s.refresh_timer = scheduler->schedule_at(at, [weak, file_id, purpose, generation] {
            if (auto self = weak.lock()) {
                self->refresh(file_id, purpose, generation);
            }
        });

        transfer_log_context ctx;
        ctx.url_key = cache_key(file_id, purpose);
        ctx.delay_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(at - clock->now()).count());
        ST_LOG_DEBUG_CTX(log_category::url_cache, "Scheduled signed URL refresh", ctx);
    }

    void refresh(const std::string& file_id, url_purpose purpose, uint64_t generation) {
        std::chrono::seconds expiry{0};
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (shut_down) {
                return;
            }
            auto it = slots.find({file_id, to_string(purpose)});
            if (it == slots.end() || it->second.refresh_generation != generation) {
                ST_LOG_TRACE(log_category::url_cache,
                             "Dropped stale refresh of " + cache_key(file_id, purpose));
                return;
            }
            it->second.refresh_timer.reset();
            it->second.refresh_generation = 0;
            expiry = it->second.expiry;
        }

        signed_url_options options;
        options.force_refresh = true;
        if (expiry.count() > 0) {
            options.expiry = expiry;
        }

        auto refreshed = fetch_signed(file_id, purpose, options);
        if (!refreshed) {
            ST_LOG_WARN(log_category::url_cache,
                        "Proactive refresh of " + cache_key(file_id, purpose) +
                            " failed: " + refreshed.error().message);
        }
    }

    auto fetch_signed(const std::string& file_id, url_purpose purpose,
                      const signed_url_options& options) -> result<entry_ptr> {
        const auto expiry = options.expiry.value_or(default_expiry(purpose));
        return lookup({file_id, to_string(purpose)}, options.force_refresh, expiry, purpose,
                      [&] { return api->request_signed_url(file_id, purpose, expiry); });
    }

    template <typename Fetch>
    auto lookup(const key_type& key, bool force_refresh, std::chrono::seconds expiry,
                std::optional<url_purpose> purpose, Fetch&& fetch) -> result<entry_ptr> {
        std::unique_lock<std::mutex> lock(mutex);
        auto& s = slots[key];

        if (!force_refresh && s.entry && is_fresh(*s.entry)) {
            ST_LOG_TRACE(log_category::url_cache, "Cache hit for " + key.first + "-" + key.second);
            return s.entry;
        }
        if (s.in_flight) {
            auto pending = *s.in_flight;
            lock.unlock();
            return pending.get();
        }

        std::promise<result<entry_ptr>> promise;
        s.in_flight = promise.get_future().share();
        s.fetch_id = ++next_fetch_id;
        const auto fetch_id = s.fetch_id;
        lock.unlock();

        auto fetched = execute_with_retry(std::forward<Fetch>(fetch), policy);

        result<entry_ptr> outcome;
        lock.lock();
        auto it = slots.find(key);
        const bool owner = it != slots.end() && it->second.fetch_id == fetch_id;
        if (fetched) {
            auto entry = std::make_shared<const signed_url_entry>(std::move(fetched.value()));
            if (owner && !shut_down) {
                it->second.entry = entry;
                it->second.expiry = expiry;
                if (purpose) {
                    schedule_refresh(key, it->second, *purpose);
                }
            }
            outcome = entry_ptr(entry);
        } else {
            outcome = unexpected(fetched.error());
        }
        if (owner) {
            it->second.in_flight.reset();
            if (!it->second.entry) {
                slots.erase(it);
            }
        }
        lock.unlock();

        promise.set_value(outcome);
        return outcome;
    }
};

signed_url_cache::signed_url_cache(std::shared_ptr<storage_api_client> api,
                                   std::shared_ptr<timer_scheduler> scheduler,
                                   std::shared_ptr<clock_source> clock,
                                   retry_policy policy)
    : impl_(std::make_shared<impl>()) {
    impl_->api = std::move(api);
    impl_->scheduler = std::move(scheduler);
    impl_->clock = clock ? std::move(clock) : make_system_clock();
    impl_->policy = std::move(policy);
}

signed_url_cache::~signed_url_cache() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->shut_down = true;
    for (auto& [key, s] : impl_->slots) {
        impl_->cancel_timer(s);
    }
}

auto signed_url_cache::cache_key(const std::string& file_id, url_purpose purpose)
    -> std::string {
    return file_id + "-" + to_string(purpose);
}

auto signed_url_cache::get(const std::string& file_id,
                           url_purpose purpose,
                           signed_url_options options) -> result<entry_ptr> {
    if (file_id.empty()) {
        return unexpected(error(error_kind::validation, "File id is required"));
    }

    return impl_->fetch_signed(file_id, purpose, options);
}

auto signed_url_cache::get_public_url(const std::string& file_id) -> result<entry_ptr> {
    if (file_id.empty()) {
        return unexpected(error(error_kind::validation, "File id is required"));
    }

    auto api = impl_->api;
    return impl_->lookup({file_id, public_purpose}, false, std::chrono::seconds{0}, std::nullopt,
                         [&] { return api->get_public_url(file_id); });
}

auto signed_url_cache::preload(const std::vector<std::string>& file_ids, url_purpose purpose)
    -> std::size_t {
    std::size_t loaded = 0;
    for (const auto& file_id : file_ids) {
        auto entry = get(file_id, purpose);
        if (entry) {
            ++loaded;
        } else {
            ST_LOG_DEBUG(log_category::url_cache,
                         "Preload skipped " + cache_key(file_id, purpose) + ": " +
                             entry.error().message);
        }
    }
    return loaded;
}

void signed_url_cache::clear(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (auto it = impl_->slots.begin(); it != impl_->slots.end();) {
        if (it->first.first == file_id) {
            impl_->cancel_timer(it->second);
            it = impl_->slots.erase(it);
        } else {
            ++it;
        }
    }
}

void signed_url_cache::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (auto& [key, s] : impl_->slots) {
        impl_->cancel_timer(s);
    }
    impl_->slots.clear();
    ST_LOG_DEBUG(log_category::url_cache, "Signed URL cache cleared");
}

auto signed_url_cache::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::size_t count = 0;
    for (const auto& [key, s] : impl_->slots) {
        if (s.entry) {
            ++count;
        }
    }
    return count;
}

auto signed_url_cache::pending_refreshes() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::size_t count = 0;
    for (const auto& [key, s] : impl_->slots) {
        if (s.refresh_timer) {
            ++count;
        }
    }
    return count;
}

}  // namespace kcenon::storage_transfer
