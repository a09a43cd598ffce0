/**
 * @file test_signed_url_cache.cpp
 * @brief Unit tests for signed_url_cache
 */

#include <gtest/gtest.h>

#include <kcenon/storage_transfer/url/signed_url_cache.h>

#include "fake_storage_service.h"
#include "manual_time.h"
#include "test_policies.h"

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace kcenon::storage_transfer::test {

using namespace std::chrono_literals;

class SignedUrlCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<manual_clock>();
        scheduler_ = std::make_shared<manual_timer_scheduler>(clock_);
        http_ = std::make_shared<mock_http_client>();
        service_ = std::make_unique<fake_storage_service>(http_, clock_);

        api_client_config config;
        config.base_url = "https://storage.example.com/api";
        config.api_key = "key";
        api_ = std::make_shared<storage_api_client>(config, http_);

        cache_ = std::make_unique<signed_url_cache>(api_, scheduler_, clock_, fast_policies().api);
    }

    std::shared_ptr<manual_clock> clock_;
    std::shared_ptr<manual_timer_scheduler> scheduler_;
    std::shared_ptr<mock_http_client> http_;
    std::unique_ptr<fake_storage_service> service_;
    std::shared_ptr<storage_api_client> api_;
    std::unique_ptr<signed_url_cache> cache_;
};

// ============================================================================
// Hits and misses
// ============================================================================

TEST_F(SignedUrlCacheTest, HitReturnsSameEntry) {
    const auto start = clock_->now();

    auto first = cache_->get("f1");
    ASSERT_TRUE(first);
    auto second = cache_->get("f1");
    ASSERT_TRUE(second);

    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(service_->signed_url_fetches(), 1u);
    EXPECT_EQ(first.value()->file_id, "f1");
    EXPECT_NE(first.value()->url.find("download-1"), std::string::npos);
    ASSERT_TRUE(first.value()->expires_at.has_value());
    EXPECT_EQ(*first.value()->expires_at, start + 900s);
    EXPECT_EQ(cache_->size(), 1u);
}

TEST_F(SignedUrlCacheTest, PurposesAreCachedSeparately) {
    ASSERT_TRUE(cache_->get("f1", url_purpose::download));
    ASSERT_TRUE(cache_->get("f1", url_purpose::preview));

    EXPECT_EQ(service_->signed_url_fetches(), 2u);
    EXPECT_EQ(cache_->size(), 2u);

    auto sent = http_->last("POST", "/files/f1/signed-url");
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(json_utils::get_uint(sent->body, "expiry"), std::optional<uint64_t>(300));
    EXPECT_EQ(json_utils::get_string(sent->body, "purpose"), std::optional<std::string>("preview"));
}

TEST_F(SignedUrlCacheTest, ExpiredEntryIsRefetched) {
    auto first = cache_->get("f1");
    ASSERT_TRUE(first);

    clock_->advance(901s);
    auto second = cache_->get("f1");
    ASSERT_TRUE(second);

    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(service_->signed_url_fetches(), 2u);
}

TEST_F(SignedUrlCacheTest, EmptyFileIdRejected) {
    auto entry = cache_->get("");
    ASSERT_FALSE(entry);
    EXPECT_EQ(entry.error().kind, error_kind::validation);

    EXPECT_FALSE(cache_->get_public_url(""));
    EXPECT_TRUE(http_->requests().empty());
}

TEST_F(SignedUrlCacheTest, FailedFetchIsNotCached) {
    http_->respond("POST", "/files/f1/signed-url", 403,
                   R"({"error":{"code":"ACCESS_DENIED","message":"no"}})");

    auto entry = cache_->get("f1");
    ASSERT_FALSE(entry);
    EXPECT_EQ(entry.error().kind, error_kind::auth);
    EXPECT_EQ(cache_->size(), 0u);
    EXPECT_EQ(cache_->pending_refreshes(), 0u);
}

TEST_F(SignedUrlCacheTest, ConcurrentMissesShareOneFetch) {
    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<int> calls{0};

    http_->on("POST", "/files/f1/signed-url",
              [&, released](const recorded_request&) {
                  if (++calls == 1) {
                      entered.set_value();
                  }
                  released.wait();
                  return make_response(
                      200, R"({"url":"https://objects.example.com/get/shared",)"
                           R"("expiresAt":")" +
                               json_utils::format_iso8601(clock_->now() + 15min) +
                               R"(","isPublic":false})");
              });

    auto a = std::async(std::launch::async, [&] { return cache_->get("f1"); });
    entered.get_future().wait();
    auto b = std::async(std::launch::async, [&] { return cache_->get("f1"); });
    std::this_thread::sleep_for(50ms);
    release.set_value();

    auto first = a.get();
    auto second = b.get();
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(calls.load(), 1);
}

// ============================================================================
// Proactive refresh
// ============================================================================

TEST_F(SignedUrlCacheTest, RefreshTimerFiresBeforeExpiry) {
    const auto start = clock_->now();
    signed_url_options options;
    options.expiry = 600s;

    auto first = cache_->get("f1", url_purpose::download, options);
    ASSERT_TRUE(first);
    EXPECT_EQ(cache_->pending_refreshes(), 1u);
    ASSERT_TRUE(scheduler_->next_due().has_value());
    EXPECT_EQ(*scheduler_->next_due(), start + 8min);

    clock_->advance(8min);
    EXPECT_EQ(scheduler_->run_due(), 1u);
    EXPECT_EQ(service_->signed_url_fetches(), 2u);

    auto refreshed_body = http_->last("POST", "/signed-url");
    ASSERT_TRUE(refreshed_body.has_value());
    EXPECT_EQ(json_utils::get_uint(refreshed_body->body, "expiry"), std::optional<uint64_t>(600));

    auto current = cache_->get("f1");
    ASSERT_TRUE(current);
    EXPECT_NE(current.value(), first.value());
    EXPECT_NE(current.value()->url.find("download-2"), std::string::npos);
    EXPECT_EQ(service_->signed_url_fetches(), 2u);

    EXPECT_EQ(cache_->pending_refreshes(), 1u);
    EXPECT_EQ(*scheduler_->next_due(), start + 16min);
}

TEST_F(SignedUrlCacheTest, ShortLivedUrlGetsNoTimer) {
    signed_url_options options;
    options.expiry = 60s;

    ASSERT_TRUE(cache_->get("f1", url_purpose::download, options));
    EXPECT_EQ(cache_->pending_refreshes(), 0u);
    EXPECT_EQ(scheduler_->pending_count(), 0u);
}

TEST_F(SignedUrlCacheTest, ForceRefreshReplacesTimer) {
    auto first = cache_->get("f1");
    ASSERT_TRUE(first);

    signed_url_options options;
    options.force_refresh = true;
    auto second = cache_->get("f1", url_purpose::download, options);
    ASSERT_TRUE(second);

    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(service_->signed_url_fetches(), 2u);
    EXPECT_EQ(scheduler_->scheduled_total(), 2u);
    EXPECT_EQ(scheduler_->cancelled_total(), 1u);
    EXPECT_EQ(scheduler_->pending_count(), 1u);
}

TEST_F(SignedUrlCacheTest, ReplacedTimerAlreadyDispatchedDoesNothing) {
    auto first = cache_->get("f1");
    ASSERT_TRUE(first);

    clock_->advance(13min);
    auto dispatched = scheduler_->take_due();
    ASSERT_EQ(dispatched.size(), 1u);

    signed_url_options options;
    options.force_refresh = true;
    auto replaced = cache_->get("f1", url_purpose::download, options);
    ASSERT_TRUE(replaced);
    EXPECT_EQ(service_->signed_url_fetches(), 2u);
    EXPECT_EQ(scheduler_->pending_count(), 1u);

    dispatched.front()();
    EXPECT_EQ(service_->signed_url_fetches(), 2u);
    EXPECT_EQ(scheduler_->pending_count(), 1u);
    EXPECT_EQ(cache_->pending_refreshes(), 1u);

    auto current = cache_->get("f1");
    ASSERT_TRUE(current);
    EXPECT_EQ(current.value(), replaced.value());

    cache_->clear("f1");
    EXPECT_EQ(scheduler_->pending_count(), 0u);
}

TEST_F(SignedUrlCacheTest, FailedRefreshKeepsCurrentEntry) {
    auto first = cache_->get("f1");
    ASSERT_TRUE(first);

    http_->respond("POST", "/files/f1/signed-url", 403,
                   R"({"error":{"code":"ACCESS_DENIED","message":"no"}})");
    clock_->advance(13min);
    EXPECT_EQ(scheduler_->run_due(), 1u);

    auto current = cache_->get("f1");
    ASSERT_TRUE(current);
    EXPECT_EQ(current.value(), first.value());
}

TEST_F(SignedUrlCacheTest, ClearCancelsTimers) {
    ASSERT_TRUE(cache_->get("f1"));
    ASSERT_TRUE(cache_->get("f2"));
    EXPECT_EQ(scheduler_->pending_count(), 2u);

    cache_->clear("f1");
    EXPECT_EQ(cache_->size(), 1u);
    EXPECT_EQ(cache_->pending_refreshes(), 1u);
    EXPECT_EQ(scheduler_->pending_count(), 1u);

    cache_->clear();
    EXPECT_EQ(cache_->size(), 0u);
    EXPECT_EQ(scheduler_->pending_count(), 0u);

    ASSERT_TRUE(cache_->get("f1"));
    EXPECT_EQ(service_->signed_url_fetches(), 3u);
}

TEST_F(SignedUrlCacheTest, DestructionCancelsTimers) {
    ASSERT_TRUE(cache_->get("f1"));
    ASSERT_EQ(scheduler_->pending_count(), 1u);

    cache_.reset();
    EXPECT_EQ(scheduler_->pending_count(), 0u);
}

// ============================================================================
// Public URLs and preload
// ============================================================================

TEST_F(SignedUrlCacheTest, PublicUrlCachedWithoutExpiry) {
    auto first = cache_->get_public_url("f1");
    ASSERT_TRUE(first);
    EXPECT_TRUE(first.value()->is_public);
    EXPECT_FALSE(first.value()->expires_at.has_value());
    EXPECT_EQ(cache_->pending_refreshes(), 0u);

    clock_->advance(24h);
    auto second = cache_->get_public_url("f1");
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(http_->count("GET", "/public-url"), 1u);
}

TEST_F(SignedUrlCacheTest, PreloadCountsSuccesses) {
    http_->respond("POST", "/files/missing/signed-url", 404,
                   R"({"error":{"code":"FILE_NOT_FOUND","message":"gone"}})");

    EXPECT_EQ(cache_->preload({"f1", "missing", "f2"}), 2u);
    EXPECT_EQ(cache_->size(), 2u);

    auto cached = cache_->get("f1", url_purpose::preview);
    ASSERT_TRUE(cached);
    EXPECT_EQ(service_->signed_url_fetches(), 2u);
}

TEST(SignedUrlCacheKeyTest, KeyJoinsIdAndPurpose) {
    EXPECT_EQ(signed_url_cache::cache_key("f1", url_purpose::preview), "f1-preview");
    EXPECT_EQ(signed_url_cache::cache_key("f1", url_purpose::stream), "f1-stream");
}

}  // namespace kcenon::storage_transfer::test
