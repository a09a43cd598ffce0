/**
 * @file test_upload_orchestrator.cpp
 * @brief Unit tests for the per-file upload state machine
 */

#include <gtest/gtest.h>

#include <kcenon/storage_transfer/api/json_utils.h>
#include <kcenon/storage_transfer/upload/upload_orchestrator.h>

#include "fake_storage_service.h"
#include "mock_transfer_backend.h"
#include "test_policies.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::storage_transfer::test {

using namespace std::chrono_literals;

class UploadOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<mock_http_client>();
        service_ = std::make_unique<fake_storage_service>(http_);
        backend_ = std::make_shared<mock_transfer_backend>();

        api_client_config config;
        config.base_url = "https://storage.example.com/api";
        config.api_key = "key";

        deps_.api = std::make_shared<storage_api_client>(config, http_);
        deps_.policies = fast_policies();
        deps_.duplicates = std::make_shared<duplicate_detector>(deps_.api, deps_.policies.api);
        deps_.transfer = std::make_shared<direct_transfer_client>(backend_);
        deps_.hasher = std::make_shared<content_hasher>();
    }

    auto make_orchestrator(upload_options options = {}, std::size_t size = 50 * 1024)
        -> std::unique_ptr<upload_orchestrator> {
        options.callbacks.on_state_change = [this](const upload_session& s) {
            std::lock_guard<std::mutex> lock(mutex_);
            states_.push_back(s.status);
        };
        options.callbacks.on_progress = [this](double percent, uint64_t, uint64_t) {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.push_back(percent);
        };
        options.callbacks.on_error = [this](const error& err) {
            std::lock_guard<std::mutex> lock(mutex_);
            errors_.push_back(err);
        };
        options.callbacks.on_complete = [this](const file_record&) { ++completions_; };
        options.callbacks.on_duplicate = [this](const duplicate_info&) { ++duplicates_; };
        options.callbacks.on_retry = [this](const error& err, std::size_t,
                                            std::chrono::milliseconds) {
            std::lock_guard<std::mutex> lock(mutex_);
            retries_.push_back(err.kind);
        };

        auto file = file_ref::from_buffer("report.txt", std::vector<std::byte>(size, std::byte{'x'}));
        return std::make_unique<upload_orchestrator>(session_id::generate(), "b1", file,
                                                     std::move(options), deps_);
    }

    [[nodiscard]] auto states() -> std::vector<upload_status> {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_;
    }

    [[nodiscard]] auto errors() -> std::vector<error> {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    std::shared_ptr<mock_http_client> http_;
    std::unique_ptr<fake_storage_service> service_;
    std::shared_ptr<mock_transfer_backend> backend_;
    orchestrator_dependencies deps_;

    std::mutex mutex_;
    std::vector<upload_status> states_;
    std::vector<double> progress_;
    std::vector<error> errors_;
    std::vector<error_kind> retries_;
    std::atomic<int> completions_{0};
    std::atomic<int> duplicates_{0};
};

// ============================================================================
// Happy path
// ============================================================================

TEST_F(UploadOrchestratorTest, UploadsSmallTextFileEndToEnd) {
    auto upload = make_orchestrator();

    auto outcome = upload->run();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, upload_status::completed);
    ASSERT_TRUE(outcome.value().record.has_value());
    EXPECT_EQ(outcome.value().record->id, "file-1");
    EXPECT_EQ(outcome.value().record->bucket_id, "b1");
    EXPECT_EQ(outcome.value().record->size, 50u * 1024);

    std::vector<upload_status> expected;
    if (content_hasher::is_available()) {
        expected = {upload_status::hashing, upload_status::checking_duplicates};
    }
    expected.insert(expected.end(), {upload_status::initiating, upload_status::uploading,
                                     upload_status::finalizing, upload_status::completed});
    EXPECT_EQ(states(), expected);

    EXPECT_EQ(http_->count("POST", "/buckets/b1/uploads"), 1u);
    EXPECT_EQ(backend_->put_count(), 1u);
    EXPECT_EQ(http_->count("POST", "/complete"), 1u);
    EXPECT_EQ(upload->snapshot().retry_count, 0u);
    EXPECT_EQ(completions_.load(), 1);
    EXPECT_TRUE(errors().empty());

    auto initiate = http_->last("POST", "/buckets/b1/uploads");
    ASSERT_TRUE(initiate.has_value());
    EXPECT_EQ(json_utils::get_string(initiate->body, "contentType"),
              std::optional<std::string>("text/plain"));
    EXPECT_EQ(json_utils::get_string(initiate->body, "clientHash").has_value(),
              content_hasher::is_available());

    auto put = backend_->puts().front();
    EXPECT_NE(put.url.find("/put/up-1"), std::string::npos);
    EXPECT_EQ(put.headers.at("x-amz-meta-upload"), "up-1");

    auto complete = http_->last("POST", "/complete");
    ASSERT_TRUE(complete.has_value());
    EXPECT_EQ(json_utils::get_string(complete->body, "etag"),
              std::optional<std::string>("\"etag-1\""));
}

TEST_F(UploadOrchestratorTest, ProgressIsMonotonicAndEndsAtHundred) {
    backend_->set_progress_steps(10);
    auto upload = make_orchestrator();
    ASSERT_TRUE(upload->run());

    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_FALSE(progress_.empty());
    for (std::size_t i = 1; i < progress_.size(); ++i) {
        EXPECT_GT(progress_[i], progress_[i - 1]);
    }
    EXPECT_DOUBLE_EQ(progress_.front(), 0.0);
    EXPECT_DOUBLE_EQ(progress_.back(), 100.0);
    EXPECT_NE(std::find(progress_.begin(), progress_.end(), 90.0), progress_.end());
    EXPECT_NE(std::find(progress_.begin(), progress_.end(), 95.0), progress_.end());
}

TEST_F(UploadOrchestratorTest, ContentTypeOverride) {
    upload_options options;
    options.content_type = "application/x-report";
    auto upload = make_orchestrator(options);
    ASSERT_TRUE(upload->run());

    auto initiate = http_->last("POST", "/buckets/b1/uploads");
    ASSERT_TRUE(initiate.has_value());
    EXPECT_EQ(json_utils::get_string(initiate->body, "contentType"),
              std::optional<std::string>("application/x-report"));
}

TEST_F(UploadOrchestratorTest, SkipDuplicateCheckSkipsHashing) {
    upload_options options;
    options.skip_duplicate_check = true;
    auto upload = make_orchestrator(options);
    ASSERT_TRUE(upload->run());

    EXPECT_EQ(http_->count("POST", "/check-duplicate"), 0u);
    EXPECT_EQ(states().front(), upload_status::initiating);
    EXPECT_FALSE(upload->snapshot().client_digest.has_value());
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(UploadOrchestratorTest, ExpiredSignedUrlRestartsWithFreshSession) {
    backend_->queue_status(410);
    backend_->queue_status(200, {{"ETag", "\"fresh\""}});
    auto upload = make_orchestrator();

    auto outcome = upload->run();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, upload_status::completed);

    EXPECT_EQ(http_->count("POST", "/buckets/b1/uploads"), 2u);
    auto puts = backend_->puts();
    ASSERT_EQ(puts.size(), 2u);
    EXPECT_NE(puts[0].url.find("/put/up-1"), std::string::npos);
    EXPECT_NE(puts[1].url.find("/put/up-2"), std::string::npos);

    EXPECT_TRUE(errors().empty());
    EXPECT_EQ(upload->snapshot().retry_count, 1u);
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(retries_, (std::vector<error_kind>{error_kind::signed_url_expired}));
}

TEST_F(UploadOrchestratorTest, SecondExpiryFails) {
    backend_->queue_status(410);
    auto upload = make_orchestrator();

    auto outcome = upload->run();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, error_kind::signed_url_expired);
    EXPECT_EQ(http_->count("POST", "/buckets/b1/uploads"), 2u);
    EXPECT_EQ(upload->status(), upload_status::error);
    EXPECT_EQ(errors().size(), 1u);
}

TEST_F(UploadOrchestratorTest, TransientPutFailureIsRetried) {
    backend_->queue(transport_failure(error_kind::network));
    backend_->queue_status(200, {{"ETag", "\"ok\""}});
    auto upload = make_orchestrator();

    auto outcome = upload->run();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(backend_->put_count(), 2u);
    EXPECT_EQ(http_->count("POST", "/buckets/b1/uploads"), 1u);
    EXPECT_EQ(upload->snapshot().retry_count, 1u);
}

TEST_F(UploadOrchestratorTest, StorageErrorOnPutIsRetried) {
    backend_->queue_status(503, {}, R"({"error":{"code":"STORAGE_ERROR","message":"busy"}})");
    backend_->queue_status(200, {{"ETag", "\"ok\""}});
    upload_options options;
    options.skip_duplicate_check = true;
    auto upload = make_orchestrator(options);

    auto outcome = upload->run();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, upload_status::completed);
    EXPECT_EQ(backend_->put_count(), 2u);
    EXPECT_EQ(http_->count("POST", "/buckets/b1/uploads"), 1u);
    EXPECT_TRUE(errors().empty());

    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_EQ(retries_.size(), 1u);
    EXPECT_EQ(retries_[0], error_kind::service);
}

TEST_F(UploadOrchestratorTest, PersistentStorageErrorExhaustsPutBudget) {
    backend_->queue_status(500);
    upload_options options;
    options.skip_duplicate_check = true;
    auto upload = make_orchestrator(options);

    auto outcome = upload->run();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, error_kind::service);
    EXPECT_EQ(backend_->put_count(), 4u);
    EXPECT_EQ(errors().size(), 1u);
}

TEST_F(UploadOrchestratorTest, NonRetryableInitiateFailureReportsOnce) {
    http_->respond("POST", "/buckets/b1/uploads", 403,
                   R"({"error":{"code":"BUCKET_ACCESS_DENIED","message":"No access"}})");
    auto upload = make_orchestrator();

    auto outcome = upload->run();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, error_kind::auth);
    EXPECT_EQ(http_->count("POST", "/buckets/b1/uploads"), 1u);
    EXPECT_EQ(backend_->put_count(), 0u);

    auto reported = errors();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].kind, error_kind::auth);
    EXPECT_EQ(states().back(), upload_status::error);
    ASSERT_TRUE(upload->snapshot().last_error.has_value());
}

TEST_F(UploadOrchestratorTest, FailedDuplicateCheckStillUploads) {
    if (!content_hasher::is_available()) {
        GTEST_SKIP() << "Built without digest support";
    }
    http_->respond("POST", "/check-duplicate", 401, R"({"error":"bad key"})");
    auto upload = make_orchestrator();

    auto outcome = upload->run();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, upload_status::completed);
    EXPECT_TRUE(errors().empty());
}

// ============================================================================
// Duplicates
// ============================================================================

class UploadOrchestratorDuplicateTest : public UploadOrchestratorTest {
protected:
    void SetUp() override {
        if (!content_hasher::is_available()) {
            GTEST_SKIP() << "Built without digest support";
        }
        UploadOrchestratorTest::SetUp();
        service_->report_duplicate("file-existing", "report.txt", 50 * 1024);
    }
};

TEST_F(UploadOrchestratorDuplicateTest, StopsAtDuplicateFound) {
    auto upload = make_orchestrator();

    auto outcome = upload->run();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, upload_status::duplicate_found);
    ASSERT_TRUE(outcome.value().duplicate.has_value());
    EXPECT_EQ(outcome.value().duplicate->existing_files.front().id, "file-existing");
    EXPECT_EQ(duplicates_.load(), 1);
    EXPECT_EQ(upload->status(), upload_status::duplicate_found);
    EXPECT_EQ(http_->count("POST", "/buckets/b1/uploads"), 0u);
    EXPECT_EQ(backend_->put_count(), 0u);
}

TEST_F(UploadOrchestratorDuplicateTest, ReuseExistingCompletesWithoutTransfer) {
    auto upload = make_orchestrator();
    ASSERT_TRUE(upload->run());

    auto outcome = upload->reuse_existing();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, upload_status::completed);
    EXPECT_EQ(outcome.value().reused_file_id, std::optional<std::string>("file-existing"));
    ASSERT_TRUE(outcome.value().record.has_value());
    EXPECT_EQ(outcome.value().record->id, "file-existing");
    EXPECT_EQ(outcome.value().record->file_hash.size(), 64u);

    EXPECT_EQ(backend_->put_count(), 0u);
    EXPECT_EQ(completions_.load(), 1);
    EXPECT_EQ(upload->status(), upload_status::completed);
    EXPECT_DOUBLE_EQ(upload->snapshot().progress_percent, 100.0);
}

TEST_F(UploadOrchestratorDuplicateTest, ReuseUnknownFileRejected) {
    auto upload = make_orchestrator();
    ASSERT_TRUE(upload->run());

    auto outcome = upload->reuse_existing(std::string("file-other"));
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, error_kind::validation);
    EXPECT_EQ(upload->status(), upload_status::duplicate_found);
}

TEST_F(UploadOrchestratorDuplicateTest, ContinueAnywayUploadsWithDigest) {
    auto upload = make_orchestrator();
    ASSERT_TRUE(upload->run());

    auto outcome = upload->continue_anyway();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, upload_status::completed);
    EXPECT_EQ(backend_->put_count(), 1u);

    auto initiate = http_->last("POST", "/buckets/b1/uploads");
    ASSERT_TRUE(initiate.has_value());
    EXPECT_EQ(json_utils::get_string(initiate->body, "clientHash"), upload->snapshot().client_digest);
}

TEST_F(UploadOrchestratorTest, DuplicateOperationsInvalidElsewhere) {
    auto upload = make_orchestrator();

    auto early = upload->continue_anyway();
    ASSERT_FALSE(early);
    EXPECT_EQ(early.error().kind, error_kind::validation);

    ASSERT_TRUE(upload->run());
    auto again = upload->run();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().kind, error_kind::validation);
    EXPECT_EQ(upload->status(), upload_status::completed);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(UploadOrchestratorTest, CancelDuringTransferReleasesSession) {
    backend_->hold();
    auto upload = make_orchestrator();

    auto running = std::async(std::launch::async, [&] { return upload->run(); });
    ASSERT_TRUE(backend_->wait_until_waiting());

    upload->cancel();
    ASSERT_EQ(running.wait_for(5s), std::future_status::ready);
    auto outcome = running.get();

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, error_kind::cancelled);
    EXPECT_EQ(upload->status(), upload_status::error);
    EXPECT_EQ(http_->count("DELETE", "/uploads/up-1"), 1u);
    EXPECT_EQ(http_->count("POST", "/complete"), 0u);

    auto reported = errors();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].kind, error_kind::cancelled);
}

TEST_F(UploadOrchestratorTest, CancelBeforeRun) {
    auto upload = make_orchestrator();
    upload->cancel();

    EXPECT_EQ(upload->status(), upload_status::error);
    EXPECT_EQ(http_->count("DELETE", "/uploads/"), 0u);
    ASSERT_EQ(errors().size(), 1u);

    auto outcome = upload->run();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(backend_->put_count(), 0u);
}

TEST_F(UploadOrchestratorTest, CancelAfterCompletionIsNoop) {
    auto upload = make_orchestrator();
    ASSERT_TRUE(upload->run());

    upload->cancel();
    EXPECT_EQ(upload->status(), upload_status::completed);
    EXPECT_TRUE(errors().empty());
    EXPECT_EQ(http_->count("DELETE", "/uploads/"), 0u);
}

}  // namespace kcenon::storage_transfer::test
