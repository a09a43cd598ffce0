/**
 * @file test_storage_api_client.cpp
 * @brief Unit tests for storage_api_client and response classification
 */

#include <gtest/gtest.h>

#include <kcenon/storage_transfer/api/json_utils.h>
#include <kcenon/storage_transfer/api/storage_api_client.h>

#include "mock_http_client.h"

#include <memory>
#include <string>

namespace kcenon::storage_transfer::test {

class StorageApiClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<mock_http_client>();
        api_client_config config;
        config.base_url = "https://storage.example.com/api/";
        config.api_key = "sk_test_123";
        client_ = std::make_unique<storage_api_client>(config, http_);
    }

    std::shared_ptr<mock_http_client> http_;
    std::unique_ptr<storage_api_client> client_;
};

// ============================================================================
// Request shape
// ============================================================================

TEST_F(StorageApiClientTest, InitiateSendsBodyAndAuth) {
    http_->respond("POST", "/buckets/b1/uploads", 200,
                   R"({"uploadId":"up-1","signedUrl":"https://objects.example.com/put?sig=1",)"
                   R"("objectKey":"b1/x","headersToInclude":{"x-amz-acl":"private"},)"
                   R"("expiresAt":"2025-01-01T00:15:00Z"})");

    initiate_request request;
    request.filename = "photo.jpg";
    request.size = 2048;
    request.content_type = "image/jpeg";
    request.client_hash = std::string(64, 'a');

    auto grant = client_->initiate_upload("b1", request);
    ASSERT_TRUE(grant);
    EXPECT_EQ(grant.value().upload_id, "up-1");
    EXPECT_EQ(grant.value().signed_url, "https://objects.example.com/put?sig=1");
    EXPECT_EQ(grant.value().object_key, "b1/x");
    EXPECT_EQ(grant.value().required_headers.at("x-amz-acl"), "private");
    ASSERT_TRUE(grant.value().expires_at.has_value());

    auto sent = http_->last("POST", "/uploads");
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->url, "https://storage.example.com/api/buckets/b1/uploads");
    EXPECT_EQ(sent->headers.at("Authorization"), "Bearer sk_test_123");
    EXPECT_EQ(sent->headers.at("Content-Type"), "application/json");
    EXPECT_EQ(json_utils::get_string(sent->body, "filename"), std::optional<std::string>("photo.jpg"));
    EXPECT_EQ(json_utils::get_uint(sent->body, "size"), std::optional<uint64_t>(2048));
    EXPECT_EQ(json_utils::get_string(sent->body, "contentType"),
              std::optional<std::string>("image/jpeg"));
    EXPECT_TRUE(json_utils::get_string(sent->body, "clientHash").has_value());
}

TEST_F(StorageApiClientTest, InitiateWithoutHashOmitsField) {
    http_->respond("POST", "/uploads", 200, R"({"uploadId":"u","signedUrl":"https://x/y"})");

    initiate_request request;
    request.filename = "a.bin";
    request.size = 1;
    request.content_type = "application/octet-stream";
    ASSERT_TRUE(client_->initiate_upload("b1", request));

    auto sent = http_->last("POST", "/uploads");
    ASSERT_TRUE(sent.has_value());
    EXPECT_FALSE(json_utils::find_member(sent->body, "clientHash").has_value());
}

TEST_F(StorageApiClientTest, CompleteParsesRecordAndVerification) {
    http_->respond("POST", "/uploads/up-1/complete", 200,
                   R"({"file":{"id":"f-9","bucket_id":"b1","original_name":"photo.jpg",)"
                   R"("mime_type":"image/jpeg","size":"2048","object_key":"b1/x",)"
                   R"("file_hash":"abc","is_public":true,"version":3,"created_at":"2025-01-01"},)"
                   R"("hashVerification":{"clientHash":"abc","serverHash":"abd","matches":false}})");

    complete_request request;
    request.etag = "\"etag-1\"";
    request.actual_size = 2048;

    auto record = client_->complete_upload("up-1", request);
    ASSERT_TRUE(record);
    EXPECT_EQ(record.value().id, "f-9");
    EXPECT_EQ(record.value().size, 2048u);
    EXPECT_TRUE(record.value().is_public);
    EXPECT_EQ(record.value().version, 3u);
    ASSERT_TRUE(record.value().hash_verification.has_value());
    EXPECT_FALSE(record.value().hash_verification->matches);

    auto sent = http_->last("POST", "/complete");
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(json_utils::get_string(sent->body, "etag"), std::optional<std::string>("\"etag-1\""));
    EXPECT_EQ(json_utils::get_bool(sent->body, "enableVersioning"), std::optional<bool>(true));
}

TEST_F(StorageApiClientTest, CancelAcceptsNoContent) {
    http_->respond("DELETE", "/uploads/up-1", 204, "");
    EXPECT_TRUE(client_->cancel_upload("up-1"));
    EXPECT_EQ(http_->count("DELETE", "/uploads/up-1"), 1u);
}

TEST_F(StorageApiClientTest, UploadStatus) {
    http_->respond("GET", "/uploads/up-1", 200,
                   R"({"uploadId":"up-1","status":"completed","filename":"a.txt","size":3,)"
                   R"("completedAt":"2025-01-01T00:00:05Z","fileId":"f-1"})");

    auto status = client_->get_upload_status("up-1");
    ASSERT_TRUE(status);
    EXPECT_EQ(status.value().status, "completed");
    EXPECT_EQ(status.value().file_id, std::optional<std::string>("f-1"));
    EXPECT_TRUE(status.value().completed_at.has_value());
    EXPECT_FALSE(status.value().expires_at.has_value());
}

TEST_F(StorageApiClientTest, CheckDuplicateParsesMatches) {
    http_->respond("POST", "/buckets/b1/check-duplicate", 200,
                   R"({"isDuplicate":true,"existingFiles":[)"
                   R"({"id":"f-1","original_name":"a.txt","size":3,"created_at":"x","is_public":false,"version":1},)"
                   R"({"id":"f-2","original_name":"b.txt","size":3,"created_at":"y","is_public":true,"version":2}],)"
                   R"("message":"exists","recommendation":"reuse"})");

    auto info = client_->check_duplicate("b1", "deadbeef");
    ASSERT_TRUE(info);
    EXPECT_TRUE(info.value().is_duplicate);
    EXPECT_EQ(info.value().digest, "deadbeef");
    ASSERT_EQ(info.value().existing_files.size(), 2u);
    EXPECT_EQ(info.value().existing_files[1].id, "f-2");
    EXPECT_EQ(info.value().recommendation, "reuse");

    auto sent = http_->last("POST", "/check-duplicate");
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(json_utils::get_string(sent->body, "hash"), std::optional<std::string>("deadbeef"));
}

TEST_F(StorageApiClientTest, SignedUrlRequestCarriesPurposeAndExpiry) {
    http_->respond("POST", "/files/f-1/signed-url", 200,
                   R"({"url":"https://objects.example.com/get?sig=2","expiresAt":"2025-01-01T00:05:00Z",)"
                   R"("isPublic":false,"cacheHeaders":{"Cache-Control":"private"}})");

    auto entry = client_->request_signed_url("f-1", url_purpose::preview, std::chrono::seconds(300));
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry.value().purpose, url_purpose::preview);
    EXPECT_FALSE(entry.value().is_public);
    ASSERT_TRUE(entry.value().expires_at.has_value());
    EXPECT_EQ(entry.value().cache_headers.at("Cache-Control"), "private");

    auto sent = http_->last("POST", "/signed-url");
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(json_utils::get_uint(sent->body, "expiry"), std::optional<uint64_t>(300));
    EXPECT_EQ(json_utils::get_string(sent->body, "purpose"), std::optional<std::string>("preview"));
}

TEST_F(StorageApiClientTest, PublicUrlHasNoExpiry) {
    http_->respond("GET", "/files/f-1/public-url", 200,
                   R"({"url":"https://cdn.example.com/f-1","isPublic":true,"expiresAt":"2025-01-01T00:00:00Z"})");

    auto entry = client_->get_public_url("f-1");
    ASSERT_TRUE(entry);
    EXPECT_TRUE(entry.value().is_public);
    EXPECT_FALSE(entry.value().expires_at.has_value());
}

TEST_F(StorageApiClientTest, TransformUsesPresetOrDimensions) {
    http_->respond("GET", "/files/f-1/transform", 200,
                   R"({"url":"https://cdn.example.com/t/1","derivative":{"id":"d-1","width":320,)"
                   R"("height":200,"format":"webp","size":1000,"mimeType":"image/webp"}})");

    transform_options preset;
    preset.preset = "thumbnail";
    preset.width = 999;
    ASSERT_TRUE(client_->get_transformed_url("f-1", preset));
    auto first = http_->last("GET", "/transform");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->query.at("preset"), "thumbnail");
    EXPECT_EQ(first->query.count("w"), 0u);

    transform_options explicit_size;
    explicit_size.width = 320;
    explicit_size.quality = 80;
    explicit_size.format = "webp";
    auto url = client_->get_transformed_url("f-1", explicit_size);
    ASSERT_TRUE(url);
    EXPECT_EQ(url.value().derivative_id, "d-1");
    EXPECT_EQ(url.value().width, 320u);
    EXPECT_EQ(url.value().mime_type, "image/webp");

    auto second = http_->last("GET", "/transform");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->query.at("w"), "320");
    EXPECT_EQ(second->query.at("q"), "80");
    EXPECT_EQ(second->query.at("format"), "webp");
    EXPECT_EQ(second->query.count("h"), 0u);
}

// ============================================================================
// Failure handling
// ============================================================================

TEST_F(StorageApiClientTest, BackendErrorCodeDecidesKind) {
    http_->respond("POST", "/uploads", 500,
                   R"({"error":{"code":"QUOTA_EXCEEDED","message":"Bucket full","used":"10","limit":"10"}})");

    initiate_request request;
    request.filename = "a";
    auto grant = client_->initiate_upload("b1", request);
    ASSERT_FALSE(grant);
    EXPECT_EQ(grant.error().kind, error_kind::quota_exceeded);
    EXPECT_EQ(grant.error().code, "QUOTA_EXCEEDED");
    EXPECT_EQ(grant.error().message, "Bucket full");
    EXPECT_EQ(grant.error().http_status, 500);
    EXPECT_FALSE(grant.error().retryable);
    EXPECT_EQ(grant.error().detail("used"), std::optional<std::string>("10"));
}

TEST_F(StorageApiClientTest, TransportFailurePassesThrough) {
    http_->respond_sequence("GET", "/uploads/", {transport_failure(error_kind::timeout, "timed out")});

    auto status = client_->get_upload_status("up-1");
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().kind, error_kind::timeout);
}

TEST_F(StorageApiClientTest, NonJsonSuccessIsMalformed) {
    http_->respond("POST", "/signed-url", 200, "<html>ok</html>");

    auto entry = client_->request_signed_url("f-1", url_purpose::download, std::chrono::seconds(900));
    ASSERT_FALSE(entry);
    EXPECT_EQ(entry.error().kind, error_kind::internal);
}

TEST_F(StorageApiClientTest, MissingFieldsAreMalformed) {
    http_->respond("POST", "/uploads", 200, R"({"uploadId":"up-1"})");

    initiate_request request;
    request.filename = "a";
    auto grant = client_->initiate_upload("b1", request);
    ASSERT_FALSE(grant);
    EXPECT_EQ(grant.error().kind, error_kind::internal);
}

class ErrorFromResponseTest : public ::testing::Test {
protected:
    static auto response(int status, const std::string& body,
                         std::map<std::string, std::string> headers = {}) -> http_response {
        return make_response(status, body, std::move(headers)).value();
    }
};

TEST_F(ErrorFromResponseTest, RetryAfterFromBody) {
    auto err = error_from_response(
        response(429, R"({"error":{"code":"RATE_LIMIT_EXCEEDED","message":"Slow","retryAfter":2.5}})"));

    EXPECT_EQ(err.kind, error_kind::rate_limited);
    ASSERT_TRUE(err.retry_after.has_value());
    EXPECT_EQ(*err.retry_after, std::chrono::milliseconds(2500));
}

TEST_F(ErrorFromResponseTest, RetryAfterFromHeader) {
    auto err = error_from_response(response(429, "", {{"retry-after", "3"}}));

    EXPECT_EQ(err.kind, error_kind::rate_limited);
    ASSERT_TRUE(err.retry_after.has_value());
    EXPECT_EQ(*err.retry_after, std::chrono::milliseconds(3000));
}

TEST_F(ErrorFromResponseTest, UnknownCodeFallsBackToStatus) {
    auto err = error_from_response(response(503, R"({"error":{"code":"BRAND_NEW","message":"down"}})"));

    EXPECT_EQ(err.kind, error_kind::service);
    EXPECT_EQ(err.code, "BRAND_NEW");
    EXPECT_TRUE(err.retryable);
}

TEST_F(ErrorFromResponseTest, PlainErrorString) {
    auto err = error_from_response(response(401, R"({"error":"Invalid token"})"));

    EXPECT_EQ(err.kind, error_kind::auth);
    EXPECT_EQ(err.message, "Invalid token");
}

TEST_F(ErrorFromResponseTest, ExpiredSignedUrl) {
    auto err = error_from_response(response(410, ""));
    EXPECT_EQ(err.kind, error_kind::signed_url_expired);
    EXPECT_EQ(err.http_status, 410);
}

TEST(ParseFileRecordTest, NumericIdAccepted) {
    auto record = parse_file_record(R"({"id":42,"bucket_id":"b1","size":10})");
    ASSERT_TRUE(record);
    EXPECT_EQ(record.value().id, "42");
    EXPECT_EQ(record.value().version, 1u);
}

TEST(ParseFileRecordTest, MissingIdRejected) {
    auto record = parse_file_record(R"({"bucket_id":"b1"})");
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, error_kind::internal);
}

}  // namespace kcenon::storage_transfer::test
