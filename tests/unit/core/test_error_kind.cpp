/**
 * @file test_error_kind.cpp
 * @brief Unit tests for the error taxonomy
 */

#include <gtest/gtest.h>

#include <kcenon/storage_transfer/core/error_kind.h>
#include <kcenon/storage_transfer/core/types.h>

#include <string>

namespace kcenon::storage_transfer::test {

class ErrorKindTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ErrorKindTest, BackendCodesRoundTripThroughStrings) {
    EXPECT_EQ(parse_backend_error_code("STORAGE_ERROR"), backend_error_code::storage_error);
    EXPECT_EQ(parse_backend_error_code("SIGNED_URL_EXPIRED"),
              backend_error_code::signed_url_expired);
    EXPECT_EQ(parse_backend_error_code("RATE_LIMIT_EXCEEDED"),
              backend_error_code::rate_limit_exceeded);
    EXPECT_EQ(to_string(backend_error_code::invalid_api_key), "INVALID_API_KEY");
}

TEST_F(ErrorKindTest, UnknownCodeFallsBackToUnknown) {
    EXPECT_EQ(parse_backend_error_code("SOMETHING_NEW"), backend_error_code::unknown);
    EXPECT_EQ(parse_backend_error_code(""), backend_error_code::unknown);
    EXPECT_EQ(kind_of(backend_error_code::unknown), error_kind::internal);
}

TEST_F(ErrorKindTest, CodesMapToKinds) {
    EXPECT_EQ(kind_of(backend_error_code::invalid_api_key), error_kind::auth);
    EXPECT_EQ(kind_of(backend_error_code::bucket_access_denied), error_kind::auth);
    EXPECT_EQ(kind_of(backend_error_code::invalid_file_type), error_kind::validation);
    EXPECT_EQ(kind_of(backend_error_code::file_too_large), error_kind::validation);
    EXPECT_EQ(kind_of(backend_error_code::storage_error), error_kind::service);
    EXPECT_EQ(kind_of(backend_error_code::database_timeout), error_kind::service);
    EXPECT_EQ(kind_of(backend_error_code::upload_timeout), error_kind::timeout);
    EXPECT_EQ(kind_of(backend_error_code::network_error), error_kind::network);
    EXPECT_EQ(kind_of(backend_error_code::signed_url_expired), error_kind::signed_url_expired);
    EXPECT_EQ(kind_of(backend_error_code::rate_limit_exceeded), error_kind::rate_limited);
    EXPECT_EQ(kind_of(backend_error_code::quota_exceeded), error_kind::quota_exceeded);
    EXPECT_EQ(kind_of(backend_error_code::upload_session_not_found), error_kind::not_found);
}

TEST_F(ErrorKindTest, HttpStatusFallback) {
    EXPECT_EQ(kind_from_http_status(400), error_kind::validation);
    EXPECT_EQ(kind_from_http_status(401), error_kind::auth);
    EXPECT_EQ(kind_from_http_status(403), error_kind::auth);
    EXPECT_EQ(kind_from_http_status(404), error_kind::not_found);
    EXPECT_EQ(kind_from_http_status(410), error_kind::signed_url_expired);
    EXPECT_EQ(kind_from_http_status(429), error_kind::rate_limited);
    EXPECT_EQ(kind_from_http_status(503), error_kind::service);
    EXPECT_EQ(kind_from_http_status(504), error_kind::timeout);
    EXPECT_EQ(kind_from_http_status(507), error_kind::quota_exceeded);
    EXPECT_EQ(kind_from_http_status(302), error_kind::internal);
}

TEST_F(ErrorKindTest, RetryableKinds) {
    EXPECT_TRUE(is_retryable_kind(error_kind::network));
    EXPECT_TRUE(is_retryable_kind(error_kind::timeout));
    EXPECT_TRUE(is_retryable_kind(error_kind::service));
    EXPECT_TRUE(is_retryable_kind(error_kind::signed_url_expired));
    EXPECT_TRUE(is_retryable_kind(error_kind::rate_limited));

    EXPECT_FALSE(is_retryable_kind(error_kind::validation));
    EXPECT_FALSE(is_retryable_kind(error_kind::auth));
    EXPECT_FALSE(is_retryable_kind(error_kind::quota_exceeded));
    EXPECT_FALSE(is_retryable_kind(error_kind::cancelled));
    EXPECT_FALSE(is_retryable_kind(error_kind::hash_unavailable));
}

TEST_F(ErrorKindTest, DescriptionsAreNotEmpty) {
    EXPECT_FALSE(describe(backend_error_code::storage_error).empty());
    EXPECT_FALSE(describe(backend_error_code::unknown).empty());
}

TEST_F(ErrorKindTest, KindNames) {
    EXPECT_EQ(to_string(error_kind::signed_url_expired), "signed_url_expired");
    EXPECT_EQ(to_string(error_kind::hash_unavailable), "hash_unavailable");
}

class ErrorTypeTest : public ::testing::Test {};

TEST_F(ErrorTypeTest, ConstructedFromBackendCode) {
    error err(backend_error_code::storage_error, "Storage down");

    EXPECT_EQ(err.kind, error_kind::service);
    EXPECT_EQ(err.code, "STORAGE_ERROR");
    EXPECT_EQ(err.message, "Storage down");
    EXPECT_TRUE(err.retryable);
}

TEST_F(ErrorTypeTest, DetailsAndStatus) {
    error err(error_kind::quota_exceeded, "Quota exhausted");
    err.with_status(507).with_detail("used", "100").with_detail("limit", "100");

    EXPECT_EQ(err.http_status, 507);
    EXPECT_FALSE(err.retryable);
    ASSERT_TRUE(err.detail("used").has_value());
    EXPECT_EQ(*err.detail("used"), "100");
    EXPECT_FALSE(err.detail("missing").has_value());
}

TEST_F(ErrorTypeTest, ResultCarriesValueOrError) {
    result<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    result<int> failed = unexpected(error(error_kind::auth, "Bad key"));
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().kind, error_kind::auth);

    result<void> done;
    EXPECT_TRUE(done.has_value());
}

TEST_F(ErrorTypeTest, SessionIdsAreUnique) {
    auto a = session_id::generate();
    auto b = session_id::generate();

    EXPECT_FALSE(a.empty());
    EXPECT_NE(a, b);
    EXPECT_EQ(a.value.rfind("upload_", 0), 0u);
}

}  // namespace kcenon::storage_transfer::test
