/**
 * @file test_file_validation.cpp
 * @brief Unit tests for client-side file validation
 */

#include <gtest/gtest.h>

#include <kcenon/storage_transfer/upload/file_validation.h>

#include <string>
#include <utility>
#include <vector>

namespace kcenon::storage_transfer::test {

namespace {

auto buffer_file(const std::string& name, std::size_t size,
                 std::string type = {}) -> file_ref {
    return file_ref::from_buffer(name, std::vector<std::byte>(size, std::byte{1}),
                                 std::move(type));
}

}  // namespace

TEST(FileValidationTest, DefaultsAcceptSmallFiles) {
    auto report = validate_file(buffer_file("a.txt", 10));
    EXPECT_TRUE(report.is_valid);
    EXPECT_TRUE(report.errors.empty());
}

TEST(FileValidationTest, SizeLimitMessage) {
    validation_options options;
    options.max_size = 2ULL * 1024 * 1024;

    auto report = validate_file(buffer_file("a.txt", 2 * 1024 * 1024 + 1), options);
    EXPECT_FALSE(report.is_valid);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0], "File size exceeds 2 MB limit");
}

TEST(FileValidationTest, SizeAtLimitIsAccepted) {
    validation_options options;
    options.max_size = 1024;
    EXPECT_TRUE(validate_file(buffer_file("a.txt", 1024), options).is_valid);
}

TEST(FileValidationTest, FractionalLimitIsTrimmed) {
    validation_options options;
    options.max_size = 512 * 1024;

    auto report = validate_file(buffer_file("a.txt", 600 * 1024), options);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0], "File size exceeds 0.5 MB limit");
}

TEST(FileValidationTest, DisallowedTypeMessage) {
    validation_options options;
    options.allowed_types = {"image/*"};

    auto report = validate_file(buffer_file("a.txt", 10), options);
    EXPECT_FALSE(report.is_valid);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0], "File type text/plain is not allowed");
}

TEST(FileValidationTest, BothErrorsReported) {
    validation_options options;
    options.max_size = 1;
    options.allowed_types = {"application/pdf"};

    auto report = validate_file(buffer_file("a.txt", 10), options);
    EXPECT_FALSE(report.is_valid);
    EXPECT_EQ(report.errors.size(), 2u);
}

TEST(FileValidationTest, AllowedTypePatterns) {
    auto png = buffer_file("Photo.PNG", 10);
    EXPECT_TRUE(matches_allowed_type(png, "*"));
    EXPECT_TRUE(matches_allowed_type(png, "image/png"));
    EXPECT_TRUE(matches_allowed_type(png, "image/*"));
    EXPECT_TRUE(matches_allowed_type(png, "png"));
    EXPECT_TRUE(matches_allowed_type(png, ".png"));
    EXPECT_FALSE(matches_allowed_type(png, "video/*"));
    EXPECT_FALSE(matches_allowed_type(png, "image/jpeg"));
    EXPECT_FALSE(matches_allowed_type(png, "jpg"));
}

TEST(FileValidationTest, WildcardNeedsWholeCategory) {
    auto file = buffer_file("clip.bin", 10, "imagery/custom");
    EXPECT_FALSE(matches_allowed_type(file, "image/*"));
}

TEST(FileValidationTest, ExplicitContentTypeIsChecked) {
    validation_options options;
    options.allowed_types = {"application/json"};

    EXPECT_TRUE(validate_file(buffer_file("data.bin", 10, "application/json"), options).is_valid);
}

TEST(FileValidationTest, NoExtensionOnlyMatchesByType) {
    auto file = buffer_file("README", 10, "text/plain");
    EXPECT_TRUE(matches_allowed_type(file, "text/plain"));
    EXPECT_FALSE(matches_allowed_type(file, "txt"));
}

}  // namespace kcenon::storage_transfer::test
