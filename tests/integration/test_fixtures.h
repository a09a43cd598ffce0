/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_STORAGE_TRANSFER_TEST_FIXTURES_H
#define KCENON_STORAGE_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/storage_transfer/storage_transfer.h>

#include "fake_storage_service.h"
#include "test_policies.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace kcenon::storage_transfer::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("storage_trans_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size, uint32_t seed = 42)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    auto create_text_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path);

        const std::string pattern = "The quick brown fox jumps over the lazy dog. ";
        std::size_t written = 0;
        while (written < size) {
            file << pattern;
            written += pattern.size();
        }

        return path;
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Storage client wired to an in-process storage backend
 *
 * REST calls and buffered PUTs both go through one mock_http_client. PUT
 * bodies are counted so tests can check what reached object storage.
 */
class StorageClientFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        http_ = std::make_shared<mock_http_client>();
        service_ = std::make_unique<fake_storage_service>(http_);
        install_object_store();

        auto client_result = storage_client::builder()
            .with_base_url("https://storage.example.com/api")
            .with_api_key("integration-key")
            .with_transfer_mode(transfer_mode::buffered)
            .with_http_client(http_)
            .with_worker_count(4)
            .with_retry_policies(fast_policies())
            .build();

        ASSERT_TRUE(client_result.has_value()) << "Failed to create client";
        client_ = std::make_unique<storage_client>(std::move(client_result.value()));
    }

    void TearDown() override {
        client_.reset();
        TempDirectoryFixture::TearDown();
    }

    void install_object_store() {
        auto bytes = bytes_stored_;
        auto objects = objects_stored_;
        http_->on("PUT", "/put/", [bytes, objects](const recorded_request& req) {
            *bytes += req.body.size();
            const auto n = ++*objects;
            return make_response(200, "", {{"ETag", "\"obj-" + std::to_string(n) + "\""}});
        });
    }

    auto open(const std::filesystem::path& path) -> file_ref {
        auto file = file_ref::from_path(path);
        EXPECT_TRUE(file.has_value()) << "Failed to open " << path;
        return file.value();
    }

    std::shared_ptr<mock_http_client> http_;
    std::unique_ptr<fake_storage_service> service_;
    std::unique_ptr<storage_client> client_;
    std::shared_ptr<std::atomic<uint64_t>> bytes_stored_ = std::make_shared<std::atomic<uint64_t>>(0);
    std::shared_ptr<std::atomic<int>> objects_stored_ = std::make_shared<std::atomic<int>>(0);
};

}  // namespace kcenon::storage_transfer::test

#endif  // KCENON_STORAGE_TRANSFER_TEST_FIXTURES_H
