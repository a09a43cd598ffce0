/**
 * @file batch_upload_example.cpp
 * @brief Upload every file in a directory with bounded concurrency
 *
 * This example demonstrates:
 * - Collecting files from a directory
 * - Overall progress across a batch
 * - Per-file completion and error callbacks
 * - Reusing existing copies instead of uploading duplicates
 */

#include <kcenon/storage_transfer/storage_transfer.h>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

using namespace kcenon::storage_transfer;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <bucket_id> <directory> [max_concurrent]"
                  << std::endl;
        std::cout << "Reads STORAGE_API_URL and STORAGE_API_KEY from the environment" << std::endl;
        return 1;
    }

    const std::string bucket = argv[1];
    const std::filesystem::path directory = argv[2];
    const std::size_t max_concurrent = argc > 3 ? std::stoul(argv[3]) : 3;

    std::vector<file_ref> files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto file = file_ref::from_path(entry.path());
        if (file.has_value()) {
            files.push_back(file.value());
        } else {
            std::cerr << "Skipping " << entry.path() << ": " << file.error().message << std::endl;
        }
    }
    if (ec) {
        std::cerr << "Cannot read " << directory << ": " << ec.message() << std::endl;
        return 1;
    }
    if (files.empty()) {
        std::cout << "No files to upload" << std::endl;
        return 0;
    }

    const char* env_url = std::getenv("STORAGE_API_URL");
    const char* env_key = std::getenv("STORAGE_API_KEY");

    auto client_result = storage_client::builder()
        .with_base_url(env_url ? env_url : "http://localhost:5000/api")
        .with_api_key(env_key ? env_key : "")
        .with_worker_count(max_concurrent)
        .build();
    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    std::mutex output;
    batch_upload_options options;
    options.max_concurrent = max_concurrent;
    options.on_batch_progress = [&](double percent, std::size_t) {
        std::lock_guard<std::mutex> lock(output);
        std::cout << "\rOverall: " << std::fixed << std::setprecision(1) << percent << "%   "
                  << std::flush;
    };
    options.on_file_complete = [&](const file_record& record, std::size_t index) {
        std::lock_guard<std::mutex> lock(output);
        std::cout << "\n[" << index << "] " << record.original_name << " -> " << record.id
                  << std::endl;
    };
    options.on_file_error = [&](const error& err, std::size_t index) {
        std::lock_guard<std::mutex> lock(output);
        std::cout << "\n[" << index << "] failed: " << err.message << std::endl;
    };

    std::cout << "Uploading " << files.size() << " file(s) to " << bucket << " ("
              << max_concurrent << " at a time)" << std::endl;

    auto result = client.upload_batch(bucket, files, options);

    std::cout << std::endl
              << "Done: " << result.succeeded << " succeeded, " << result.failed << " failed"
              << std::endl;
    return result.all_succeeded() ? 0 : 1;
}
