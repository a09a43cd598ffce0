/**
 * @file upload_example.cpp
 * @brief File upload example with progress, duplicate handling and error hints
 *
 * This example demonstrates:
 * - Building a storage_client from command line options
 * - Using progress and state callbacks to monitor an upload
 * - Deciding what to do when the file already exists in the bucket
 * - Mapping error kinds to actionable messages
 */

#include <kcenon/storage_transfer/storage_transfer.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace kcenon::storage_transfer;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_progress(double percent, uint64_t loaded, uint64_t total) {
    constexpr int bar_width = 30;
    int filled = static_cast<int>(percent / 100.0 * bar_width);

    std::cout << "\r[";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percent << "%"
              << " | " << format_bytes(loaded) << "/" << format_bytes(total) << "     "
              << std::flush;

    if (percent >= 100.0) {
        std::cout << std::endl;
    }
}

void print_error_hint(const error& err) {
    switch (err.kind) {
        case error_kind::auth:
            std::cerr << "Hint: Check the API key and bucket permissions" << std::endl;
            break;
        case error_kind::quota_exceeded:
            std::cerr << "Hint: The bucket quota is full; delete files or raise the quota"
                      << std::endl;
            break;
        case error_kind::validation:
            std::cerr << "Hint: The file was rejected before upload; check size and type"
                      << std::endl;
            break;
        case error_kind::network:
        case error_kind::timeout:
            std::cerr << "Hint: The storage service could not be reached" << std::endl;
            break;
        default:
            break;
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Storage Transfer System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --url <url>         API base URL (default: $STORAGE_API_URL or http://localhost:5000/api)" << std::endl;
    std::cout << "  -k, --key <key>         API key (default: $STORAGE_API_KEY)" << std::endl;
    std::cout << "  -b, --bucket <id>       Target bucket (default: default)" << std::endl;
    std::cout << "  --buffered              Send the file in one buffered PUT" << std::endl;
    std::cout << "  --skip-duplicates       Do not look for an existing copy" << std::endl;
    std::cout << "  --on-duplicate <mode>   reuse | upload | stop (default: reuse)" << std::endl;
    std::cout << "  --max-size <MB>         Reject files larger than this" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    const char* env_url = std::getenv("STORAGE_API_URL");
    const char* env_key = std::getenv("STORAGE_API_KEY");

    std::string base_url = env_url ? env_url : "http://localhost:5000/api";
    std::string api_key = env_key ? env_key : "";
    std::string bucket = "default";
    std::string on_duplicate = "reuse";
    transfer_mode mode = transfer_mode::streamed;
    bool skip_duplicates = false;
    std::optional<uint64_t> max_size_mb;
    std::string local_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-u" || arg == "--url" || arg == "-k" || arg == "--key" ||
                   arg == "-b" || arg == "--bucket" || arg == "--on-duplicate" ||
                   arg == "--max-size") {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            if (arg == "-u" || arg == "--url") base_url = argv[i];
            else if (arg == "-k" || arg == "--key") api_key = argv[i];
            else if (arg == "-b" || arg == "--bucket") bucket = argv[i];
            else if (arg == "--on-duplicate") on_duplicate = argv[i];
            else max_size_mb = std::stoull(argv[i]);
        } else if (arg == "--buffered") {
            mode = transfer_mode::buffered;
        } else if (arg == "--skip-duplicates") {
            skip_duplicates = true;
        } else if (arg[0] != '-') {
            local_path = arg;
        }
    }

    if (local_path.empty()) {
        std::cerr << "Error: local_file is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    auto file = file_ref::from_path(local_path);
    if (!file.has_value()) {
        std::cerr << "Error: " << file.error().message << std::endl;
        return 1;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "       File Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  API: " << base_url << std::endl;
    std::cout << "  Bucket: " << bucket << std::endl;
    std::cout << "  File: " << file.value().name() << " (" << format_bytes(file.value().size()) << ", "
              << file.value().content_type() << ")" << std::endl;
    std::cout << "  Transfer: " << (mode == transfer_mode::buffered ? "buffered" : "streamed")
              << std::endl;
    std::cout << std::endl;

    auto builder = storage_client::builder();
    builder.with_base_url(base_url).with_api_key(api_key).with_transfer_mode(mode);
    if (max_size_mb) {
        validation_options rules;
        rules.max_size = *max_size_mb * 1024 * 1024;
        builder.with_validation(rules);
    }

    auto client_result = builder.build();
    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    upload_options options;
    options.skip_duplicate_check = skip_duplicates;
    options.callbacks.on_state_change = [](const upload_session& session) {
        if (session.status != upload_status::uploading) {
            std::cout << "[State] " << to_string(session.status) << std::endl;
        }
    };
    options.callbacks.on_progress = print_progress;
    options.callbacks.on_retry = [](const error& err, std::size_t attempt,
                                    std::chrono::milliseconds delay) {
        std::cout << std::endl
                  << "[Retry " << attempt << "] " << err.message << " (waiting " << delay.count()
                  << " ms)" << std::endl;
    };

    const auto started = std::chrono::steady_clock::now();
    auto id = client.start_upload(bucket, file.value(), options);
    if (!id.has_value()) {
        std::cerr << "Upload rejected: " << id.error().message << std::endl;
        print_error_hint(id.error());
        return 1;
    }

    auto outcome = client.wait(id.value());
    if (outcome.has_value() && outcome.value().status == upload_status::duplicate_found) {
        const auto& existing = outcome.value().duplicate->existing_files.front();
        std::cout << "Found existing copy: " << existing.original_name << " (" << existing.id
                  << ", v" << existing.version << ")" << std::endl;

        if (on_duplicate == "reuse") {
            outcome = client.reuse_existing(id.value());
        } else if (on_duplicate == "upload") {
            auto resumed = client.continue_anyway(id.value());
            if (!resumed.has_value()) {
                std::cerr << "Failed to continue: " << resumed.error().message << std::endl;
                return 1;
            }
            outcome = client.wait(id.value());
        } else {
            static_cast<void>(client.cancel_upload(id.value()));
            std::cout << "Stopped; nothing uploaded" << std::endl;
            return 0;
        }
    }

    if (!outcome.has_value()) {
        std::cerr << std::endl << "Upload failed: " << outcome.error().message << std::endl;
        print_error_hint(outcome.error());
        return 1;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    const auto& record = *outcome.value().record;

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  File id: " << record.id << std::endl;
    std::cout << "  Object key: " << record.object_key << std::endl;
    std::cout << "  Version: " << record.version << std::endl;
    if (record.hash_verification) {
        std::cout << "  Digest verified: " << (record.hash_verification->matches ? "yes" : "NO")
                  << std::endl;
    }
    if (outcome.value().reused_file_id) {
        std::cout << "  Reused existing file, no bytes sent" << std::endl;
    }
    std::cout << "  Elapsed: " << elapsed.count() << " ms" << std::endl;
    std::cout << "========================================" << std::endl;
    return 0;
}
