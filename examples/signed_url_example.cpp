/**
 * @file signed_url_example.cpp
 * @brief Signed download URLs, public URLs and image derivatives
 *
 * This example demonstrates:
 * - Fetching signed URLs for different purposes
 * - Cache hits and proactive refresh before expiry
 * - Preloading URLs for a gallery of files
 * - Requesting a resized image derivative
 */

#include <kcenon/storage_transfer/storage_transfer.h>

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

using namespace kcenon::storage_transfer;

namespace {

auto format_time(const std::optional<std::chrono::system_clock::time_point>& tp) -> std::string {
    if (!tp) {
        return "never";
    }
    auto t = std::chrono::system_clock::to_time_t(*tp);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", std::localtime(&t));
    return buffer;
}

void print_entry(const std::string& label, const signed_url_cache::entry_ptr& entry) {
    std::cout << "  " << label << ": " << entry->url << std::endl;
    std::cout << "    expires: " << format_time(entry->expires_at)
              << (entry->is_public ? " (public)" : "") << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <file_id> [more file ids...]" << std::endl;
        std::cout << "Reads STORAGE_API_URL and STORAGE_API_KEY from the environment" << std::endl;
        return 1;
    }

    const char* env_url = std::getenv("STORAGE_API_URL");
    const char* env_key = std::getenv("STORAGE_API_KEY");

    auto client_result = storage_client::builder()
        .with_base_url(env_url ? env_url : "http://localhost:5000/api")
        .with_api_key(env_key ? env_key : "")
        .build();
    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    const std::string file_id = argv[1];

    std::cout << "Signed URLs for " << file_id << std::endl;
    for (auto purpose : {url_purpose::download, url_purpose::preview, url_purpose::stream}) {
        auto entry = client.get_signed_url(file_id, purpose);
        if (!entry.has_value()) {
            std::cerr << "  " << to_string(purpose) << ": " << entry.error().message << std::endl;
            continue;
        }
        print_entry(to_string(purpose), entry.value());
    }

    // Second lookup is served from the cache
    auto again = client.get_signed_url(file_id, url_purpose::download);
    if (again.has_value()) {
        std::cout << "  cached entries: " << client.url_cache().size()
                  << ", refresh timers: " << client.url_cache().pending_refreshes() << std::endl;
    }

    auto public_url = client.get_public_url(file_id);
    if (public_url.has_value()) {
        print_entry("public", public_url.value());
    } else {
        std::cout << "  public: " << public_url.error().message << std::endl;
    }

    std::vector<std::string> gallery(argv + 1, argv + argc);
    auto loaded = client.preload_urls(gallery, url_purpose::preview);
    std::cout << "Preloaded " << loaded << " of " << gallery.size() << " preview URLs" << std::endl;

    transform_options thumbnail;
    thumbnail.width = 320;
    thumbnail.format = "webp";
    thumbnail.quality = 80;
    auto derivative = client.get_transformed_url(file_id, thumbnail);
    if (derivative.has_value()) {
        const auto& d = derivative.value();
        std::cout << "Thumbnail: " << d.url << " (" << d.width << "x" << d.height << " "
                  << d.format << ")" << std::endl;
    } else {
        std::cout << "Thumbnail unavailable: " << derivative.error().message << std::endl;
    }

    client.clear_url_cache();
    return 0;
}
