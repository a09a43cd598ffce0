/**
 * @file storage_api_client.h
 * @brief Typed REST calls against the storage backend
 */

#ifndef KCENON_STORAGE_TRANSFER_API_STORAGE_API_CLIENT_H
#define KCENON_STORAGE_TRANSFER_API_STORAGE_API_CLIENT_H

#include "kcenon/storage_transfer/api/http_types.h"
#include "kcenon/storage_transfer/core/types.h"
#include "kcenon/storage_transfer/core/upload_types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::storage_transfer {

/**
 * @brief Backend endpoint and credential
 */
struct api_client_config {
    std::string base_url;   ///< e.g. "https://storage.example.com/api"
    std::string api_key;    ///< Sent as "Authorization: Bearer <key>"
    header_map extra_headers;
};

/**
 * @brief Body of POST /buckets/{id}/uploads
 */
struct initiate_request {
    std::string filename;
    uint64_t size = 0;
    std::string content_type;
    std::optional<std::string> client_hash;
};

/**
 * @brief Body of POST /uploads/{id}/complete
 */
struct complete_request {
    std::string etag;
    uint64_t actual_size = 0;
    std::optional<std::string> client_hash;
    bool enable_versioning = true;
};

/**
 * @brief Single-attempt REST client
 *
 * Every call is exactly one HTTP request; retries belong to the caller's
 * retry_policy. Non-2xx responses become structured errors through
 * error_from_response(). Safe for concurrent use when the underlying
 * http_client_interface is.
 */
class storage_api_client {
public:
    storage_api_client(api_client_config config,
                       std::shared_ptr<http_client_interface> http);

    /**
     * @brief Request an upload session and its signed PUT URL
     */
    [[nodiscard]] auto initiate_upload(const std::string& bucket_id,
                                       const initiate_request& request)
        -> result<upload_grant>;

    /**
     * @brief Finalize an upload session into a file record
     */
    [[nodiscard]] auto complete_upload(const std::string& upload_id,
                                       const complete_request& request)
        -> result<file_record>;

    /**
     * @brief Release an in-progress upload session
     */
    [[nodiscard]] auto cancel_upload(const std::string& upload_id) -> result<void>;

    [[nodiscard]] auto get_upload_status(const std::string& upload_id)
        -> result<upload_status_info>;

    /**
     * @brief Ask whether content with this digest already exists in a bucket
     */
    [[nodiscard]] auto check_duplicate(const std::string& bucket_id,
                                       const std::string& digest)
        -> result<duplicate_info>;

    /**
     * @brief Fetch a time-limited download URL
     */
    [[nodiscard]] auto request_signed_url(const std::string& file_id,
                                          url_purpose purpose,
                                          std::chrono::seconds expiry)
        -> result<signed_url_entry>;

    /**
     * @brief Fetch the permanent URL of a public file
     */
    [[nodiscard]] auto get_public_url(const std::string& file_id)
        -> result<signed_url_entry>;

    /**
     * @brief Fetch the URL of a transformed derivative of an image
     */
    [[nodiscard]] auto get_transformed_url(const std::string& file_id,
                                           const transform_options& options)
        -> result<transformed_url>;

    [[nodiscard]] auto config() const -> const api_client_config& { return config_; }

private:
    [[nodiscard]] auto endpoint(const std::string& path) const -> std::string;
    [[nodiscard]] auto headers() const -> header_map;
    [[nodiscard]] auto expect_json(result<http_response> response, const char* operation)
        -> result<std::string>;

    api_client_config config_;
    std::shared_ptr<http_client_interface> http_;
};

/**
 * @brief Classify a non-2xx response
 *
 * Reads {"error":{"code","message","retryAfter",...}} or {"error":"text"}.
 * A recognized code decides the kind; otherwise the HTTP status does. The
 * retry-after hint comes from the body (seconds) or the Retry-After header.
 */
[[nodiscard]] auto error_from_response(const http_response& response) -> error;

/**
 * @brief Parse a file object as returned by the complete call
 */
[[nodiscard]] auto parse_file_record(std::string_view json) -> result<file_record>;

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_API_STORAGE_API_CLIENT_H
