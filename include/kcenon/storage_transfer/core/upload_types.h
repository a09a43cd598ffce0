/**
 * @file upload_types.h
 * @brief Upload and signed-URL type definitions for storage_trans_system
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_UPLOAD_TYPES_H
#define KCENON_STORAGE_TRANSFER_CORE_UPLOAD_TYPES_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/storage_transfer/core/file_ref.h"
#include "kcenon/storage_transfer/core/types.h"

namespace kcenon::storage_transfer {

using time_point = std::chrono::system_clock::time_point;
using header_map = std::map<std::string, std::string>;

/**
 * @brief Upload session state
 */
enum class upload_status {
    pending,
    hashing,
    checking_duplicates,
    duplicate_found,
    initiating,
    uploading,
    finalizing,
    completed,
    error
};

[[nodiscard]] constexpr auto to_string(upload_status status) noexcept -> const char* {
    switch (status) {
        case upload_status::pending: return "pending";
        case upload_status::hashing: return "hashing";
        case upload_status::checking_duplicates: return "checking-duplicates";
        case upload_status::duplicate_found: return "duplicate-found";
        case upload_status::initiating: return "initiating";
        case upload_status::uploading: return "uploading";
        case upload_status::finalizing: return "finalizing";
        case upload_status::completed: return "completed";
        case upload_status::error: return "error";
    }
    return "unknown";
}

/**
 * @brief Check if status is terminal (final)
 *
 * duplicate_found is a pause awaiting a caller decision, not a terminal state.
 */
[[nodiscard]] constexpr auto is_terminal_status(upload_status status) noexcept -> bool {
    return status == upload_status::completed || status == upload_status::error;
}

/**
 * @brief Existing file sharing a digest
 */
struct file_summary {
    std::string id;
    std::string original_name;
    uint64_t size = 0;
    std::string created_at;
    bool is_public = false;
    uint32_t version = 1;
};

/**
 * @brief Result of a duplicate check
 */
struct duplicate_info {
    std::string digest;
    bool is_duplicate = false;
    std::vector<file_summary> existing_files;
    std::string message;
    std::string recommendation;
};

/**
 * @brief Server comparison of client and server digests
 */
struct hash_verification {
    std::string client_hash;
    std::string server_hash;
    bool matches = false;
};

/**
 * @brief Finalized file returned by the complete call
 */
struct file_record {
    std::string id;
    std::string bucket_id;
    std::string original_name;
    std::string mime_type;
    uint64_t size = 0;
    std::string object_key;
    std::string file_hash;
    bool is_public = false;
    uint32_t version = 1;
    std::string created_at;
    std::optional<struct hash_verification> hash_verification;
};

/**
 * @brief Upload session issued by the backend at initiation
 */
struct upload_grant {
    std::string upload_id;
    std::string signed_url;
    std::string object_key;
    header_map required_headers;
    std::optional<time_point> expires_at;
};

/**
 * @brief Remote view of an upload session (GET /uploads/{id})
 */
struct upload_status_info {
    std::string upload_id;
    std::string status;
    std::string filename;
    uint64_t size = 0;
    std::optional<time_point> expires_at;
    std::optional<time_point> completed_at;
    std::optional<std::string> file_id;
};

/**
 * @brief Snapshot of an upload session
 *
 * Handed to state-change callbacks and returned by the manager; never a live
 * view.
 */
struct upload_session {
    session_id id;
    file_ref file;
    std::string bucket_id;
    upload_status status = upload_status::pending;
    double progress_percent = 0.0;
    std::size_t retry_count = 0;
    std::optional<std::string> client_digest;
    std::optional<std::string> server_upload_id;
    std::optional<std::string> signed_url;
    header_map required_headers;
    std::optional<time_point> url_expires_at;
    std::optional<error> last_error;
    std::optional<duplicate_info> duplicate;
    std::optional<file_record> result;
};

/**
 * @brief Per-upload callbacks
 *
 * Invoked on the worker running the upload. on_error fires at most once per
 * session.
 */
struct upload_callbacks {
    std::function<void(const upload_session&)> on_state_change;
    std::function<void(double percent, uint64_t bytes_loaded, uint64_t bytes_total)> on_progress;
    std::function<void(const duplicate_info&)> on_duplicate;
    std::function<void(const file_record&)> on_complete;
    std::function<void(const error&)> on_error;
    std::function<void(const error&, std::size_t attempt, std::chrono::milliseconds delay)>
        on_retry;
};

/**
 * @brief Upload options
 */
struct upload_options {
    bool skip_duplicate_check = false;
    bool enable_versioning = true;
    std::optional<std::string> content_type;  ///< Overrides the file's type
    upload_callbacks callbacks;
};

/**
 * @brief Where an upload run stopped
 *
 * Either completed with a record, or paused at duplicate_found awaiting
 * continue_anyway(), reuse_existing() or cancel().
 */
struct upload_outcome {
    upload_status status = upload_status::pending;
    std::optional<file_record> record;
    std::optional<duplicate_info> duplicate;
    std::optional<std::string> reused_file_id;
};

/**
 * @brief Client-side file validation options
 */
struct validation_options {
    uint64_t max_size = 100ULL * 1024 * 1024;  // 100MB
    std::vector<std::string> allowed_types;     ///< MIME type, category wildcard, "*" or extension
};

/**
 * @brief Client-side file validation result
 */
struct validation_result {
    bool is_valid = true;
    std::vector<std::string> errors;
};

/**
 * @brief Batch upload options
 */
struct batch_upload_options {
    std::size_t max_concurrent = 3;
    bool reuse_duplicates = true;  ///< Resolve duplicate-found with the first match
    upload_options per_file;
    std::function<void(double overall_percent, std::size_t index)> on_batch_progress;
    std::function<void(const file_record&, std::size_t index)> on_file_complete;
    std::function<void(const error&, std::size_t index)> on_file_error;
};

/**
 * @brief Per-file outcome of a batch upload
 */
struct batch_item_result {
    std::size_t index = 0;
    std::string filename;
    session_id id;
    upload_status final_status = upload_status::pending;
    std::optional<file_record> record;
    std::optional<error> failure;
};

/**
 * @brief Aggregate outcome of a batch upload
 */
struct batch_upload_result {
    std::vector<batch_item_result> items;
    std::size_t succeeded = 0;
    std::size_t failed = 0;

    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return failed == 0 && succeeded == items.size();
    }
};

/**
 * @brief Intended use of a signed download URL
 */
enum class url_purpose {
    download,
    preview,
    stream
};

[[nodiscard]] constexpr auto to_string(url_purpose purpose) noexcept -> const char* {
    switch (purpose) {
        case url_purpose::download: return "download";
        case url_purpose::preview: return "preview";
        case url_purpose::stream: return "stream";
    }
    return "download";
}

/**
 * @brief Default validity window requested for a purpose
 */
[[nodiscard]] constexpr auto default_expiry(url_purpose purpose) noexcept
    -> std::chrono::seconds {
    switch (purpose) {
        case url_purpose::download: return std::chrono::seconds{900};
        case url_purpose::preview: return std::chrono::seconds{300};
        case url_purpose::stream: return std::chrono::seconds{1800};
    }
    return std::chrono::seconds{900};
}

/**
 * @brief Cached download URL
 */
struct signed_url_entry {
    std::string file_id;
    url_purpose purpose = url_purpose::download;
    std::string url;
    bool is_public = false;
    std::optional<time_point> expires_at;  ///< Absent for public entries
    header_map cache_headers;
};

/**
 * @brief Options for a signed URL lookup
 */
struct signed_url_options {
    std::optional<std::chrono::seconds> expiry;  ///< Overrides default_expiry(purpose)
    bool force_refresh = false;
};

/**
 * @brief Image transformation parameters
 *
 * Either a named preset or explicit dimensions, quality and format.
 */
struct transform_options {
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::optional<uint32_t> quality;
    std::optional<std::string> format;
    std::optional<std::string> preset;
};

/**
 * @brief Transformed image URL
 */
struct transformed_url {
    std::string url;
    std::string file_id;
    std::string derivative_id;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string format;
    uint64_t size = 0;
    std::string mime_type;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CORE_UPLOAD_TYPES_H
