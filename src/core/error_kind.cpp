/**
 * @file error_kind.cpp
 * @brief Backend error code parsing and descriptions
 */

#include <kcenon/storage_transfer/core/error_kind.h>

#include <array>

namespace kcenon::storage_transfer {

namespace {

constexpr std::array<backend_error_code, 23> known_codes = {
    backend_error_code::invalid_api_key,
    backend_error_code::insufficient_permissions,
    backend_error_code::bucket_access_denied,
    backend_error_code::permission_denied,
    backend_error_code::invalid_file_type,
    backend_error_code::file_too_large,
    backend_error_code::bucket_name_taken,
    backend_error_code::invalid_transform_params,
    backend_error_code::upload_failed,
    backend_error_code::upload_timeout,
    backend_error_code::signed_url_expired,
    backend_error_code::storage_error,
    backend_error_code::transform_failed,
    backend_error_code::transform_timeout,
    backend_error_code::database_error,
    backend_error_code::database_timeout,
    backend_error_code::rate_limit_exceeded,
    backend_error_code::quota_exceeded,
    backend_error_code::file_not_found,
    backend_error_code::bucket_not_found,
    backend_error_code::upload_session_not_found,
    backend_error_code::network_error,
    backend_error_code::timeout_error,
};

}  // namespace

auto parse_backend_error_code(std::string_view code) noexcept -> backend_error_code {
    for (auto candidate : known_codes) {
        if (to_string(candidate) == code) {
            return candidate;
        }
    }
    return backend_error_code::unknown;
}

auto describe(backend_error_code code) noexcept -> std::string_view {
    switch (code) {
        case backend_error_code::invalid_api_key:
            return "Invalid API key. Please check your credentials.";
        case backend_error_code::insufficient_permissions:
            return "Your API key does not have permission for this operation.";
        case backend_error_code::bucket_access_denied:
            return "Access to this bucket is denied.";
        case backend_error_code::permission_denied:
            return "Permission denied.";
        case backend_error_code::invalid_file_type:
            return "This file type is not allowed in the bucket.";
        case backend_error_code::file_too_large:
            return "File size exceeds the allowed limit.";
        case backend_error_code::bucket_name_taken:
            return "A bucket with this name already exists.";
        case backend_error_code::invalid_transform_params:
            return "Invalid image transformation parameters.";
        case backend_error_code::upload_failed:
            return "Upload failed. Retrying...";
        case backend_error_code::upload_timeout:
            return "Upload timed out. Retrying...";
        case backend_error_code::signed_url_expired:
            return "Upload URL expired. Restarting upload...";
        case backend_error_code::storage_error:
            return "Storage service temporarily unavailable.";
        case backend_error_code::transform_failed:
            return "Image transformation failed.";
        case backend_error_code::transform_timeout:
            return "Image transformation timed out.";
        case backend_error_code::database_error:
            return "Database temporarily unavailable.";
        case backend_error_code::database_timeout:
            return "Database request timed out.";
        case backend_error_code::rate_limit_exceeded:
            return "Rate limit exceeded. Please wait before retrying.";
        case backend_error_code::quota_exceeded:
            return "Storage quota exceeded. Free up space or upgrade your plan.";
        case backend_error_code::file_not_found:
            return "File not found.";
        case backend_error_code::bucket_not_found:
            return "Bucket not found.";
        case backend_error_code::upload_session_not_found:
            return "Upload session not found or already completed.";
        case backend_error_code::network_error:
            return "Network error. Check your connection.";
        case backend_error_code::timeout_error:
            return "Request timed out.";
        case backend_error_code::unknown:
            return "An unexpected error occurred.";
    }
    return "An unexpected error occurred.";
}

}  // namespace kcenon::storage_transfer
