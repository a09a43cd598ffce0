/**
 * @file error_kind.h
 * @brief Error taxonomy shared by the upload and signed-URL paths
 *
 * Two closed enumerations live here:
 * - error_kind: the canonical classes every component reports and every
 *   retry decision is keyed on.
 * - backend_error_code: the dispatch keys the REST backend sends in
 *   {"error":{"code":...}} (range -900 to -999 per ecosystem convention).
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_ERROR_KIND_H
#define KCENON_STORAGE_TRANSFER_CORE_ERROR_KIND_H

#include <cstdint>
#include <string_view>

namespace kcenon::storage_transfer {

/**
 * @brief Canonical error classes
 */
enum class error_kind : uint8_t {
    validation,          ///< Bad input (file type, size, parameters)
    auth,                ///< Invalid credential or access denied
    network,             ///< Connection-level failure
    timeout,             ///< Operation exceeded its time ceiling
    service,             ///< Transient backend failure (storage, database, transform)
    signed_url_expired,  ///< Signed URL or upload session expired
    rate_limited,        ///< Too many requests
    quota_exceeded,      ///< Storage quota exhausted
    not_found,           ///< Entity does not exist
    hash_unavailable,    ///< No cryptographic digest primitive in this build
    cancelled,           ///< Caller cancelled the operation
    internal,            ///< Malformed response or unexpected failure
};

[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case error_kind::validation:         return "validation";
        case error_kind::auth:               return "auth";
        case error_kind::network:            return "network";
        case error_kind::timeout:            return "timeout";
        case error_kind::service:            return "service";
        case error_kind::signed_url_expired: return "signed_url_expired";
        case error_kind::rate_limited:       return "rate_limited";
        case error_kind::quota_exceeded:     return "quota_exceeded";
        case error_kind::not_found:          return "not_found";
        case error_kind::hash_unavailable:   return "hash_unavailable";
        case error_kind::cancelled:          return "cancelled";
        case error_kind::internal:           return "internal";
    }
    return "internal";
}

/**
 * @brief Whether errors of this kind may ever be retried
 *
 * Call sites narrow this further through their retry_policy.
 */
[[nodiscard]] constexpr auto is_retryable_kind(error_kind kind) noexcept -> bool {
    switch (kind) {
        case error_kind::network:
        case error_kind::timeout:
        case error_kind::service:
        case error_kind::signed_url_expired:
        case error_kind::rate_limited:
            return true;
        case error_kind::validation:
        case error_kind::auth:
        case error_kind::quota_exceeded:
        case error_kind::not_found:
        case error_kind::hash_unavailable:
        case error_kind::cancelled:
        case error_kind::internal:
            return false;
    }
    return false;
}

/**
 * @brief Error codes sent by the storage backend (-900 to -999)
 *
 * Error code ranges:
 * - -900 to -909: Authentication/Authorization
 * - -910 to -919: Validation
 * - -920 to -929: Upload session
 * - -930 to -939: Service (storage, database, transform)
 * - -940 to -949: Limits
 * - -950 to -959: Not found
 * - -960 to -969: Client-side transport
 * - -999: Unrecognized
 */
enum class backend_error_code : int32_t {
    // Authentication/Authorization (-900 to -909)
    invalid_api_key = -900,
    insufficient_permissions = -901,
    bucket_access_denied = -902,
    permission_denied = -903,

    // Validation (-910 to -919)
    invalid_file_type = -910,
    file_too_large = -911,
    bucket_name_taken = -912,
    invalid_transform_params = -913,

    // Upload session (-920 to -929)
    upload_failed = -920,
    upload_timeout = -921,
    signed_url_expired = -922,

    // Service (-930 to -939)
    storage_error = -930,
    transform_failed = -931,
    transform_timeout = -932,
    database_error = -933,
    database_timeout = -934,

    // Limits (-940 to -949)
    rate_limit_exceeded = -940,
    quota_exceeded = -941,

    // Not found (-950 to -959)
    file_not_found = -950,
    bucket_not_found = -951,
    upload_session_not_found = -952,

    // Client-side transport (-960 to -969)
    network_error = -960,
    timeout_error = -961,

    unknown = -999,
};

/**
 * @brief Wire representation of a backend code (e.g. "STORAGE_ERROR")
 */
[[nodiscard]] constexpr auto to_string(backend_error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case backend_error_code::invalid_api_key:          return "INVALID_API_KEY";
        case backend_error_code::insufficient_permissions: return "INSUFFICIENT_PERMISSIONS";
        case backend_error_code::bucket_access_denied:     return "BUCKET_ACCESS_DENIED";
        case backend_error_code::permission_denied:        return "PERMISSION_DENIED";
        case backend_error_code::invalid_file_type:        return "INVALID_FILE_TYPE";
        case backend_error_code::file_too_large:           return "FILE_TOO_LARGE";
        case backend_error_code::bucket_name_taken:        return "BUCKET_NAME_TAKEN";
        case backend_error_code::invalid_transform_params: return "INVALID_TRANSFORM_PARAMS";
        case backend_error_code::upload_failed:            return "UPLOAD_FAILED";
        case backend_error_code::upload_timeout:           return "UPLOAD_TIMEOUT";
        case backend_error_code::signed_url_expired:       return "SIGNED_URL_EXPIRED";
        case backend_error_code::storage_error:            return "STORAGE_ERROR";
        case backend_error_code::transform_failed:         return "TRANSFORM_FAILED";
        case backend_error_code::transform_timeout:        return "TRANSFORM_TIMEOUT";
        case backend_error_code::database_error:           return "DATABASE_ERROR";
        case backend_error_code::database_timeout:         return "DATABASE_TIMEOUT";
        case backend_error_code::rate_limit_exceeded:      return "RATE_LIMIT_EXCEEDED";
        case backend_error_code::quota_exceeded:           return "QUOTA_EXCEEDED";
        case backend_error_code::file_not_found:           return "FILE_NOT_FOUND";
        case backend_error_code::bucket_not_found:         return "BUCKET_NOT_FOUND";
        case backend_error_code::upload_session_not_found: return "UPLOAD_SESSION_NOT_FOUND";
        case backend_error_code::network_error:            return "NETWORK_ERROR";
        case backend_error_code::timeout_error:            return "TIMEOUT_ERROR";
        case backend_error_code::unknown:                  return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

/**
 * @brief Parse a wire code; unrecognized codes map to backend_error_code::unknown
 */
[[nodiscard]] auto parse_backend_error_code(std::string_view code) noexcept
    -> backend_error_code;

/**
 * @brief Error class of a backend code
 *
 * backend_error_code::unknown maps to error_kind::internal; callers with an
 * HTTP status should prefer kind_from_http_status() for unknown codes.
 */
[[nodiscard]] constexpr auto kind_of(backend_error_code code) noexcept -> error_kind {
    switch (code) {
        case backend_error_code::invalid_api_key:
        case backend_error_code::insufficient_permissions:
        case backend_error_code::bucket_access_denied:
        case backend_error_code::permission_denied:
            return error_kind::auth;

        case backend_error_code::invalid_file_type:
        case backend_error_code::file_too_large:
        case backend_error_code::bucket_name_taken:
        case backend_error_code::invalid_transform_params:
            return error_kind::validation;

        case backend_error_code::upload_failed:
        case backend_error_code::storage_error:
        case backend_error_code::transform_failed:
        case backend_error_code::transform_timeout:
        case backend_error_code::database_error:
        case backend_error_code::database_timeout:
            return error_kind::service;

        case backend_error_code::upload_timeout:
        case backend_error_code::timeout_error:
            return error_kind::timeout;

        case backend_error_code::network_error:
            return error_kind::network;

        case backend_error_code::signed_url_expired:
            return error_kind::signed_url_expired;

        case backend_error_code::rate_limit_exceeded:
            return error_kind::rate_limited;

        case backend_error_code::quota_exceeded:
            return error_kind::quota_exceeded;

        case backend_error_code::file_not_found:
        case backend_error_code::bucket_not_found:
        case backend_error_code::upload_session_not_found:
            return error_kind::not_found;

        case backend_error_code::unknown:
            return error_kind::internal;
    }
    return error_kind::internal;
}

/**
 * @brief Error class implied by an HTTP status alone
 */
[[nodiscard]] constexpr auto kind_from_http_status(int status) noexcept -> error_kind {
    switch (status) {
        case 400:
        case 413:
        case 415:
        case 422:
            return error_kind::validation;
        case 401:
        case 403:
            return error_kind::auth;
        case 404:
            return error_kind::not_found;
        case 408:
        case 504:
            return error_kind::timeout;
        case 410:
            return error_kind::signed_url_expired;
        case 429:
            return error_kind::rate_limited;
        case 507:
            return error_kind::quota_exceeded;
        default:
            break;
    }
    if (status >= 500 && status < 600) {
        return error_kind::service;
    }
    return error_kind::internal;
}

/**
 * @brief Human readable description for user-facing messages
 */
[[nodiscard]] auto describe(backend_error_code code) noexcept -> std::string_view;

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CORE_ERROR_KIND_H
