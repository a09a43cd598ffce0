/**
 * @file storage_api_client.cpp
 * @brief Implementation of storage_api_client
 */

#include "kcenon/storage_transfer/api/storage_api_client.h"
#include "kcenon/storage_transfer/api/json_utils.h"
#include "kcenon/storage_transfer/core/logging.h"

#include <cmath>
#include <cstdlib>
#include <map>

namespace kcenon::storage_transfer {

namespace {

auto to_seconds_hint(double seconds) -> std::optional<std::chrono::milliseconds> {
    if (!std::isfinite(seconds) || seconds < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

auto malformed(const char* operation, const std::string& what) -> error {
    return error(error_kind::internal,
                 std::string("Malformed ") + operation + " response: " + what);
}

auto optional_time(std::string_view json, std::string_view key)
    -> std::optional<time_point> {
    auto text = json_utils::get_string(json, key);
    if (!text) {
        return std::nullopt;
    }
    return json_utils::parse_iso8601(*text);
}

auto parse_summary(std::string_view json) -> file_summary {
    file_summary summary;
    summary.id = json_utils::get_string(json, "id").value_or("");
    summary.original_name = json_utils::get_string(json, "original_name").value_or("");
    summary.size = json_utils::get_uint(json, "size").value_or(0);
    summary.created_at = json_utils::get_string(json, "created_at").value_or("");
    summary.is_public = json_utils::get_bool(json, "is_public").value_or(false);
    summary.version = static_cast<uint32_t>(json_utils::get_uint(json, "version").value_or(1));
    return summary;
}

auto parse_url_entry(std::string_view json, const std::string& file_id, url_purpose purpose,
                     const char* operation) -> result<signed_url_entry> {
    auto url = json_utils::get_string(json, "url");
    if (!url || url->empty()) {
        return unexpected(malformed(operation, "missing url"));
    }

    signed_url_entry entry;
    entry.file_id = file_id;
    entry.purpose = purpose;
    entry.url = *url;
    entry.is_public = json_utils::get_bool(json, "isPublic").value_or(false);
    if (!entry.is_public) {
        entry.expires_at = optional_time(json, "expiresAt");
    }
    if (auto headers = json_utils::get_object(json, "cacheHeaders")) {
        entry.cache_headers = json_utils::to_string_map(*headers);
    }
    return entry;
}

}  // namespace

// ============================================================================
// Error classification
// ============================================================================

auto error_from_response(const http_response& response) -> error {
    const int status = response.status_code;
    const std::string body = response.body_string();

    error err(kind_from_http_status(status), "HTTP " + std::to_string(status));

    if (json_utils::is_object(body)) {
        if (auto detail = json_utils::get_object(body, "error")) {
            auto code_text = json_utils::get_string(*detail, "code");
            if (code_text) {
                auto code = parse_backend_error_code(*code_text);
                err.code = *code_text;
                if (code != backend_error_code::unknown) {
                    err.kind = kind_of(code);
                }
            }
            if (auto message = json_utils::get_string(*detail, "message")) {
                err.message = *message;
            } else if (code_text) {
                err.message = std::string(describe(parse_backend_error_code(*code_text)));
            }
            if (auto retry_after = json_utils::get_number(*detail, "retryAfter")) {
                err.retry_after = to_seconds_hint(*retry_after);
            }
            for (auto& [key, value] : json_utils::to_string_map(*detail)) {
                if (key != "code" && key != "message" && key != "retryAfter") {
                    err.details[key] = value;
                }
            }
        } else if (auto text = json_utils::get_string(body, "error")) {
            err.message = *text;
        } else if (auto message = json_utils::get_string(body, "message")) {
            err.message = *message;
        }
    }

    if (!err.retry_after) {
        if (auto header = response.header("Retry-After")) {
            char* end = nullptr;
            double seconds = std::strtod(header->c_str(), &end);
            if (end != header->c_str()) {
                err.retry_after = to_seconds_hint(seconds);
            }
        }
    }

    err.http_status = status;
    err.retryable = is_retryable_kind(err.kind);
    return err;
}

auto parse_file_record(std::string_view json) -> result<file_record> {
    auto id = json_utils::get_string(json, "id");
    if (!id) {
        // Numeric identifiers are accepted as well
        if (auto raw = json_utils::find_member(json, "id"); raw && !raw->empty() &&
                                                             raw->front() != '"') {
            id = std::string(*raw);
        }
    }
    if (!id || id->empty()) {
        return unexpected(malformed("file", "missing id"));
    }

    file_record record;
    record.id = *id;
    record.bucket_id = json_utils::get_string(json, "bucket_id").value_or("");
    record.original_name = json_utils::get_string(json, "original_name").value_or("");
    record.mime_type = json_utils::get_string(json, "mime_type").value_or("");
    record.size = json_utils::get_uint(json, "size").value_or(0);
    record.object_key = json_utils::get_string(json, "object_key").value_or("");
    record.file_hash = json_utils::get_string(json, "file_hash").value_or("");
    record.is_public = json_utils::get_bool(json, "is_public").value_or(false);
    record.version = static_cast<uint32_t>(json_utils::get_uint(json, "version").value_or(1));
    record.created_at = json_utils::get_string(json, "created_at").value_or("");
    return record;
}

// ============================================================================
// Client
// ============================================================================

storage_api_client::storage_api_client(api_client_config config,
                                       std::shared_ptr<http_client_interface> http)
    : config_(std::move(config)), http_(std::move(http)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

auto storage_api_client::endpoint(const std::string& path) const -> std::string {
    return config_.base_url + path;
}

auto storage_api_client::headers() const -> header_map {
    header_map h = config_.extra_headers;
    h["Authorization"] = "Bearer " + config_.api_key;
    h["Content-Type"] = "application/json";
    h["Accept"] = "application/json";
    return h;
}

auto storage_api_client::expect_json(result<http_response> response, const char* operation)
    -> result<std::string> {
    if (!response) {
        ST_LOG_WARN(log_category::api, std::string(operation) + " transport failure: " +
                                           response.error().message);
        return unexpected(response.error());
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        auto err = error_from_response(resp);
        ST_LOG_WARN(log_category::api, std::string(operation) + " failed with HTTP " +
                                           std::to_string(resp.status_code) + " (" +
                                           std::string(to_string(err.kind)) + "): " +
                                           err.message);
        return unexpected(std::move(err));
    }

    auto body = resp.body_string();
    if (!json_utils::is_object(body)) {
        return unexpected(malformed(operation, "body is not a JSON object"));
    }
    return body;
}

auto storage_api_client::initiate_upload(const std::string& bucket_id,
                                         const initiate_request& request)
    -> result<upload_grant> {
    auto body = json_utils::object_builder()
                    .add("filename", request.filename)
                    .add("size", request.size)
                    .add("contentType", request.content_type)
                    .add_if("clientHash", request.client_hash)
                    .str();

    auto json = expect_json(
        http_->post(endpoint("/buckets/" + json_utils::url_encode(bucket_id) + "/uploads"),
                    body, headers()),
        "initiate upload");
    if (!json) {
        return unexpected(json.error());
    }

    const auto& text = json.value();
    upload_grant grant;
    auto upload_id = json_utils::get_string(text, "uploadId");
    auto signed_url = json_utils::get_string(text, "signedUrl");
    if (!upload_id || !signed_url) {
        return unexpected(malformed("initiate upload", "missing uploadId or signedUrl"));
    }

    grant.upload_id = *upload_id;
    grant.signed_url = *signed_url;
    grant.object_key = json_utils::get_string(text, "objectKey").value_or("");
    grant.expires_at = optional_time(text, "expiresAt");
    if (auto required = json_utils::get_object(text, "headersToInclude")) {
        grant.required_headers = json_utils::to_string_map(*required);
    }
    return grant;
}

auto storage_api_client::complete_upload(const std::string& upload_id,
                                         const complete_request& request)
    -> result<file_record> {
    auto body = json_utils::object_builder()
                    .add("etag", request.etag)
                    .add("actualSize", request.actual_size)
                    .add_if("clientHash", request.client_hash)
                    .add("enableVersioning", request.enable_versioning)
                    .str();

    auto json = expect_json(
        http_->post(endpoint("/uploads/" + json_utils::url_encode(upload_id) + "/complete"),
                    body, headers()),
        "complete upload");
    if (!json) {
        return unexpected(json.error());
    }

    const auto& text = json.value();
    auto file = json_utils::get_object(text, "file");
    if (!file) {
        return unexpected(malformed("complete upload", "missing file"));
    }

    auto record = parse_file_record(*file);
    if (!record) {
        return record;
    }

    if (auto verification = json_utils::get_object(text, "hashVerification")) {
        struct hash_verification hv;
        hv.client_hash = json_utils::get_string(*verification, "clientHash").value_or("");
        hv.server_hash = json_utils::get_string(*verification, "serverHash").value_or("");
        hv.matches = json_utils::get_bool(*verification, "matches").value_or(false);
        record.value().hash_verification = hv;
    }
    return record;
}

auto storage_api_client::cancel_upload(const std::string& upload_id) -> result<void> {
    auto response = http_->del(endpoint("/uploads/" + json_utils::url_encode(upload_id)),
                               headers());
    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(error_from_response(response.value()));
    }
    return {};
}

auto storage_api_client::get_upload_status(const std::string& upload_id)
    -> result<upload_status_info> {
    auto json = expect_json(
        http_->get(endpoint("/uploads/" + json_utils::url_encode(upload_id)), {}, headers()),
        "upload status");
    if (!json) {
        return unexpected(json.error());
    }

    const auto& text = json.value();
    upload_status_info info;
    info.upload_id = json_utils::get_string(text, "uploadId").value_or(upload_id);
    info.status = json_utils::get_string(text, "status").value_or("");
    info.filename = json_utils::get_string(text, "filename").value_or("");
    info.size = json_utils::get_uint(text, "size").value_or(0);
    info.expires_at = optional_time(text, "expiresAt");
    info.completed_at = optional_time(text, "completedAt");
    info.file_id = json_utils::get_string(text, "fileId");
    return info;
}

auto storage_api_client::check_duplicate(const std::string& bucket_id,
                                         const std::string& digest)
    -> result<duplicate_info> {
    auto body = json_utils::object_builder().add("hash", digest).str();

    auto json = expect_json(
        http_->post(
            endpoint("/buckets/" + json_utils::url_encode(bucket_id) + "/check-duplicate"),
            body, headers()),
        "check duplicate");
    if (!json) {
        return unexpected(json.error());
    }

    const auto& text = json.value();
    auto is_duplicate = json_utils::get_bool(text, "isDuplicate");
    if (!is_duplicate) {
        return unexpected(malformed("check duplicate", "missing isDuplicate"));
    }

    duplicate_info info;
    info.digest = digest;
    info.is_duplicate = *is_duplicate;
    info.message = json_utils::get_string(text, "message").value_or("");
    info.recommendation = json_utils::get_string(text, "recommendation").value_or("");
    if (auto files = json_utils::get_array(text, "existingFiles")) {
        for (auto item : *files) {
            info.existing_files.push_back(parse_summary(item));
        }
    }
    return info;
}

auto storage_api_client::request_signed_url(const std::string& file_id,
                                            url_purpose purpose,
                                            std::chrono::seconds expiry)
    -> result<signed_url_entry> {
    auto body = json_utils::object_builder()
                    .add("expiry", static_cast<int64_t>(expiry.count()))
                    .add("purpose", to_string(purpose))
                    .str();

    auto json = expect_json(
        http_->post(endpoint("/files/" + json_utils::url_encode(file_id) + "/signed-url"),
                    body, headers()),
        "signed url");
    if (!json) {
        return unexpected(json.error());
    }
    return parse_url_entry(json.value(), file_id, purpose, "signed url");
}

auto storage_api_client::get_public_url(const std::string& file_id)
    -> result<signed_url_entry> {
    auto json = expect_json(
        http_->get(endpoint("/files/" + json_utils::url_encode(file_id) + "/public-url"), {},
                   headers()),
        "public url");
    if (!json) {
        return unexpected(json.error());
    }

    auto entry = parse_url_entry(json.value(), file_id, url_purpose::download, "public url");
    if (entry) {
        entry.value().is_public = true;
        entry.value().expires_at.reset();
    }
    return entry;
}

auto storage_api_client::get_transformed_url(const std::string& file_id,
                                             const transform_options& options)
    -> result<transformed_url> {
    std::map<std::string, std::string> query;
    if (options.preset) {
        query["preset"] = *options.preset;
    } else {
        if (options.width) query["w"] = std::to_string(*options.width);
        if (options.height) query["h"] = std::to_string(*options.height);
        if (options.quality) query["q"] = std::to_string(*options.quality);
        if (options.format) query["format"] = *options.format;
    }

    auto json = expect_json(
        http_->get(endpoint("/files/" + json_utils::url_encode(file_id) + "/transform"), query,
                   headers()),
        "transform");
    if (!json) {
        return unexpected(json.error());
    }

    const auto& text = json.value();
    auto url = json_utils::get_string(text, "url");
    if (!url) {
        return unexpected(malformed("transform", "missing url"));
    }

    transformed_url out;
    out.url = *url;
    out.file_id = file_id;
    if (auto derivative = json_utils::get_object(text, "derivative")) {
        out.derivative_id = json_utils::get_string(*derivative, "id").value_or("");
        out.width = static_cast<uint32_t>(json_utils::get_uint(*derivative, "width").value_or(0));
        out.height = static_cast<uint32_t>(json_utils::get_uint(*derivative, "height").value_or(0));
        out.format = json_utils::get_string(*derivative, "format").value_or("");
        out.size = json_utils::get_uint(*derivative, "size").value_or(0);
        out.mime_type = json_utils::get_string(*derivative, "mimeType").value_or("");
    }
    return out;
}

}  // namespace kcenon::storage_transfer
