/**
 * @file direct_transfer_client.cpp
 * @brief Implementation of direct_transfer_client
 */

#include "kcenon/storage_transfer/transfer/direct_transfer_client.h"
#include "kcenon/storage_transfer/api/json_utils.h"
#include "kcenon/storage_transfer/api/storage_api_client.h"
#include "kcenon/storage_transfer/core/logging.h"
#include "kcenon/storage_transfer/transfer/buffered_transfer_backend.h"
#include "kcenon/storage_transfer/transfer/streaming_transfer_backend.h"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace kcenon::storage_transfer {

namespace {

auto has_header(const header_map& headers, const std::string& name) -> bool {
    return std::any_of(headers.begin(), headers.end(), [&](const auto& entry) {
        const auto& key = entry.first;
        return key.size() == name.size() &&
               std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    });
}

auto classify_put_failure(const http_response& response) -> error {
    switch (response.status_code) {
        case 410:
            return error(error_kind::signed_url_expired, "Signed upload URL has expired")
                .with_status(410);
        case 413:
            return error(error_kind::validation, "File too large for the storage service")
                .with_status(413);
        default:
            return error_from_response(response);
    }
}

}  // namespace

direct_transfer_client::direct_transfer_client(std::shared_ptr<transfer_backend> backend,
                                               std::chrono::milliseconds timeout)
    : backend_(std::move(backend)), timeout_(timeout) {}

auto direct_transfer_client::create(transfer_mode mode,
                                    std::shared_ptr<http_client_interface> http,
                                    std::chrono::milliseconds timeout)
    -> std::unique_ptr<direct_transfer_client> {
    std::shared_ptr<transfer_backend> backend;
    if (mode == transfer_mode::streamed && streaming_transfer_backend::is_available()) {
        backend = std::make_shared<streaming_transfer_backend>();
    } else {
        if (mode == transfer_mode::streamed) {
            ST_LOG_WARN(log_category::transfer,
                        "Streaming transfer not built in, using buffered transfers");
        }
        backend = std::make_shared<buffered_transfer_backend>(std::move(http));
    }
    return std::make_unique<direct_transfer_client>(std::move(backend), timeout);
}

auto direct_transfer_client::mode() const noexcept -> transfer_mode {
    return backend_ ? backend_->mode() : transfer_mode::buffered;
}

auto direct_transfer_client::put(const std::string& signed_url,
                                 const file_ref& file,
                                 const header_map& headers,
                                 transfer_progress_callback on_progress,
                                 std::optional<cancellation_token> cancel)
    -> result<transfer_result> {
    if (!backend_) {
        return unexpected(error(error_kind::internal, "No transfer backend configured"));
    }
    if (signed_url.empty()) {
        return unexpected(error(error_kind::validation, "Signed URL is empty"));
    }

    transfer_request request;
    request.url = signed_url;
    request.file = file;
    request.headers = headers;
    request.cancel = std::move(cancel);
    request.timeout = timeout_;

    if (!has_header(request.headers, "Content-Type")) {
        request.headers["Content-Type"] =
            file.content_type().empty() ? "application/octet-stream" : file.content_type();
    }

    if (on_progress) {
        // Backends may report from transport threads; keep the sequence monotonic
        auto guard = std::make_shared<std::mutex>();
        auto last = std::make_shared<uint64_t>(0);
        auto first = std::make_shared<bool>(true);
        request.on_progress = [on_progress = std::move(on_progress), guard, last,
                               first](uint64_t loaded, uint64_t total) {
            std::lock_guard<std::mutex> lock(*guard);
            if (!*first && loaded <= *last) {
                return;
            }
            *first = false;
            *last = loaded;
            on_progress(loaded, total);
        };
    }

    const auto started = std::chrono::steady_clock::now();
    auto response = backend_->put(request);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!response) {
        ST_LOG_WARN(log_category::transfer,
                    std::string("PUT failed (") + std::string(to_string(response.error().kind)) +
                        "): " + response.error().message);
        return unexpected(response.error());
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        auto err = classify_put_failure(resp);
        ST_LOG_WARN(log_category::transfer,
                    "PUT rejected with HTTP " + std::to_string(resp.status_code) + ": " +
                        err.message);
        return unexpected(std::move(err));
    }

    transfer_result out;
    out.ok = true;
    out.status = resp.status_code;
    if (auto etag = resp.header("ETag")) {
        out.etag = *etag;
    } else {
        auto body = resp.body_string();
        if (json_utils::is_object(body)) {
            out.etag = json_utils::get_string(body, "etag").value_or("");
        }
    }

    ST_LOG_DEBUG(log_category::transfer,
                 "PUT of " + std::to_string(file.size()) + " bytes completed in " +
                     std::to_string(elapsed.count()) + " ms");
    return out;
}

}  // namespace kcenon::storage_transfer
