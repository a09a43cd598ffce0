/**
 * @file buffered_transfer_backend.cpp
 * @brief Implementation of buffered_transfer_backend
 */

#include "kcenon/storage_transfer/transfer/buffered_transfer_backend.h"
#include "kcenon/storage_transfer/core/logging.h"

#include <istream>

namespace kcenon::storage_transfer {

namespace {

auto is_cancelled(const transfer_request& request) -> bool {
    return request.cancel && request.cancel->is_cancelled();
}

/**
 * @brief Copy the file's bytes into a request body, once
 */
auto load_body(const file_ref& file) -> result<std::vector<uint8_t>> {
    if (file.is_buffered()) {
        auto bytes = file.buffer();
        const auto* first = reinterpret_cast<const uint8_t*>(bytes.data());
        return std::vector<uint8_t>(first, first + bytes.size());
    }

    auto stream = file.open();
    if (!stream) {
        return unexpected(stream.error());
    }

    std::vector<uint8_t> body(static_cast<std::size_t>(file.size()));
    stream.value()->read(reinterpret_cast<char*>(body.data()),
                         static_cast<std::streamsize>(body.size()));
    auto read = static_cast<std::size_t>(stream.value()->gcount());
    if (read != body.size()) {
        return unexpected(error(error_kind::internal,
                                "Short read: expected " + std::to_string(body.size()) +
                                " bytes, got " + std::to_string(read)));
    }
    return body;
}

}  // namespace

buffered_transfer_backend::buffered_transfer_backend(
    std::shared_ptr<http_client_interface> http)
    : http_(std::move(http)) {}

auto buffered_transfer_backend::put(const transfer_request& request)
    -> result<http_response> {
    if (!http_) {
        return unexpected(error(error_kind::internal, "No HTTP client configured"));
    }
    if (is_cancelled(request)) {
        return unexpected(error(error_kind::cancelled, "Transfer cancelled"));
    }

    const uint64_t total = request.file.size();
    auto loaded = load_body(request.file);
    if (!loaded) {
        return unexpected(loaded.error());
    }
    auto body = std::move(loaded).value();

    if (request.on_progress) {
        request.on_progress(0, total);
    }

    ST_LOG_DEBUG(log_category::transfer,
                 "Buffered PUT of " + std::to_string(body.size()) + " bytes");

    auto response = http_->put(request.url, body, request.headers);
    if (!response) {
        return response;
    }
    if (is_cancelled(request)) {
        return unexpected(error(error_kind::cancelled, "Transfer cancelled"));
    }

    if (response.value().is_success() && request.on_progress) {
        request.on_progress(total, total);
    }
    return response;
}

}  // namespace kcenon::storage_transfer
