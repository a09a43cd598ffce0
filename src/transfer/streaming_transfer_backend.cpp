/**
 * @file streaming_transfer_backend.cpp
 * @brief libcurl implementation of streaming_transfer_backend
 */

#include "kcenon/storage_transfer/transfer/streaming_transfer_backend.h"
#include "kcenon/storage_transfer/config/feature_flags.h"
#include "kcenon/storage_transfer/core/logging.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#if STORAGE_TRANS_HAS_STREAMING_TRANSFER
#include <curl/curl.h>
#endif

namespace kcenon::storage_transfer {

#if STORAGE_TRANS_HAS_STREAMING_TRANSFER

namespace {

constexpr std::size_t max_response_body = 64 * 1024;

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

/**
 * @brief Per-request state shared with the curl callbacks
 */
struct curl_transfer_state {
    const transfer_request* request = nullptr;
    std::istream* source = nullptr;
    std::size_t chunk_size = 0;
    uint64_t total = 0;
    uint64_t last_reported = 0;
    uint64_t read_so_far = 0;
    bool read_failed = false;
    http_response response;

    [[nodiscard]] auto cancelled() const -> bool {
        return request->cancel && request->cancel->is_cancelled();
    }
};

auto read_callback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* state = static_cast<curl_transfer_state*>(userdata);
    if (state->cancelled()) {
        return CURL_READFUNC_ABORT;
    }

    const size_t want = std::min(size * nitems, state->chunk_size);
    state->source->read(buffer, static_cast<std::streamsize>(want));
    const auto got = static_cast<size_t>(state->source->gcount());
    state->read_so_far += got;
    // A source that ends before the announced length cannot complete the body
    if (state->source->bad() || (got == 0 && want > 0 && state->read_so_far < state->total)) {
        state->read_failed = true;
        return CURL_READFUNC_ABORT;
    }
    return got;
}

auto progress_callback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                       curl_off_t /*ultotal*/, curl_off_t ulnow) -> int {
    auto* state = static_cast<curl_transfer_state*>(clientp);
    if (state->cancelled()) {
        return 1;
    }

    const auto sent = static_cast<uint64_t>(std::max<curl_off_t>(ulnow, 0));
    if (sent > state->last_reported && state->request->on_progress) {
        state->last_reported = std::min(sent, state->total);
        state->request->on_progress(state->last_reported, state->total);
    }
    return 0;
}

auto header_callback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* state = static_cast<curl_transfer_state*>(userdata);
    const size_t length = size * nitems;
    std::string line(buffer, length);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto trim = [](std::string s) {
            auto begin = s.find_first_not_of(" \t\r\n");
            auto end = s.find_last_not_of(" \t\r\n");
            return begin == std::string::npos ? std::string{} : s.substr(begin, end - begin + 1);
        };
        state->response.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return length;
}

auto write_callback(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* state = static_cast<curl_transfer_state*>(userdata);
    const size_t length = size * nmemb;
    auto& body = state->response.body;
    const size_t room = max_response_body > body.size() ? max_response_body - body.size() : 0;
    body.insert(body.end(), data, data + std::min(length, room));
    return length;
}

struct curl_deleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct slist_deleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

streaming_transfer_backend::streaming_transfer_backend(std::size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? default_chunk_size : chunk_size) {
    ensure_curl_initialized();
}

auto streaming_transfer_backend::is_available() noexcept -> bool { return true; }

auto streaming_transfer_backend::put(const transfer_request& request)
    -> result<http_response> {
    if (request.cancel && request.cancel->is_cancelled()) {
        return unexpected(error(error_kind::cancelled, "Transfer cancelled"));
    }

    auto source = request.file.open();
    if (!source) {
        return unexpected(source.error());
    }

    std::unique_ptr<CURL, curl_deleter> handle(curl_easy_init());
    if (!handle) {
        return unexpected(error(error_kind::internal, "Failed to create transfer handle"));
    }

    std::vector<std::string> lines;
    for (const auto& [name, value] : request.headers) {
        lines.push_back(name + ": " + value);
    }
    // Suppress "Expect: 100-continue" round trips on large bodies
    lines.emplace_back("Expect:");

    std::unique_ptr<curl_slist, slist_deleter> headers;
    for (const auto& line : lines) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (next == nullptr) {
            return unexpected(error(error_kind::internal, "Failed to build request headers"));
        }
        static_cast<void>(headers.release());
        headers.reset(next);
    }

    curl_transfer_state state;
    state.request = &request;
    state.source = source.value().get();
    state.chunk_size = chunk_size_;
    state.total = request.file.size();

    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(state.total));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_READFUNCTION, read_callback);
    curl_easy_setopt(h, CURLOPT_READDATA, &state);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    ST_LOG_DEBUG(log_category::transfer,
                 "Streamed PUT of " + std::to_string(state.total) + " bytes");

    const CURLcode code = curl_easy_perform(h);
    if (code != CURLE_OK) {
        if (state.cancelled()) {
            return unexpected(error(error_kind::cancelled, "Transfer cancelled"));
        }
        if (code == CURLE_OPERATION_TIMEDOUT) {
            return unexpected(error(error_kind::timeout,
                                    "Transfer exceeded " +
                                        std::to_string(request.timeout.count()) + " ms"));
        }
        if (state.read_failed) {
            return unexpected(error(error_kind::internal,
                                    "Failed to read upload source: " + request.file.name()));
        }
        return unexpected(error(error_kind::network, curl_easy_strerror(code)));
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    state.response.status_code = static_cast<int>(status);

    if (state.response.is_success() && request.on_progress &&
        state.last_reported < state.total) {
        request.on_progress(state.total, state.total);
    }
    return std::move(state.response);
}

#else

streaming_transfer_backend::streaming_transfer_backend(std::size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? default_chunk_size : chunk_size) {}

auto streaming_transfer_backend::is_available() noexcept -> bool { return false; }

auto streaming_transfer_backend::put(const transfer_request& /*request*/)
    -> result<http_response> {
    return unexpected(error(error_kind::internal,
                            "Streaming transfer not available "
                            "(STORAGE_TRANS_ENABLE_STREAMING not defined)"));
}

#endif

}  // namespace kcenon::storage_transfer
