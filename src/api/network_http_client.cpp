/**
 * @file network_http_client.cpp
 * @brief network_system-backed HTTP client implementation
 */

#include "kcenon/storage_transfer/api/network_http_client.h"

#include "kcenon/storage_transfer/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::storage_transfer {

namespace {

constexpr const char* unavailable_message =
    "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)";

}  // namespace

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    std::chrono::milliseconds timeout;

    explicit impl(std::chrono::milliseconds t) : timeout(t) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
#endif
    }

    /**
     * @brief Run a request, classifying transport failures by elapsed time
     */
    template <typename Request>
    auto execute(const char* method, Request&& request) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
        if (!client) {
            return unexpected(error(error_kind::internal, "HTTP client not initialized"));
        }

        auto started = std::chrono::steady_clock::now();
        auto response = request(*client);
        if (response.is_err()) {
            auto elapsed = std::chrono::steady_clock::now() - started;
            auto kind = classify_transport_failure(elapsed, timeout);
            return unexpected(error(kind, std::string("HTTP ") + method +
                                          " request failed: " + response.error().message));
        }

        const auto& raw = response.value();
        http_response converted;
        converted.status_code = raw.status_code;
        converted.headers = raw.headers;
        converted.body.assign(raw.body.begin(), raw.body.end());
        return converted;
#else
        (void)method;
        (void)request;
        return unexpected(error(error_kind::network, unavailable_message));
#endif
    }
};

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

auto network_http_client::get(const std::string& url,
                              const std::map<std::string, std::string>& query,
                              const std::map<std::string, std::string>& headers)
    -> result<http_response> {
    return impl_->execute("GET", [&](auto& client) {
        return client.get(url, query, headers);
    });
}

auto network_http_client::post(const std::string& url,
                               const std::string& body,
                               const std::map<std::string, std::string>& headers)
    -> result<http_response> {
    return impl_->execute("POST", [&](auto& client) {
        return client.post(url, body, headers);
    });
}

auto network_http_client::put(const std::string& url,
                              const std::vector<uint8_t>& body,
                              const std::map<std::string, std::string>& headers)
    -> result<http_response> {
    return impl_->execute("PUT", [&](auto& client) {
        return client.put(url, std::string(body.begin(), body.end()), headers);
    });
}

auto network_http_client::del(const std::string& url,
                              const std::map<std::string, std::string>& headers)
    -> result<http_response> {
    return impl_->execute("DELETE", [&](auto& client) {
        return client.del(url, headers);
    });
}

auto network_http_client::is_available() const noexcept -> bool {
    return KCENON_WITH_NETWORK_SYSTEM != 0;
}

auto network_http_client::timeout() const noexcept -> std::chrono::milliseconds {
    return impl_->timeout;
}

auto classify_transport_failure(std::chrono::steady_clock::duration elapsed,
                                std::chrono::milliseconds timeout) noexcept -> error_kind {
    return elapsed >= timeout ? error_kind::timeout : error_kind::network;
}

auto make_network_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<network_http_client> {
    return std::make_shared<network_http_client>(timeout);
}

}  // namespace kcenon::storage_transfer
