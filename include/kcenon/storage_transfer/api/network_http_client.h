/**
 * @file network_http_client.h
 * @brief http_client_interface over network_system's HTTP client
 */

#ifndef KCENON_STORAGE_TRANSFER_API_NETWORK_HTTP_CLIENT_H
#define KCENON_STORAGE_TRANSFER_API_NETWORK_HTTP_CLIENT_H

#include "http_types.h"

#include <chrono>
#include <memory>

namespace kcenon::storage_transfer {

/**
 * @brief HTTP client backed by kcenon network_system
 *
 * Without KCENON_WITH_NETWORK_SYSTEM every call fails with a network error
 * and is_available() is false.
 *
 * @note This client is thread-safe for concurrent operations.
 */
class network_http_client : public http_client_interface {
public:
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& query,
                           const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::vector<uint8_t>& body,
                           const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto del(const std::string& url,
                           const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto is_available() const noexcept -> bool;

    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Kind of a failed request, judged by how long it ran
 *
 * network_system reports a timeout like any other connection failure, so a
 * failure that lasted at least the configured timeout counts as a timeout.
 */
[[nodiscard]] auto classify_transport_failure(std::chrono::steady_clock::duration elapsed,
                                              std::chrono::milliseconds timeout) noexcept
    -> error_kind;

[[nodiscard]] auto make_network_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<network_http_client>;

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_API_NETWORK_HTTP_CLIENT_H
