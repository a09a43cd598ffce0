/**
 * @file direct_transfer_client.h
 * @brief Progress-reporting PUT of raw bytes to a signed URL
 */

#ifndef KCENON_STORAGE_TRANSFER_TRANSFER_DIRECT_TRANSFER_CLIENT_H
#define KCENON_STORAGE_TRANSFER_TRANSFER_DIRECT_TRANSFER_CLIENT_H

#include "kcenon/storage_transfer/transfer/transfer_backend.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::storage_transfer {

/**
 * @brief Outcome of a successful PUT
 */
struct transfer_result {
    bool ok = false;
    int status = 0;
    std::string etag;  ///< Quotes preserved as sent by the storage service
};

/**
 * @brief Direct transfer client
 *
 * Adds the storage contract on top of a transfer_backend: default
 * Content-Type, the time ceiling, monotonic progress and status
 * classification (410 signed_url_expired, 413 validation, others through the
 * error taxonomy). Safe for concurrent use when the backend is.
 *
 * @code
 * auto client = direct_transfer_client::create(transfer_mode::streamed, http);
 * auto put = client->put(grant.signed_url, file, grant.required_headers,
 *                        [](uint64_t loaded, uint64_t total) { ... });
 * @endcode
 */
class direct_transfer_client {
public:
    static constexpr std::chrono::milliseconds default_timeout{300000};

    explicit direct_transfer_client(std::shared_ptr<transfer_backend> backend,
                                    std::chrono::milliseconds timeout = default_timeout);

    /**
     * @brief Build a client over the backend for the requested mode
     *
     * A streamed request falls back to the buffered backend when this build
     * lacks the streaming transport.
     */
    [[nodiscard]] static auto create(transfer_mode mode,
                                     std::shared_ptr<http_client_interface> http,
                                     std::chrono::milliseconds timeout = default_timeout)
        -> std::unique_ptr<direct_transfer_client>;

    /**
     * @brief PUT a file's bytes to a signed URL
     * @param signed_url Target URL issued at initiation
     * @param file Source bytes
     * @param headers Headers the backend requires on the PUT
     * @param on_progress Receives (bytes_loaded, bytes_total), never decreasing
     * @param cancel Token aborting the transfer when cancelled
     */
    [[nodiscard]] auto put(const std::string& signed_url,
                           const file_ref& file,
                           const header_map& headers,
                           transfer_progress_callback on_progress = {},
                           std::optional<cancellation_token> cancel = std::nullopt)
        -> result<transfer_result>;

    [[nodiscard]] auto mode() const noexcept -> transfer_mode;
    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds { return timeout_; }

private:
    std::shared_ptr<transfer_backend> backend_;
    std::chrono::milliseconds timeout_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_TRANSFER_DIRECT_TRANSFER_CLIENT_H
