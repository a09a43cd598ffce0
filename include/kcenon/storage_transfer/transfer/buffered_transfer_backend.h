/**
 * @file buffered_transfer_backend.h
 * @brief PUT with the whole body in memory over http_client_interface
 */

#ifndef KCENON_STORAGE_TRANSFER_TRANSFER_BUFFERED_TRANSFER_BACKEND_H
#define KCENON_STORAGE_TRANSFER_TRANSFER_BUFFERED_TRANSFER_BACKEND_H

#include "kcenon/storage_transfer/transfer/transfer_backend.h"

#include <memory>

namespace kcenon::storage_transfer {

/**
 * @brief Buffered transfer backend
 *
 * Path-backed files are drained into memory before the request. Progress is
 * reported once before the request (0 of total) and once after a response
 * arrives (total of total). The request timeout is the one configured on the
 * HTTP client; cancellation is observed before and after the request.
 */
class buffered_transfer_backend : public transfer_backend {
public:
    explicit buffered_transfer_backend(std::shared_ptr<http_client_interface> http);

    [[nodiscard]] auto put(const transfer_request& request)
        -> result<http_response> override;

    [[nodiscard]] auto mode() const noexcept -> transfer_mode override {
        return transfer_mode::buffered;
    }

private:
    std::shared_ptr<http_client_interface> http_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_TRANSFER_BUFFERED_TRANSFER_BACKEND_H
