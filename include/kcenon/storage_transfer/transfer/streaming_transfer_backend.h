/**
 * @file streaming_transfer_backend.h
 * @brief Chunked PUT with transport-driven progress and abort
 */

#ifndef KCENON_STORAGE_TRANSFER_TRANSFER_STREAMING_TRANSFER_BACKEND_H
#define KCENON_STORAGE_TRANSFER_TRANSFER_STREAMING_TRANSFER_BACKEND_H

#include "kcenon/storage_transfer/transfer/transfer_backend.h"

#include <cstddef>

namespace kcenon::storage_transfer {

/**
 * @brief Streaming transfer backend (libcurl)
 *
 * Reads the source in chunk_size pieces while the request is on the wire, so
 * memory use does not grow with the file. Progress follows the transport's
 * upload counter. A cancelled token aborts the request mid-body.
 *
 * Only functional when built with STORAGE_TRANS_ENABLE_STREAMING; otherwise
 * put() fails with kind internal.
 */
class streaming_transfer_backend : public transfer_backend {
public:
    static constexpr std::size_t default_chunk_size = 64 * 1024;

    explicit streaming_transfer_backend(std::size_t chunk_size = default_chunk_size);

    [[nodiscard]] auto put(const transfer_request& request)
        -> result<http_response> override;

    [[nodiscard]] auto mode() const noexcept -> transfer_mode override {
        return transfer_mode::streamed;
    }

    /**
     * @brief Whether this build carries the streaming transport
     */
    [[nodiscard]] static auto is_available() noexcept -> bool;

private:
    std::size_t chunk_size_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_TRANSFER_STREAMING_TRANSFER_BACKEND_H
