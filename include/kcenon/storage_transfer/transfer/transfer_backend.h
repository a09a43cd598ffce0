/**
 * @file transfer_backend.h
 * @brief Transport capability used for PUTs to signed URLs
 */

#ifndef KCENON_STORAGE_TRANSFER_TRANSFER_TRANSFER_BACKEND_H
#define KCENON_STORAGE_TRANSFER_TRANSFER_TRANSFER_BACKEND_H

#include "kcenon/storage_transfer/api/http_types.h"
#include "kcenon/storage_transfer/core/cancellation.h"
#include "kcenon/storage_transfer/core/file_ref.h"
#include "kcenon/storage_transfer/core/upload_types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::storage_transfer {

/**
 * @brief How the request body reaches the transport
 */
enum class transfer_mode {
    buffered,  ///< Whole body in memory, start and completion progress only
    streamed   ///< Body read in chunks with transport-driven progress and abort
};

[[nodiscard]] constexpr auto to_string(transfer_mode mode) noexcept -> const char* {
    switch (mode) {
        case transfer_mode::buffered: return "buffered";
        case transfer_mode::streamed: return "streamed";
    }
    return "buffered";
}

using transfer_progress_callback = std::function<void(uint64_t bytes_loaded, uint64_t bytes_total)>;

/**
 * @brief A single PUT of a file's bytes
 */
struct transfer_request {
    std::string url;
    file_ref file;
    header_map headers;
    transfer_progress_callback on_progress;
    std::optional<cancellation_token> cancel;
    std::chrono::milliseconds timeout{300000};
};

/**
 * @brief Transport performing the PUT
 *
 * Returns the HTTP response whatever its status. Transport-level failures
 * are errors of kind network, timeout or cancelled. Implementations must be
 * safe for concurrent use.
 */
class transfer_backend {
public:
    virtual ~transfer_backend() = default;

    [[nodiscard]] virtual auto put(const transfer_request& request)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto mode() const noexcept -> transfer_mode = 0;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_TRANSFER_TRANSFER_BACKEND_H
