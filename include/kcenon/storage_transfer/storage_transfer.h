/**
 * @file storage_transfer.h
 * @brief Main header for storage_trans_system library
 * @version 0.1.0
 *
 * Include this header to access the upload and signed-URL functionality.
 *
 * @code
 * #include <kcenon/storage_transfer/storage_transfer.h>
 *
 * using namespace kcenon::storage_transfer;
 *
 * auto client = storage_client::builder()
 *     .with_base_url("https://storage.example.com/api")
 *     .with_api_key(api_key)
 *     .build();
 *
 * auto file = file_ref::from_path("report.pdf");
 * auto outcome = client.value().upload("b1", file.value());
 * @endcode
 */

#ifndef KCENON_STORAGE_TRANSFER_STORAGE_TRANSFER_H
#define KCENON_STORAGE_TRANSFER_STORAGE_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/storage_transfer/core/error_kind.h"
#include "kcenon/storage_transfer/core/types.h"
#include "kcenon/storage_transfer/core/upload_types.h"
#include "kcenon/storage_transfer/core/file_ref.h"
#include "kcenon/storage_transfer/core/retry_policy.h"
#include "kcenon/storage_transfer/core/content_hasher.h"

// Upload pipeline
#include "kcenon/storage_transfer/upload/file_validation.h"
#include "kcenon/storage_transfer/upload/upload_manager.h"

// Download URLs
#include "kcenon/storage_transfer/url/signed_url_cache.h"

// Client
#include "kcenon/storage_transfer/client/storage_client.h"

namespace kcenon::storage_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_STORAGE_TRANSFER_H
