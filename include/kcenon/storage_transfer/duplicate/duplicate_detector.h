/**
 * @file duplicate_detector.h
 * @brief Content-digest duplicate lookup against the backend
 */

#ifndef KCENON_STORAGE_TRANSFER_DUPLICATE_DUPLICATE_DETECTOR_H
#define KCENON_STORAGE_TRANSFER_DUPLICATE_DUPLICATE_DETECTOR_H

#include "kcenon/storage_transfer/api/storage_api_client.h"
#include "kcenon/storage_transfer/core/retry_policy.h"

#include <memory>
#include <string>

namespace kcenon::storage_transfer {

/**
 * @brief Duplicate detector
 *
 * Stateless and idempotent. A positive match is a value, not an error.
 */
class duplicate_detector {
public:
    duplicate_detector(std::shared_ptr<storage_api_client> api,
                       retry_policy policy = retry_policy::api());

    /**
     * @brief Look up content with the given digest in a bucket
     * @param bucket_id Target bucket
     * @param digest Lowercase hex SHA-256
     * @param hooks Retry observation and cancellation
     */
    [[nodiscard]] auto check_duplicate(const std::string& bucket_id,
                                       const std::string& digest,
                                       const retry_hooks& hooks = {}) const
        -> result<duplicate_info>;

private:
    std::shared_ptr<storage_api_client> api_;
    retry_policy policy_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_DUPLICATE_DUPLICATE_DETECTOR_H
