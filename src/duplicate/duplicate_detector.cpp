/**
 * @file duplicate_detector.cpp
 * @brief Implementation of duplicate_detector
 */

#include "kcenon/storage_transfer/duplicate/duplicate_detector.h"
#include "kcenon/storage_transfer/core/logging.h"

namespace kcenon::storage_transfer {

duplicate_detector::duplicate_detector(std::shared_ptr<storage_api_client> api,
                                       retry_policy policy)
    : api_(std::move(api)), policy_(std::move(policy)) {}

auto duplicate_detector::check_duplicate(const std::string& bucket_id,
                                         const std::string& digest,
                                         const retry_hooks& hooks) const
    -> result<duplicate_info> {
    if (digest.empty()) {
        return unexpected(error(error_kind::validation, "Digest is required"));
    }
    if (bucket_id.empty()) {
        return unexpected(error(error_kind::validation, "Bucket id is required"));
    }

    auto info = execute_with_retry(
        [&] { return api_->check_duplicate(bucket_id, digest); }, policy_, hooks);

    if (info && info.value().is_duplicate) {
        ST_LOG_INFO(log_category::duplicate,
                    "Content " + digest.substr(0, 12) + " already stored in bucket " +
                        bucket_id + " (" +
                        std::to_string(info.value().existing_files.size()) + " match(es))");
    }
    return info;
}

}  // namespace kcenon::storage_transfer
