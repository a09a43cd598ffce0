// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_orchestrator.h
 * @brief Per-file upload state machine
 */

#ifndef KCENON_STORAGE_TRANSFER_UPLOAD_UPLOAD_ORCHESTRATOR_H
#define KCENON_STORAGE_TRANSFER_UPLOAD_UPLOAD_ORCHESTRATOR_H

#include "kcenon/storage_transfer/api/storage_api_client.h"
#include "kcenon/storage_transfer/core/content_hasher.h"
#include "kcenon/storage_transfer/core/retry_policy.h"
#include "kcenon/storage_transfer/core/upload_types.h"
#include "kcenon/storage_transfer/duplicate/duplicate_detector.h"
#include "kcenon/storage_transfer/transfer/direct_transfer_client.h"

#include <memory>
#include <optional>
#include <string>

namespace kcenon::storage_transfer {

/**
 * @brief Collaborators shared by every orchestrator of a client
 *
 * All of them are safe for concurrent use. hasher may be null, in which case
 * uploads never compute a digest.
 */
struct orchestrator_dependencies {
    std::shared_ptr<storage_api_client> api;
    std::shared_ptr<duplicate_detector> duplicates;
    std::shared_ptr<direct_transfer_client> transfer;
    std::shared_ptr<content_hasher> hasher;
    retry_policy_set policies;
};

/**
 * @brief Drives one file through the upload pipeline
 *
 * State flow:
 * @code
 * pending -> hashing -> checking-duplicates -> {duplicate-found | initiating}
 * initiating -> uploading -> finalizing -> completed
 * duplicate-found -> initiating          (continue_anyway)
 * duplicate-found -> completed           (reuse_existing)
 * uploading | finalizing -> initiating   (signed URL expired)
 * any -> error
 * @endcode
 *
 * run(), continue_anyway() and reuse_existing() block the calling thread.
 * cancel() and snapshot() may be called from any thread.
 */
class upload_orchestrator {
public:
    upload_orchestrator(session_id id,
                        std::string bucket_id,
                        file_ref file,
                        upload_options options,
                        orchestrator_dependencies deps);
    ~upload_orchestrator();

    upload_orchestrator(const upload_orchestrator&) = delete;
    auto operator=(const upload_orchestrator&) -> upload_orchestrator& = delete;

    /**
     * @brief Run from pending until completed, error or duplicate-found
     * @return Outcome, or the terminal error
     */
    [[nodiscard]] auto run() -> result<upload_outcome>;

    /**
     * @brief Upload despite a duplicate match
     *
     * Only valid in duplicate-found.
     */
    [[nodiscard]] auto continue_anyway() -> result<upload_outcome>;

    /**
     * @brief Finish by pointing at an already stored file; no bytes are sent
     * @param file_id One of the matched files; the first match when omitted
     */
    [[nodiscard]] auto reuse_existing(std::optional<std::string> file_id = std::nullopt)
        -> result<upload_outcome>;

    /**
     * @brief Abort the upload
     *
     * Interrupts the in-flight step, releases the server-side session when one
     * was issued, and ends in error with kind cancelled. No effect once
     * terminal.
     */
    void cancel();

    [[nodiscard]] auto snapshot() const -> upload_session;
    [[nodiscard]] auto status() const -> upload_status;
    [[nodiscard]] auto id() const -> const session_id&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_UPLOAD_UPLOAD_ORCHESTRATOR_H
