// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_manager.h
 * @brief Owner of concurrent upload sessions
 */

#ifndef KCENON_STORAGE_TRANSFER_UPLOAD_UPLOAD_MANAGER_H
#define KCENON_STORAGE_TRANSFER_UPLOAD_UPLOAD_MANAGER_H

#include "kcenon/storage_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/storage_transfer/upload/upload_orchestrator.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::storage_transfer {

using subscription_id = uint64_t;

/**
 * @brief Receives a snapshot on every state change of every session
 */
using session_listener = std::function<void(const upload_session&)>;

/**
 * @brief Upload manager
 *
 * Runs each upload on the worker pool with its own upload_orchestrator and
 * keeps every session in a map keyed by session_id. Sessions stay queryable
 * after they finish until remove() or clear_finished().
 *
 * @code
 * auto id = manager.start_upload("b1", file.value(), {});
 * auto outcome = manager.wait(id.value());
 * @endcode
 */
class upload_manager {
public:
    /**
     * @param deps Shared collaborators for every orchestrator
     * @param pool Worker pool; transfer_pool_factory's choice when null
     * @param validation Rules applied before any network call; none when absent
     */
    upload_manager(orchestrator_dependencies deps,
                   std::shared_ptr<adapters::transfer_thread_pool_interface> pool = nullptr,
                   std::optional<validation_options> validation = std::nullopt);

    /**
     * @brief Cancels running sessions and waits for their workers
     */
    ~upload_manager();

    upload_manager(const upload_manager&) = delete;
    auto operator=(const upload_manager&) -> upload_manager& = delete;

    /**
     * @brief Start an upload on the worker pool
     * @return Session identifier, or a validation error for a rejected file
     */
    [[nodiscard]] auto start_upload(const std::string& bucket_id,
                                    file_ref file,
                                    upload_options options = {}) -> result<session_id>;

    /**
     * @brief Start an upload and block until it completes, fails or pauses
     */
    [[nodiscard]] auto upload(const std::string& bucket_id,
                              file_ref file,
                              upload_options options = {}) -> result<upload_outcome>;

    /**
     * @brief Upload several files with bounded concurrency and block until all end
     */
    [[nodiscard]] auto upload_batch(const std::string& bucket_id,
                                    std::vector<file_ref> files,
                                    batch_upload_options options = {}) -> batch_upload_result;

    /**
     * @brief Resume a session paused at duplicate-found, uploading anyway
     */
    [[nodiscard]] auto continue_anyway(const session_id& id) -> result<void>;

    /**
     * @brief Resolve a paused session with an existing file
     */
    [[nodiscard]] auto reuse_existing(const session_id& id,
                                      std::optional<std::string> file_id = std::nullopt)
        -> result<upload_outcome>;

    [[nodiscard]] auto cancel(const session_id& id) -> result<void>;

    /**
     * @brief Wait for the current step of a session to end
     */
    [[nodiscard]] auto wait(const session_id& id) -> result<upload_outcome>;

    [[nodiscard]] auto get_session(const session_id& id) const -> std::optional<upload_session>;

    /**
     * @brief Sessions not yet completed or failed
     */
    [[nodiscard]] auto active_sessions() const -> std::vector<upload_session>;

    /**
     * @brief Forget a finished session
     * @return false if unknown or still active
     */
    auto remove(const session_id& id) -> bool;

    /**
     * @brief Forget every finished session
     * @return Number of sessions removed
     */
    auto clear_finished() -> std::size_t;

    /**
     * @brief Remote status of a session that has been initiated
     */
    [[nodiscard]] auto get_upload_status(const session_id& id) -> result<upload_status_info>;

    auto subscribe(session_listener listener) -> subscription_id;
    auto unsubscribe(subscription_id id) -> bool;

    [[nodiscard]] auto session_count() const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_UPLOAD_UPLOAD_MANAGER_H
