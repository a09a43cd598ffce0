// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for storage_trans_system
 *
 * Uploads, batch items and signed-URL refreshes run as tasks on one shared
 * pool. Each task is tagged with a lane ("upload", "url_refresh", ...) so the
 * number of outstanding tasks per activity can be observed.
 *
 * Backends, in order of preference:
 * - thread_system's thread_pool (KCENON_WITH_THREAD_SYSTEM)
 * - network_system's basic_thread_pool (KCENON_WITH_NETWORK_SYSTEM)
 * - std::async
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::storage_transfer::adapters {

/**
 * @brief Well-known lane names
 */
struct pool_lane {
    static constexpr const char* upload = "upload";
    static constexpr const char* batch = "batch";
    static constexpr const char* url_refresh = "url_refresh";
};

/**
 * @brief Worker pool used by the upload manager and the URL cache
 *
 * Exceptions escaping a task are stored in the returned future.
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Run a task on a worker
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Run a task on a worker and count it against a lane until it ends
     */
    virtual std::future<void> submit_to_lane(std::function<void()> task,
                                             const std::string& lane) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks queued or running across all lanes
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Tasks queued or running in one lane
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& lane) const = 0;
};

/**
 * @brief Per-lane outstanding task counter shared by the adapters
 */
class lane_counter {
public:
    void enter(const std::string& lane) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[lane];
        ++total_;
    }

    void leave(const std::string& lane) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(lane);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
        if (total_ > 0) {
            --total_;
        }
    }

    [[nodiscard]] size_t count(const std::string& lane) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(lane);
        return it != counts_.end() ? it->second : 0;
    }

    [[nodiscard]] size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
    size_t total_{0};
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter over thread_system's thread_pool
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    thread_system_transfer_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                   size_t worker_count);
    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create and start a pool
     * @param worker_count Number of workers (0 = hardware concurrency)
     * @param pool_name Name shown in thread_system diagnostics
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "storage_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_lane(std::function<void()> task,
                                     const std::string& lane) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& lane) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Adapter over network_system's thread_pool_interface
 */
class network_pool_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit network_pool_transfer_adapter(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool);
    ~network_pool_transfer_adapter() override;

    network_pool_transfer_adapter(const network_pool_transfer_adapter&) = delete;
    network_pool_transfer_adapter& operator=(const network_pool_transfer_adapter&) = delete;

    [[nodiscard]] static std::shared_ptr<network_pool_transfer_adapter> create_basic(
        size_t worker_count = 0);

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_lane(std::function<void()> task,
                                     const std::string& lane) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& lane) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fallback that runs every task on its own std::async thread
 *
 * worker_count() reports hardware concurrency; there is no queue, so
 * pending_tasks() counts running tasks.
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    async_transfer_pool();
    ~async_transfer_pool() override;

    async_transfer_pool(const async_transfer_pool&) = delete;
    async_transfer_pool& operator=(const async_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_lane(std::function<void()> task,
                                     const std::string& lane) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& lane) const override;

private:
    std::shared_ptr<lane_counter> lanes_;
};

/**
 * @brief Selects the best available pool implementation
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "storage_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr bool has_network_pool() noexcept {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::storage_transfer::adapters
