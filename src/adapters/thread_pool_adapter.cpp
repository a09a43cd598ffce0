// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation for storage_trans_system
 */

#include "kcenon/storage_transfer/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::storage_transfer::adapters {

namespace {

auto default_worker_count(size_t requested) -> size_t {
    if (requested != 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

/**
 * @brief Wrap a task so it leaves its lane when done, whatever the outcome
 */
auto counted(std::function<void()> task, std::shared_ptr<lane_counter> lanes,
             std::string lane) -> std::function<void()> {
    lanes->enter(lane);
    return [task = std::move(task), lanes = std::move(lanes), lane = std::move(lane)]() {
        struct leave_guard {
            lane_counter& counter;
            const std::string& name;
            ~leave_guard() { counter.leave(name); }
        } guard{*lanes, lane};
        task();
    };
}

}  // namespace

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief thread_system job running a std::function and fulfilling a promise
 */
class promise_job : public kcenon::thread::job {
public:
    promise_job(std::function<void()> func, std::shared_ptr<std::promise<void>> promise)
        : job("storage_transfer_task"), func_(std::move(func)), promise_(std::move(promise)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        try {
            func_();
            promise_->set_value();
        } catch (...) {
            promise_->set_exception(std::current_exception());
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
    std::shared_ptr<std::promise<void>> promise_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    size_t workers{0};
    std::shared_ptr<lane_counter> lanes = std::make_shared<lane_counter>();

    std::future<void> enqueue(std::function<void()> task) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        pool->enqueue(std::make_unique<promise_job>(std::move(task), std::move(promise)));
        return future;
    }
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool, size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->workers = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    if (pimpl_ && pimpl_->pool) {
        (void)pimpl_->pool->stop(false);
    }
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    return submit_to_lane(std::move(task), pool_lane::upload);
}

std::future<void> thread_system_transfer_adapter::submit_to_lane(
    std::function<void()> task, const std::string& lane) {
    return pimpl_->enqueue(counted(std::move(task), pimpl_->lanes, lane));
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->workers;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    return pimpl_->lanes->total();
}

size_t thread_system_transfer_adapter::pending_tasks(const std::string& lane) const {
    return pimpl_->lanes->count(lane);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

struct network_pool_transfer_adapter::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    std::shared_ptr<lane_counter> lanes = std::make_shared<lane_counter>();
};

network_pool_transfer_adapter::network_pool_transfer_adapter(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
}

network_pool_transfer_adapter::~network_pool_transfer_adapter() = default;

std::shared_ptr<network_pool_transfer_adapter>
network_pool_transfer_adapter::create_basic(size_t worker_count) {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        default_worker_count(worker_count));
    return std::make_shared<network_pool_transfer_adapter>(std::move(pool));
}

std::future<void> network_pool_transfer_adapter::submit(std::function<void()> task) {
    return submit_to_lane(std::move(task), pool_lane::upload);
}

std::future<void> network_pool_transfer_adapter::submit_to_lane(
    std::function<void()> task, const std::string& lane) {
    return pimpl_->pool->submit(counted(std::move(task), pimpl_->lanes, lane));
}

size_t network_pool_transfer_adapter::worker_count() const {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

bool network_pool_transfer_adapter::is_running() const {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

size_t network_pool_transfer_adapter::pending_tasks() const {
    return pimpl_->lanes->total();
}

size_t network_pool_transfer_adapter::pending_tasks(const std::string& lane) const {
    return pimpl_->lanes->count(lane);
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

async_transfer_pool::async_transfer_pool() : lanes_(std::make_shared<lane_counter>()) {}

async_transfer_pool::~async_transfer_pool() = default;

std::future<void> async_transfer_pool::submit(std::function<void()> task) {
    return submit_to_lane(std::move(task), pool_lane::upload);
}

std::future<void> async_transfer_pool::submit_to_lane(std::function<void()> task,
                                                      const std::string& lane) {
    return std::async(std::launch::async, counted(std::move(task), lanes_, lane));
}

size_t async_transfer_pool::worker_count() const {
    return default_worker_count(0);
}

bool async_transfer_pool::is_running() const { return true; }

size_t async_transfer_pool::pending_tasks() const {
    return lanes_->total();
}

size_t async_transfer_pool::pending_tasks(const std::string& lane) const {
    return lanes_->count(lane);
}

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    (void)pool_name;
    return network_pool_transfer_adapter::create_basic(worker_count);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_transfer_pool>();
#endif
}

}  // namespace kcenon::storage_transfer::adapters
