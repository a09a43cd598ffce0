/**
 * @file timer_scheduler.cpp
 * @brief Implementation of pool_timer_scheduler
 */

#include <kcenon/storage_transfer/core/timer_scheduler.h>
#include <kcenon/storage_transfer/core/logging.h>
#include <kcenon/storage_transfer/adapters/thread_pool_adapter.h>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <future>
#include <list>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace kcenon::storage_transfer {

struct pool_timer_scheduler::impl {
    using clock_time = std::chrono::system_clock::time_point;

    struct entry {
        clock_time when;
        std::function<void()> task;
    };

    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::shared_ptr<clock_source> clock;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::map<timer_id, entry> timers;
    timer_id next_id{1};
    bool stopping{false};
    std::thread dispatcher;

    // Only the dispatch thread touches this until it has been joined
    std::list<std::future<void>> in_flight;

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopping) {
            if (timers.empty()) {
                cv.wait(lock, [this] { return stopping || !timers.empty(); });
                continue;
            }

            auto due = timers.begin();
            for (auto it = timers.begin(); it != timers.end(); ++it) {
                if (it->second.when < due->second.when) {
                    due = it;
                }
            }

            auto now = clock->now();
            if (due->second.when > now) {
                // Wake on the steady clock; re-evaluate against the injected clock
                auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
                    due->second.when - now);
                cv.wait_for(lock, std::min(wait, std::chrono::milliseconds(1000)));
                continue;
            }

            auto task = std::move(due->second.task);
            timers.erase(due);

            lock.unlock();
            dispatch(std::move(task));
            lock.lock();
        }
    }

    void reap() {
        in_flight.remove_if([](const std::future<void>& f) {
            return !f.valid() ||
                   f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
    }

    void dispatch(std::function<void()> task) {
        if (pool) {
            // Refresh tasks report through logging; futures are held so that a
            // std::async-backed pool does not block here
            reap();
            in_flight.push_back(
                pool->submit_to_lane(std::move(task), adapters::pool_lane::url_refresh));
            return;
        }
        try {
            task();
        } catch (const std::exception& e) {
            ST_LOG_ERROR(log_category::url_cache,
                         std::string("Timer task threw: ") + e.what());
        }
    }
};

pool_timer_scheduler::pool_timer_scheduler(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
    std::shared_ptr<clock_source> clock)
    : impl_(std::make_unique<impl>()) {
    impl_->pool = std::move(pool);
    impl_->clock = clock ? std::move(clock) : make_system_clock();
    impl_->dispatcher = std::thread([this] { impl_->run(); });
}

pool_timer_scheduler::~pool_timer_scheduler() {
    shutdown();
}

void pool_timer_scheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) {
            return;
        }
        impl_->stopping = true;
        impl_->timers.clear();
    }
    impl_->cv.notify_all();
    if (impl_->dispatcher.joinable()) {
        impl_->dispatcher.join();
    }
    for (auto& task : impl_->in_flight) {
        if (task.valid()) {
            task.wait();
        }
    }
    impl_->in_flight.clear();
}

auto pool_timer_scheduler::schedule_at(std::chrono::system_clock::time_point when,
                                       std::function<void()> task) -> timer_id {
    timer_id id;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        id = impl_->next_id++;
        if (impl_->stopping) {
            return id;
        }
        impl_->timers.emplace(id, impl::entry{when, std::move(task)});
    }
    impl_->cv.notify_all();
    return id;
}

auto pool_timer_scheduler::cancel(timer_id id) -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->timers.erase(id) > 0;
}

auto pool_timer_scheduler::pending_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->timers.size();
}

}  // namespace kcenon::storage_transfer
