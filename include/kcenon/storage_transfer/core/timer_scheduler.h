/**
 * @file timer_scheduler.h
 * @brief Single-shot timers for proactive signed-URL refresh
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_TIMER_SCHEDULER_H
#define KCENON_STORAGE_TRANSFER_CORE_TIMER_SCHEDULER_H

#include <kcenon/storage_transfer/core/clock.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace kcenon::storage_transfer {

namespace adapters {
class transfer_thread_pool_interface;
}

using timer_id = uint64_t;

/**
 * @brief Schedules callbacks at wall-clock instants
 *
 * Timers are single-shot. cancel() of a timer that already fired or was
 * never scheduled is a no-op.
 */
class timer_scheduler {
public:
    virtual ~timer_scheduler() = default;

    /**
     * @brief Run a task at (or soon after) the given instant
     * @return Identifier usable with cancel()
     */
    virtual auto schedule_at(std::chrono::system_clock::time_point when,
                             std::function<void()> task) -> timer_id = 0;

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was pending and is now cancelled
     */
    virtual auto cancel(timer_id id) -> bool = 0;

    /**
     * @brief Number of timers that have not fired or been cancelled
     */
    [[nodiscard]] virtual auto pending_count() const -> std::size_t = 0;
};

/**
 * @brief Timer scheduler with one dispatch thread handing due tasks to a pool
 *
 * The dispatch thread only waits and submits, so a slow refresh never delays
 * other timers. Pending timers are dropped on destruction.
 */
class pool_timer_scheduler : public timer_scheduler {
public:
    /**
     * @param pool Pool that runs due tasks; tasks run on the dispatch thread when null
     * @param clock Time source; system clock when null
     */
    explicit pool_timer_scheduler(
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
        std::shared_ptr<clock_source> clock = nullptr);
    ~pool_timer_scheduler() override;

    pool_timer_scheduler(const pool_timer_scheduler&) = delete;
    auto operator=(const pool_timer_scheduler&) -> pool_timer_scheduler& = delete;

    auto schedule_at(std::chrono::system_clock::time_point when,
                     std::function<void()> task) -> timer_id override;
    auto cancel(timer_id id) -> bool override;
    [[nodiscard]] auto pending_count() const -> std::size_t override;

    /**
     * @brief Stop the dispatch thread and drop pending timers
     */
    void shutdown();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CORE_TIMER_SCHEDULER_H
