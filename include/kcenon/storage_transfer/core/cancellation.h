/**
 * @file cancellation.h
 * @brief Cross-thread cancellation flag with interruptible waits
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_CANCELLATION_H
#define KCENON_STORAGE_TRANSFER_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace kcenon::storage_transfer {

/**
 * @brief Shared cancellation flag
 *
 * Copies observe the same flag. wait_for() returns early when the token is
 * cancelled, so retry backoff never outlives a cancel() call.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<state>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->cancelled.load();
    }

    /**
     * @brief Sleep for the given duration unless cancelled first
     * @return true if the full duration elapsed, false if cancelled
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds duration) const -> bool {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration,
                                    [this] { return state_->cancelled.load(); });
    }

private:
    struct state {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<state> state_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CORE_CANCELLATION_H
