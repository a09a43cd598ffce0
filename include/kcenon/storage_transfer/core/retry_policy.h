/**
 * @file retry_policy.h
 * @brief Error-class-aware retry with exponential backoff and jitter
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_RETRY_POLICY_H
#define KCENON_STORAGE_TRANSFER_CORE_RETRY_POLICY_H

#include "kcenon/storage_transfer/core/cancellation.h"
#include "kcenon/storage_transfer/core/types.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <thread>

namespace kcenon::storage_transfer {

/**
 * @brief Retry configuration for one call site
 *
 * Attempts are counted from 0: with max_retries = 3 an operation runs at most
 * four times. A kind listed in kind_ceilings is retried only while the
 * attempt index is below its ceiling.
 */
struct retry_policy {
    std::size_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{10000};
    double backoff_factor = 2.0;
    bool jitter = true;
    std::set<error_kind> retryable_kinds;
    std::map<error_kind, std::size_t> kind_ceilings;

    /// Whole-upload steps: transient, expired-URL and rate-limit failures
    [[nodiscard]] static auto upload() -> retry_policy;

    /// REST calls against the backend
    [[nodiscard]] static auto api() -> retry_policy;

    /// Raw PUT to a signed URL
    [[nodiscard]] static auto direct_transfer() -> retry_policy;

    /// Image transform URL requests
    [[nodiscard]] static auto transform() -> retry_policy;

    /// A policy that never retries
    [[nodiscard]] static auto none() -> retry_policy;
};

/**
 * @brief The four call-site policies used by the client
 */
struct retry_policy_set {
    retry_policy upload = retry_policy::upload();
    retry_policy api = retry_policy::api();
    retry_policy direct_transfer = retry_policy::direct_transfer();
    retry_policy transform = retry_policy::transform();
};

/**
 * @brief Whether a failure of the given kind at this attempt may be retried
 */
[[nodiscard]] auto should_retry(error_kind kind, std::size_t attempt,
                                const retry_policy& policy) -> bool;

/**
 * @brief Backoff before jitter: min(base * factor^attempt, max)
 */
[[nodiscard]] auto base_delay_for(std::size_t attempt, const retry_policy& policy)
    -> std::chrono::milliseconds;

/**
 * @brief Backoff with jitter drawn from a thread-local generator
 *
 * Always within [0, max_delay].
 */
[[nodiscard]] auto delay_for(std::size_t attempt, const retry_policy& policy)
    -> std::chrono::milliseconds;

/**
 * @brief Backoff with an explicit jitter sample
 * @param jitter_sample Value in [-1, 1] scaling the +/-25% perturbation
 */
[[nodiscard]] auto delay_for(std::size_t attempt, const retry_policy& policy,
                             double jitter_sample) -> std::chrono::milliseconds;

/**
 * @brief Delay before retrying a specific failure
 *
 * rate_limited failures carrying a retry-after hint wait for the hint,
 * capped at max_delay. Everything else uses delay_for().
 */
[[nodiscard]] auto delay_for_error(const error& err, std::size_t attempt,
                                   const retry_policy& policy)
    -> std::chrono::milliseconds;

/**
 * @brief Observation and control points for execute_with_retry
 */
struct retry_hooks {
    /// Called before each wait with the failure, the 1-based retry number and the delay
    std::function<void(const error&, std::size_t, std::chrono::milliseconds)> on_retry;

    /// Performs the wait; returns false when interrupted. Defaults to sleep_for.
    std::function<bool(std::chrono::milliseconds)> sleep;

    /// Polled before every attempt
    std::function<bool()> cancelled;

    /**
     * @brief Hooks that wait on and observe a cancellation token
     */
    [[nodiscard]] static auto with_token(const cancellation_token& token) -> retry_hooks {
        retry_hooks hooks;
        hooks.sleep = [token](std::chrono::milliseconds d) { return token.wait_for(d); };
        hooks.cancelled = [token] { return token.is_cancelled(); };
        return hooks;
    }
};

namespace detail {

[[nodiscard]] inline auto cancelled_error() -> error {
    return error(error_kind::cancelled, "Operation cancelled");
}

[[nodiscard]] inline auto with_attempts(error err, std::size_t attempts) -> error {
    err.with_detail("attempts", std::to_string(attempts));
    return err;
}

}  // namespace detail

/**
 * @brief Run an operation returning result<T>, retrying per policy
 *
 * The terminal error is the last failure with an "attempts" detail attached.
 *
 * @code
 * auto grant = execute_with_retry(
 *     [&] { return api.initiate_upload(bucket, file, digest); },
 *     retry_policy::api(),
 *     retry_hooks::with_token(token));
 * @endcode
 */
template <typename Operation>
[[nodiscard]] auto execute_with_retry(Operation&& op, const retry_policy& policy,
                                      const retry_hooks& hooks = {})
    -> decltype(op()) {
    std::size_t attempt = 0;

    while (true) {
        if (hooks.cancelled && hooks.cancelled()) {
            return unexpected(detail::with_attempts(detail::cancelled_error(), attempt));
        }

        auto outcome = op();
        if (outcome.has_value()) {
            return outcome;
        }

        const auto& err = outcome.error();
        if (!should_retry(err.kind, attempt, policy)) {
            return unexpected(detail::with_attempts(err, attempt + 1));
        }

        auto delay = delay_for_error(err, attempt, policy);
        if (hooks.on_retry) {
            hooks.on_retry(err, attempt + 1, delay);
        }

        bool waited = true;
        if (hooks.sleep) {
            waited = hooks.sleep(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }

        if (!waited || (hooks.cancelled && hooks.cancelled())) {
            return unexpected(detail::with_attempts(detail::cancelled_error(), attempt + 1));
        }

        ++attempt;
    }
}

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CORE_RETRY_POLICY_H
