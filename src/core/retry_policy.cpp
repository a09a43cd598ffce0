/**
 * @file retry_policy.cpp
 * @brief Retry policy presets and backoff computation
 */

#include <kcenon/storage_transfer/core/retry_policy.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace kcenon::storage_transfer {

namespace {

// Jitter perturbs the delay by at most this fraction in either direction
constexpr double jitter_fraction = 0.25;

auto jitter_engine() -> std::mt19937& {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

}  // namespace

auto retry_policy::upload() -> retry_policy {
    retry_policy policy;
    policy.max_retries = 3;
    policy.base_delay = std::chrono::milliseconds{1000};
    policy.max_delay = std::chrono::milliseconds{10000};
    policy.backoff_factor = 2.0;
    policy.jitter = true;
    policy.retryable_kinds = {error_kind::network, error_kind::timeout, error_kind::service,
                              error_kind::signed_url_expired, error_kind::rate_limited};
    policy.kind_ceilings = {{error_kind::signed_url_expired, 1},
                            {error_kind::rate_limited, 1}};
    return policy;
}

auto retry_policy::api() -> retry_policy {
    retry_policy policy;
    policy.max_retries = 3;
    policy.base_delay = std::chrono::milliseconds{500};
    policy.max_delay = std::chrono::milliseconds{5000};
    policy.backoff_factor = 1.5;
    policy.jitter = true;
    policy.retryable_kinds = {error_kind::network, error_kind::timeout, error_kind::service,
                              error_kind::rate_limited};
    policy.kind_ceilings = {{error_kind::rate_limited, 1}};
    return policy;
}

auto retry_policy::direct_transfer() -> retry_policy {
    // Same budget as the upload call site; expiry is handled by a restart
    retry_policy policy;
    policy.max_retries = 3;
    policy.base_delay = std::chrono::milliseconds{1000};
    policy.max_delay = std::chrono::milliseconds{10000};
    policy.backoff_factor = 2.0;
    policy.jitter = true;
    policy.retryable_kinds = {error_kind::network, error_kind::timeout, error_kind::service};
    return policy;
}

auto retry_policy::transform() -> retry_policy {
    retry_policy policy;
    policy.max_retries = 2;
    policy.base_delay = std::chrono::milliseconds{2000};
    policy.max_delay = std::chrono::milliseconds{8000};
    policy.backoff_factor = 2.0;
    policy.jitter = false;
    policy.retryable_kinds = {error_kind::network, error_kind::timeout, error_kind::service};
    return policy;
}

auto retry_policy::none() -> retry_policy {
    retry_policy policy;
    policy.max_retries = 0;
    policy.jitter = false;
    return policy;
}

auto should_retry(error_kind kind, std::size_t attempt, const retry_policy& policy) -> bool {
    if (attempt >= policy.max_retries) {
        return false;
    }
    if (policy.retryable_kinds.find(kind) == policy.retryable_kinds.end()) {
        return false;
    }

    auto ceiling = policy.kind_ceilings.find(kind);
    if (ceiling != policy.kind_ceilings.end() && attempt >= ceiling->second) {
        return false;
    }
    return true;
}

auto base_delay_for(std::size_t attempt, const retry_policy& policy)
    -> std::chrono::milliseconds {
    auto max_ms = static_cast<double>(std::max<int64_t>(policy.max_delay.count(), 0));
    auto delay = static_cast<double>(policy.base_delay.count()) *
                 std::pow(policy.backoff_factor, static_cast<double>(attempt));

    if (!std::isfinite(delay)) {
        delay = max_ms;
    }
    delay = std::clamp(delay, 0.0, max_ms);

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto delay_for(std::size_t attempt, const retry_policy& policy)
    -> std::chrono::milliseconds {
    if (!policy.jitter) {
        return base_delay_for(attempt, policy);
    }

    std::uniform_real_distribution<double> dis(-1.0, 1.0);
    return delay_for(attempt, policy, dis(jitter_engine()));
}

auto delay_for(std::size_t attempt, const retry_policy& policy, double jitter_sample)
    -> std::chrono::milliseconds {
    auto base = base_delay_for(attempt, policy);
    if (!policy.jitter) {
        return base;
    }

    auto max_ms = static_cast<double>(std::max<int64_t>(policy.max_delay.count(), 0));
    auto sample = std::clamp(jitter_sample, -1.0, 1.0);
    auto delay = static_cast<double>(base.count()) * (1.0 + sample * jitter_fraction);
    delay = std::clamp(delay, 0.0, max_ms);

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

auto delay_for_error(const error& err, std::size_t attempt, const retry_policy& policy)
    -> std::chrono::milliseconds {
    if (err.kind == error_kind::rate_limited && err.retry_after) {
        auto hint = std::max<int64_t>(err.retry_after->count(), 0);
        return std::chrono::milliseconds(
            std::min<int64_t>(hint, std::max<int64_t>(policy.max_delay.count(), 0)));
    }
    return delay_for(attempt, policy);
}

}  // namespace kcenon::storage_transfer
