/**
 * @file Retry.hpp
 * @brief Bounded retry with linear backoff for std::expected-returning steps
 */

#pragma once

#include "util/Error.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <thread>

namespace util {

/**
 * @struct RetryPolicy
 * @brief Attempt count and backoff step; attempt n (0-based) waits step * (n + 1) before retrying
 */
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds backoff_step{100};
};

/**
 * @brief Run @p attempt until it succeeds, a non-retryable error occurs or attempts run out
 * @param on_retry Called with the failed attempt number and its error before sleeping
 * @return The first success, or the last error
 */
template<typename T>
auto retry_with_backoff(const RetryPolicy& policy,
                        const std::function<std::expected<T, Error>()>& attempt,
                        const std::function<void(int, const Error&)>& on_retry = {})
    -> std::expected<T, Error> {
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

    for (int i = 0;; ++i) {
        auto result = attempt();
        if (result || !result.error().is_retryable() || i + 1 >= attempts) {
            return result;
        }
        if (on_retry) {
            on_retry(i + 1, result.error());
        }
        std::this_thread::sleep_for(policy.backoff_step * (i + 1));
    }
}

} // namespace util
